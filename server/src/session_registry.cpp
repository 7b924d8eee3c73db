#include "sftpgate/server/session_registry.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

#include "sftpgate/crypto.hpp"
#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::size_t kSessionIdBytes = 16;

        void validate_credentials(const SessionCredentials &credentials)
        {
            if (credentials.host.empty())
            {
                throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Host is required");
            }
            if (credentials.port == 0)
            {
                throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Port must be between 1 and 65535");
            }
            if (credentials.username.empty())
            {
                throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Username is required");
            }
            if (credentials.password.empty())
            {
                throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Password is required");
            }
        }

        std::string describe_target(const SessionCredentials &credentials)
        {
            return credentials.username + "@" + credentials.host + ":" + std::to_string(credentials.port);
        }

    } // namespace

    SessionRegistry::SessionRegistry(ConnectionFactory &factory, RegistryOptions options)
        : factory_(factory), options_(std::move(options))
    {
        if (!options_.clock)
        {
            options_.clock = []
            { return Clock::now(); };
        }
    }

    SessionRegistry::~SessionRegistry()
    {
        close_all();
    }

    std::shared_ptr<Session> SessionRegistry::create(const SessionCredentials &credentials)
    {
        validate_credentials(credentials);

        {
            std::shared_lock lock(mutex_);
            if (sessions_.size() >= options_.max_sessions)
            {
                const auto now = options_.clock();
                const bool reclaimable = std::any_of(sessions_.begin(), sessions_.end(), [&](const auto &item)
                                                     { return item.second->idle_expired(now, options_.session_timeout); });
                if (!reclaimable)
                {
                    throw GatewayError(sftpgate::ErrorCode::CapacityExceeded,
                                       "Maximum number of sessions (" + std::to_string(options_.max_sessions) +
                                           ") reached");
                }
            }
        }

        auto connection = factory_.connect(ConnectionRequest{
            .host = credentials.host,
            .port = credentials.port,
            .username = credentials.username,
            .credential = credentials.password,
            .timeout = options_.connect_timeout,
        });

        SessionInfo info{
            .username = credentials.username,
            .host = credentials.host,
            .port = credentials.port,
            .home_directory = resolve_home_directory(*connection, credentials.username),
        };

        std::vector<std::shared_ptr<Session>> evicted;
        std::shared_ptr<Session> session;
        {
            std::unique_lock lock(mutex_);
            if (sessions_.size() >= options_.max_sessions)
            {
                evicted = take_expired_locked(options_.clock());
            }
            if (sessions_.size() < options_.max_sessions)
            {
                auto id = generate_id_locked();
                session = std::make_shared<Session>(id, std::move(connection), std::move(info), options_.clock);
                sessions_.emplace(std::move(id), session);
            }
        }

        for (const auto &stale : evicted)
        {
            close_session(stale, "evicted to make room");
        }

        if (!session)
        {
            close_connection(*connection, describe_target(credentials));
            throw GatewayError(sftpgate::ErrorCode::CapacityExceeded,
                               "Maximum number of sessions (" + std::to_string(options_.max_sessions) + ") reached");
        }

        spdlog::info("Session {} created for {} (home {})", session->id(), describe_target(credentials),
                     session->home_directory());
        return session;
    }

    std::shared_ptr<Session> SessionRegistry::get(const std::string &id)
    {
        std::shared_lock lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end())
        {
            throw GatewayError(sftpgate::ErrorCode::NotFound, "Session not found");
        }
        const auto &session = it->second;
        if (!session->active() || session->idle_expired(options_.clock(), options_.session_timeout))
        {
            throw GatewayError(sftpgate::ErrorCode::Expired, "Session expired");
        }
        // Still under the shared lock, so a sweep cannot interleave between the check and the refresh.
        session->touch();
        return session;
    }

    void SessionRegistry::remove(const std::string &id)
    {
        std::shared_ptr<Session> session;
        {
            std::unique_lock lock(mutex_);
            const auto it = sessions_.find(id);
            if (it == sessions_.end())
            {
                throw GatewayError(sftpgate::ErrorCode::NotFound, "Session not found");
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        close_session(session, "logged out");
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::list() const
    {
        std::shared_lock lock(mutex_);
        const auto now = options_.clock();
        std::vector<std::shared_ptr<Session>> result;
        result.reserve(sessions_.size());
        for (const auto &[id, session] : sessions_)
        {
            if (session->active() && !session->idle_expired(now, options_.session_timeout))
            {
                result.push_back(session);
            }
        }
        return result;
    }

    SessionStats SessionRegistry::stats() const
    {
        std::shared_lock lock(mutex_);
        const auto now = options_.clock();
        SessionStats stats{.active_sessions = 0, .total_sessions = sessions_.size()};
        for (const auto &[id, session] : sessions_)
        {
            if (session->active() && !session->idle_expired(now, options_.session_timeout))
            {
                ++stats.active_sessions;
            }
        }
        return stats;
    }

    std::size_t SessionRegistry::sweep_expired()
    {
        std::vector<std::shared_ptr<Session>> expired;
        {
            std::unique_lock lock(mutex_);
            expired = take_expired_locked(options_.clock());
        }
        for (const auto &session : expired)
        {
            close_session(session, "expired");
        }
        if (!expired.empty())
        {
            spdlog::info("Expired {} idle session(s)", expired.size());
        }
        return expired.size();
    }

    void SessionRegistry::close_all()
    {
        std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
        {
            std::unique_lock lock(mutex_);
            sessions.swap(sessions_);
        }
        for (const auto &[id, session] : sessions)
        {
            close_session(session, "shutting down");
        }
        if (!sessions.empty())
        {
            spdlog::info("Closed {} session(s) on shutdown", sessions.size());
        }
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::take_expired_locked(Clock::time_point now)
    {
        std::vector<std::shared_ptr<Session>> expired;
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (it->second->idle_expired(now, options_.session_timeout))
            {
                expired.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return expired;
    }

    std::string SessionRegistry::generate_id_locked() const
    {
        auto id = crypto::random_token(kSessionIdBytes);
        while (sessions_.contains(id))
        {
            spdlog::warn("Session id collision, generating a new one");
            id = crypto::random_token(kSessionIdBytes);
        }
        return id;
    }

    std::string SessionRegistry::resolve_home_directory(RemoteConnection &connection, const std::string &username) const
    {
        try
        {
            auto cwd = connection.working_directory();
            if (!cwd.empty())
            {
                return cwd;
            }
        }
        catch (const GatewayError &ex)
        {
            spdlog::debug("Working directory unavailable for {}: {}", username, ex.what());
        }

        std::vector<std::string> candidates{"/home/" + username, "/Users/" + username};
        if (username == "root")
        {
            candidates.emplace_back("/root");
        }
        for (const auto &candidate : candidates)
        {
            try
            {
                if (connection.stat(candidate).is_directory)
                {
                    return candidate;
                }
            }
            catch (const GatewayError &)
            {
                // not present on this host; try the next convention
            }
        }
        return "/";
    }

    void SessionRegistry::close_session(const std::shared_ptr<Session> &session, const char *reason)
    {
        try
        {
            if (session->close())
            {
                spdlog::debug("Session {} closed ({})", session->id(), reason);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Closing session {} ({}) failed: {}", session->id(), reason, ex.what());
        }
    }

    void SessionRegistry::close_connection(RemoteConnection &connection, const std::string &target)
    {
        try
        {
            connection.close();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Closing rejected connection to {} failed: {}", target, ex.what());
        }
    }

} // namespace sftpgate::server
