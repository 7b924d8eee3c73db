#include "sftpgate/server/session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "sftpgate/remote_path.hpp"
#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    ConnectionLease::ConnectionLease(Session &session, std::unique_lock<std::mutex> lock, RemoteConnection *connection)
        : session_(&session), lock_(std::move(lock)), connection_(connection) {}

    ConnectionLease::ConnectionLease(ConnectionLease &&other) noexcept
        : session_(std::exchange(other.session_, nullptr)),
          lock_(std::move(other.lock_)),
          connection_(std::exchange(other.connection_, nullptr)) {}

    ConnectionLease::~ConnectionLease()
    {
        if (session_ == nullptr)
        {
            return;
        }
        // Refresh before the busy count drops so a sweep never sees the session idle and unleased.
        session_->touch();
        lock_.unlock();
        session_->release_lease();
    }

    Session::Session(std::string id, std::unique_ptr<RemoteConnection> connection, SessionInfo info, ClockSource clock)
        : id_(std::move(id)),
          info_(std::move(info)),
          clock_(std::move(clock)),
          created_at_(clock_()),
          connection_(std::move(connection)),
          last_access_(created_at_) {}

    Session::~Session()
    {
        try
        {
            if (close())
            {
                spdlog::warn("Session {} destroyed while still open", id_);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Closing session {} on destruction failed: {}", id_, ex.what());
        }
    }

    Clock::time_point Session::last_access() const
    {
        std::lock_guard lock(state_mutex_);
        return last_access_;
    }

    bool Session::active() const
    {
        std::lock_guard lock(state_mutex_);
        return active_;
    }

    void Session::touch()
    {
        const auto now = clock_();
        std::lock_guard lock(state_mutex_);
        if (now > last_access_)
        {
            last_access_ = now;
        }
    }

    bool Session::idle_expired(Clock::time_point now, std::chrono::seconds timeout) const
    {
        if (busy())
        {
            return false;
        }
        std::lock_guard lock(state_mutex_);
        return now - last_access_ >= timeout;
    }

    ConnectionLease Session::lease()
    {
        ++leases_;
        std::unique_lock connection_lock(connection_mutex_);
        {
            std::lock_guard lock(state_mutex_);
            if (!active_)
            {
                connection_lock.unlock();
                --leases_;
                throw GatewayError(sftpgate::ErrorCode::Expired, "Session " + id_ + " is closed");
            }
        }
        return ConnectionLease(*this, std::move(connection_lock), connection_.get());
    }

    void Session::release_lease()
    {
        --leases_;
    }

    bool Session::close()
    {
        std::unique_lock connection_lock(connection_mutex_);
        {
            std::lock_guard lock(state_mutex_);
            if (!active_)
            {
                return false;
            }
            active_ = false;
        }
        auto connection = std::move(connection_);
        if (connection)
        {
            connection->close();
        }
        return true;
    }

    std::string Session::resolve(const std::string &path) const
    {
        if (path.empty())
        {
            return info_.home_directory;
        }
        if (path.front() == '/')
        {
            return remote_path::clean(path);
        }
        return remote_path::clean(remote_path::join(info_.home_directory, path));
    }

} // namespace sftpgate::server
