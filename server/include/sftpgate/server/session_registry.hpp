#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sftpgate/server/remote_connection.hpp"
#include "sftpgate/server/session.hpp"

namespace sftpgate::server
{

    struct SessionCredentials
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::string password;
    };

    struct RegistryOptions
    {
        std::chrono::seconds session_timeout{std::chrono::minutes{30}};
        std::size_t max_sessions{100};
        std::chrono::seconds connect_timeout{30};
        ClockSource clock{};
    };

    struct SessionStats
    {
        std::size_t active_sessions{};
        std::size_t total_sessions{};
    };

    // Owns every live Session. Map access goes through one reader/writer lock; connections are
    // always closed after the lock has been released.
    class SessionRegistry
    {
    public:
        SessionRegistry(ConnectionFactory &factory, RegistryOptions options);
        ~SessionRegistry();

        SessionRegistry(const SessionRegistry &) = delete;
        SessionRegistry &operator=(const SessionRegistry &) = delete;

        // Throws GatewayError (InvalidPayload, CapacityExceeded) or ConnectionError.
        std::shared_ptr<Session> create(const SessionCredentials &credentials);

        // Throws GatewayError (NotFound, Expired). Refreshes the session's last access time.
        std::shared_ptr<Session> get(const std::string &id);

        // Throws GatewayError(NotFound) when the id is unknown, including on a second call.
        void remove(const std::string &id);

        std::vector<std::shared_ptr<Session>> list() const;
        SessionStats stats() const;

        // Evicts every idle, unleased session whose idle time reached the timeout; returns the count.
        std::size_t sweep_expired();

        void close_all();

        std::chrono::seconds session_timeout() const noexcept { return options_.session_timeout; }
        std::size_t max_sessions() const noexcept { return options_.max_sessions; }

    private:
        std::vector<std::shared_ptr<Session>> take_expired_locked(Clock::time_point now);
        std::string generate_id_locked() const;
        std::string resolve_home_directory(RemoteConnection &connection, const std::string &username) const;

        static void close_session(const std::shared_ptr<Session> &session, const char *reason);
        static void close_connection(RemoteConnection &connection, const std::string &target);

        ConnectionFactory &factory_;
        RegistryOptions options_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    };

} // namespace sftpgate::server
