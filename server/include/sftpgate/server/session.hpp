/**
 * sftpgate - One brokered SFTP session: the connection it owns plus its bookkeeping.
 *
 * Lock order inside a session is connection_mutex_ before state_mutex_. The registry's own lock is
 * always taken before either of them.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "sftpgate/server/remote_connection.hpp"

namespace sftpgate::server
{

    using Clock = std::chrono::system_clock;
    using ClockSource = std::function<Clock::time_point()>;

    struct SessionInfo
    {
        std::string username;
        std::string host;
        std::uint16_t port{22};
        std::string home_directory{"/"};
    };

    class Session;

    // Scoped exclusive access to a session's connection. The session counts as busy for as long as
    // a lease exists, and releasing it counts as activity.
    class ConnectionLease
    {
    public:
        ConnectionLease(ConnectionLease &&other) noexcept;
        ConnectionLease &operator=(ConnectionLease &&) = delete;
        ConnectionLease(const ConnectionLease &) = delete;
        ConnectionLease &operator=(const ConnectionLease &) = delete;
        ~ConnectionLease();

        RemoteConnection &connection() const noexcept { return *connection_; }
        RemoteConnection *operator->() const noexcept { return connection_; }

    private:
        friend class Session;
        ConnectionLease(Session &session, std::unique_lock<std::mutex> lock, RemoteConnection *connection);

        Session *session_;
        std::unique_lock<std::mutex> lock_;
        RemoteConnection *connection_;
    };

    class Session
    {
    public:
        Session(std::string id, std::unique_ptr<RemoteConnection> connection, SessionInfo info, ClockSource clock);
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        const std::string &id() const noexcept { return id_; }
        const std::string &username() const noexcept { return info_.username; }
        const std::string &host() const noexcept { return info_.host; }
        std::uint16_t port() const noexcept { return info_.port; }
        const std::string &home_directory() const noexcept { return info_.home_directory; }
        Clock::time_point created_at() const noexcept { return created_at_; }

        Clock::time_point last_access() const;
        bool active() const;
        bool busy() const noexcept { return leases_.load() > 0; }

        void touch();

        // True when the session has been idle for at least `timeout` and no lease is outstanding.
        bool idle_expired(Clock::time_point now, std::chrono::seconds timeout) const;

        // Blocks until the connection is free. Throws GatewayError(Expired) once the session is closed.
        ConnectionLease lease();

        // Closes the connection at most once; returns false when it was already closed. Waits for any
        // outstanding lease. Errors from the transport propagate after the session is marked inactive.
        bool close();

        // Empty → home directory, relative → under the home directory; the result is lexically clean.
        std::string resolve(const std::string &path) const;

    private:
        friend class ConnectionLease;
        void release_lease();

        std::string id_;
        SessionInfo info_;
        ClockSource clock_;
        Clock::time_point created_at_;

        std::mutex connection_mutex_;
        std::unique_ptr<RemoteConnection> connection_;

        mutable std::mutex state_mutex_;
        Clock::time_point last_access_;
        bool active_{true};

        std::atomic<int> leases_{0};
    };

} // namespace sftpgate::server
