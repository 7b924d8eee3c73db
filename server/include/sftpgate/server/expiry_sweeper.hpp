#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "sftpgate/server/session_registry.hpp"

namespace sftpgate::server
{

    // Periodically evicts idle sessions. The timer runs on an io_context and thread owned by the
    // sweeper, so request handlers blocked on remote I/O never delay a sweep. stop() cancels the
    // pending wait and joins the thread.
    class ExpirySweeper
    {
    public:
        ExpirySweeper(SessionRegistry &registry, std::chrono::milliseconds interval);
        ~ExpirySweeper();

        ExpirySweeper(const ExpirySweeper &) = delete;
        ExpirySweeper &operator=(const ExpirySweeper &) = delete;

        // Extra housekeeping run after each registry sweep. Register before start().
        void add_task(std::function<void()> task);

        void start();
        void stop();

        // One sweep pass; returns the number of sessions evicted.
        std::size_t run_once();

        bool running() const;

    private:
        void schedule_locked();
        void on_tick(const std::error_code &ec);

        SessionRegistry &registry_;
        std::chrono::milliseconds interval_;
        std::vector<std::function<void()>> tasks_;

        asio::io_context io_context_;
        mutable std::mutex mutex_;
        asio::steady_timer timer_;
        std::thread thread_;
        bool running_{false};
    };

} // namespace sftpgate::server
