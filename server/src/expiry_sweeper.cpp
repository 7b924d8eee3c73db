#include "sftpgate/server/expiry_sweeper.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    ExpirySweeper::ExpirySweeper(SessionRegistry &registry, std::chrono::milliseconds interval)
        : registry_(registry), interval_(interval), timer_(io_context_) {}

    ExpirySweeper::~ExpirySweeper()
    {
        stop();
    }

    void ExpirySweeper::add_task(std::function<void()> task)
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }

    void ExpirySweeper::start()
    {
        std::lock_guard lock(mutex_);
        if (running_)
        {
            return;
        }
        running_ = true;
        io_context_.restart();
        schedule_locked();
        thread_ = std::thread([this]
                              { io_context_.run(); });
        spdlog::info("Session sweeper started (interval {} ms)", interval_.count());
    }

    void ExpirySweeper::stop()
    {
        {
            std::lock_guard lock(mutex_);
            if (!running_)
            {
                return;
            }
            running_ = false;
            timer_.cancel();
        }
        // A sweep already in progress finishes first; no new tick is scheduled after it.
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        {
            thread_.join();
        }
        else if (thread_.joinable())
        {
            thread_.detach();
        }
        spdlog::info("Session sweeper stopped");
    }

    bool ExpirySweeper::running() const
    {
        std::lock_guard lock(mutex_);
        return running_;
    }

    std::size_t ExpirySweeper::run_once()
    {
        const auto evicted = registry_.sweep_expired();

        std::vector<std::function<void()>> tasks;
        {
            std::lock_guard lock(mutex_);
            tasks = tasks_;
        }
        for (const auto &task : tasks)
        {
            try
            {
                task();
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Sweeper task failed: {}", ex.what());
            }
        }
        return evicted;
    }

    void ExpirySweeper::schedule_locked()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          { on_tick(ec); });
    }

    void ExpirySweeper::on_tick(const std::error_code &ec)
    {
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Sweeper timer error: {}", ec.message());
        }
        else
        {
            try
            {
                run_once();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Session sweep failed: {}", ex.what());
            }
        }

        std::lock_guard lock(mutex_);
        if (running_)
        {
            schedule_locked();
        }
    }

} // namespace sftpgate::server
