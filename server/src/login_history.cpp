#include "sftpgate/server/login_history.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    namespace
    {

        std::int64_t now_seconds()
        {
            using namespace std::chrono;
            return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
        }

        bool same_target(const LoginRecord &record, const std::string &host, std::uint16_t port,
                         const std::string &username)
        {
            return record.host == host && record.port == port && record.username == username;
        }

    } // namespace

    void to_json(nlohmann::json &json, const LoginRecord &record)
    {
        json = {
            {"host", record.host},
            {"port", record.port},
            {"username", record.username},
            {"last_used", record.last_used},
            {"success", record.success},
        };
    }

    void from_json(const nlohmann::json &json, LoginRecord &record)
    {
        record.host = json.at("host").get<std::string>();
        record.port = json.value("port", std::uint16_t{22});
        record.username = json.at("username").get<std::string>();
        record.last_used = json.value("last_used", std::int64_t{0});
        record.success = json.value("success", false);
    }

    LoginHistory::LoginHistory(std::optional<std::filesystem::path> file, std::size_t max_entries, bool enabled)
        : file_(std::move(file)), max_entries_(max_entries), enabled_(enabled)
    {
        if (enabled_)
        {
            std::lock_guard lock(mutex_);
            load_locked();
        }
    }

    void LoginHistory::record(const std::string &host, std::uint16_t port, const std::string &username, bool success)
    {
        if (!enabled_)
        {
            return;
        }
        std::lock_guard lock(mutex_);

        LoginRecord entry{.host = host, .port = port, .username = username, .last_used = now_seconds(), .success = success};
        auto it = std::find_if(records_.begin(), records_.end(), [&](const LoginRecord &record)
                               { return same_target(record, host, port, username); });
        if (it != records_.end())
        {
            records_.erase(it);
        }
        records_.insert(records_.begin(), std::move(entry));
        if (records_.size() > max_entries_)
        {
            records_.resize(max_entries_);
        }
        persist_locked();
    }

    std::vector<LoginRecord> LoginHistory::entries() const
    {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::vector<LoginRecord> LoginHistory::successful_entries() const
    {
        std::lock_guard lock(mutex_);
        std::vector<LoginRecord> result;
        std::copy_if(records_.begin(), records_.end(), std::back_inserter(result), [](const LoginRecord &record)
                     { return record.success; });
        return result;
    }

    bool LoginHistory::remove(const std::string &host, std::uint16_t port, const std::string &username)
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(records_.begin(), records_.end(), [&](const LoginRecord &record)
                               { return same_target(record, host, port, username); });
        if (it == records_.end())
        {
            return false;
        }
        records_.erase(it);
        persist_locked();
        return true;
    }

    void LoginHistory::clear()
    {
        std::lock_guard lock(mutex_);
        records_.clear();
        persist_locked();
    }

    void LoginHistory::load_locked()
    {
        records_.clear();
        if (!file_ || !std::filesystem::exists(*file_))
        {
            return;
        }
        std::ifstream in(*file_);
        if (!in.is_open())
        {
            spdlog::warn("Cannot open login history {}", file_->string());
            return;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            records_ = json.get<std::vector<LoginRecord>>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Ignoring unreadable login history {}: {}", file_->string(), ex.what());
            records_.clear();
            return;
        }
        std::stable_sort(records_.begin(), records_.end(), [](const LoginRecord &lhs, const LoginRecord &rhs)
                         { return lhs.last_used > rhs.last_used; });
        if (records_.size() > max_entries_)
        {
            records_.resize(max_entries_);
        }
    }

    void LoginHistory::persist_locked() const
    {
        if (!file_)
        {
            return;
        }
        if (file_->has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(file_->parent_path(), ec);
        }
        std::ofstream out(*file_, std::ios::trunc);
        out << nlohmann::json(records_).dump(2);
        if (!out)
        {
            spdlog::warn("Failed to write login history {}", file_->string());
        }
    }

} // namespace sftpgate::server
