#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sftpgate::server
{

    struct LoginRecord
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::int64_t last_used{};
        bool success{};
    };

    void to_json(nlohmann::json &json, const LoginRecord &record);
    void from_json(const nlohmann::json &json, LoginRecord &record);

    // Most recently used connection targets, newest first. Persisted as a JSON array when a file is
    // configured; a missing file starts an empty history.
    class LoginHistory
    {
    public:
        LoginHistory(std::optional<std::filesystem::path> file, std::size_t max_entries, bool enabled = true);

        void record(const std::string &host, std::uint16_t port, const std::string &username, bool success);

        std::vector<LoginRecord> entries() const;
        std::vector<LoginRecord> successful_entries() const;

        bool remove(const std::string &host, std::uint16_t port, const std::string &username);
        void clear();

        bool enabled() const noexcept { return enabled_; }

    private:
        void load_locked();
        void persist_locked() const;

        std::optional<std::filesystem::path> file_;
        std::size_t max_entries_;
        bool enabled_;

        mutable std::mutex mutex_;
        std::vector<LoginRecord> records_;
    };

} // namespace sftpgate::server
