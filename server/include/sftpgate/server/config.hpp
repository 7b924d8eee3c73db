#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace sftpgate::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8088};
        std::size_t worker_threads{0};

        std::chrono::seconds connect_timeout{30};
        std::chrono::seconds session_timeout{std::chrono::minutes{30}};
        std::chrono::seconds cleanup_interval{std::chrono::minutes{5}};
        std::size_t max_sessions{100};

        std::filesystem::path staging_dir;
        std::chrono::seconds upload_timeout{std::chrono::hours{1}};
        std::uint64_t max_preview_size{1024 * 1024};

        bool save_history{true};
        std::optional<std::filesystem::path> history_file{std::filesystem::path{"login_history.json"}};
        std::size_t max_history{50};

        std::string log_level{"info"};
        std::optional<std::filesystem::path> log_file;
    };

    using EnvironmentLookup = std::function<const char *(const char *)>;

    // Overlays a JSON config file. A missing file leaves the config untouched; malformed JSON or a
    // value of the wrong type throws std::runtime_error.
    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

    // Overlays SFTPGATE_* environment variables. Throws std::invalid_argument on unparsable values.
    void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup);

    // Defaults, then the JSON file when one is given, then the environment. Not validated.
    ServerConfig load_config(const std::optional<std::filesystem::path> &file, const EnvironmentLookup &lookup);

    // Throws std::invalid_argument describing the first invalid setting.
    void validate_config(const ServerConfig &config);

    // Accepts plain seconds ("90") or a number with an s/m/h suffix ("30m").
    std::chrono::seconds parse_duration(const std::string &text);

    spdlog::level::level_enum parse_log_level(const std::string &text);

} // namespace sftpgate::server
