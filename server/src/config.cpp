#include "sftpgate/server/config.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace sftpgate::server
{

    namespace
    {

        std::uint64_t parse_unsigned(const std::string &text, const char *what)
        {
            std::size_t consumed = 0;
            unsigned long long value = 0;
            try
            {
                value = std::stoull(text, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(std::string("Invalid value for ") + what + ": " + text);
            }
            if (consumed != text.size() || text.front() == '-')
            {
                throw std::invalid_argument(std::string("Invalid value for ") + what + ": " + text);
            }
            return value;
        }

        std::uint16_t parse_port(const std::string &text)
        {
            const auto value = parse_unsigned(text, "port");
            if (value > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::invalid_argument("Port out of range: " + text);
            }
            return static_cast<std::uint16_t>(value);
        }

        bool parse_bool(const std::string &text, const char *what)
        {
            if (text == "true" || text == "1" || text == "yes")
            {
                return true;
            }
            if (text == "false" || text == "0" || text == "no")
            {
                return false;
            }
            throw std::invalid_argument(std::string("Invalid value for ") + what + ": " + text);
        }

        std::chrono::seconds json_duration(const nlohmann::json &value)
        {
            if (value.is_number_integer())
            {
                return std::chrono::seconds(value.get<std::int64_t>());
            }
            return parse_duration(value.get<std::string>());
        }

        std::optional<std::filesystem::path> optional_path(const std::string &text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            return std::filesystem::path(text);
        }

    } // namespace

    std::chrono::seconds parse_duration(const std::string &text)
    {
        if (text.empty())
        {
            throw std::invalid_argument("Empty duration");
        }
        std::string digits = text;
        std::int64_t scale = 1;
        const char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
        if (suffix == 's' || suffix == 'm' || suffix == 'h')
        {
            digits.pop_back();
            scale = suffix == 'h' ? 3600 : suffix == 'm' ? 60 : 1;
        }
        if (digits.empty())
        {
            throw std::invalid_argument("Invalid duration: " + text);
        }
        const auto value = parse_unsigned(digits, "duration");
        return std::chrono::seconds(static_cast<std::int64_t>(value) * scale);
    }

    spdlog::level::level_enum parse_log_level(const std::string &text)
    {
        if (text == "debug")
        {
            return spdlog::level::debug;
        }
        if (text == "info")
        {
            return spdlog::level::info;
        }
        if (text == "warn")
        {
            return spdlog::level::warn;
        }
        if (text == "error")
        {
            return spdlog::level::err;
        }
        throw std::invalid_argument("Invalid log level: " + text);
    }

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        if (!std::filesystem::exists(path))
        {
            return;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;

            if (const auto server = json.find("server"); server != json.end())
            {
                config.address = server->value("host", config.address);
                config.port = server->value("port", config.port);
                config.worker_threads = server->value("threads", config.worker_threads);
            }
            if (const auto session = json.find("session"); session != json.end())
            {
                if (session->contains("timeout"))
                {
                    config.session_timeout = json_duration(session->at("timeout"));
                }
                if (session->contains("cleanup_interval"))
                {
                    config.cleanup_interval = json_duration(session->at("cleanup_interval"));
                }
                if (session->contains("connect_timeout"))
                {
                    config.connect_timeout = json_duration(session->at("connect_timeout"));
                }
                config.max_sessions = session->value("max_sessions", config.max_sessions);
                config.save_history = session->value("save_history", config.save_history);
                config.max_history = session->value("max_history", config.max_history);
                if (session->contains("history_file"))
                {
                    config.history_file = optional_path(session->at("history_file").get<std::string>());
                }
            }
            if (const auto transfer = json.find("transfer"); transfer != json.end())
            {
                if (transfer->contains("staging_dir"))
                {
                    config.staging_dir = transfer->at("staging_dir").get<std::string>();
                }
                if (transfer->contains("upload_timeout"))
                {
                    config.upload_timeout = json_duration(transfer->at("upload_timeout"));
                }
                config.max_preview_size = transfer->value("max_preview_size", config.max_preview_size);
            }
            if (const auto logging = json.find("logging"); logging != json.end())
            {
                config.log_level = logging->value("level", config.log_level);
                if (logging->contains("file"))
                {
                    config.log_file = optional_path(logging->at("file").get<std::string>());
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
    }

    void apply_environment(ServerConfig &config, const EnvironmentLookup &lookup)
    {
        const auto read = [&](const char *name) -> std::optional<std::string>
        {
            const char *value = lookup(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        };

        if (auto value = read("SFTPGATE_HOST"))
        {
            config.address = *value;
        }
        if (auto value = read("SFTPGATE_PORT"))
        {
            config.port = parse_port(*value);
        }
        if (auto value = read("SFTPGATE_THREADS"))
        {
            config.worker_threads = static_cast<std::size_t>(parse_unsigned(*value, "SFTPGATE_THREADS"));
        }
        if (auto value = read("SFTPGATE_SESSION_TIMEOUT"))
        {
            config.session_timeout = parse_duration(*value);
        }
        if (auto value = read("SFTPGATE_CLEANUP_INTERVAL"))
        {
            config.cleanup_interval = parse_duration(*value);
        }
        if (auto value = read("SFTPGATE_CONNECT_TIMEOUT"))
        {
            config.connect_timeout = parse_duration(*value);
        }
        if (auto value = read("SFTPGATE_MAX_SESSIONS"))
        {
            config.max_sessions = static_cast<std::size_t>(parse_unsigned(*value, "SFTPGATE_MAX_SESSIONS"));
        }
        if (auto value = read("SFTPGATE_STAGING_DIR"))
        {
            config.staging_dir = *value;
        }
        if (auto value = read("SFTPGATE_SAVE_HISTORY"))
        {
            config.save_history = parse_bool(*value, "SFTPGATE_SAVE_HISTORY");
        }
        if (auto value = read("SFTPGATE_HISTORY_FILE"))
        {
            config.history_file = std::filesystem::path(*value);
        }
        if (auto value = read("SFTPGATE_LOG_LEVEL"))
        {
            config.log_level = *value;
        }
        if (auto value = read("SFTPGATE_LOG_FILE"))
        {
            config.log_file = std::filesystem::path(*value);
        }
    }

    ServerConfig load_config(const std::optional<std::filesystem::path> &file, const EnvironmentLookup &lookup)
    {
        ServerConfig config;
        if (file)
        {
            apply_config_file(config, *file);
        }
        apply_environment(config, lookup);
        return config;
    }

    void validate_config(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw std::invalid_argument("Server port must be between 1 and 65535");
        }
        if (config.session_timeout < std::chrono::seconds{1})
        {
            throw std::invalid_argument("Session timeout must be at least 1 second");
        }
        if (config.cleanup_interval <= std::chrono::seconds{0})
        {
            throw std::invalid_argument("Cleanup interval must be positive");
        }
        if (config.connect_timeout <= std::chrono::seconds{0})
        {
            throw std::invalid_argument("Connect timeout must be positive");
        }
        if (config.max_sessions < 1)
        {
            throw std::invalid_argument("max_sessions must be at least 1");
        }
        if (config.max_preview_size == 0)
        {
            throw std::invalid_argument("max_preview_size must be positive");
        }
        if (config.save_history && config.max_history < 1)
        {
            throw std::invalid_argument("max_history must be at least 1 when history is saved");
        }
        parse_log_level(config.log_level);
    }

} // namespace sftpgate::server
