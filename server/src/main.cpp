#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sftpgate/server/config.hpp"
#include "sftpgate/server/server.hpp"
#include "sftpgate/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "sftpgate " << sftpgate::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] [--address <ADDRESS>] [--port <PORT>] [--threads <N>]\n"
                     "       [--session-timeout <DURATION>] [--max-sessions <N>] [--staging-dir <DIR>]\n"
                     "       [--upload-timeout <DURATION>] [--log <FILE>] [--log-level debug|info|warn|error]\n"
                     "Durations are seconds or a number with an s/m/h suffix. SFTPGATE_* environment variables\n"
                     "override the config file; flags override both.\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::size_t parse_count(const std::string &value, const std::string &flag)
    {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("Invalid value for " + flag + ": " + value);
        }
        return static_cast<std::size_t>(parsed);
    }

    void apply_flag(sftpgate::server::ServerConfig &config, const std::string &flag, const std::string &value)
    {
        if (flag == "--port")
        {
            const auto port = parse_count(value, flag);
            if (port > 65535)
            {
                throw std::invalid_argument("Port out of range: " + value);
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        else if (flag == "--address")
        {
            config.address = value;
        }
        else if (flag == "--threads")
        {
            config.worker_threads = parse_count(value, flag);
        }
        else if (flag == "--session-timeout")
        {
            config.session_timeout = sftpgate::server::parse_duration(value);
        }
        else if (flag == "--max-sessions")
        {
            config.max_sessions = parse_count(value, flag);
        }
        else if (flag == "--staging-dir")
        {
            config.staging_dir = std::filesystem::path(value);
        }
        else if (flag == "--upload-timeout")
        {
            config.upload_timeout = sftpgate::server::parse_duration(value);
        }
        else if (flag == "--log")
        {
            config.log_file = std::filesystem::path(value);
        }
        else if (flag == "--log-level")
        {
            config.log_level = value;
        }
    }

    bool is_known_flag(const std::string &flag)
    {
        static const std::vector<std::string> kFlags{
            "--config", "--port", "--address", "--threads", "--session-timeout", "--max-sessions",
            "--staging-dir", "--upload-timeout", "--log", "--log-level"};
        for (const auto &known : kFlags)
        {
            if (known == flag)
            {
                return true;
            }
        }
        return false;
    }

} // namespace

int main(int argc, char *argv[])
{
    using sftpgate::server::Server;
    using sftpgate::server::ServerConfig;

    std::optional<std::filesystem::path> config_file;
    std::vector<std::pair<std::string, std::string>> flags;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (!is_known_flag(arg))
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (arg == "--config")
        {
            config_file = std::filesystem::path(*value);
        }
        else
        {
            flags.emplace_back(arg, std::move(*value));
        }
    }

    ServerConfig config;
    try
    {
        config = sftpgate::server::load_config(config_file, [](const char *name)
                                               { return std::getenv(name); });
        for (const auto &[flag, value] : flags)
        {
            apply_flag(config, flag, value);
        }
        sftpgate::server::validate_config(config);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("sftpgate", sinks.begin(), sinks.end());
        logger->set_level(sftpgate::server::parse_log_level(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting sftpgate {} on {}:{}", sftpgate::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
        spdlog::info("Server stopped");
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
