#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftpgate/crypto.hpp"
#include "sftpgate/server/config.hpp"
#include "sftpgate/server/errors.hpp"
#include "sftpgate/server/login_history.hpp"
#include "sftpgate/server/upload_staging.hpp"

using namespace sftpgate;
using namespace sftpgate::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

    template <typename Fn>
    std::optional<ErrorCode> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const GatewayError &error)
        {
            return error.code();
        }
        return std::nullopt;
    }

    void test_upload_staging_basic()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_staging_test";
        cleanup_path(temp_root);

        UploadStaging staging(temp_root, 3);
        auto state = staging.begin("session-a", "/home/alice/file.bin", 6, false);
        assert(state.bytes_written == 0);
        assert(state.chunk_size == 3);
        assert(std::filesystem::exists(state.spool_path));

        const auto chunk1 = bytes_of("abc");
        const auto chunk2 = bytes_of("def");
        assert(staging.append_chunk("session-a", state.transfer_id, 0, chunk1, crypto::hash_bytes(chunk1)) == 3);
        assert(staging.append_chunk("session-a", state.transfer_id, 3, chunk2, crypto::hash_bytes(chunk2)) == 6);

        const auto final_hash = crypto::hash_bytes(bytes_of("abcdef"));
        const auto completed = staging.take_completed("session-a", state.transfer_id, final_hash);
        assert(completed.remote_path == "/home/alice/file.bin");
        assert(completed.bytes_written == 6);
        assert(!staging.find(state.transfer_id).has_value());

        std::ifstream in(completed.spool_path, std::ios::binary);
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content == "abcdef");
        in.close();

        UploadStaging::release(completed);
        assert(!std::filesystem::exists(completed.spool_path));

        cleanup_path(temp_root);
    }

    void test_upload_staging_rejects_bad_chunks()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_staging_reject_test";
        cleanup_path(temp_root);

        UploadStaging staging(temp_root, 4);
        auto state = staging.begin("session-a", "/tmp/out.txt", 4, true);
        const auto chunk = bytes_of("wxyz");
        const auto hash = crypto::hash_bytes(chunk);

        // Another session cannot see the transfer.
        assert(error_of([&]
                        { staging.append_chunk("session-b", state.transfer_id, 0, chunk, hash); }) == ErrorCode::NotFound);
        assert(error_of([&]
                        { staging.append_chunk("session-a", state.transfer_id, 2, chunk, hash); }) == ErrorCode::InvalidPayload);
        assert(error_of([&]
                        { staging.append_chunk("session-a", state.transfer_id, 0, chunk, "bad-hash"); }) ==
               ErrorCode::InvalidPayload);

        const auto too_long = bytes_of("wxyz!");
        assert(error_of([&]
                        { staging.append_chunk("session-a", state.transfer_id, 0, too_long,
                                               crypto::hash_bytes(too_long)); }) == ErrorCode::InvalidPayload);

        // Incomplete commit keeps the transfer alive.
        assert(error_of([&]
                        { staging.take_completed("session-a", state.transfer_id, hash); }) == ErrorCode::InvalidPayload);
        assert(staging.find(state.transfer_id).has_value());

        staging.append_chunk("session-a", state.transfer_id, 0, chunk, hash);
        assert(error_of([&]
                        { staging.take_completed("session-a", state.transfer_id, "wrong"); }) == ErrorCode::InvalidPayload);
        assert(!staging.find(state.transfer_id).has_value());
        assert(!std::filesystem::exists(state.spool_path));

        cleanup_path(temp_root);
    }

    void test_upload_staging_cleanup()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_staging_cleanup_test";
        cleanup_path(temp_root);

        UploadStaging staging(temp_root);
        assert(staging.chunk_size() == kDefaultUploadChunkSize);
        const auto first = staging.begin("session-a", "/a", 10, false);
        const auto second = staging.begin("session-b", "/b", 10, false);
        assert(first.transfer_id != second.transfer_id);

        assert(staging.discard_for_session("session-a") == 1);
        assert(!staging.find(first.transfer_id).has_value());
        assert(!std::filesystem::exists(first.spool_path));
        assert(staging.find(second.transfer_id).has_value());

        assert(staging.cleanup_expired(std::chrono::hours(1)) == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(1100));
        assert(staging.cleanup_expired(std::chrono::seconds(1)) == 1);
        assert(!staging.find(second.transfer_id).has_value());
        assert(!std::filesystem::exists(second.spool_path));

        cleanup_path(temp_root);
    }

    void test_login_history_order_and_persistence()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_history_test";
        cleanup_path(temp_root);
        const auto file = temp_root / "history.json";

        {
            LoginHistory history(file, 2);
            assert(history.entries().empty());
            history.record("alpha.example", 22, "alice", true);
            history.record("beta.example", 2222, "bob", false);
            history.record("alpha.example", 22, "alice", true);

            const auto entries = history.entries();
            assert(entries.size() == 2);
            assert(entries[0].host == "alpha.example");
            assert(entries[1].host == "beta.example");

            history.record("gamma.example", 22, "carol", true);
            const auto truncated = history.entries();
            assert(truncated.size() == 2);
            assert(truncated[0].host == "gamma.example");
            assert(truncated[1].host == "alpha.example");

            const auto successful = history.successful_entries();
            assert(successful.size() == 2);
        }

        assert(std::filesystem::exists(file));
        {
            LoginHistory reloaded(file, 10);
            const auto entries = reloaded.entries();
            assert(entries.size() == 2);
            assert(entries[0].host == "gamma.example");
            assert(reloaded.remove("gamma.example", 22, "carol"));
            assert(!reloaded.remove("gamma.example", 22, "carol"));
            reloaded.clear();
            assert(reloaded.entries().empty());
        }
        {
            LoginHistory cleared(file, 10);
            assert(cleared.entries().empty());
        }

        cleanup_path(temp_root);
    }

    void test_login_history_load_sorts_and_tolerates_garbage()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_history_load_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        const auto file = temp_root / "history.json";

        {
            std::ofstream out(file);
            out << R"([{"host":"old","port":22,"username":"u","last_used":100,"success":true},
                       {"host":"new","port":22,"username":"u","last_used":300,"success":false},
                       {"host":"mid","port":22,"username":"u","last_used":200,"success":true}])";
        }
        {
            LoginHistory history(file, 2);
            const auto entries = history.entries();
            assert(entries.size() == 2);
            assert(entries[0].host == "new");
            assert(entries[1].host == "mid");
        }

        {
            std::ofstream out(file, std::ios::trunc);
            out << "{ not json";
        }
        {
            LoginHistory history(file, 5);
            assert(history.entries().empty());
        }
        {
            LoginHistory disabled(file, 5, false);
            disabled.record("host", 22, "user", true);
            assert(disabled.entries().empty());
        }

        cleanup_path(temp_root);
    }

    void test_config_file_and_environment()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "sftpgate_config_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        const auto file = temp_root / "sftpgate.json";
        {
            std::ofstream out(file);
            out << R"({
                "server": {"host": "127.0.0.1", "port": 9000, "threads": 3},
                "session": {"timeout": "15m", "cleanup_interval": 60, "max_sessions": 7, "save_history": false},
                "transfer": {"staging_dir": "/var/tmp/sftpgate", "max_preview_size": 2048},
                "logging": {"level": "debug"}
            })";
        }

        std::map<std::string, std::string> environment{
            {"SFTPGATE_PORT", "9100"},
            {"SFTPGATE_MAX_SESSIONS", "12"},
        };
        const EnvironmentLookup lookup = [&](const char *name) -> const char *
        {
            const auto it = environment.find(name);
            return it == environment.end() ? nullptr : it->second.c_str();
        };

        auto config = load_config(file, lookup);
        assert(config.address == "127.0.0.1");
        assert(config.port == 9100);
        assert(config.worker_threads == 3);
        assert(config.session_timeout == std::chrono::minutes(15));
        assert(config.cleanup_interval == std::chrono::seconds(60));
        assert(config.max_sessions == 12);
        assert(!config.save_history);
        assert(config.staging_dir == std::filesystem::path("/var/tmp/sftpgate"));
        assert(config.max_preview_size == 2048);
        assert(config.log_level == "debug");
        validate_config(config);

        const auto missing = load_config(temp_root / "absent.json", lookup);
        assert(missing.address == "0.0.0.0");
        assert(missing.port == 9100);

        {
            std::ofstream out(file, std::ios::trunc);
            out << R"({"server": {"port": "not a number"}})";
        }
        bool threw = false;
        try
        {
            (void)load_config(file, lookup);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        environment["SFTPGATE_SESSION_TIMEOUT"] = "soon";
        threw = false;
        try
        {
            (void)load_config(std::nullopt, lookup);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        cleanup_path(temp_root);
    }

    void test_config_validation()
    {
        const auto rejects = [](const ServerConfig &config)
        {
            try
            {
                validate_config(config);
            }
            catch (const std::invalid_argument &)
            {
                return true;
            }
            return false;
        };

        ServerConfig config;
        assert(!rejects(config));

        auto bad = config;
        bad.port = 0;
        assert(rejects(bad));

        bad = config;
        bad.session_timeout = std::chrono::seconds(0);
        assert(rejects(bad));

        bad = config;
        bad.max_sessions = 0;
        assert(rejects(bad));

        bad = config;
        bad.cleanup_interval = std::chrono::seconds(0);
        assert(rejects(bad));

        bad = config;
        bad.max_preview_size = 0;
        assert(rejects(bad));

        bad = config;
        bad.log_level = "verbose";
        assert(rejects(bad));

        assert(parse_duration("90") == std::chrono::seconds(90));
        assert(parse_duration("30m") == std::chrono::minutes(30));
        assert(parse_duration("2h") == std::chrono::hours(2));
        assert(parse_log_level("warn") == spdlog::level::warn);
    }

} // namespace

void run_server_component_tests()
{
    test_upload_staging_basic();
    test_upload_staging_rejects_bad_chunks();
    test_upload_staging_cleanup();
    test_login_history_order_and_persistence();
    test_login_history_load_sorts_and_tolerates_garbage();
    test_config_file_and_environment();
    test_config_validation();
}
