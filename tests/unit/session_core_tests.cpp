#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "fake_remote.hpp"
#include "sftpgate/server/errors.hpp"
#include "sftpgate/server/expiry_sweeper.hpp"
#include "sftpgate/server/session_registry.hpp"
#include "sftpgate/server/transfer_engine.hpp"

using namespace sftpgate;
using namespace sftpgate::server;
using sftpgate::testing::FakeClock;
using sftpgate::testing::FakeFactory;

namespace
{

    SessionCredentials alice()
    {
        return SessionCredentials{
            .host = "sftp.example.org",
            .port = 22,
            .username = "alice",
            .password = FakeFactory::kPassword,
        };
    }

    RegistryOptions options_with(FakeClock &clock, std::size_t max_sessions, std::chrono::seconds timeout)
    {
        return RegistryOptions{
            .session_timeout = timeout,
            .max_sessions = max_sessions,
            .connect_timeout = std::chrono::seconds(5),
            .clock = clock.source(),
        };
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

    void test_registry_create_and_get()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));

        const auto session = registry.create(alice());
        assert(session->id().size() == 32);
        assert(session->home_directory() == "/home/alice");
        assert(session->username() == "alice");
        assert(session->host() == "sftp.example.org");
        assert(session->active());
        assert(registry.get(session->id()) == session);

        const auto other = registry.create(alice());
        assert(other->id() != session->id());
        assert(registry.list().size() == 2);

        auto wrong = alice();
        wrong.password = "nope";
        assert(error_of([&]
                        { registry.create(wrong); }) == ErrorCode::ConnectionError);

        auto missing_host = alice();
        missing_host.host.clear();
        assert(error_of([&]
                        { registry.create(missing_host); }) == ErrorCode::InvalidPayload);
        assert(factory.connects() == 3);

        assert(error_of([&]
                        { registry.get("does-not-exist"); }) == ErrorCode::NotFound);

        const auto stats = registry.stats();
        assert(stats.active_sessions == 2);
        assert(stats.total_sessions == 2);
    }

    void test_session_resolves_paths()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());

        assert(session->resolve("") == "/home/alice");
        assert(session->resolve("docs/../notes.txt") == "/home/alice/notes.txt");
        assert(session->resolve("/etc//hosts") == "/etc/hosts");
        assert(session->resolve("../..") == "/");
    }

    void test_home_directory_fallback()
    {
        FakeFactory factory;
        factory.set_home("");
        factory.tree().add_directory("/home");
        factory.tree().add_directory("/home/alice");
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));

        assert(registry.create(alice())->home_directory() == "/home/alice");

        auto bob = alice();
        bob.username = "bob";
        assert(registry.create(bob)->home_directory() == "/");
    }

    void test_registry_capacity_sequential()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 2, std::chrono::seconds(60)));

        registry.create(alice());
        registry.create(alice());
        assert(error_of([&]
                        { registry.create(alice()); }) == ErrorCode::CapacityExceeded);
        // Rejected before a connection is attempted.
        assert(factory.connects() == 2);

        // Once both are idle past the timeout the slot is reclaimed.
        clock.advance(std::chrono::seconds(61));
        const auto fresh = registry.create(alice());
        assert(fresh->active());
        assert(registry.stats().total_sessions <= 2);
        assert(factory.closes() == 2);
    }

    void test_registry_capacity_concurrent()
    {
        FakeFactory factory;
        factory.set_connect_delay(std::chrono::milliseconds(20));
        FakeClock clock;
        constexpr std::size_t kMax = 3;
        SessionRegistry registry(factory, options_with(clock, kMax, std::chrono::seconds(600)));

        std::atomic<int> created{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 12; ++i)
        {
            threads.emplace_back([&]
                                 {
                try
                {
                    registry.create(alice());
                    ++created;
                }
                catch (const GatewayError &error)
                {
                    assert(error.code() == ErrorCode::CapacityExceeded);
                    ++rejected;
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        assert(created.load() == static_cast<int>(kMax));
        assert(rejected.load() == 12 - static_cast<int>(kMax));
        assert(registry.stats().total_sessions == kMax);
        // Connections opened but refused at insert time were closed again.
        assert(factory.closes() == factory.connects() - static_cast<int>(kMax));
    }

    void test_registry_expiry_and_refresh()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto id = registry.create(alice())->id();

        clock.advance(std::chrono::seconds(59));
        registry.get(id);
        clock.advance(std::chrono::seconds(59));
        registry.get(id);
        assert(registry.sweep_expired() == 0);

        clock.advance(std::chrono::seconds(60));
        assert(error_of([&]
                        { registry.get(id); }) == ErrorCode::Expired);
        assert(registry.list().empty());
        assert(registry.stats().active_sessions == 0);
        assert(registry.stats().total_sessions == 1);

        assert(registry.sweep_expired() == 1);
        assert(error_of([&]
                        { registry.get(id); }) == ErrorCode::NotFound);
        assert(factory.closes() == 1);
    }

    void test_registry_remove_is_idempotent()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());
        const auto id = session->id();

        registry.remove(id);
        assert(error_of([&]
                        { registry.remove(id); }) == ErrorCode::NotFound);
        assert(factory.closes() == 1);
        assert(!session->active());
        assert(!session->close());
        assert(factory.closes() == 1);
        assert(error_of([&]
                        { session->lease(); }) == ErrorCode::Expired);
    }

    void test_busy_session_survives_sweep()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());

        {
            auto lease = session->lease();
            assert(session->busy());
            clock.advance(std::chrono::seconds(120));
            assert(registry.sweep_expired() == 0);
            assert(!session->idle_expired(clock.now(), std::chrono::seconds(60)));
        }
        assert(!session->busy());
        // Releasing the lease counted as activity.
        assert(session->last_access() == clock.now());
        assert(registry.get(session->id()) == session);
        assert(factory.closes() == 0);
    }

    void test_sweep_races_with_get()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 64, std::chrono::seconds(60)));

        std::vector<std::string> ids;
        for (int i = 0; i < 32; ++i)
        {
            ids.push_back(registry.create(alice())->id());
        }
        // Half of the sessions stay fresh.
        clock.advance(std::chrono::seconds(30));
        for (std::size_t i = 0; i < ids.size(); i += 2)
        {
            registry.get(ids[i]);
        }
        clock.advance(std::chrono::seconds(31));

        std::atomic<bool> inactive_returned{false};
        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t)
        {
            readers.emplace_back([&]
                                 {
                for (int round = 0; round < 50; ++round)
                {
                    for (const auto &id : ids)
                    {
                        try
                        {
                            const auto session = registry.get(id);
                            if (!session->active())
                            {
                                inactive_returned = true;
                            }
                        }
                        catch (const GatewayError &error)
                        {
                            assert(error.code() == ErrorCode::Expired || error.code() == ErrorCode::NotFound);
                        }
                    }
                } });
        }
        std::size_t swept = 0;
        for (int round = 0; round < 20; ++round)
        {
            swept += registry.sweep_expired();
        }
        for (auto &reader : readers)
        {
            reader.join();
        }

        assert(!inactive_returned.load());
        assert(swept == 16);
        assert(registry.stats().total_sessions == 16);
        assert(factory.closes() == 16);
    }

    void test_close_all()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto first = registry.create(alice());
        registry.create(alice());

        registry.close_all();
        assert(registry.stats().total_sessions == 0);
        assert(!first->active());
        assert(factory.closes() == 2);
    }

    void test_expiry_sweeper_runs_on_its_own_thread()
    {
        FakeFactory factory;
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        registry.create(alice());
        registry.create(alice());
        const auto pinned = registry.create(alice());

        ExpirySweeper sweeper(registry, std::chrono::milliseconds(10));
        std::atomic<int> task_runs{0};
        sweeper.add_task([&]
                         { ++task_runs; });
        sweeper.add_task([]
                         { throw std::runtime_error("housekeeping failed"); });

        assert(sweeper.run_once() == 0);
        assert(task_runs.load() == 1);

        // The caller's thread stays blocked holding a lease, as a long download would; nothing
        // here drives an io_context, yet the idle sessions are still evicted.
        auto lease = pinned->lease();
        clock.advance(std::chrono::seconds(61));
        sweeper.start();
        assert(sweeper.running());

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (registry.stats().total_sessions != 1 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(registry.stats().total_sessions == 1);
        assert(factory.closes() == 2);
        assert(pinned->active());

        sweeper.stop();
        sweeper.stop();
        assert(!sweeper.running());
        assert(task_runs.load() >= 2);
    }

    void populate_home(FakeFactory &factory)
    {
        auto &tree = factory.tree();
        tree.add_directory("/home");
        tree.add_directory("/home/alice");
        tree.add_directory("/home/alice/zeta");
        tree.add_directory("/home/alice/Alpha");
        tree.add_file("/home/alice/b.txt", "bravo");
        tree.add_file("/home/alice/A.png", "png-bytes");
        tree.add_file("/home/alice/.hidden", "secret");
        tree.add_file("/home/alice/script.py", "print('hi')\n");
        tree.add_file("/home/alice/Alpha/inner.txt", "inner");
    }

    std::vector<std::string> names_of(const std::vector<protocol::FileEntry> &entries)
    {
        std::vector<std::string> names;
        for (const auto &entry : entries)
        {
            names.push_back(entry.name);
        }
        return names;
    }

    void test_engine_listing()
    {
        FakeFactory factory;
        populate_home(factory);
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());
        const TransferEngine engine;

        const auto entries = engine.list_directory(*session, "", false);
        const std::vector<std::string> expected{"Alpha", "zeta", "A.png", "b.txt", "script.py"};
        assert(names_of(entries) == expected);
        assert(entries[0].is_directory);
        assert(entries[0].full_path == "/home/alice/Alpha");
        assert(entries[3].size == 5);

        const auto with_hidden = engine.list_directory(*session, "/home/alice", true);
        assert(with_hidden.size() == expected.size() + 1);
        assert(with_hidden[2].name == ".hidden");

        assert(names_of(engine.list_directory(*session, "", false, make_name_filter("images"))) ==
               std::vector<std::string>{"A.png"});
        assert(names_of(engine.list_directory(*session, "", false, make_name_filter("code"))) ==
               std::vector<std::string>{"script.py"});
        assert(names_of(engine.list_directory(*session, "", false, make_name_filter("TXT"))) ==
               std::vector<std::string>{"b.txt"});
        assert(!make_name_filter(""));

        assert(error_of([&]
                        { engine.list_directory(*session, "missing", false); }) == ErrorCode::RemoteIoError);

        const auto crumbs = TransferEngine::breadcrumbs("/home/alice/Alpha");
        assert(crumbs.size() == 4);
        assert(crumbs.back().path == "/home/alice/Alpha");
    }

    void test_engine_open_and_preview()
    {
        FakeFactory factory;
        populate_home(factory);
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());
        const TransferEngine engine;

        {
            auto file = engine.open_file(*session, "b.txt");
            assert(file.entry().name == "b.txt");
            assert(file.entry().size == 5);
            assert(session->busy());
            std::vector<std::byte> buffer(16);
            const auto count = file.read(buffer);
            assert(count == 5);
            assert(static_cast<char>(buffer[0]) == 'b');
            assert(file.read(buffer) == 0);
        }
        assert(!session->busy());

        assert(error_of([&]
                        { engine.open_file(*session, "Alpha"); }) == ErrorCode::NotAFile);

        const auto preview = engine.preview_file(*session, "script.py", 1024);
        assert(preview.content == "print('hi')\n");
        assert(preview.language == "python");
        assert(preview.size == 12);

        assert(engine.preview_file(*session, "b.txt", 1024).language == "text");
        assert(error_of([&]
                        { engine.preview_file(*session, "script.py", 4); }) == ErrorCode::TooLarge);
        assert(error_of([&]
                        { engine.preview_file(*session, "Alpha", 1024); }) == ErrorCode::NotAFile);

        // A generous cap must not cost memory up front.
        factory.tree().add_file("/home/alice/tiny.py", "x=1\n");
        const auto tiny = engine.preview_file(*session, "tiny.py", std::uint64_t{1} << 44);
        assert(tiny.content == "x=1\n");
        assert(tiny.size == 4);
        assert(tiny.language == "python");
    }

    void test_engine_upload_delete_mkdir()
    {
        FakeFactory factory;
        populate_home(factory);
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());
        const TransferEngine engine(4);
        auto &tree = factory.tree();

        std::istringstream fresh("uploaded content");
        engine.upload_file(*session, "new.txt", fresh, false);
        assert(tree.content("/home/alice/new.txt") == "uploaded content");

        std::istringstream clash("other");
        assert(error_of([&]
                        { engine.upload_file(*session, "b.txt", clash, false); }) == ErrorCode::AlreadyExists);
        assert(tree.content("/home/alice/b.txt") == "bravo");

        std::istringstream replacement("replaced");
        engine.upload_file(*session, "b.txt", replacement, true);
        assert(tree.content("/home/alice/b.txt") == "replaced");

        engine.make_directory(*session, "fresh");
        assert(tree.exists("/home/alice/fresh"));
        assert(error_of([&]
                        { engine.make_directory(*session, "fresh"); }) == ErrorCode::RemoteIoError);

        engine.delete_entry(*session, "fresh");
        assert(!tree.exists("/home/alice/fresh"));
        assert(error_of([&]
                        { engine.delete_entry(*session, "Alpha"); }) == ErrorCode::RemoteIoError);

        const auto result = engine.delete_entries(*session, {"/home/alice/new.txt", "/home/alice/absent",
                                                             "/home/alice/Alpha/inner.txt", "/home/alice/Alpha"});
        assert((result.deleted == std::vector<std::string>{"/home/alice/new.txt", "/home/alice/Alpha/inner.txt",
                                                           "/home/alice/Alpha"}));
        assert(result.failed == std::vector<std::string>{"/home/alice/absent"});
        assert(!tree.exists("/home/alice/Alpha"));
    }

    void test_engine_on_closed_session()
    {
        FakeFactory factory;
        populate_home(factory);
        FakeClock clock;
        SessionRegistry registry(factory, options_with(clock, 10, std::chrono::seconds(60)));
        const auto session = registry.create(alice());
        const TransferEngine engine;
        registry.remove(session->id());

        assert(error_of([&]
                        { engine.list_directory(*session, "", false); }) == ErrorCode::Expired);
        assert(error_of([&]
                        { engine.delete_entries(*session, {"/home/alice/b.txt"}); }) == ErrorCode::Expired);
        assert(factory.tree().exists("/home/alice/b.txt"));
    }

} // namespace

void run_session_core_tests()
{
    test_registry_create_and_get();
    test_session_resolves_paths();
    test_home_directory_fallback();
    test_registry_capacity_sequential();
    test_registry_capacity_concurrent();
    test_registry_expiry_and_refresh();
    test_registry_remove_is_idempotent();
    test_busy_session_survives_sweep();
    test_sweep_races_with_get();
    test_close_all();
    test_expiry_sweeper_runs_on_its_own_thread();
    test_engine_listing();
    test_engine_open_and_preview();
    test_engine_upload_delete_mkdir();
    test_engine_on_closed_session();
}
