#include <zlib.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "fake_remote.hpp"
#include "sftpgate/server/archive_builder.hpp"
#include "sftpgate/server/errors.hpp"
#include "sftpgate/server/session_registry.hpp"
#include "sftpgate/server/zip_writer.hpp"

using namespace sftpgate;
using namespace sftpgate::server;
using sftpgate::testing::FakeClock;
using sftpgate::testing::FakeFactory;

namespace
{

    class MemorySink : public OutputSink
    {
    public:
        void write(std::span<const std::byte> data) override
        {
            bytes.insert(bytes.end(), data.begin(), data.end());
        }

        std::vector<std::byte> bytes;
    };

    // Accepts `limit` bytes, then behaves like a disconnected client.
    class FailingSink : public OutputSink
    {
    public:
        explicit FailingSink(std::size_t limit) : limit_(limit) {}

        void write(std::span<const std::byte> data) override
        {
            if (written_ + data.size() > limit_)
            {
                throw SinkError("client went away");
            }
            written_ += data.size();
        }

    private:
        std::size_t limit_;
        std::size_t written_{};
    };

    struct ZipEntry
    {
        std::uint16_t method{};
        std::uint32_t crc{};
        std::string content;
    };

    std::uint16_t read16(const std::vector<std::byte> &data, std::size_t at)
    {
        return static_cast<std::uint16_t>(std::to_integer<unsigned>(data.at(at)) |
                                          (std::to_integer<unsigned>(data.at(at + 1)) << 8));
    }

    std::uint32_t read32(const std::vector<std::byte> &data, std::size_t at)
    {
        return static_cast<std::uint32_t>(read16(data, at)) | (static_cast<std::uint32_t>(read16(data, at + 2)) << 16);
    }

    std::string inflate_raw(const std::vector<std::byte> &data, std::size_t offset, std::size_t size,
                            std::size_t expected)
    {
        std::string out(expected, '\0');
        if (expected == 0)
        {
            return out;
        }
        z_stream stream{};
        assert(::inflateInit2(&stream, -MAX_WBITS) == Z_OK);
        stream.next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(data.data() + offset));
        stream.avail_in = static_cast<uInt>(size);
        stream.next_out = reinterpret_cast<Bytef *>(out.data());
        stream.avail_out = static_cast<uInt>(out.size());
        const int rc = ::inflate(&stream, Z_FINISH);
        ::inflateEnd(&stream);
        assert(rc == Z_STREAM_END);
        return out;
    }

    // Reads the central directory the way an unzip tool would and inflates each file entry.
    std::map<std::string, ZipEntry> read_zip(const std::vector<std::byte> &data)
    {
        assert(data.size() >= 22);
        const auto end = data.size() - 22;
        assert(read32(data, end) == 0x06054b50);
        const auto count = read16(data, end + 10);
        const auto directory_offset = read32(data, end + 16);

        std::map<std::string, ZipEntry> entries;
        std::size_t at = directory_offset;
        for (std::uint16_t i = 0; i < count; ++i)
        {
            assert(read32(data, at) == 0x02014b50);
            ZipEntry entry;
            entry.method = read16(data, at + 10);
            entry.crc = read32(data, at + 16);
            const auto compressed = read32(data, at + 20);
            const auto uncompressed = read32(data, at + 24);
            const auto name_length = read16(data, at + 28);
            const auto extra_length = read16(data, at + 30);
            const auto comment_length = read16(data, at + 32);
            const auto local_offset = read32(data, at + 42);

            std::string name(name_length, '\0');
            for (std::size_t j = 0; j < name_length; ++j)
            {
                name[j] = static_cast<char>(data.at(at + 46 + j));
            }

            assert(read32(data, local_offset) == 0x04034b50);
            const auto local_data = local_offset + 30 + read16(data, local_offset + 26) + read16(data, local_offset + 28);
            if (entry.method == 8)
            {
                entry.content = inflate_raw(data, local_data, compressed, uncompressed);
                const auto crc = ::crc32(0L, reinterpret_cast<const Bytef *>(entry.content.data()),
                                         static_cast<uInt>(entry.content.size()));
                assert(crc == entry.crc);
            }
            entries.emplace(std::move(name), std::move(entry));
            at += 46 + name_length + extra_length + comment_length;
        }
        return entries;
    }

    bool contains_signature(const std::vector<std::byte> &data, std::uint32_t signature)
    {
        for (std::size_t i = 0; i + 4 <= data.size(); ++i)
        {
            if (read32(data, i) == signature)
            {
                return true;
            }
        }
        return false;
    }

    SessionCredentials alice()
    {
        return SessionCredentials{
            .host = "sftp.example.org",
            .port = 22,
            .username = "alice",
            .password = FakeFactory::kPassword,
        };
    }

    RegistryOptions options_for(FakeClock &clock)
    {
        return RegistryOptions{
            .session_timeout = std::chrono::seconds(600),
            .max_sessions = 4,
            .connect_timeout = std::chrono::seconds(5),
            .clock = clock.source(),
        };
    }

    void test_empty_archive()
    {
        MemorySink sink;
        ZipWriter zip(sink);
        zip.finish();
        zip.finish();
        assert(sink.bytes.size() == 22);
        assert(zip.bytes_written() == 22);
        assert(read_zip(sink.bytes).empty());
    }

    void test_partial_failure_is_reported()
    {
        FakeFactory factory;
        FakeClock clock;
        auto &tree = factory.tree();
        tree.add_directory("/home");
        tree.add_directory("/home/alice");
        tree.add_file("/home/alice/fileA.txt", "alpha alpha alpha alpha");
        tree.add_directory("/home/alice/dirB");
        tree.add_file("/home/alice/dirB/c.txt", "charlie");
        tree.add_file("/home/alice/dirB/d.txt", "delta");
        tree.fail_open("/home/alice/dirB/d.txt");

        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());

        MemorySink sink;
        const ArchiveBuilder builder;
        const auto report = builder.build(*session, {"fileA.txt", "dirB", "missing.bin"}, sink);

        assert(report.files_added == 2);
        assert(report.directories_added == 1);
        assert(report.skipped.size() == 2);
        assert(report.skipped[0].path == "/home/alice/dirB/d.txt");
        assert(report.skipped[1].path == "/home/alice/missing.bin");
        assert(report.bytes_written == sink.bytes.size());

        const auto entries = read_zip(sink.bytes);
        assert(entries.size() == 3);
        assert(entries.at("fileA.txt").content == "alpha alpha alpha alpha");
        assert(entries.contains("dirB/"));
        assert(entries.at("dirB/").method == 0);
        assert(entries.at("dirB/c.txt").content == "charlie");
        assert(!entries.contains("dirB/d.txt"));
        assert(!contains_signature(sink.bytes, 0x06064b50));
        assert(!contains_signature(sink.bytes, 0x07064b50));

        registry.close_all();
    }

    void test_read_failure_abandons_entry()
    {
        FakeFactory factory;
        FakeClock clock;
        auto &tree = factory.tree();
        tree.add_directory("/home");
        tree.add_directory("/home/alice");
        tree.add_file("/home/alice/broken.log", std::string(64, 'x'));
        tree.add_file("/home/alice/fine.txt", "fine");
        tree.fail_read("/home/alice/broken.log");

        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());

        MemorySink sink;
        const ArchiveBuilder builder(4);
        const auto report = builder.build(*session, {"broken.log", "fine.txt"}, sink);

        assert(report.files_added == 1);
        assert(report.skipped.size() == 1);
        assert(report.skipped[0].path == "/home/alice/broken.log");

        const auto entries = read_zip(sink.bytes);
        assert(entries.size() == 1);
        assert(entries.at("fine.txt").content == "fine");

        // The session stays usable after a skipped entry.
        assert(session->active());
        registry.close_all();
    }

    void test_unlistable_subtree_is_skipped()
    {
        FakeFactory factory;
        FakeClock clock;
        auto &tree = factory.tree();
        tree.add_directory("/data");
        tree.add_directory("/data/open");
        tree.add_file("/data/open/readme.md", "# hi");
        tree.add_directory("/data/locked");
        tree.add_file("/data/locked/secret.txt", "hidden");
        tree.fail_list("/data/locked");

        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());

        MemorySink sink;
        const ArchiveBuilder builder;
        const auto report = builder.build(*session, {"/data"}, sink);

        assert(report.directories_added == 2);
        assert(report.files_added == 1);
        assert(report.skipped.size() == 1);
        assert(report.skipped[0].path == "/data/locked");

        const auto entries = read_zip(sink.bytes);
        assert(entries.contains("data/"));
        assert(entries.contains("data/open/"));
        assert(entries.at("data/open/readme.md").content == "# hi");
        assert(!entries.contains("data/locked/"));
        assert(!entries.contains("data/locked/secret.txt"));

        registry.close_all();
    }

    void test_sink_abort_stops_build()
    {
        FakeFactory factory;
        FakeClock clock;
        auto &tree = factory.tree();
        tree.add_directory("/home");
        tree.add_directory("/home/alice");
        tree.add_file("/home/alice/one.bin", std::string(4096, 'a'));
        tree.add_file("/home/alice/two.bin", std::string(4096, 'b'));

        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());

        FailingSink sink(40);
        const ArchiveBuilder builder;
        std::optional<ErrorCode> code;
        try
        {
            (void)builder.build(*session, {"one.bin", "two.bin"}, sink);
        }
        catch (const SinkError &error)
        {
            code = error.code();
        }
        assert(code == ErrorCode::StreamAborted);

        // The lease was released on the way out.
        assert(session->lease()->stat("/home/alice/two.bin").size == 4096);
        registry.close_all();
    }

    void test_root_archives_as_archive()
    {
        assert(ArchiveBuilder::entry_name_for("/") == "archive");
        assert(ArchiveBuilder::entry_name_for(".") == "archive");
        assert(ArchiveBuilder::entry_name_for("/home/alice/docs") == "docs");
        assert(ArchiveBuilder::entry_name_for("/home/alice/docs/") == "docs");

        FakeFactory factory;
        FakeClock clock;
        factory.tree().add_file("/top.txt", "top");
        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());

        MemorySink sink;
        const ArchiveBuilder builder;
        const auto report = builder.build(*session, {"/"}, sink);
        assert(report.directories_added == 1);
        const auto entries = read_zip(sink.bytes);
        assert(entries.contains("archive/"));
        assert(entries.at("archive/top.txt").content == "top");

        registry.close_all();
    }

    void test_closed_session_aborts_build()
    {
        FakeFactory factory;
        FakeClock clock;
        factory.tree().add_file("/top.txt", "top");
        SessionRegistry registry(factory, options_for(clock));
        const auto session = registry.create(alice());
        registry.remove(session->id());

        MemorySink sink;
        const ArchiveBuilder builder;
        std::optional<ErrorCode> code;
        try
        {
            (void)builder.build(*session, {"/top.txt"}, sink);
        }
        catch (const GatewayError &error)
        {
            code = error.code();
        }
        assert(code == ErrorCode::Expired);
    }

} // namespace

void run_archive_tests()
{
    test_empty_archive();
    test_partial_failure_is_reported();
    test_read_failure_abandons_entry();
    test_unlistable_subtree_is_skipped();
    test_sink_abort_stops_build();
    test_root_archives_as_archive();
    test_closed_session_aborts_build();
}
