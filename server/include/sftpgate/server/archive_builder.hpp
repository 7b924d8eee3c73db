#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sftpgate/server/output_sink.hpp"
#include "sftpgate/server/remote_connection.hpp"
#include "sftpgate/server/session.hpp"
#include "sftpgate/server/transfer_engine.hpp"
#include "sftpgate/server/zip_writer.hpp"

namespace sftpgate::server
{

    struct SkippedEntry
    {
        std::string path;
        std::string reason;
    };

    // Result of placing one remote entry into the archive.
    struct EntryOutcome
    {
        enum class Kind
        {
            FileAdded,
            DirectoryAdded,
            Skipped
        };

        Kind kind{Kind::Skipped};
        std::string remote_path;
        std::string reason;

        static EntryOutcome file_added(std::string target);
        static EntryOutcome directory_added(std::string target);
        static EntryOutcome skipped(std::string target, std::string reason);
    };

    struct ArchiveReport
    {
        std::size_t files_added{};
        std::size_t directories_added{};
        std::vector<SkippedEntry> skipped;
        std::uint64_t bytes_written{};

        void record(const EntryOutcome &outcome);
    };

    // Streams the requested remote paths into one ZIP on `sink`. A path that cannot be read is
    // skipped and reported; only a failing sink or a session closed underneath aborts the build.
    class ArchiveBuilder
    {
    public:
        explicit ArchiveBuilder(std::size_t buffer_size = kCopyBufferSize);

        ArchiveReport build(Session &session, const std::vector<std::string> &paths, OutputSink &sink) const;

        // Top-level name used for a requested path; the root and "." become "archive".
        static std::string entry_name_for(const std::string &target);

    private:
        void add_path(Session &session, ZipWriter &zip, const std::string &target, ArchiveReport &report) const;

        EntryOutcome add_file(Session &session, ZipWriter &zip, const std::string &target,
                              const std::string &entry_name, const RemoteStat &stat) const;

        void add_tree(Session &session, ZipWriter &zip, const std::string &target, const std::string &entry_name,
                      const RemoteStat &stat, ArchiveReport &report) const;

        std::size_t buffer_size_;
    };

} // namespace sftpgate::server
