#include "sftpgate/server/archive_builder.hpp"

#include <algorithm>
#include <memory>

#include <spdlog/spdlog.h>

#include "sftpgate/remote_path.hpp"
#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        // A dead sink or a session closed mid-walk ends the whole archive; anything else only
        // costs the entry being processed.
        void rethrow_if_fatal(const GatewayError &ex)
        {
            if (ex.code() == sftpgate::ErrorCode::StreamAborted || ex.code() == sftpgate::ErrorCode::Expired)
            {
                throw;
            }
        }

        void tally(ArchiveReport &report, const EntryOutcome &outcome)
        {
            if (outcome.kind == EntryOutcome::Kind::Skipped)
            {
                spdlog::warn("Archive skipped {}: {}", outcome.remote_path, outcome.reason);
            }
            report.record(outcome);
        }

    } // namespace

    EntryOutcome EntryOutcome::file_added(std::string target)
    {
        return EntryOutcome{.kind = Kind::FileAdded, .remote_path = std::move(target), .reason = {}};
    }

    EntryOutcome EntryOutcome::directory_added(std::string target)
    {
        return EntryOutcome{.kind = Kind::DirectoryAdded, .remote_path = std::move(target), .reason = {}};
    }

    EntryOutcome EntryOutcome::skipped(std::string target, std::string reason)
    {
        return EntryOutcome{.kind = Kind::Skipped, .remote_path = std::move(target), .reason = std::move(reason)};
    }

    void ArchiveReport::record(const EntryOutcome &outcome)
    {
        switch (outcome.kind)
        {
        case EntryOutcome::Kind::FileAdded:
            ++files_added;
            break;
        case EntryOutcome::Kind::DirectoryAdded:
            ++directories_added;
            break;
        case EntryOutcome::Kind::Skipped:
            skipped.push_back(SkippedEntry{.path = outcome.remote_path, .reason = outcome.reason});
            break;
        }
    }

    ArchiveBuilder::ArchiveBuilder(std::size_t buffer_size)
        : buffer_size_(buffer_size == 0 ? kCopyBufferSize : buffer_size) {}

    std::string ArchiveBuilder::entry_name_for(const std::string &target)
    {
        auto name = remote_path::base_name(target);
        if (name.empty() || name == "/" || name == "." || name == "..")
        {
            return "archive";
        }
        return name;
    }

    ArchiveReport ArchiveBuilder::build(Session &session, const std::vector<std::string> &paths,
                                        OutputSink &sink) const
    {
        ArchiveReport report;
        ZipWriter zip(sink);
        for (const auto &path : paths)
        {
            add_path(session, zip, session.resolve(path), report);
        }
        zip.finish();
        report.bytes_written = zip.bytes_written();

        spdlog::info("Session {} archived {} file(s), {} director(ies), {} skipped, {} bytes", session.id(),
                     report.files_added, report.directories_added, report.skipped.size(), report.bytes_written);
        return report;
    }

    void ArchiveBuilder::add_path(Session &session, ZipWriter &zip, const std::string &target,
                                  ArchiveReport &report) const
    {
        RemoteStat stat{};
        try
        {
            auto lease = session.lease();
            stat = lease->stat(target);
        }
        catch (const GatewayError &ex)
        {
            rethrow_if_fatal(ex);
            tally(report, EntryOutcome::skipped(target, ex.what()));
            return;
        }

        const auto name = entry_name_for(target);
        if (stat.is_directory)
        {
            add_tree(session, zip, target, name, stat, report);
        }
        else
        {
            tally(report, add_file(session, zip, target, name, stat));
        }
    }

    EntryOutcome ArchiveBuilder::add_file(Session &session, ZipWriter &zip, const std::string &target,
                                          const std::string &entry_name, const RemoteStat &stat) const
    {
        auto lease = session.lease();
        std::unique_ptr<RemoteReader> reader;
        try
        {
            reader = lease->open_read(target);
        }
        catch (const GatewayError &ex)
        {
            return EntryOutcome::skipped(target, ex.what());
        }

        zip.begin_file(entry_name, stat.modified_at, stat.mode, stat.size);
        std::vector<std::byte> buffer(buffer_size_);
        try
        {
            // Bounded by the size seen at stat time so the entry never outgrows its header.
            auto remaining = stat.size;
            while (remaining > 0)
            {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
                const auto count = reader->read(std::span<std::byte>(buffer.data(), want));
                if (count == 0)
                {
                    break;
                }
                zip.write(std::span<const std::byte>(buffer.data(), count));
                remaining -= count;
            }
        }
        catch (const SinkError &)
        {
            throw;
        }
        catch (const GatewayError &ex)
        {
            zip.abandon_file();
            return EntryOutcome::skipped(target, ex.what());
        }
        zip.end_file();
        return EntryOutcome::file_added(target);
    }

    void ArchiveBuilder::add_tree(Session &session, ZipWriter &zip, const std::string &target,
                                  const std::string &entry_name, const RemoteStat &stat, ArchiveReport &report) const
    {
        std::vector<RemoteDirEntry> children;
        try
        {
            auto lease = session.lease();
            children = lease->list_directory(target);
        }
        catch (const GatewayError &ex)
        {
            rethrow_if_fatal(ex);
            tally(report, EntryOutcome::skipped(target, ex.what()));
            return;
        }

        zip.add_directory(entry_name + "/", stat.modified_at, stat.mode);
        tally(report, EntryOutcome::directory_added(target));

        std::sort(children.begin(), children.end(), [](const RemoteDirEntry &lhs, const RemoteDirEntry &rhs)
                  { return lhs.name < rhs.name; });
        for (const auto &child : children)
        {
            const auto child_path = remote_path::join(target, child.name);
            const auto child_entry = entry_name + "/" + child.name;
            if (child.stat.is_directory)
            {
                add_tree(session, zip, child_path, child_entry, child.stat, report);
            }
            else
            {
                tally(report, add_file(session, zip, child_path, child_entry, child.stat));
            }
        }
    }

} // namespace sftpgate::server
