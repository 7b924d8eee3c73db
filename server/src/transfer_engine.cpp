#include "sftpgate/server/transfer_engine.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

#include "sftpgate/file_types.hpp"
#include "sftpgate/remote_path.hpp"
#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        bool less_by_kind_then_name(const protocol::FileEntry &lhs, const protocol::FileEntry &rhs)
        {
            if (lhs.is_directory != rhs.is_directory)
            {
                return lhs.is_directory;
            }
            return file_types::to_lower(lhs.name) < file_types::to_lower(rhs.name);
        }

    } // namespace

    FileFilter make_name_filter(std::string_view text)
    {
        if (text.empty())
        {
            return {};
        }
        const auto needle = file_types::to_lower(text);
        if (needle == "images")
        {
            return [](const protocol::FileEntry &entry)
            { return file_types::is_image_extension(remote_path::extension(entry.name)); };
        }
        if (needle == "documents")
        {
            return [](const protocol::FileEntry &entry)
            { return file_types::is_document_extension(remote_path::extension(entry.name)); };
        }
        if (needle == "archives")
        {
            return [](const protocol::FileEntry &entry)
            { return file_types::is_archive_extension(remote_path::extension(entry.name)); };
        }
        if (needle == "code")
        {
            return [](const protocol::FileEntry &entry)
            { return file_types::is_code_extension(remote_path::extension(entry.name)); };
        }
        return [needle](const protocol::FileEntry &entry)
        { return file_types::to_lower(entry.name).find(needle) != std::string::npos; };
    }

    OpenedFile::OpenedFile(protocol::FileEntry entry, ConnectionLease lease, std::unique_ptr<RemoteReader> reader)
        : entry_(std::move(entry)), lease_(std::move(lease)), reader_(std::move(reader)) {}

    std::size_t OpenedFile::read(std::span<std::byte> buffer)
    {
        return reader_->read(buffer);
    }

    TransferEngine::TransferEngine(std::size_t buffer_size)
        : buffer_size_(buffer_size == 0 ? kCopyBufferSize : buffer_size) {}

    std::vector<protocol::FileEntry> TransferEngine::list_directory(Session &session, const std::string &path,
                                                                    bool include_hidden, const FileFilter &filter) const
    {
        const auto directory = session.resolve(path);

        std::vector<RemoteDirEntry> raw;
        {
            auto lease = session.lease();
            raw = lease->list_directory(directory);
        }

        std::vector<protocol::FileEntry> entries;
        entries.reserve(raw.size());
        for (const auto &item : raw)
        {
            if (!include_hidden && remote_path::is_hidden_name(item.name))
            {
                continue;
            }
            auto entry = to_file_entry(remote_path::join(directory, item.name), item.stat);
            entry.name = item.name;
            if (filter && !filter(entry))
            {
                continue;
            }
            entries.push_back(std::move(entry));
        }
        std::sort(entries.begin(), entries.end(), less_by_kind_then_name);
        return entries;
    }

    OpenedFile TransferEngine::open_file(Session &session, const std::string &path) const
    {
        const auto target = session.resolve(path);
        auto lease = session.lease();
        const auto stat = lease->stat(target);
        if (stat.is_directory)
        {
            throw GatewayError(sftpgate::ErrorCode::NotAFile, "Path is a directory", target);
        }
        auto reader = lease->open_read(target);
        return OpenedFile(to_file_entry(target, stat), std::move(lease), std::move(reader));
    }

    void TransferEngine::upload_file(Session &session, const std::string &path, std::istream &source,
                                     bool overwrite) const
    {
        const auto target = session.resolve(path);
        auto lease = session.lease();

        if (!overwrite)
        {
            // Check-then-create: a concurrent uploader to the same path can still win the race.
            bool exists = false;
            try
            {
                lease->stat(target);
                exists = true;
            }
            catch (const GatewayError &)
            {
                exists = false;
            }
            if (exists)
            {
                throw GatewayError(sftpgate::ErrorCode::AlreadyExists, "File already exists", target);
            }
        }

        auto writer = lease->create_write(target);
        std::vector<char> buffer(buffer_size_);
        std::uint64_t total = 0;
        while (source)
        {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = source.gcount();
            if (count <= 0)
            {
                break;
            }
            writer->write(std::as_bytes(std::span(buffer.data(), static_cast<std::size_t>(count))));
            total += static_cast<std::uint64_t>(count);
        }
        if (source.bad())
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError, "Failed to read upload source", target);
        }
        writer->close();
        spdlog::info("Session {} uploaded {} ({} bytes)", session.id(), target, total);
    }

    void TransferEngine::delete_entry(Session &session, const std::string &path) const
    {
        const auto target = session.resolve(path);
        auto lease = session.lease();
        const auto stat = lease->stat(target);
        if (stat.is_directory)
        {
            lease->remove_directory(target);
        }
        else
        {
            lease->remove_file(target);
        }
        spdlog::info("Session {} deleted {}", session.id(), target);
    }

    BatchDeleteResult TransferEngine::delete_entries(Session &session, const std::vector<std::string> &paths) const
    {
        BatchDeleteResult result;
        for (const auto &path : paths)
        {
            try
            {
                delete_entry(session, path);
                result.deleted.push_back(path);
            }
            catch (const GatewayError &ex)
            {
                if (ex.code() == sftpgate::ErrorCode::Expired)
                {
                    throw;
                }
                spdlog::warn("Session {} failed to delete {}: {}", session.id(), path, ex.what());
                result.failed.push_back(path);
            }
        }
        return result;
    }

    void TransferEngine::make_directory(Session &session, const std::string &path) const
    {
        const auto target = session.resolve(path);
        auto lease = session.lease();
        lease->make_directory(target);
        spdlog::info("Session {} created directory {}", session.id(), target);
    }

    PreviewResult TransferEngine::preview_file(Session &session, const std::string &path, std::uint64_t max_bytes) const
    {
        const auto target = session.resolve(path);
        auto lease = session.lease();
        const auto stat = lease->stat(target);
        if (stat.is_directory)
        {
            throw GatewayError(sftpgate::ErrorCode::NotAFile, "Cannot preview a directory", target);
        }
        if (stat.size > max_bytes)
        {
            throw GatewayError(sftpgate::ErrorCode::TooLarge,
                               "File too large for preview (" + std::to_string(stat.size) + " > " +
                                   std::to_string(max_bytes) + " bytes)",
                               target);
        }

        auto reader = lease->open_read(target);
        // Memory follows the bytes actually read; max_bytes only caps them.
        std::string content;
        content.reserve(static_cast<std::size_t>(std::min(stat.size, max_bytes)));
        std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(kCopyBufferSize, max_bytes)));
        while (content.size() < max_bytes)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), max_bytes - content.size()));
            const auto count = reader->read(std::span<std::byte>(buffer.data(), want));
            if (count == 0)
            {
                break;
            }
            content.append(reinterpret_cast<const char *>(buffer.data()), count);
        }

        return PreviewResult{
            .content = std::move(content),
            .language = file_types::language_for_extension(remote_path::extension(target)),
            .size = stat.size,
        };
    }

    std::vector<protocol::Breadcrumb> TransferEngine::breadcrumbs(std::string_view path)
    {
        return remote_path::breadcrumbs(path);
    }

    protocol::FileEntry TransferEngine::to_file_entry(const std::string &full_path, const RemoteStat &stat)
    {
        return protocol::FileEntry{
            .name = remote_path::base_name(full_path),
            .size = stat.size,
            .mode = stat.mode,
            .modified_at = stat.modified_at,
            .is_directory = stat.is_directory,
            .full_path = full_path,
        };
    }

} // namespace sftpgate::server
