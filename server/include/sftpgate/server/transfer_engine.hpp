#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sftpgate/protocol.hpp"
#include "sftpgate/server/remote_connection.hpp"
#include "sftpgate/server/session.hpp"

namespace sftpgate::server
{

    inline constexpr std::size_t kCopyBufferSize = 64 * 1024;

    using FileFilter = std::function<bool(const protocol::FileEntry &)>;

    // "images", "documents", "archives" and "code" select by extension; any other text is a
    // case-insensitive substring match on the name. Empty text yields an empty filter.
    FileFilter make_name_filter(std::string_view text);

    // A remote file opened for reading. Holds the session's connection for as long as it lives.
    class OpenedFile
    {
    public:
        OpenedFile(protocol::FileEntry entry, ConnectionLease lease, std::unique_ptr<RemoteReader> reader);

        const protocol::FileEntry &entry() const noexcept { return entry_; }

        // 0 means end of file.
        std::size_t read(std::span<std::byte> buffer);

    private:
        protocol::FileEntry entry_;
        ConnectionLease lease_;
        std::unique_ptr<RemoteReader> reader_;
    };

    struct PreviewResult
    {
        std::string content;
        std::string language;
        std::uint64_t size{};
    };

    struct BatchDeleteResult
    {
        std::vector<std::string> deleted;
        std::vector<std::string> failed;
    };

    // Every remote call goes through a ConnectionLease on the session. Failures surface as
    // GatewayError; the batch delete is the only operation that records failures instead.
    class TransferEngine
    {
    public:
        explicit TransferEngine(std::size_t buffer_size = kCopyBufferSize);

        std::vector<protocol::FileEntry> list_directory(Session &session, const std::string &path,
                                                        bool include_hidden, const FileFilter &filter = {}) const;

        OpenedFile open_file(Session &session, const std::string &path) const;

        void upload_file(Session &session, const std::string &path, std::istream &source, bool overwrite) const;

        void delete_entry(Session &session, const std::string &path) const;

        BatchDeleteResult delete_entries(Session &session, const std::vector<std::string> &paths) const;

        void make_directory(Session &session, const std::string &path) const;

        PreviewResult preview_file(Session &session, const std::string &path, std::uint64_t max_bytes) const;

        static std::vector<protocol::Breadcrumb> breadcrumbs(std::string_view path);

        static protocol::FileEntry to_file_entry(const std::string &full_path, const RemoteStat &stat);

    private:
        std::size_t buffer_size_;
    };

} // namespace sftpgate::server
