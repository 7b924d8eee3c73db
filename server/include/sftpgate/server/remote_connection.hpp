/**
 * sftpgate - Seam between the session core and whatever transport reaches the remote filesystem.
 *
 * Implementations report every failure by throwing GatewayError (RemoteIoError) or, for
 * ConnectionFactory::connect, ConnectionError. A RemoteConnection is not assumed to be safe for
 * concurrent use; callers serialize access (see Session::lease()).
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sftpgate::server
{

    struct RemoteStat
    {
        std::uint64_t size{};
        std::uint32_t mode{};
        std::int64_t modified_at{};
        bool is_directory{};
    };

    struct RemoteDirEntry
    {
        std::string name;
        RemoteStat stat;
    };

    class RemoteReader
    {
    public:
        virtual ~RemoteReader() = default;

        // Fills at most buffer.size() bytes; 0 means end of file.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    class RemoteWriter
    {
    public:
        virtual ~RemoteWriter() = default;

        virtual void write(std::span<const std::byte> data) = 0;

        // Flushes and releases the remote handle; must be called for the write to count as successful.
        virtual void close() = 0;
    };

    class RemoteConnection
    {
    public:
        virtual ~RemoteConnection() = default;

        virtual RemoteStat stat(const std::string &path) = 0;
        virtual std::unique_ptr<RemoteReader> open_read(const std::string &path) = 0;
        // Creates or truncates.
        virtual std::unique_ptr<RemoteWriter> create_write(const std::string &path) = 0;
        virtual void remove_file(const std::string &path) = 0;
        // Fails unless the directory is empty.
        virtual void remove_directory(const std::string &path) = 0;
        virtual void make_directory(const std::string &path) = 0;
        // Excludes "." and "..".
        virtual std::vector<RemoteDirEntry> list_directory(const std::string &path) = 0;
        virtual std::string working_directory() = 0;
        virtual void close() = 0;
    };

    struct ConnectionRequest
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::string credential;
        std::chrono::seconds timeout{30};
    };

    class ConnectionFactory
    {
    public:
        virtual ~ConnectionFactory() = default;

        virtual std::unique_ptr<RemoteConnection> connect(const ConnectionRequest &request) = 0;
    };

} // namespace sftpgate::server
