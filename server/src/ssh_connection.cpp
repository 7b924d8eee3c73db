#include "sftpgate/server/ssh_connection.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        void ensure_libssh2_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (libssh2_init(0) != 0)
                               {
                                   throw ConnectionError("libssh2 initialization failed");
                               } });
        }

        std::string session_error(LIBSSH2_SESSION *session)
        {
            char *message = nullptr;
            int length = 0;
            libssh2_session_last_error(session, &message, &length, 0);
            if (message == nullptr || length <= 0)
            {
                return "unknown libssh2 error";
            }
            return std::string(message, static_cast<std::size_t>(length));
        }

        std::string sftp_status_text(unsigned long status)
        {
            switch (status)
            {
            case LIBSSH2_FX_EOF:
                return "end of file";
            case LIBSSH2_FX_NO_SUCH_FILE:
                return "no such file";
            case LIBSSH2_FX_PERMISSION_DENIED:
                return "permission denied";
            case LIBSSH2_FX_FAILURE:
                return "failure";
            case LIBSSH2_FX_NO_SUCH_PATH:
                return "no such path";
            case LIBSSH2_FX_FILE_ALREADY_EXISTS:
                return "file already exists";
            case LIBSSH2_FX_WRITE_PROTECT:
                return "write protected";
            case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
                return "no space on filesystem";
            case LIBSSH2_FX_QUOTA_EXCEEDED:
                return "quota exceeded";
            case LIBSSH2_FX_DIR_NOT_EMPTY:
                return "directory not empty";
            case LIBSSH2_FX_NOT_A_DIRECTORY:
                return "not a directory";
            case LIBSSH2_FX_INVALID_FILENAME:
                return "invalid filename";
            default:
                return "sftp status " + std::to_string(status);
            }
        }

        RemoteStat to_remote_stat(const LIBSSH2_SFTP_ATTRIBUTES &attrs)
        {
            RemoteStat stat{};
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            {
                stat.size = attrs.filesize;
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            {
                stat.modified_at = static_cast<std::int64_t>(attrs.mtime);
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            {
                stat.mode = static_cast<std::uint32_t>(attrs.permissions);
                stat.is_directory = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
            }
            return stat;
        }

        int connect_socket(const std::string &host, std::uint16_t port, std::chrono::seconds timeout)
        {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo *results = nullptr;
            const auto port_string = std::to_string(port);
            if (const int rc = ::getaddrinfo(host.c_str(), port_string.c_str(), &hints, &results); rc != 0)
            {
                throw ConnectionError("Cannot resolve " + host + ": " + ::gai_strerror(rc));
            }

            std::string last_error = "no usable address";
            for (auto *candidate = results; candidate != nullptr; candidate = candidate->ai_next)
            {
                const int fd = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
                if (fd < 0)
                {
                    last_error = std::strerror(errno);
                    continue;
                }

                const int flags = ::fcntl(fd, F_GETFL, 0);
                ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
                int rc = ::connect(fd, candidate->ai_addr, candidate->ai_addrlen);
                if (rc != 0 && errno == EINPROGRESS)
                {
                    pollfd waiter{.fd = fd, .events = POLLOUT, .revents = 0};
                    rc = ::poll(&waiter, 1, static_cast<int>(std::chrono::milliseconds(timeout).count()));
                    if (rc == 0)
                    {
                        last_error = "connection timed out";
                        rc = -1;
                    }
                    else if (rc > 0)
                    {
                        int so_error = 0;
                        socklen_t length = sizeof(so_error);
                        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &length);
                        rc = so_error == 0 ? 0 : -1;
                        if (so_error != 0)
                        {
                            last_error = std::strerror(so_error);
                        }
                    }
                    else
                    {
                        last_error = std::strerror(errno);
                    }
                }
                else if (rc != 0)
                {
                    last_error = std::strerror(errno);
                }

                if (rc == 0)
                {
                    ::fcntl(fd, F_SETFL, flags);
                    ::freeaddrinfo(results);
                    return fd;
                }
                ::close(fd);
            }
            ::freeaddrinfo(results);
            throw ConnectionError("Cannot connect to " + host + ":" + port_string + ": " + last_error);
        }

        struct KeyboardInteractiveContext
        {
            const std::string *password;
        };

        void keyboard_interactive_callback(const char * /*name*/, int /*name_len*/, const char * /*instruction*/,
                                           int /*instruction_len*/, int num_prompts,
                                           const LIBSSH2_USERAUTH_KBDINT_PROMPT * /*prompts*/,
                                           LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses, void **abstract)
        {
            const auto *context = static_cast<const KeyboardInteractiveContext *>(*abstract);
            for (int i = 0; i < num_prompts; ++i)
            {
                // libssh2 frees each response with its default allocator
                auto *copy = static_cast<char *>(std::malloc(context->password->size() + 1));
                if (copy == nullptr)
                {
                    responses[i].text = nullptr;
                    responses[i].length = 0;
                    continue;
                }
                std::memcpy(copy, context->password->c_str(), context->password->size() + 1);
                responses[i].text = copy;
                responses[i].length = static_cast<unsigned int>(context->password->size());
            }
        }

        class SftpReader : public RemoteReader
        {
        public:
            SftpReader(LIBSSH2_SFTP_HANDLE *handle, std::string path)
                : handle_(handle), path_(std::move(path)) {}

            ~SftpReader() override
            {
                libssh2_sftp_close_handle(handle_);
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                const auto count = libssh2_sftp_read(handle_, reinterpret_cast<char *>(buffer.data()), buffer.size());
                if (count < 0)
                {
                    throw_remote_io("read failed for", path_, "libssh2 error " + std::to_string(count));
                }
                return static_cast<std::size_t>(count);
            }

        private:
            LIBSSH2_SFTP_HANDLE *handle_;
            std::string path_;
        };

        class SftpWriter : public RemoteWriter
        {
        public:
            SftpWriter(LIBSSH2_SFTP_HANDLE *handle, std::string path)
                : handle_(handle), path_(std::move(path)) {}

            ~SftpWriter() override
            {
                if (handle_ != nullptr)
                {
                    libssh2_sftp_close_handle(handle_);
                }
            }

            void write(std::span<const std::byte> data) override
            {
                const auto *cursor = reinterpret_cast<const char *>(data.data());
                std::size_t remaining = data.size();
                while (remaining > 0)
                {
                    const auto written = libssh2_sftp_write(handle_, cursor, remaining);
                    if (written < 0)
                    {
                        throw_remote_io("write failed for", path_, "libssh2 error " + std::to_string(written));
                    }
                    cursor += written;
                    remaining -= static_cast<std::size_t>(written);
                }
            }

            void close() override
            {
                auto *handle = std::exchange(handle_, nullptr);
                if (handle != nullptr && libssh2_sftp_close_handle(handle) != 0)
                {
                    throw_remote_io("close failed for", path_, "");
                }
            }

        private:
            LIBSSH2_SFTP_HANDLE *handle_;
            std::string path_;
        };

        class SftpConnection : public RemoteConnection
        {
        public:
            SftpConnection(int socket_fd, LIBSSH2_SESSION *session, LIBSSH2_SFTP *sftp)
                : socket_(socket_fd), session_(session), sftp_(sftp) {}

            ~SftpConnection() override
            {
                release();
            }

            RemoteStat stat(const std::string &path) override
            {
                LIBSSH2_SFTP_ATTRIBUTES attrs{};
                if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                         LIBSSH2_SFTP_STAT, &attrs) != 0)
                {
                    throw_remote_io("stat failed for", path, last_error());
                }
                return to_remote_stat(attrs);
            }

            std::unique_ptr<RemoteReader> open_read(const std::string &path) override
            {
                auto *handle = libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
                if (handle == nullptr)
                {
                    throw_remote_io("open failed for", path, last_error());
                }
                return std::make_unique<SftpReader>(handle, path);
            }

            std::unique_ptr<RemoteWriter> create_write(const std::string &path) override
            {
                auto *handle = libssh2_sftp_open_ex(
                    sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                    LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
                    LIBSSH2_SFTP_OPENFILE);
                if (handle == nullptr)
                {
                    throw_remote_io("create failed for", path, last_error());
                }
                return std::make_unique<SftpWriter>(handle, path);
            }

            void remove_file(const std::string &path) override
            {
                if (libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size())) != 0)
                {
                    throw_remote_io("remove failed for", path, last_error());
                }
            }

            void remove_directory(const std::string &path) override
            {
                if (libssh2_sftp_rmdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size())) != 0)
                {
                    throw_remote_io("rmdir failed for", path, last_error());
                }
            }

            void make_directory(const std::string &path) override
            {
                if (libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                          LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP |
                                              LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IXOTH) != 0)
                {
                    throw_remote_io("mkdir failed for", path, last_error());
                }
            }

            std::vector<RemoteDirEntry> list_directory(const std::string &path) override
            {
                auto *dir = libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), 0, 0,
                                                 LIBSSH2_SFTP_OPENDIR);
                if (dir == nullptr)
                {
                    throw_remote_io("opendir failed for", path, last_error());
                }

                std::vector<RemoteDirEntry> entries;
                std::array<char, 4096> name{};
                LIBSSH2_SFTP_ATTRIBUTES attrs{};
                for (;;)
                {
                    attrs = {};
                    const int rc = libssh2_sftp_readdir_ex(dir, name.data(), name.size(), nullptr, 0, &attrs);
                    if (rc == 0)
                    {
                        break;
                    }
                    if (rc < 0)
                    {
                        const auto cause = last_error();
                        libssh2_sftp_close_handle(dir);
                        throw_remote_io("readdir failed for", path, cause);
                    }
                    std::string entry_name(name.data(), static_cast<std::size_t>(rc));
                    if (entry_name == "." || entry_name == "..")
                    {
                        continue;
                    }
                    entries.push_back(RemoteDirEntry{.name = std::move(entry_name), .stat = to_remote_stat(attrs)});
                }
                libssh2_sftp_close_handle(dir);
                return entries;
            }

            std::string working_directory() override
            {
                std::array<char, 4096> buffer{};
                const int rc = libssh2_sftp_symlink_ex(sftp_, ".", 1, buffer.data(), buffer.size(),
                                                       LIBSSH2_SFTP_REALPATH);
                if (rc <= 0)
                {
                    throw_remote_io("realpath failed for", ".", last_error());
                }
                return std::string(buffer.data(), static_cast<std::size_t>(rc));
            }

            void close() override
            {
                if (session_ == nullptr)
                {
                    return;
                }
                int rc = 0;
                if (sftp_ != nullptr)
                {
                    rc = libssh2_sftp_shutdown(sftp_);
                    sftp_ = nullptr;
                }
                const int disconnect_rc = libssh2_session_disconnect(session_, "Session closed");
                const auto cause = disconnect_rc != 0 ? session_error(session_) : std::string{};
                release();
                if (rc != 0 || disconnect_rc != 0)
                {
                    throw_remote_io("disconnect failed for", "session", cause);
                }
            }

        private:
            std::string last_error() const
            {
                if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL)
                {
                    return sftp_status_text(libssh2_sftp_last_error(sftp_));
                }
                return session_error(session_);
            }

            void release() noexcept
            {
                if (sftp_ != nullptr)
                {
                    libssh2_sftp_shutdown(sftp_);
                    sftp_ = nullptr;
                }
                if (session_ != nullptr)
                {
                    libssh2_session_free(session_);
                    session_ = nullptr;
                }
                if (socket_ >= 0)
                {
                    ::close(socket_);
                    socket_ = -1;
                }
            }

            int socket_;
            LIBSSH2_SESSION *session_;
            LIBSSH2_SFTP *sftp_;
        };

    } // namespace

    SshConnectionFactory::SshConnectionFactory()
    {
        ensure_libssh2_init();
    }

    std::unique_ptr<RemoteConnection> SshConnectionFactory::connect(const ConnectionRequest &request)
    {
        const int fd = connect_socket(request.host, request.port, request.timeout);

        auto *session = libssh2_session_init();
        if (session == nullptr)
        {
            ::close(fd);
            throw ConnectionError("libssh2_session_init failed");
        }
        auto fail = [&](const std::string &stage)
        {
            const auto cause = session_error(session);
            libssh2_session_free(session);
            ::close(fd);
            throw ConnectionError(stage + " with " + request.host + ": " + cause);
        };

        libssh2_session_set_blocking(session, 1);
        libssh2_session_set_timeout(session, static_cast<long>(std::chrono::milliseconds(request.timeout).count()));
        if (libssh2_session_handshake(session, fd) != 0)
        {
            fail("SSH handshake failed");
        }

        // Host keys are not pinned; the fingerprint is logged so operators can audit targets.
        if (const auto *hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256); hash != nullptr)
        {
            std::string fingerprint;
            for (int i = 0; i < 32; ++i)
            {
                constexpr char kHex[] = "0123456789abcdef";
                const auto byte = static_cast<unsigned char>(hash[i]);
                fingerprint.push_back(kHex[byte >> 4]);
                fingerprint.push_back(kHex[byte & 0x0F]);
            }
            spdlog::debug("Host key for {}:{} SHA256 {}", request.host, request.port, fingerprint);
        }

        int rc = libssh2_userauth_password(session, request.username.c_str(), request.credential.c_str());
        if (rc != 0 && rc != LIBSSH2_ERROR_SOCKET_DISCONNECT)
        {
            const char *methods = libssh2_userauth_list(session, request.username.c_str(),
                                                        static_cast<unsigned int>(request.username.size()));
            if (methods != nullptr && std::strstr(methods, "keyboard-interactive") != nullptr)
            {
                KeyboardInteractiveContext context{.password = &request.credential};
                *libssh2_session_abstract(session) = &context;
                rc = libssh2_userauth_keyboard_interactive(session, request.username.c_str(),
                                                           &keyboard_interactive_callback);
                *libssh2_session_abstract(session) = nullptr;
            }
        }
        if (rc != 0)
        {
            fail("Authentication failed for " + request.username);
        }

        auto *sftp = libssh2_sftp_init(session);
        if (sftp == nullptr)
        {
            libssh2_session_disconnect(session, "SFTP unavailable");
            fail("SFTP subsystem unavailable");
        }

        spdlog::info("Opened SFTP channel to {}@{}:{}", request.username, request.host, request.port);
        return std::make_unique<SftpConnection>(fd, session, sftp);
    }

} // namespace sftpgate::server
