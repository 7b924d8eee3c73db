#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "sftpgate/server/archive_builder.hpp"
#include "sftpgate/server/config.hpp"
#include "sftpgate/server/expiry_sweeper.hpp"
#include "sftpgate/server/login_history.hpp"
#include "sftpgate/server/remote_connection.hpp"
#include "sftpgate/server/session_registry.hpp"
#include "sftpgate/server/transfer_engine.hpp"
#include "sftpgate/server/upload_staging.hpp"

namespace sftpgate::server
{

    class Server
    {
    public:
        // `factory` defaults to the libssh2 implementation.
        explicit Server(ServerConfig config, std::unique_ptr<ConnectionFactory> factory = nullptr);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::unique_ptr<ConnectionFactory> factory_;
        SessionRegistry registry_;
        TransferEngine engine_;
        ArchiveBuilder archive_builder_;
        UploadStaging staging_;
        LoginHistory history_;
        ExpirySweeper sweeper_;

        std::vector<std::thread> workers_;
    };

} // namespace sftpgate::server
