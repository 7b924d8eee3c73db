#include "sftpgate/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "sftpgate/server/client_connection.hpp"
#include "sftpgate/server/ssh_connection.hpp"

namespace sftpgate::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::filesystem::path resolve_staging_dir(const std::filesystem::path &configured)
        {
            if (!configured.empty())
            {
                return configured;
            }
            return std::filesystem::temp_directory_path() / "sftpgate-uploads";
        }

        std::unique_ptr<ConnectionFactory> default_factory(std::unique_ptr<ConnectionFactory> factory)
        {
            if (factory)
            {
                return factory;
            }
            return std::make_unique<SshConnectionFactory>();
        }

        std::optional<std::filesystem::path> history_path(const ServerConfig &config)
        {
            return config.save_history ? config.history_file : std::nullopt;
        }

    } // namespace

    Server::Server(ServerConfig config, std::unique_ptr<ConnectionFactory> factory)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          factory_(default_factory(std::move(factory))),
          registry_(*factory_, RegistryOptions{
                                   .session_timeout = config_.session_timeout,
                                   .max_sessions = config_.max_sessions,
                                   .connect_timeout = config_.connect_timeout,
                                   .clock = {},
                               }),
          staging_(resolve_staging_dir(config_.staging_dir)),
          history_(history_path(config_), config_.max_history, config_.save_history),
          sweeper_(registry_, config_.cleanup_interval)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} (max {} sessions, timeout {}s, staging {})", config_.address, config_.port,
                     config_.max_sessions, config_.session_timeout.count(), staging_.staging_dir().string());

        const auto upload_timeout = config_.upload_timeout;
        sweeper_.add_task([this, upload_timeout]
                          { staging_.cleanup_expired(upload_timeout); });

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        sweeper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        sweeper_.stop();
        registry_.close_all();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{
                .registry = registry_,
                .engine = engine_,
                .archive_builder = archive_builder_,
                .staging = staging_,
                .history = history_,
                .max_preview_size = config_.max_preview_size,
                .upload_timeout = config_.upload_timeout,
            };
            auto connection = std::make_shared<ClientConnection>(std::move(socket), services);
            connection->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        std::error_code ec;
        acceptor_.close(ec);
        sweeper_.stop();
        registry_.close_all();
        io_context_.stop();
    }

} // namespace sftpgate::server
