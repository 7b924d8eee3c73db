#include "sftpgate/server/client_connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/framing.hpp"
#include "sftpgate/server/errors.hpp"
#include "client_common.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    namespace
    {

        bool names_unknown_command(const nlohmann::json &json)
        {
            if (!json.is_object())
            {
                return false;
            }
            const auto it = json.find("cmd");
            return it != json.end() && it->is_string() &&
                   !sftpgate::protocol::command_from_string(it->get<std::string>()).has_value();
        }

        std::optional<std::string> request_id_of(const nlohmann::json &json)
        {
            if (json.is_object())
            {
                if (const auto it = json.find("id"); it != json.end() && it->is_string())
                {
                    return it->get<std::string>();
                }
            }
            return std::nullopt;
        }

    } // namespace

    ClientConnection::ClientConnection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    ClientConnection::~ClientConnection()
    {
        spdlog::debug("Connection object released");
    }

    void ClientConnection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void ClientConnection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void ClientConnection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = sftpgate::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 send_error(sftpgate::ErrorCode::TooLarge, ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void ClientConnection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(sftpgate::ErrorCode::InvalidPayload, ex.what());
                             }
                             if (!stopped_)
                             {
                                 read_frame_header();
                             }
                         });
    }

    void ClientConnection::process_message(const nlohmann::json &json)
    {
        sftpgate::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<sftpgate::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            const auto code = names_unknown_command(json) ? sftpgate::ErrorCode::InvalidCommand
                                                          : sftpgate::ErrorCode::InvalidPayload;
            send_error(code, ex.what(), request_id_of(json));
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), sftpgate::protocol::to_string(envelope.command));

        try
        {
            dispatch(envelope);
        }
        catch (const GatewayError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id, error.path());
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(sftpgate::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(sftpgate::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed: {}", sftpgate::protocol::to_string(envelope.command), ex.what());
            send_error(sftpgate::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void ClientConnection::dispatch(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        switch (envelope.command)
        {
        case sftpgate::protocol::Command::Login:
            handle_login(envelope);
            break;
        case sftpgate::protocol::Command::Logout:
            handle_logout(envelope);
            break;
        case sftpgate::protocol::Command::List:
            handle_list(envelope);
            break;
        case sftpgate::protocol::Command::Mkdir:
            handle_mkdir(envelope);
            break;
        case sftpgate::protocol::Command::Delete:
            handle_delete(envelope);
            break;
        case sftpgate::protocol::Command::DeleteMany:
            handle_delete_many(envelope);
            break;
        case sftpgate::protocol::Command::Preview:
            handle_preview(envelope);
            break;
        case sftpgate::protocol::Command::Download:
            handle_download(envelope);
            break;
        case sftpgate::protocol::Command::Archive:
            handle_archive(envelope);
            break;
        case sftpgate::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case sftpgate::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case sftpgate::protocol::Command::UploadCommit:
            handle_upload_commit(envelope);
            break;
        case sftpgate::protocol::Command::History:
            handle_history(envelope);
            break;
        case sftpgate::protocol::Command::Stats:
            handle_stats(envelope);
            break;
        case sftpgate::protocol::Command::Ping:
            send_response(client_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
            break;
        default:
            send_error(sftpgate::ErrorCode::InvalidCommand, "Command not supported", envelope.request_id);
            break;
        }
    }

    std::shared_ptr<Session> ClientConnection::require_session(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        if (!envelope.session || envelope.session->empty())
        {
            throw GatewayError(sftpgate::ErrorCode::AuthenticationRequired, "Session token required");
        }
        return services_.registry.get(*envelope.session);
    }

    void ClientConnection::send_frame(const sftpgate::protocol::ResponseEnvelope &envelope)
    {
        if (stopped_)
        {
            throw SinkError("Connection closed");
        }
        const auto frame = sftpgate::protocol::encode_frame(nlohmann::json(envelope));
        std::error_code ec;
        asio::write(socket_, asio::buffer(frame), ec);
        if (ec)
        {
            stop();
            throw SinkError("Write to client failed: " + ec.message());
        }
    }

    void ClientConnection::send_response(const sftpgate::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            send_frame(envelope);
        }
        catch (const SinkError &ex)
        {
            spdlog::debug("Dropping response for {}: {}", remote_endpoint(), ex.what());
        }
    }

    void ClientConnection::send_error(sftpgate::ErrorCode code, std::string message,
                                      std::optional<std::string> request_id, std::optional<std::string> path)
    {
        sftpgate::protocol::ResponseEnvelope envelope;
        envelope.kind = sftpgate::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        envelope.path = std::move(path);
        send_response(envelope);
    }

    std::string ClientConnection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace sftpgate::server
