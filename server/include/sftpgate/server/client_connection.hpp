#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sftpgate/error_codes.hpp"
#include "sftpgate/protocol.hpp"
#include "sftpgate/server/archive_builder.hpp"
#include "sftpgate/server/login_history.hpp"
#include "sftpgate/server/session_registry.hpp"
#include "sftpgate/server/transfer_engine.hpp"
#include "sftpgate/server/upload_staging.hpp"

namespace sftpgate::server
{

    struct ServerServices
    {
        SessionRegistry &registry;
        TransferEngine &engine;
        ArchiveBuilder &archive_builder;
        UploadStaging &staging;
        LoginHistory &history;
        std::uint64_t max_preview_size;
        std::chrono::seconds upload_timeout;
    };

    // One client socket. Requests are handled one at a time; replies and streamed bodies are written
    // synchronously before the next frame is read.
    class ClientConnection : public std::enable_shared_from_this<ClientConnection>
    {
    public:
        ClientConnection(asio::ip::tcp::socket socket, ServerServices services);
        ~ClientConnection();

        void start();

        void stop();

        // Writes one frame; throws SinkError when the socket is gone.
        void send_frame(const sftpgate::protocol::ResponseEnvelope &envelope);

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const sftpgate::protocol::RequestEnvelope &envelope);
        void send_response(const sftpgate::protocol::ResponseEnvelope &envelope);
        void send_error(sftpgate::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        std::optional<std::string> path = std::nullopt);

        std::shared_ptr<Session> require_session(const sftpgate::protocol::RequestEnvelope &envelope);

        // Command handlers
        void handle_login(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_logout(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_history(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_stats(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_list(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_mkdir(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_delete(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_delete_many(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_preview(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_download(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_archive(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_upload_init(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const sftpgate::protocol::RequestEnvelope &envelope);
        void handle_upload_commit(const sftpgate::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool stopped_{false};
    };

} // namespace sftpgate::server
