#include "sftpgate/server/client_connection.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <vector>

#include "sftpgate/encoding/base64.hpp"
#include "sftpgate/server/errors.hpp"
#include "client_common.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    namespace
    {

        nlohmann::json report_to_json(const ArchiveReport &report)
        {
            nlohmann::json skipped = nlohmann::json::array();
            for (const auto &entry : report.skipped)
            {
                skipped.push_back({{"path", entry.path}, {"reason", entry.reason}});
            }
            return {
                {"files_added", report.files_added},
                {"directories_added", report.directories_added},
                {"skipped", std::move(skipped)},
                {"bytes_written", report.bytes_written},
            };
        }

        // Removes a committed spool however the remote write ends.
        class SpoolGuard
        {
        public:
            explicit SpoolGuard(const UploadState &state) : state_(state) {}
            ~SpoolGuard() { UploadStaging::release(state_); }

            SpoolGuard(const SpoolGuard &) = delete;
            SpoolGuard &operator=(const SpoolGuard &) = delete;

        private:
            const UploadState &state_;
        };

    } // namespace

    void ClientConnection::handle_download(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathRequest>();
        const auto path = session->resolve(request.path);

        std::optional<OpenedFile> file;
        try
        {
            file.emplace(services_.engine.open_file(*session, path));
        }
        catch (const GatewayError &error)
        {
            if (error.code() != sftpgate::ErrorCode::NotAFile)
            {
                throw;
            }
        }

        client_common::FrameSink sink(*this, envelope.request_id);
        nlohmann::json payload;
        if (file)
        {
            std::vector<std::byte> buffer(kCopyBufferSize);
            for (;;)
            {
                const auto count = file->read(buffer);
                if (count == 0)
                {
                    break;
                }
                sink.write(std::span<const std::byte>(buffer.data(), count));
            }
            sink.flush();
            payload["archive"] = false;
            payload["name"] = file->entry().name;
            file.reset();
        }
        else
        {
            const auto report = services_.archive_builder.build(*session, {path}, sink);
            sink.flush();
            payload = report_to_json(report);
            payload["archive"] = true;
            payload["name"] = ArchiveBuilder::entry_name_for(path) + ".zip";
        }
        payload["bytes"] = sink.bytes_sent();
        spdlog::info("Session {} downloaded {} ({} bytes)", session->id(), path, sink.bytes_sent());
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_archive(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathsRequest>();
        if (request.paths.empty())
        {
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "No paths given");
        }

        std::vector<std::string> paths;
        paths.reserve(request.paths.size());
        for (const auto &path : request.paths)
        {
            paths.push_back(session->resolve(path));
        }

        client_common::FrameSink sink(*this, envelope.request_id);
        const auto report = services_.archive_builder.build(*session, paths, sink);
        sink.flush();

        auto payload = report_to_json(report);
        payload["archive"] = true;
        payload["bytes"] = sink.bytes_sent();
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_upload_init(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        services_.staging.cleanup_expired(services_.upload_timeout);
        const auto request = envelope.payload.get<sftpgate::protocol::UploadInitRequest>();
        const auto path = session->resolve(request.path);
        const auto state = services_.staging.begin(session->id(), path, request.file_size, request.overwrite);

        const sftpgate::protocol::UploadInitResponse response{
            .transfer_id = state.transfer_id,
            .chunk_size = state.chunk_size,
        };
        nlohmann::json payload = response;
        payload["path"] = path;
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_upload_chunk(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::UploadChunkRequest>();
        const auto data = sftpgate::encoding::decode_base64(request.data_base64);
        const auto written = services_.staging.append_chunk(session->id(), request.transfer_id, request.offset, data,
                                                            request.chunk_hash);

        nlohmann::json payload;
        payload["bytes"] = data.size();
        payload["bytes_written"] = written;
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_upload_commit(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::UploadCommitRequest>();
        const auto state = services_.staging.take_completed(session->id(), request.transfer_id, request.final_hash);
        const SpoolGuard guard(state);

        std::ifstream source(state.spool_path, std::ios::binary);
        if (!source.is_open())
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError, "Upload spool is missing", state.remote_path);
        }
        services_.engine.upload_file(*session, state.remote_path, source, state.overwrite);

        nlohmann::json payload;
        payload["path"] = state.remote_path;
        payload["size"] = state.file_size;
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

} // namespace sftpgate::server
