#include "sftpgate/server/client_connection.hpp"

#include <nlohmann/json.hpp>

#include "client_common.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    void ClientConnection::handle_list(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::ListRequest>();
        const auto path = session->resolve(request.path);

        sftpgate::protocol::ListResponse response{
            .path = path,
            .entries = services_.engine.list_directory(*session, path, request.show_hidden,
                                                       make_name_filter(request.filter)),
            .breadcrumbs = TransferEngine::breadcrumbs(path),
        };
        nlohmann::json payload = response;
        payload["total"] = response.entries.size();
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_mkdir(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathRequest>();
        const auto path = session->resolve(request.path);
        services_.engine.make_directory(*session, path);

        nlohmann::json payload;
        payload["path"] = path;
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_delete(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathRequest>();
        const auto path = session->resolve(request.path);
        services_.engine.delete_entry(*session, path);

        nlohmann::json payload;
        payload["path"] = path;
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_delete_many(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathsRequest>();

        std::vector<std::string> paths;
        paths.reserve(request.paths.size());
        for (const auto &path : request.paths)
        {
            paths.push_back(session->resolve(path));
        }

        auto result = services_.engine.delete_entries(*session, paths);
        if (!result.failed.empty())
        {
            spdlog::info("Batch delete in session {}: {} deleted, {} failed", session->id(), result.deleted.size(),
                         result.failed.size());
        }
        const sftpgate::protocol::BatchDeleteResponse response{
            .deleted = std::move(result.deleted),
            .failed = std::move(result.failed),
        };
        send_response(client_common::make_ok_response(response, envelope.request_id));
    }

    void ClientConnection::handle_preview(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto session = require_session(envelope);
        const auto request = envelope.payload.get<sftpgate::protocol::PathRequest>();
        auto preview = services_.engine.preview_file(*session, session->resolve(request.path),
                                                     services_.max_preview_size);

        const sftpgate::protocol::PreviewResponse response{
            .content = std::move(preview.content),
            .language = std::move(preview.language),
            .size = preview.size,
        };
        send_response(client_common::make_ok_response(response, envelope.request_id));
    }

} // namespace sftpgate::server
