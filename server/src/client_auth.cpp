#include "sftpgate/server/client_connection.hpp"

#include <nlohmann/json.hpp>

#include "sftpgate/server/errors.hpp"
#include "client_common.hpp"

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    void ClientConnection::handle_login(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<sftpgate::protocol::LoginRequest>();
        const SessionCredentials credentials{
            .host = request.host,
            .port = request.port,
            .username = request.username,
            .password = request.password,
        };

        std::shared_ptr<Session> session;
        try
        {
            session = services_.registry.create(credentials);
        }
        catch (const GatewayError &error)
        {
            if (error.code() != sftpgate::ErrorCode::InvalidPayload)
            {
                services_.history.record(request.host, request.port, request.username, false);
            }
            spdlog::warn("Login {}@{}:{} from {} failed: {}", request.username, request.host, request.port,
                         remote_endpoint(), error.what());
            throw;
        }
        services_.history.record(request.host, request.port, request.username, true);

        sftpgate::protocol::LoginResponse response{
            .session = session->id(),
            .home = session->home_directory(),
            .username = session->username(),
            .host = session->host(),
            .port = session->port(),
        };
        nlohmann::json payload = response;
        payload["created_at"] = client_common::to_unix_time(session->created_at());
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
        spdlog::info("Session {} opened for {}@{}:{} ({})", session->id(), session->username(), session->host(),
                     session->port(), remote_endpoint());
    }

    void ClientConnection::handle_logout(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        if (!envelope.session || envelope.session->empty())
        {
            throw GatewayError(sftpgate::ErrorCode::AuthenticationRequired, "Session token required");
        }
        // An idle session that has not been swept yet can still be logged out.
        services_.registry.remove(*envelope.session);
        const auto discarded = services_.staging.discard_for_session(*envelope.session);
        if (discarded > 0)
        {
            spdlog::info("Discarded {} pending upload(s) of session {}", discarded, *envelope.session);
        }
        send_response(client_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

    void ClientConnection::handle_history(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        nlohmann::json payload;
        payload["entries"] = services_.history.entries();
        payload["enabled"] = services_.history.enabled();
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

    void ClientConnection::handle_stats(const sftpgate::protocol::RequestEnvelope &envelope)
    {
        require_session(envelope);
        const auto stats = services_.registry.stats();
        nlohmann::json payload;
        payload["active_sessions"] = stats.active_sessions;
        payload["total_sessions"] = stats.total_sessions;
        payload["max_sessions"] = services_.registry.max_sessions();
        payload["session_timeout"] = services_.registry.session_timeout().count();
        send_response(client_common::make_ok_response(std::move(payload), envelope.request_id));
    }

} // namespace sftpgate::server
