#include "sftpgate/protocol.hpp"

#include <array>
#include <stdexcept>

namespace sftpgate::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
            bool session_free;
        };

        constexpr std::array<CommandMapping, 15> kCommandMappings{{
            {Command::Login, "LOGIN", true},
            {Command::Logout, "LOGOUT", false},
            {Command::List, "LIST", false},
            {Command::Mkdir, "MKDIR", false},
            {Command::Delete, "DELETE", false},
            {Command::DeleteMany, "DELETE_MANY", false},
            {Command::Preview, "PREVIEW", false},
            {Command::Download, "DOWNLOAD", false},
            {Command::Archive, "ARCHIVE", false},
            {Command::UploadInit, "UPLOAD_INIT", false},
            {Command::UploadChunk, "UPLOAD_CHUNK", false},
            {Command::UploadCommit, "UPLOAD_COMMIT", false},
            {Command::History, "HISTORY", true},
            {Command::Stats, "STATS", false},
            {Command::Ping, "PING", true},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Continue, "CONTINUE"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    bool is_session_free(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.session_free;
            }
        }
        return false;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
        if (envelope.session)
        {
            json["session"] = *envelope.session;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
        envelope.session = optional_string(json, "session");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_string(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
        if (envelope.path)
        {
            json["path"] = *envelope.path;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_string(json.value("error", std::string{"ok"})).value_or(ErrorCode::InternalError);
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
        envelope.path = optional_string(json, "path");
    }

    void to_json(nlohmann::json &json, const FileEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"size", entry.size},
            {"mode", entry.mode},
            {"mtime", entry.modified_at},
            {"is_dir", entry.is_directory},
            {"path", entry.full_path},
        };
    }

    void from_json(const nlohmann::json &json, FileEntry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.size = json.value("size", 0ULL);
        entry.mode = json.value("mode", 0U);
        entry.modified_at = json.value("mtime", 0LL);
        entry.is_directory = json.value("is_dir", false);
        entry.full_path = json.value("path", std::string{});
    }

    void to_json(nlohmann::json &json, const Breadcrumb &crumb)
    {
        json = {{"name", crumb.name}, {"path", crumb.path}};
    }

    void from_json(const nlohmann::json &json, Breadcrumb &crumb)
    {
        crumb.name = json.at("name").get<std::string>();
        crumb.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const LoginRequest &request)
    {
        json = {
            {"host", request.host},
            {"port", request.port},
            {"username", request.username},
            {"password", request.password},
        };
    }

    void from_json(const nlohmann::json &json, LoginRequest &request)
    {
        request.host = json.value("host", std::string{});
        const auto port = json.value("port", 22);
        if (port < 0 || port > 65535)
        {
            throw std::invalid_argument("port must be between 1 and 65535");
        }
        request.port = static_cast<std::uint16_t>(port);
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
    }

    void to_json(nlohmann::json &json, const LoginResponse &response)
    {
        json = {
            {"session", response.session},
            {"home", response.home},
            {"username", response.username},
            {"host", response.host},
            {"port", response.port},
        };
    }

    void from_json(const nlohmann::json &json, LoginResponse &response)
    {
        response.session = json.at("session").get<std::string>();
        response.home = json.value("home", std::string{"/"});
        response.username = json.value("username", std::string{});
        response.host = json.value("host", std::string{});
        response.port = json.value("port", std::uint16_t{22});
    }

    void to_json(nlohmann::json &json, const ListRequest &request)
    {
        json = {
            {"path", request.path},
            {"show_hidden", request.show_hidden},
            {"filter", request.filter},
        };
    }

    void from_json(const nlohmann::json &json, ListRequest &request)
    {
        request.path = json.value("path", std::string{});
        request.show_hidden = json.value("show_hidden", false);
        request.filter = json.value("filter", std::string{});
    }

    void to_json(nlohmann::json &json, const ListResponse &response)
    {
        json = {
            {"path", response.path},
            {"entries", response.entries},
            {"breadcrumbs", response.breadcrumbs},
            {"total", response.entries.size()},
        };
    }

    void from_json(const nlohmann::json &json, ListResponse &response)
    {
        response.path = json.at("path").get<std::string>();
        response.entries = json.value("entries", std::vector<FileEntry>{});
        response.breadcrumbs = json.value("breadcrumbs", std::vector<Breadcrumb>{});
    }

    void to_json(nlohmann::json &json, const PathRequest &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, PathRequest &request)
    {
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const PathsRequest &request)
    {
        json = {{"paths", request.paths}};
    }

    void from_json(const nlohmann::json &json, PathsRequest &request)
    {
        request.paths = json.at("paths").get<std::vector<std::string>>();
    }

    void to_json(nlohmann::json &json, const BatchDeleteResponse &response)
    {
        json = {{"deleted", response.deleted}, {"failed", response.failed}};
    }

    void from_json(const nlohmann::json &json, BatchDeleteResponse &response)
    {
        response.deleted = json.value("deleted", std::vector<std::string>{});
        response.failed = json.value("failed", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const PreviewResponse &response)
    {
        json = {
            {"content", response.content},
            {"language", response.language},
            {"size", response.size},
        };
    }

    void from_json(const nlohmann::json &json, PreviewResponse &response)
    {
        response.content = json.at("content").get<std::string>();
        response.language = json.value("language", std::string{"text"});
        response.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const StreamChunk &chunk)
    {
        json = {
            {"offset", chunk.offset},
            {"data", chunk.data_base64},
            {"hash", chunk.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, StreamChunk &chunk)
    {
        chunk.offset = json.at("offset").get<std::uint64_t>();
        chunk.data_base64 = json.at("data").get<std::string>();
        chunk.chunk_hash = json.value("hash", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"path", request.path},
            {"file_size", request.file_size},
            {"overwrite", request.overwrite},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.path = json.at("path").get<std::string>();
        request.file_size = json.at("file_size").get<std::uint64_t>();
        request.overwrite = json.value("overwrite", false);
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"transfer_id", response.transfer_id},
            {"chunk_size", response.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.transfer_id = json.at("transfer_id").get<std::string>();
        response.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"offset", request.offset},
            {"data", request.data_base64},
            {"hash", request.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.offset = json.at("offset").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.chunk_hash = json.value("hash", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadCommitRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"final_hash", request.final_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadCommitRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.final_hash = json.value("final_hash", std::string{});
    }

} // namespace sftpgate::protocol
