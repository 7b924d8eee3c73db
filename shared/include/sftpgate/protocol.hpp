/**
 * sftpgate - Wire schema of the framed JSON front end.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::protocol
{

    enum class Command : std::uint8_t
    {
        Login,
        Logout,
        List,
        Mkdir,
        Delete,
        DeleteMany,
        Preview,
        Download,
        Archive,
        UploadInit,
        UploadChunk,
        UploadCommit,
        History,
        Stats,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    // Commands that may be issued without a session token.
    bool is_session_free(Command command) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Continue = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
        std::optional<std::string> session{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
        std::optional<std::string> path{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct FileEntry
    {
        std::string name;
        std::uint64_t size{};
        std::uint32_t mode{};
        std::int64_t modified_at{};
        bool is_directory{};
        std::string full_path;

        bool operator==(const FileEntry &) const = default;
    };

    void to_json(nlohmann::json &json, const FileEntry &entry);
    void from_json(const nlohmann::json &json, FileEntry &entry);

    struct Breadcrumb
    {
        std::string name;
        std::string path;

        bool operator==(const Breadcrumb &) const = default;
    };

    void to_json(nlohmann::json &json, const Breadcrumb &crumb);
    void from_json(const nlohmann::json &json, Breadcrumb &crumb);

    struct LoginRequest
    {
        std::string host;
        std::uint16_t port{22};
        std::string username;
        std::string password;
    };

    void to_json(nlohmann::json &json, const LoginRequest &request);
    void from_json(const nlohmann::json &json, LoginRequest &request);

    struct LoginResponse
    {
        std::string session;
        std::string home;
        std::string username;
        std::string host;
        std::uint16_t port{};
    };

    void to_json(nlohmann::json &json, const LoginResponse &response);
    void from_json(const nlohmann::json &json, LoginResponse &response);

    struct ListRequest
    {
        std::string path;
        bool show_hidden{};
        std::string filter;
    };

    void to_json(nlohmann::json &json, const ListRequest &request);
    void from_json(const nlohmann::json &json, ListRequest &request);

    struct ListResponse
    {
        std::string path;
        std::vector<FileEntry> entries;
        std::vector<Breadcrumb> breadcrumbs;
    };

    void to_json(nlohmann::json &json, const ListResponse &response);
    void from_json(const nlohmann::json &json, ListResponse &response);

    struct PathRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const PathRequest &request);
    void from_json(const nlohmann::json &json, PathRequest &request);

    struct PathsRequest
    {
        std::vector<std::string> paths;
    };

    void to_json(nlohmann::json &json, const PathsRequest &request);
    void from_json(const nlohmann::json &json, PathsRequest &request);

    struct BatchDeleteResponse
    {
        std::vector<std::string> deleted;
        std::vector<std::string> failed;
    };

    void to_json(nlohmann::json &json, const BatchDeleteResponse &response);
    void from_json(const nlohmann::json &json, BatchDeleteResponse &response);

    struct PreviewResponse
    {
        std::string content;
        std::string language;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const PreviewResponse &response);
    void from_json(const nlohmann::json &json, PreviewResponse &response);

    // One CONTINUE frame of a streamed download or archive body.
    struct StreamChunk
    {
        std::uint64_t offset{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const StreamChunk &chunk);
    void from_json(const nlohmann::json &json, StreamChunk &chunk);

    struct UploadInitRequest
    {
        std::string path;
        std::uint64_t file_size{};
        bool overwrite{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string transfer_id;
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCommitRequest
    {
        std::string transfer_id;
        std::string final_hash;
    };

    void to_json(nlohmann::json &json, const UploadCommitRequest &request);
    void from_json(const nlohmann::json &json, UploadCommitRequest &request);

} // namespace sftpgate::protocol
