#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    // Typed failure surfaced by every core operation; `path` names the remote entry involved, if any.
    class GatewayError : public std::runtime_error
    {
    public:
        GatewayError(sftpgate::ErrorCode code, std::string message, std::optional<std::string> path = std::nullopt);

        sftpgate::ErrorCode code() const noexcept { return code_; }
        const std::optional<std::string> &path() const noexcept { return path_; }

    private:
        sftpgate::ErrorCode code_;
        std::optional<std::string> path_;
    };

    // Connection factory or authentication failure.
    class ConnectionError : public GatewayError
    {
    public:
        explicit ConnectionError(std::string message);
    };

    // The archive/download consumer stopped accepting bytes.
    class SinkError : public GatewayError
    {
    public:
        explicit SinkError(std::string message);
    };

    [[noreturn]] void throw_remote_io(const std::string &what, const std::string &path, const std::string &cause);

} // namespace sftpgate::server
