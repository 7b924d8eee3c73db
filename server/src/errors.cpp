#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    GatewayError::GatewayError(sftpgate::ErrorCode code, std::string message, std::optional<std::string> path)
        : std::runtime_error(std::move(message)), code_(code), path_(std::move(path)) {}

    ConnectionError::ConnectionError(std::string message)
        : GatewayError(sftpgate::ErrorCode::ConnectionError, std::move(message)) {}

    SinkError::SinkError(std::string message)
        : GatewayError(sftpgate::ErrorCode::StreamAborted, std::move(message)) {}

    void throw_remote_io(const std::string &what, const std::string &path, const std::string &cause)
    {
        std::string message = what + " " + path;
        if (!cause.empty())
        {
            message += ": " + cause;
        }
        throw GatewayError(sftpgate::ErrorCode::RemoteIoError, std::move(message), path);
    }

} // namespace sftpgate::server
