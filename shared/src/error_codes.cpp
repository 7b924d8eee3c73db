#include "sftpgate/error_codes.hpp"

#include <array>

namespace sftpgate
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::ConnectionError, "connection_error"},
            {ErrorCode::CapacityExceeded, "capacity_exceeded"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Expired, "expired"},
            {ErrorCode::RemoteIoError, "remote_io_error"},
            {ErrorCode::NotAFile, "not_a_file"},
            {ErrorCode::TooLarge, "too_large"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::StreamAborted, "stream_aborted"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view label) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == label)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace sftpgate
