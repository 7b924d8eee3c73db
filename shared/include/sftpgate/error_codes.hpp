/**
 * sftpgate - Error codes shared by the core, the front end and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sftpgate
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        AuthenticationRequired = 3,
        ConnectionError = 4,
        CapacityExceeded = 5,
        NotFound = 6,
        Expired = 7,
        RemoteIoError = 8,
        NotAFile = 9,
        TooLarge = 10,
        AlreadyExists = 11,
        StreamAborted = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view label) noexcept;

} // namespace sftpgate
