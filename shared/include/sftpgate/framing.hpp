/**
 * sftpgate - Length-prefixed JSON framing.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace sftpgate::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upload chunks are the largest legitimate frames; anything past this is rejected before allocation.
    inline constexpr std::uint32_t kMaxFramePayload = 16u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace sftpgate::protocol
