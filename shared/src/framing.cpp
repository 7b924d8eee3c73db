#include "sftpgate/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace sftpgate::protocol
{

    namespace
    {
        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kFrameHeaderSize> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        // Preview text is not guaranteed to be UTF-8; invalid sequences become U+FFFD.
        const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > kMaxFramePayload)
        {
            throw std::length_error("JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        const auto length = (static_cast<std::uint32_t>(header[0]) << 24) |
                            (static_cast<std::uint32_t>(header[1]) << 16) |
                            (static_cast<std::uint32_t>(header[2]) << 8) |
                            static_cast<std::uint32_t>(header[3]);
        if (length > kMaxFramePayload)
        {
            throw std::length_error("Frame payload exceeds limit: " + std::to_string(length));
        }
        return length;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = decode_frame_length(buffer.first<kFrameHeaderSize>());
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + payload_size);
        return DecodedFrame{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace sftpgate::protocol
