#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sftpgate::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Throws std::invalid_argument on malformed input.
    std::vector<std::byte> decode_base64(std::string_view input);

} // namespace sftpgate::encoding
