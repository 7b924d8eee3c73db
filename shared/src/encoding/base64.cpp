#include "sftpgate/encoding/base64.hpp"

#include <stdexcept>

#include <sodium.h>

#include "sftpgate/crypto.hpp"

namespace sftpgate::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        std::string output(sodium_base64_encoded_len(data.size(), kVariant), '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // encoded_len counts the terminating NUL
        output.pop_back();
        return output;
    }

    std::vector<std::byte> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output((input.size() / 4 + 1) * 3);
        std::size_t decoded = 0;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), " \t\r\n", &decoded, nullptr, kVariant) != 0)
        {
            throw std::invalid_argument("Malformed base64 payload");
        }
        output.resize(decoded);
        return output;
    }

} // namespace sftpgate::encoding
