#include "sftpgate/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace sftpgate::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            std::string result(data.size() * 2 + 1, '\0');
            sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
            result.resize(data.size() * 2);
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw std::runtime_error("libsodium initialization failed");
                               } });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string random_token(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        auto token = to_hex(bytes);
        sodium_memzero(bytes.data(), bytes.size());
        return token;
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        ensure_initialized_once();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }

        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0 && crypto_generichash_update(&state, buffer.data(), read_count) != 0)
            {
                throw std::runtime_error("crypto_generichash_update failed");
            }
        }

        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

} // namespace sftpgate::crypto
