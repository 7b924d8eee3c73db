/**
 * sftpgate - Random tokens and content hashes built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace sftpgate::crypto
{

    void ensure_sodium_init();

    // Hex encoding of `byte_count` bytes from the system CSPRNG.
    std::string random_token(std::size_t byte_count);

    // BLAKE2b (crypto_generichash) digests, hex encoded.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace sftpgate::crypto
