#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace sftpgate::server
{

    inline constexpr std::uint64_t kDefaultUploadChunkSize = 1u << 20;

    struct UploadState
    {
        std::string transfer_id;
        std::string session_id;
        std::string remote_path;
        std::filesystem::path spool_path;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t bytes_written{};
        bool overwrite{};
        std::chrono::system_clock::time_point last_update{};
    };

    // Chunked uploads are spooled to local `.part` files until they are complete and verified;
    // the caller then streams the spool to the remote side and calls release().
    class UploadStaging
    {
    public:
        explicit UploadStaging(std::filesystem::path staging_dir, std::uint64_t chunk_size = kDefaultUploadChunkSize);
        ~UploadStaging();

        UploadState begin(const std::string &session_id, const std::string &remote_path, std::uint64_t file_size,
                          bool overwrite);

        // Throws GatewayError: NotFound for an unknown transfer or one owned by another session,
        // InvalidPayload for an out-of-order chunk, an overlong upload or a hash mismatch.
        // Returns the number of bytes spooled so far.
        std::uint64_t append_chunk(const std::string &session_id, const std::string &transfer_id, std::uint64_t offset,
                                   std::span<const std::byte> data, const std::string &chunk_hash);

        // Verifies size and whole-file hash, then hands the spool over to the caller and forgets the
        // transfer. On a hash mismatch the transfer is discarded.
        UploadState take_completed(const std::string &session_id, const std::string &transfer_id,
                                   const std::string &final_hash);

        std::optional<UploadState> find(const std::string &transfer_id) const;

        std::size_t discard_for_session(const std::string &session_id);
        std::size_t cleanup_expired(std::chrono::seconds max_age);

        static void release(const UploadState &state);

        std::uint64_t chunk_size() const noexcept { return chunk_size_; }
        const std::filesystem::path &staging_dir() const noexcept { return staging_dir_; }

    private:
        UploadState &find_owned_locked(const std::string &session_id, const std::string &transfer_id);

        std::filesystem::path staging_dir_;
        std::uint64_t chunk_size_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadState> uploads_;
    };

} // namespace sftpgate::server
