#include "sftpgate/server/upload_staging.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "sftpgate/crypto.hpp"
#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::size_t kTransferIdBytes = 12;

        void remove_spool(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove upload spool {}: {}", path.string(), ec.message());
            }
        }

    } // namespace

    UploadStaging::UploadStaging(std::filesystem::path staging_dir, std::uint64_t chunk_size)
        : staging_dir_(std::move(staging_dir)), chunk_size_(chunk_size == 0 ? kDefaultUploadChunkSize : chunk_size)
    {
        std::filesystem::create_directories(staging_dir_);
    }

    UploadStaging::~UploadStaging()
    {
        std::lock_guard lock(mutex_);
        for (const auto &[id, state] : uploads_)
        {
            remove_spool(state.spool_path);
        }
    }

    UploadState UploadStaging::begin(const std::string &session_id, const std::string &remote_path,
                                     std::uint64_t file_size, bool overwrite)
    {
        std::lock_guard lock(mutex_);

        auto transfer_id = crypto::random_token(kTransferIdBytes);
        while (uploads_.contains(transfer_id))
        {
            transfer_id = crypto::random_token(kTransferIdBytes);
        }

        UploadState state{};
        state.transfer_id = transfer_id;
        state.session_id = session_id;
        state.remote_path = remote_path;
        state.spool_path = staging_dir_ / (transfer_id + ".part");
        state.file_size = file_size;
        state.chunk_size = chunk_size_;
        state.bytes_written = 0;
        state.overwrite = overwrite;
        state.last_update = std::chrono::system_clock::now();

        std::ofstream file(state.spool_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError,
                               "Cannot create upload spool " + state.spool_path.string());
        }
        file.close();

        uploads_[transfer_id] = state;
        spdlog::debug("Upload {} staged for {} ({} bytes)", transfer_id, remote_path, file_size);
        return state;
    }

    std::uint64_t UploadStaging::append_chunk(const std::string &session_id, const std::string &transfer_id,
                                              std::uint64_t offset, std::span<const std::byte> data,
                                              const std::string &chunk_hash)
    {
        std::lock_guard lock(mutex_);
        auto &state = find_owned_locked(session_id, transfer_id);

        if (offset != state.bytes_written)
        {
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload,
                               "Unexpected chunk offset " + std::to_string(offset) + ", expected " +
                                   std::to_string(state.bytes_written));
        }
        if (state.bytes_written + static_cast<std::uint64_t>(data.size()) > state.file_size)
        {
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Chunk exceeds declared file size");
        }
        if (crypto::hash_bytes(data) != chunk_hash)
        {
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "Chunk hash mismatch");
        }

        std::ofstream file(state.spool_path, std::ios::binary | std::ios::app);
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError,
                               "Failed to write upload spool " + state.spool_path.string());
        }

        state.bytes_written += static_cast<std::uint64_t>(data.size());
        state.last_update = std::chrono::system_clock::now();
        return state.bytes_written;
    }

    UploadState UploadStaging::take_completed(const std::string &session_id, const std::string &transfer_id,
                                              const std::string &final_hash)
    {
        std::lock_guard lock(mutex_);
        auto &state = find_owned_locked(session_id, transfer_id);
        if (state.bytes_written != state.file_size)
        {
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload,
                               "Upload incomplete (" + std::to_string(state.bytes_written) + " of " +
                                   std::to_string(state.file_size) + " bytes)");
        }

        auto completed = state;
        uploads_.erase(transfer_id);
        if (crypto::hash_file(completed.spool_path) != final_hash)
        {
            remove_spool(completed.spool_path);
            throw GatewayError(sftpgate::ErrorCode::InvalidPayload, "File hash mismatch");
        }
        return completed;
    }

    std::optional<UploadState> UploadStaging::find(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(transfer_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::size_t UploadStaging::discard_for_session(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        for (auto it = uploads_.begin(); it != uploads_.end();)
        {
            if (it->second.session_id == session_id)
            {
                remove_spool(it->second.spool_path);
                it = uploads_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t UploadStaging::cleanup_expired(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        std::size_t removed = 0;
        for (auto it = uploads_.begin(); it != uploads_.end();)
        {
            if (now - it->second.last_update > max_age)
            {
                spdlog::info("Dropping stale upload {} for {}", it->first, it->second.remote_path);
                remove_spool(it->second.spool_path);
                it = uploads_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    void UploadStaging::release(const UploadState &state)
    {
        remove_spool(state.spool_path);
    }

    UploadState &UploadStaging::find_owned_locked(const std::string &session_id, const std::string &transfer_id)
    {
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end() || it->second.session_id != session_id)
        {
            throw GatewayError(sftpgate::ErrorCode::NotFound, "Unknown transfer");
        }
        return it->second;
    }

} // namespace sftpgate::server
