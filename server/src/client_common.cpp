#include "client_common.hpp"

#include <algorithm>

#include "sftpgate/crypto.hpp"
#include "sftpgate/encoding/base64.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/client_connection.hpp"

namespace sftpgate::server::client_common
{

    std::int64_t to_unix_time(std::chrono::system_clock::time_point time)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }

    sftpgate::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id)
    {
        sftpgate::protocol::ResponseEnvelope envelope;
        envelope.kind = sftpgate::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = sftpgate::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    FrameSink::FrameSink(ClientConnection &connection, std::optional<std::string> request_id)
        : connection_(connection), request_id_(std::move(request_id))
    {
        pending_.reserve(kStreamChunkSize);
    }

    void FrameSink::write(std::span<const std::byte> data)
    {
        while (!data.empty())
        {
            const auto room = kStreamChunkSize - pending_.size();
            const auto take = std::min(room, data.size());
            pending_.insert(pending_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
            data = data.subspan(take);
            if (pending_.size() == kStreamChunkSize)
            {
                send_chunk();
            }
        }
    }

    void FrameSink::flush()
    {
        if (!pending_.empty())
        {
            send_chunk();
        }
    }

    void FrameSink::send_chunk()
    {
        sftpgate::protocol::StreamChunk chunk{
            .offset = offset_,
            .data_base64 = sftpgate::encoding::encode_base64(pending_),
            .chunk_hash = sftpgate::crypto::hash_bytes(pending_),
        };

        sftpgate::protocol::ResponseEnvelope envelope;
        envelope.kind = sftpgate::protocol::ResponseKind::Continue;
        envelope.payload = chunk;
        envelope.request_id = request_id_;
        connection_.send_frame(envelope);

        offset_ += pending_.size();
        pending_.clear();
    }

} // namespace sftpgate::server::client_common
