#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sftpgate/protocol.hpp"
#include "sftpgate/server/output_sink.hpp"

namespace sftpgate::server
{
    class ClientConnection;
}

namespace sftpgate::server::client_common
{

    inline constexpr std::size_t kStreamChunkSize = 256 * 1024;

    std::int64_t to_unix_time(std::chrono::system_clock::time_point time);

    sftpgate::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id);

    // Turns a byte stream into CONTINUE frames of at most kStreamChunkSize bytes each.
    class FrameSink : public OutputSink
    {
    public:
        FrameSink(ClientConnection &connection, std::optional<std::string> request_id);

        void write(std::span<const std::byte> data) override;

        // Sends whatever is still buffered.
        void flush();

        std::uint64_t bytes_sent() const noexcept { return offset_; }

    private:
        void send_chunk();

        ClientConnection &connection_;
        std::optional<std::string> request_id_;
        std::vector<std::byte> pending_;
        std::uint64_t offset_{};
    };

} // namespace sftpgate::server::client_common
