#pragma once

#include <cstddef>
#include <span>

namespace sftpgate::server
{

    // Non-seekable byte consumer for streamed downloads and archives. write() throws SinkError once
    // the consumer has gone away; nothing more should be written after that.
    class OutputSink
    {
    public:
        virtual ~OutputSink() = default;

        virtual void write(std::span<const std::byte> data) = 0;
    };

} // namespace sftpgate::server
