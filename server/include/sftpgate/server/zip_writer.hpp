/**
 * sftpgate - Streaming ZIP producer.
 *
 * Entries are written front to back with data descriptors, so the sink never has to seek. File data
 * is raw deflate; directories are stored. ZIP64 records appear only when a size, offset or the entry
 * count no longer fits the classic fields.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "sftpgate/server/output_sink.hpp"

namespace sftpgate::server
{

    class ZipWriter
    {
    public:
        explicit ZipWriter(OutputSink &sink);
        ~ZipWriter();

        ZipWriter(const ZipWriter &) = delete;
        ZipWriter &operator=(const ZipWriter &) = delete;

        // `name` must end in '/'.
        void add_directory(const std::string &name, std::int64_t modified_at, std::uint32_t mode);

        // `size_hint` is the expected uncompressed size; entries that may reach 4 GiB are written as ZIP64.
        void begin_file(const std::string &name, std::int64_t modified_at, std::uint32_t mode,
                        std::uint64_t size_hint);
        void write(std::span<const std::byte> data);
        void end_file();

        // Terminates the open entry so the stream stays well formed, but leaves it out of the
        // central directory; archive tools will not list it.
        void abandon_file();

        // Writes the central directory and end records. Later calls do nothing.
        void finish();

        bool entry_open() const noexcept { return current_ != nullptr; }
        std::size_t entry_count() const noexcept { return entries_.size(); }
        std::uint64_t bytes_written() const noexcept { return offset_; }

    private:
        struct Entry
        {
            std::string name;
            std::uint16_t method{};
            std::uint16_t dos_time{};
            std::uint16_t dos_date{};
            std::uint32_t crc{};
            std::uint64_t compressed_size{};
            std::uint64_t uncompressed_size{};
            std::uint64_t header_offset{};
            std::uint32_t external_attributes{};
            bool zip64{};
        };

        struct Deflater;

        void write_local_header(const Entry &entry);
        void close_entry(bool keep);
        void emit(std::span<const std::byte> data);
        void emit(const std::vector<std::byte> &data);
        void write_central_directory();

        OutputSink &sink_;
        std::uint64_t offset_{0};
        std::vector<Entry> entries_;
        std::unique_ptr<Entry> current_;
        std::unique_ptr<Deflater> deflater_;
        bool finished_{false};
    };

} // namespace sftpgate::server
