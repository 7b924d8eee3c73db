#include "sftpgate/server/zip_writer.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <limits>
#include <stdexcept>

#include "sftpgate/server/errors.hpp"

namespace sftpgate::server
{

    namespace
    {

        constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
        constexpr std::uint32_t kDataDescriptorSignature = 0x08074b50;
        constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
        constexpr std::uint32_t kZip64EndSignature = 0x06064b50;
        constexpr std::uint32_t kZip64LocatorSignature = 0x07064b50;
        constexpr std::uint32_t kEndSignature = 0x06054b50;

        constexpr std::uint16_t kFlagDataDescriptor = 0x0008;
        constexpr std::uint16_t kFlagUtf8 = 0x0800;
        constexpr std::uint16_t kMethodStored = 0;
        constexpr std::uint16_t kMethodDeflated = 8;
        constexpr std::uint16_t kVersionDefault = 20;
        constexpr std::uint16_t kVersionZip64 = 45;
        constexpr std::uint16_t kHostUnix = 3;
        constexpr std::uint16_t kZip64ExtraId = 0x0001;

        constexpr std::uint32_t kMax32 = 0xFFFFFFFF;
        constexpr std::uint16_t kMax16 = 0xFFFF;
        // Leaves room for deflate's worst-case expansion of incompressible input.
        constexpr std::uint64_t kZip64SizeThreshold = kMax32 - (kMax32 >> 10);

        constexpr std::uint32_t kModeTypeMask = 0170000;
        constexpr std::uint32_t kModeDirectory = 0040000;
        constexpr std::uint32_t kModeRegular = 0100000;
        constexpr std::uint32_t kDosDirectoryAttribute = 0x10;

        constexpr std::size_t kDeflateChunk = 64 * 1024;

        class ByteWriter
        {
        public:
            void u16(std::uint16_t value)
            {
                bytes_.push_back(static_cast<std::byte>(value & 0xFF));
                bytes_.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
            }

            void u32(std::uint32_t value)
            {
                for (int shift = 0; shift < 32; shift += 8)
                {
                    bytes_.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
                }
            }

            void u64(std::uint64_t value)
            {
                for (int shift = 0; shift < 64; shift += 8)
                {
                    bytes_.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
                }
            }

            void text(const std::string &value)
            {
                for (const char ch : value)
                {
                    bytes_.push_back(static_cast<std::byte>(ch));
                }
            }

            const std::vector<std::byte> &bytes() const noexcept { return bytes_; }

        private:
            std::vector<std::byte> bytes_;
        };

        std::uint32_t clamp32(std::uint64_t value)
        {
            return value >= kMax32 ? kMax32 : static_cast<std::uint32_t>(value);
        }

        void to_dos_time(std::int64_t modified_at, std::uint16_t &dos_time, std::uint16_t &dos_date)
        {
            dos_time = 0;
            dos_date = (1 << 5) | 1; // 1980-01-01
            if (modified_at <= 0)
            {
                return;
            }
            const auto seconds = static_cast<std::time_t>(modified_at);
            std::tm parts{};
            if (::localtime_r(&seconds, &parts) == nullptr || parts.tm_year < 80)
            {
                return;
            }
            dos_time = static_cast<std::uint16_t>((parts.tm_hour << 11) | (parts.tm_min << 5) | (parts.tm_sec / 2));
            dos_date = static_cast<std::uint16_t>(((parts.tm_year - 80) << 9) | ((parts.tm_mon + 1) << 5) | parts.tm_mday);
        }

        std::uint32_t external_attributes(std::uint32_t mode, bool directory)
        {
            if ((mode & kModeTypeMask) == 0)
            {
                mode |= directory ? (kModeDirectory | 0755) : (kModeRegular | 0644);
            }
            return (mode << 16) | (directory ? kDosDirectoryAttribute : 0);
        }

        [[noreturn]] void throw_zlib(const char *call, int rc)
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError,
                               std::string("zlib ") + call + " failed (" + std::to_string(rc) + ")");
        }

    } // namespace

    struct ZipWriter::Deflater
    {
        Deflater()
        {
            const int rc = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                                          Z_DEFAULT_STRATEGY);
            if (rc != Z_OK)
            {
                throw_zlib("deflateInit2", rc);
            }
        }

        ~Deflater()
        {
            ::deflateEnd(&stream);
        }

        Deflater(const Deflater &) = delete;
        Deflater &operator=(const Deflater &) = delete;

        z_stream stream{};
        std::array<std::byte, kDeflateChunk> out{};
    };

    ZipWriter::ZipWriter(OutputSink &sink)
        : sink_(sink) {}

    ZipWriter::~ZipWriter() = default;

    void ZipWriter::add_directory(const std::string &name, std::int64_t modified_at, std::uint32_t mode)
    {
        if (finished_ || current_)
        {
            throw std::logic_error("ZipWriter: cannot add a directory now");
        }
        Entry entry{};
        entry.name = name.ends_with('/') ? name : name + "/";
        entry.method = kMethodStored;
        to_dos_time(modified_at, entry.dos_time, entry.dos_date);
        entry.header_offset = offset_;
        entry.external_attributes = external_attributes(mode, true);
        write_local_header(entry);
        entries_.push_back(std::move(entry));
    }

    void ZipWriter::begin_file(const std::string &name, std::int64_t modified_at, std::uint32_t mode,
                               std::uint64_t size_hint)
    {
        if (finished_ || current_)
        {
            throw std::logic_error("ZipWriter: cannot begin a file now");
        }
        auto entry = std::make_unique<Entry>();
        entry->name = name;
        entry->method = kMethodDeflated;
        to_dos_time(modified_at, entry->dos_time, entry->dos_date);
        entry->header_offset = offset_;
        entry->external_attributes = external_attributes(mode, false);
        entry->zip64 = size_hint >= kZip64SizeThreshold;
        entry->crc = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));

        if (!deflater_)
        {
            deflater_ = std::make_unique<Deflater>();
        }
        else if (const int rc = ::deflateReset(&deflater_->stream); rc != Z_OK)
        {
            throw_zlib("deflateReset", rc);
        }

        write_local_header(*entry);
        current_ = std::move(entry);
    }

    void ZipWriter::write(std::span<const std::byte> data)
    {
        if (!current_)
        {
            throw std::logic_error("ZipWriter: no open entry");
        }
        auto &stream = deflater_->stream;
        while (!data.empty())
        {
            const auto take = std::min<std::size_t>(data.size(), std::numeric_limits<uInt>::max());
            const auto *input = reinterpret_cast<const Bytef *>(data.data());
            current_->crc = static_cast<std::uint32_t>(::crc32(current_->crc, input, static_cast<uInt>(take)));
            current_->uncompressed_size += take;

            stream.next_in = const_cast<Bytef *>(input);
            stream.avail_in = static_cast<uInt>(take);
            do
            {
                stream.next_out = reinterpret_cast<Bytef *>(deflater_->out.data());
                stream.avail_out = static_cast<uInt>(deflater_->out.size());
                const int rc = ::deflate(&stream, Z_NO_FLUSH);
                if (rc != Z_OK && rc != Z_BUF_ERROR)
                {
                    throw_zlib("deflate", rc);
                }
                const auto produced = deflater_->out.size() - stream.avail_out;
                if (produced > 0)
                {
                    emit(std::span<const std::byte>(deflater_->out.data(), produced));
                    current_->compressed_size += produced;
                }
            } while (stream.avail_out == 0);

            data = data.subspan(take);
        }
    }

    void ZipWriter::end_file()
    {
        close_entry(true);
    }

    void ZipWriter::abandon_file()
    {
        close_entry(false);
    }

    void ZipWriter::close_entry(bool keep)
    {
        if (!current_)
        {
            throw std::logic_error("ZipWriter: no open entry");
        }
        auto &stream = deflater_->stream;
        stream.next_in = Z_NULL;
        stream.avail_in = 0;
        int rc = Z_OK;
        do
        {
            stream.next_out = reinterpret_cast<Bytef *>(deflater_->out.data());
            stream.avail_out = static_cast<uInt>(deflater_->out.size());
            rc = ::deflate(&stream, Z_FINISH);
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR)
            {
                throw_zlib("deflate", rc);
            }
            const auto produced = deflater_->out.size() - stream.avail_out;
            if (produced > 0)
            {
                emit(std::span<const std::byte>(deflater_->out.data(), produced));
                current_->compressed_size += produced;
            }
        } while (rc != Z_STREAM_END);

        auto entry = std::move(current_);
        if (!entry->zip64 && (entry->compressed_size >= kMax32 || entry->uncompressed_size >= kMax32))
        {
            throw GatewayError(sftpgate::ErrorCode::InternalError,
                               "ZIP entry " + entry->name + " outgrew its declared size");
        }

        ByteWriter descriptor;
        descriptor.u32(kDataDescriptorSignature);
        descriptor.u32(entry->crc);
        if (entry->zip64)
        {
            descriptor.u64(entry->compressed_size);
            descriptor.u64(entry->uncompressed_size);
        }
        else
        {
            descriptor.u32(static_cast<std::uint32_t>(entry->compressed_size));
            descriptor.u32(static_cast<std::uint32_t>(entry->uncompressed_size));
        }
        emit(descriptor.bytes());

        if (keep)
        {
            entries_.push_back(std::move(*entry));
        }
    }

    void ZipWriter::finish()
    {
        if (finished_)
        {
            return;
        }
        if (current_)
        {
            throw std::logic_error("ZipWriter: finish with an open entry");
        }
        write_central_directory();
        finished_ = true;
    }

    void ZipWriter::write_local_header(const Entry &entry)
    {
        const bool streamed = entry.method == kMethodDeflated;
        ByteWriter header;
        header.u32(kLocalHeaderSignature);
        header.u16(entry.zip64 ? kVersionZip64 : kVersionDefault);
        header.u16(streamed ? (kFlagDataDescriptor | kFlagUtf8) : kFlagUtf8);
        header.u16(entry.method);
        header.u16(entry.dos_time);
        header.u16(entry.dos_date);
        header.u32(0); // crc, sizes follow in the data descriptor
        header.u32(entry.zip64 ? kMax32 : 0);
        header.u32(entry.zip64 ? kMax32 : 0);
        header.u16(static_cast<std::uint16_t>(entry.name.size()));
        header.u16(entry.zip64 ? 20 : 0);
        header.text(entry.name);
        if (entry.zip64)
        {
            header.u16(kZip64ExtraId);
            header.u16(16);
            header.u64(0);
            header.u64(0);
        }
        emit(header.bytes());
    }

    void ZipWriter::write_central_directory()
    {
        const auto directory_offset = offset_;
        for (const auto &entry : entries_)
        {
            const bool streamed = entry.method == kMethodDeflated;
            ByteWriter extra;
            if (entry.uncompressed_size >= kMax32)
            {
                extra.u64(entry.uncompressed_size);
            }
            if (entry.compressed_size >= kMax32)
            {
                extra.u64(entry.compressed_size);
            }
            if (entry.header_offset >= kMax32)
            {
                extra.u64(entry.header_offset);
            }
            const bool zip64 = entry.zip64 || !extra.bytes().empty();
            const auto version = zip64 ? kVersionZip64 : kVersionDefault;

            ByteWriter header;
            header.u32(kCentralHeaderSignature);
            header.u16(static_cast<std::uint16_t>((kHostUnix << 8) | version));
            header.u16(version);
            header.u16(streamed ? (kFlagDataDescriptor | kFlagUtf8) : kFlagUtf8);
            header.u16(entry.method);
            header.u16(entry.dos_time);
            header.u16(entry.dos_date);
            header.u32(entry.crc);
            header.u32(clamp32(entry.compressed_size));
            header.u32(clamp32(entry.uncompressed_size));
            header.u16(static_cast<std::uint16_t>(entry.name.size()));
            header.u16(static_cast<std::uint16_t>(extra.bytes().empty() ? 0 : extra.bytes().size() + 4));
            header.u16(0); // comment
            header.u16(0); // disk number
            header.u16(0); // internal attributes
            header.u32(entry.external_attributes);
            header.u32(clamp32(entry.header_offset));
            header.text(entry.name);
            if (!extra.bytes().empty())
            {
                header.u16(kZip64ExtraId);
                header.u16(static_cast<std::uint16_t>(extra.bytes().size()));
            }
            emit(header.bytes());
            if (!extra.bytes().empty())
            {
                emit(extra.bytes());
            }
        }
        const auto directory_size = offset_ - directory_offset;
        const auto count = static_cast<std::uint64_t>(entries_.size());

        ByteWriter trailer;
        if (count >= kMax16 || directory_offset >= kMax32 || directory_size >= kMax32)
        {
            const auto zip64_end_offset = offset_;
            trailer.u32(kZip64EndSignature);
            trailer.u64(44);
            trailer.u16(static_cast<std::uint16_t>((kHostUnix << 8) | kVersionZip64));
            trailer.u16(kVersionZip64);
            trailer.u32(0);
            trailer.u32(0);
            trailer.u64(count);
            trailer.u64(count);
            trailer.u64(directory_size);
            trailer.u64(directory_offset);

            trailer.u32(kZip64LocatorSignature);
            trailer.u32(0);
            trailer.u64(zip64_end_offset);
            trailer.u32(1);
        }
        trailer.u32(kEndSignature);
        trailer.u16(0);
        trailer.u16(0);
        trailer.u16(static_cast<std::uint16_t>(std::min<std::uint64_t>(count, kMax16)));
        trailer.u16(static_cast<std::uint16_t>(std::min<std::uint64_t>(count, kMax16)));
        trailer.u32(clamp32(directory_size));
        trailer.u32(clamp32(directory_offset));
        trailer.u16(0); // comment
        emit(trailer.bytes());
    }

    void ZipWriter::emit(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        sink_.write(data);
        offset_ += data.size();
    }

    void ZipWriter::emit(const std::vector<std::byte> &data)
    {
        emit(std::span<const std::byte>(data.data(), data.size()));
    }

} // namespace sftpgate::server
