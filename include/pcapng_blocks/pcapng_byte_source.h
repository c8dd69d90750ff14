#ifndef __PCAPNG_BYTE_SOURCE_H__
#define __PCAPNG_BYTE_SOURCE_H__
#include <istream>
#include <type_traits>
#include <vector>
#include "pcapng_types.h"

namespace pcapng_blocks {
    /*
        Minimal readable byte stream used by all decoders. Implementations must either fill the
        whole output buffer or throw PcapngError of ErrorKind::transport.
    */
    class ByteSource {
        public:
            virtual ~ByteSource() noexcept = default;
            virtual void read(Span<byte_t> out) = 0;
            // true when no more bytes can be read
            virtual bool eof() const = 0;
            // reads len bytes; memory grows with the data actually read, so a bogus length
            // declared by damaged input fails with ErrorCode::short_read instead of a huge allocation
            virtual std::vector<byte_t> read_bytes(size_t len);
    };


    // reads from a memory region owned by the caller, the region must outlive the source
    class MemoryByteSource final : public ByteSource {
        public:
            explicit MemoryByteSource(Span<const byte_t> data);
            void read(Span<byte_t> out) override;
            bool eof() const override;
            std::vector<byte_t> read_bytes(size_t len) override;
            size_t remaining() const;

        private:
            Span<const byte_t> data_;
            size_t pos_ {0};
    };


    class StreamByteSource final : public ByteSource {
        public:
            explicit StreamByteSource(std::istream& stream);
            void read(Span<byte_t> out) override;
            // throws PcapngError with ErrorCode::stream_failure if the stream is broken
            bool eof() const override;

        private:
            std::istream& stream_;
    };


    std::vector<byte_t> read_bytes(ByteSource& source, size_t len);
    // reads len bytes as little-endian unsigned integer, throws std::invalid_argument if len > 8
    uint64_t read_le_uint_n(ByteSource& source, size_t len);

    template<typename T>
    T read_le(ByteSource& source) {
        static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>);
        return static_cast<T>(read_le_uint_n(source, sizeof(T)));
    }
}
#endif // __PCAPNG_BYTE_SOURCE_H__
