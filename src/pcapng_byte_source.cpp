#include "pcapng_blocks/pcapng_byte_source.h"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include "pcapng_blocks/pcapng_error.h"

using namespace pcapng_blocks;

namespace {
    constexpr size_t read_chunk_len {64 * 1024};

    PcapngDescriptiveError short_read_error(size_t requested, size_t available) {
        return PcapngDescriptiveError {ErrorCode::short_read,
            "Requested " + std::to_string(requested) + " bytes, only " + std::to_string(available) + " available"};
    }
} // namespace

// ByteSource

std::vector<byte_t> ByteSource::read_bytes(size_t len) {
    std::vector<byte_t> result;
    while (result.size() < len) {
        const auto offset {result.size()};
        const auto chunk {std::min(len - offset, read_chunk_len)};
        result.resize(offset + chunk);
        read(Span<byte_t> {result.data() + offset, chunk});
    }
    return result;
}

// MemoryByteSource

MemoryByteSource::MemoryByteSource(Span<const byte_t> data)
    : data_ {data}
{
}

void MemoryByteSource::read(Span<byte_t> out) {
    if (out.size() > remaining()) {
        throw short_read_error(out.size(), remaining());
    }
    std::copy_n(data_.begin() + pos_, out.size(), out.begin());
    pos_ += out.size();
}

bool MemoryByteSource::eof() const {
    return pos_ >= data_.size();
}

std::vector<byte_t> MemoryByteSource::read_bytes(size_t len) {
    if (len > remaining()) {
        throw short_read_error(len, remaining());
    }
    std::vector<byte_t> result(data_.begin() + pos_, data_.begin() + pos_ + len);
    pos_ += len;
    return result;
}

size_t MemoryByteSource::remaining() const {
    return data_.size() - pos_;
}

// StreamByteSource

StreamByteSource::StreamByteSource(std::istream& stream)
    : stream_ {stream}
{
}

void StreamByteSource::read(Span<byte_t> out) {
    if (out.empty()) {
        return;
    }
    if (stream_.bad()) {
        throw PcapngDescriptiveError {ErrorCode::stream_failure, "Stream is in bad state before read"};
    }
    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    const auto got {static_cast<size_t>(stream_.gcount())};
    if (stream_.bad()) {
        throw PcapngDescriptiveError {ErrorCode::stream_failure,
            "Stream failed after reading " + std::to_string(got) + " of " + std::to_string(out.size()) + " bytes"};
    }
    if (got != out.size()) {
        throw PcapngDescriptiveError {ErrorCode::short_read,
            "Requested " + std::to_string(out.size()) + " bytes from stream, got " + std::to_string(got)};
    }
}

bool StreamByteSource::eof() const {
    if (stream_.bad()) {
        throw PcapngDescriptiveError {ErrorCode::stream_failure, "Stream is in bad state"};
    }
    const auto result {stream_.peek() == std::istream::traits_type::eof()};
    if (stream_.bad()) {
        throw PcapngDescriptiveError {ErrorCode::stream_failure, "Stream failed while checking for end of data"};
    }
    return result;
}

// free functions

std::vector<byte_t> pcapng_blocks::read_bytes(ByteSource& source, size_t len) {
    return source.read_bytes(len);
}

uint64_t pcapng_blocks::read_le_uint_n(ByteSource& source, size_t len) {
    if (len > sizeof(uint64_t)) {
        throw std::invalid_argument {"read_le_uint_n: integer wider than 64 bits requested"};
    }
    std::array<byte_t, sizeof(uint64_t)> buf {};
    source.read(Span<byte_t> {buf.data(), len});
    uint64_t result {0};
    for (size_t i {0}; i < len; ++i) {
        result |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return result;
}
