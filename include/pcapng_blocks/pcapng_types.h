#ifndef __PCAPNG_TYPES_H__
#define __PCAPNG_TYPES_H__
#include <cstdint>
#include <vector>
#include "tcb/span.hpp"

namespace pcapng_blocks {
    // we are targeting compilers with no c++20 support, so use non-standard span implementation
    template<typename T> using Span = tcb::span<T>;
    using byte_t = unsigned char;

    struct Version {
        uint16_t major;
        uint16_t minor;
    };

    // block as it was framed on the wire, payload is not interpreted yet
    struct RawBlock {
        uint32_t type {};
        std::vector<byte_t> data;
    };

    struct RawOption {
        uint16_t code {};
        std::vector<byte_t> data;
    };

    // pcapng timestamps are stored as two 32 bit words, most significant one first
    struct Timestamp {
        uint32_t high {};
        uint32_t low {};

        uint64_t value() const {
            return (static_cast<uint64_t>(high) << 32) | low;
        }
    };
}
#endif // __PCAPNG_TYPES_H__
