#ifndef __PCAPNG_OPTIONS_H__
#define __PCAPNG_OPTIONS_H__
#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "pcapng_types.h"

/*
    Typed options for every supported block. Option code spaces are independent for each block
    type (e.g. code 2 is shb_hardware for section header and if_name for interface description),
    so every block has its own closed std::variant of options.
*/
namespace pcapng_blocks {
    // opt_comment, the only option shared by all blocks
    struct Comment {
        std::string text;
    };

    // option kept as is, produced only with UnknownOptionPolicy::preserve
    struct UnknownOption {
        uint16_t code {};
        std::vector<byte_t> data;
    };

    namespace shb {
        struct Hardware {
            std::string text;
        };

        struct Os {
            std::string text;
        };

        struct UserApplication {
            std::string text;
        };
    }

    namespace idb {
        struct Name {
            std::string text;
        };

        struct Description {
            std::string text;
        };

        struct Ipv4Address {
            uint32_t address {};
            uint32_t mask {};
        };

        struct Ipv6Address {
            std::array<byte_t, 16> address {};
            uint8_t prefix_length {};
        };

        // 48 bit address, first byte on the wire is the least significant one
        struct MacAddress {
            uint64_t address {};
        };

        struct EuiAddress {
            uint64_t address {};
        };

        // bits per second
        struct Speed {
            uint64_t value {};
        };

        // If the MSB is zero, the remaining bits are the resolution as a negative power of 10
        // (6 means microseconds). If the MSB is set, they are a negative power of 2.
        struct TimestampResolution {
            uint8_t value {};

            bool is_power_of_two() const { return (value & 0x80) != 0; }
            uint8_t exponent() const { return value & 0x7F; }
        };

        struct Timezone {
            uint32_t value {};
        };

        // first byte of the option is the filter type (libpcap string, BPF bytecode, ...)
        struct Filter {
            uint8_t kind {};
            std::vector<byte_t> data;
        };

        struct Os {
            std::string text;
        };

        // frame check sequence length in bits
        struct FcsLength {
            uint8_t value {};
        };

        // seconds added to every timestamp of the interface
        struct TimestampOffset {
            uint64_t value {};
        };
    }

    namespace isb {
        struct StartTime {
            Timestamp time;
        };

        struct EndTime {
            Timestamp time;
        };

        struct Received {
            uint64_t count {};
        };

        struct Dropped {
            uint64_t count {};
        };

        struct FilterAccepted {
            uint64_t count {};
        };

        struct OsDropped {
            uint64_t count {};
        };

        struct Delivered {
            uint64_t count {};
        };
    }

    namespace epb {
        struct Flags {
            uint32_t value {};
        };

        struct Hash {
            uint8_t algorithm {};
            std::vector<byte_t> digest;
        };

        // packets lost between this packet and the preceding one
        struct DropCount {
            uint64_t count {};
        };
    }

    using SectionHeaderOption = std::variant<
        Comment,
        shb::Hardware,
        shb::Os,
        shb::UserApplication,
        UnknownOption
    >;

    using InterfaceDescriptionOption = std::variant<
        Comment,
        idb::Name,
        idb::Description,
        idb::Ipv4Address,
        idb::Ipv6Address,
        idb::MacAddress,
        idb::EuiAddress,
        idb::Speed,
        idb::TimestampResolution,
        idb::Timezone,
        idb::Filter,
        idb::Os,
        idb::FcsLength,
        idb::TimestampOffset,
        UnknownOption
    >;

    using InterfaceStatisticsOption = std::variant<
        Comment,
        isb::StartTime,
        isb::EndTime,
        isb::Received,
        isb::Dropped,
        isb::FilterAccepted,
        isb::OsDropped,
        isb::Delivered,
        UnknownOption
    >;

    using EnhancedPacketOption = std::variant<
        Comment,
        epb::Flags,
        epb::Hash,
        epb::DropCount,
        UnknownOption
    >;
}
#endif // __PCAPNG_OPTIONS_H__
