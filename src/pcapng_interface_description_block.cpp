#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_functions.h"
#include "pcapng_option_decoding.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

namespace {
    constexpr size_t mac_address_len {6};

    std::optional<InterfaceDescriptionOption> map_interface_option(const RawOption& raw) {
        MemoryByteSource value {raw.data};
        switch (raw.code) {
            case option_comment:
                return Comment {functions::to_utf8_string(raw.data)};
            case option_if_name:
                return idb::Name {functions::to_utf8_string(raw.data)};
            case option_if_description:
                return idb::Description {functions::to_utf8_string(raw.data)};
            case option_if_ipv4addr: {
                idb::Ipv4Address opt;
                opt.address = read_le<uint32_t>(value);
                opt.mask = read_le<uint32_t>(value);
                return opt;
            }
            case option_if_ipv6addr: {
                idb::Ipv6Address opt;
                value.read(opt.address);
                opt.prefix_length = read_le<uint8_t>(value);
                return opt;
            }
            case option_if_macaddr:
                return idb::MacAddress {read_le_uint_n(value, mac_address_len)};
            case option_if_euiaddr:
                return idb::EuiAddress {read_le<uint64_t>(value)};
            case option_if_speed:
                return idb::Speed {read_le<uint64_t>(value)};
            case option_if_tsresol:
                return idb::TimestampResolution {read_le<uint8_t>(value)};
            case option_if_tzone:
                return idb::Timezone {read_le<uint32_t>(value)};
            case option_if_filter: {
                idb::Filter opt;
                opt.kind = read_le<uint8_t>(value);
                opt.data = read_bytes(value, value.remaining());
                return opt;
            }
            case option_if_os:
                return idb::Os {functions::to_utf8_string(raw.data)};
            case option_if_fcslen:
                return idb::FcsLength {read_le<uint8_t>(value)};
            case option_if_tsoffset:
                return idb::TimestampOffset {read_le<uint64_t>(value)};
            default:
                return {};
        }
    }
} // namespace

InterfaceDescriptionBlock pcapng_blocks::read_interface_description_block(ByteSource& payload, const DecoderConfig& config) {
    //                         1                   2                   3
    //     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  0 |           LinkType            |           Reserved            |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  4 |                            SnapLen                            |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  8 /                                                               /
    //    /                      Options (variable)                       /
    //    /                                                               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    InterfaceDescriptionBlock block;
    block.link_type = read_le<uint16_t>(payload);
    // reserved
    read_le<uint16_t>(payload);
    block.snapshot_length = read_le<uint32_t>(payload);
    block.options = detail::read_options<InterfaceDescriptionOption>(payload, config, "interface description block", map_interface_option);
    return block;
}
