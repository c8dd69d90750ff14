#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_functions.h"
#include "pcapng_option_decoding.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

namespace {
    std::optional<EnhancedPacketOption> map_packet_option(const RawOption& raw) {
        MemoryByteSource value {raw.data};
        switch (raw.code) {
            case option_comment:
                return Comment {functions::to_utf8_string(raw.data)};
            case option_epb_flags:
                return epb::Flags {read_le<uint32_t>(value)};
            case option_epb_hash: {
                epb::Hash opt;
                opt.algorithm = read_le<uint8_t>(value);
                opt.digest = read_bytes(value, value.remaining());
                return opt;
            }
            case option_epb_dropcount:
                return epb::DropCount {read_le<uint64_t>(value)};
            default:
                return {};
        }
    }
} // namespace

EnhancedPacketBlock pcapng_blocks::read_enhanced_packet_block(ByteSource& payload, const DecoderConfig& config) {
    //                         1                   2                   3
    //     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  0 |                         Interface ID                          |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  4 |                        Timestamp (High)                       |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  8 |                        Timestamp (Low)                        |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // 12 |                    Captured Packet Length                     |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // 16 |                    Original Packet Length                     |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // 20 /                                                               /
    //    /                          Packet Data                          /
    //    /              variable length, padded to 32 bits               /
    //    /                                                               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //    /                                                               /
    //    /                      Options (variable)                       /
    //    /                                                               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    EnhancedPacketBlock block;
    block.interface_id = read_le<uint32_t>(payload);
    block.timestamp.high = read_le<uint32_t>(payload);
    block.timestamp.low = read_le<uint32_t>(payload);
    block.captured_length = read_le<uint32_t>(payload);
    block.original_length = read_le<uint32_t>(payload);
    block.packet_data = read_bytes(payload, functions::get_4_byte_aligned_len(block.captured_length));
    block.packet_data.resize(block.captured_length);
    block.options = detail::read_options<EnhancedPacketOption>(payload, config, "enhanced packet block", map_packet_option);
    return block;
}
