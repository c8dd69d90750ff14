#include <string>
#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_error.h"
#include "pcapng_blocks/pcapng_functions.h"
#include "pcapng_option_decoding.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

namespace {
    std::optional<SectionHeaderOption> map_section_header_option(const RawOption& raw) {
        switch (raw.code) {
            case option_comment:
                return Comment {functions::to_utf8_string(raw.data)};
            case option_shb_hardware:
                return shb::Hardware {functions::to_utf8_string(raw.data)};
            case option_shb_os:
                return shb::Os {functions::to_utf8_string(raw.data)};
            case option_shb_userappl:
                return shb::UserApplication {functions::to_utf8_string(raw.data)};
            default:
                return {};
        }
    }
} // namespace

SectionHeaderBlock pcapng_blocks::read_section_header_block(ByteSource& payload, const DecoderConfig& config) {
    //                         1                   2                   3
    //     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  0 |                      Byte-Order Magic                         |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  4 |          Major Version        |         Minor Version         |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  8 |                                                               |
    //    |                          Section Length                       |
    //    |                                                               |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // 16 /                                                               /
    //    /                      Options (variable)                       /
    //    /                                                               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    SectionHeaderBlock block;
    block.magic = read_le<uint32_t>(payload);
    if (block.magic != byte_order_magic) {
        // big-endian sections are not supported, they will show up here as 0x4D3C2B1A
        throw PcapngDescriptiveError {ErrorCode::wrong_magic_number,
            "Unsupported byte order magic " + std::to_string(block.magic)};
    }
    block.version.major = read_le<uint16_t>(payload);
    block.version.minor = read_le<uint16_t>(payload);
    block.section_length = read_le<uint64_t>(payload);
    block.options = detail::read_options<SectionHeaderOption>(payload, config, "section header block", map_section_header_option);
    return block;
}
