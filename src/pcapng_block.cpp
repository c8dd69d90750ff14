#include "pcapng_blocks/pcapng_block.h"
#include <string>
#include "pcapng_blocks/pcapng_block_reader.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_error.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

Block pcapng_blocks::decode_block(const RawBlock& raw, const DecoderConfig& config) {
    MemoryByteSource payload {raw.data};
    switch (raw.type) {
        case section_header_block:
            return read_section_header_block(payload, config);
        case interface_block:
            return read_interface_description_block(payload, config);
        case interface_statistics_block:
            return read_interface_statistics_block(payload, config);
        case enhanced_packet_block:
            return read_enhanced_packet_block(payload, config);
        default:
            throw PcapngDescriptiveError {ErrorCode::unknown_block_type,
                "Unknown block type " + std::to_string(raw.type)};
    }
}

Block pcapng_blocks::read_block(ByteSource& source, const DecoderConfig& config) {
    return decode_block(read_raw_block(source), config);
}
