#include "pcapng_blocks/pcapng_block_reader.h"
#include <string>
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_error.h"
#include "pcapng_blocks/pcapng_functions.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

RawBlock pcapng_blocks::read_raw_block(ByteSource& source) {
    //                         1                   2                   3
    //     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  0 |                          Block Type                           |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  4 |                      Block Total Length                       |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  8 /                          Block Body                           /
    //    /              variable length, padded to 32 bits               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //    |                      Block Total Length                       |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    RawBlock result;
    result.type = read_le<uint32_t>(source);
    const auto total_len {read_le<uint32_t>(source)};
    if (total_len < block_base_len) {
        throw PcapngDescriptiveError {ErrorCode::framing_mismatch,
            "Block total length " + std::to_string(total_len) + " is less than block header size"};
    }

    const size_t data_len {total_len - block_base_len};
    result.data = read_bytes(source, functions::get_4_byte_aligned_len(data_len));
    result.data.resize(data_len);

    const auto footer_len {read_le<uint32_t>(source)};
    if (footer_len != total_len) {
        throw PcapngDescriptiveError {ErrorCode::framing_mismatch,
            "Block total length " + std::to_string(total_len) + " does not match trailing length " + std::to_string(footer_len)};
    }
    return result;
}
