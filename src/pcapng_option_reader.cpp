#include "pcapng_blocks/pcapng_option_reader.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_functions.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

OptionReader::OptionReader(ByteSource& source)
    : source_ {source}
{
}

std::optional<RawOption> OptionReader::next() {
    //                      1                   2                   3
    //  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |      Option Code              |         Option Length         |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // /                       Option Value                            /
    // /              variable length, padded to 32 bits               /
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // /                                                               /
    // /                 . . . other options . . .                     /
    // /                                                               /
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // |   Option Code == opt_endofopt |   Option Length == 0          |
    // +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    if (finished_ || source_.eof()) {
        finished_ = true;
        return {};
    }

    RawOption opt {};
    opt.code = read_le<uint16_t>(source_);
    const auto len {read_le<uint16_t>(source_)};
    opt.data = read_bytes(source_, functions::get_4_byte_aligned_len(len));
    opt.data.resize(len);
    if (opt.code == option_endofopt) {
        finished_ = true;
        return {};
    }
    return opt;
}
