#ifndef __PCAPNG_BLOCK_READER_H__
#define __PCAPNG_BLOCK_READER_H__
#include "pcapng_byte_source.h"

namespace pcapng_blocks {
    // reads one block envelope and checks the trailing length,
    // stream is advanced by exactly 12 + align4(total_length - 12) bytes
    RawBlock read_raw_block(ByteSource& source);
}
#endif // __PCAPNG_BLOCK_READER_H__
