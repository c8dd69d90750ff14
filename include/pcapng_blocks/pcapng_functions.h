#ifndef __PCAPNG_FUNCTIONS_H__
#define __PCAPNG_FUNCTIONS_H__
#include <cstddef>
#include <string>
#include "pcapng_types.h"

namespace pcapng_blocks::functions {
    // smallest multiple of 4 which is not less than len
    size_t get_4_byte_aligned_len(size_t len);
    bool is_valid_utf8(Span<const byte_t> data);
    // converts option value to string, throws PcapngError with ErrorCode::invalid_utf8 on bad input
    std::string to_utf8_string(Span<const byte_t> data);
}
#endif // __PCAPNG_FUNCTIONS_H__
