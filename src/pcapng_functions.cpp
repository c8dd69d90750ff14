#include "pcapng_blocks/pcapng_functions.h"
#include <cstdint>
#include "pcapng_blocks/pcapng_error.h"

namespace pcapng_blocks::functions {

size_t get_4_byte_aligned_len(size_t len) {
    constexpr auto alignment {sizeof(uint32_t)};
    return len % alignment == 0 ? len : (len / alignment + 1) * alignment;
}

bool is_valid_utf8(Span<const byte_t> data) {
    size_t i {0};
    while (i < data.size()) {
        const byte_t c {data[i]};
        size_t len {0};
        uint32_t cp {0};
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (data.size() - i < len) {
            return false;
        }
        for (size_t j {1}; j < len; ++j) {
            if ((data[i + j] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (data[i + j] & 0x3F);
        }

        // reject overlong forms, surrogates and values above U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string to_utf8_string(Span<const byte_t> data) {
    if (!is_valid_utf8(data)) {
        throw PcapngError {ErrorCode::invalid_utf8};
    }
    return std::string(data.begin(), data.end());
}

} // namespace pcapng_blocks::functions
