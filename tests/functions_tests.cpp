#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>
#include "pcapng_blocks/pcapng_error.h"
#include "pcapng_blocks/pcapng_functions.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::functions;

namespace {
    std::vector<byte_t> bytes(std::initializer_list<int> values) {
        std::vector<byte_t> result;
        for (auto v : values) {
            result.push_back(static_cast<byte_t>(v));
        }
        return result;
    }
}

TEST(Functions, AlignedLength) {
    ASSERT_EQ(get_4_byte_aligned_len(0), 0);
    ASSERT_EQ(get_4_byte_aligned_len(1), 4);
    ASSERT_EQ(get_4_byte_aligned_len(4), 4);
    ASSERT_EQ(get_4_byte_aligned_len(5), 8);
    ASSERT_EQ(get_4_byte_aligned_len(0xFFFF), 0x10000);

    for (size_t n {0}; n < 64; ++n) {
        const auto aligned {get_4_byte_aligned_len(n)};
        ASSERT_EQ(aligned % 4, 0);
        ASSERT_GE(aligned, n);
        ASSERT_LT(aligned, n + 4);
        ASSERT_EQ(get_4_byte_aligned_len(aligned), aligned);
        if (n % 4 == 0) {
            ASSERT_EQ(aligned, n);
        }
    }
}

TEST(Functions, ValidUtf8) {
    ASSERT_TRUE(is_valid_utf8({}));
    const std::string ascii {"Hello world"};
    ASSERT_TRUE(is_valid_utf8(Span<const byte_t> {reinterpret_cast<const byte_t*>(ascii.data()), ascii.size()}));
    // "привет"
    ASSERT_TRUE(is_valid_utf8(bytes({0xD0, 0xBF, 0xD1, 0x80, 0xD0, 0xB8, 0xD0, 0xB2, 0xD0, 0xB5, 0xD1, 0x82})));
    // euro sign and U+1F600
    ASSERT_TRUE(is_valid_utf8(bytes({0xE2, 0x82, 0xAC, 0xF0, 0x9F, 0x98, 0x80})));
    ASSERT_TRUE(is_valid_utf8(bytes({'a', 0x00, 'b'})));
}

TEST(Functions, InvalidUtf8) {
    // stray continuation byte
    ASSERT_FALSE(is_valid_utf8(bytes({0x80})));
    // truncated sequence
    ASSERT_FALSE(is_valid_utf8(bytes({'a', 0xE2, 0x82})));
    // overlong '/'
    ASSERT_FALSE(is_valid_utf8(bytes({0xC0, 0xAF})));
    // surrogate half U+D800
    ASSERT_FALSE(is_valid_utf8(bytes({0xED, 0xA0, 0x80})));
    // above U+10FFFF
    ASSERT_FALSE(is_valid_utf8(bytes({0xF4, 0x90, 0x80, 0x80})));
    ASSERT_FALSE(is_valid_utf8(bytes({0xFF, 0xFE})));
}

TEST(Functions, Utf8String) {
    ASSERT_EQ(to_utf8_string(bytes({'t', 'e', 's', 't'})), "test");
    try {
        to_utf8_string(bytes({'t', 0xFF}));
        FAIL() << "Must throw";
    } catch (const PcapngError& err) {
        ASSERT_EQ(err.code(), ErrorCode::invalid_utf8);
        ASSERT_EQ(err.kind(), ErrorKind::format);
    }
}
