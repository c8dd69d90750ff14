#include <gtest/gtest.h>
#include <variant>
#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_error.h"
#include "test_bytes.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;
using namespace pcapng_blocks::test;

namespace {
    // ethernet, reserved field is filled with garbage to check that it is skipped
    Bytes interface_fields() {
        return Bytes {}.u16(1).u16(0xFFFF).u32(262144);
    }
}

TEST(InterfaceDescription, FixedFields) {
    const auto payload {interface_fields().data()};
    MemoryByteSource source {payload};
    const auto block {read_interface_description_block(source)};
    ASSERT_EQ(block.link_type, 1);
    ASSERT_EQ(block.snapshot_length, 262144);
    ASSERT_TRUE(block.options.empty());
}

TEST(InterfaceDescription, AllOptions) {
    const std::vector<byte_t> ipv6 {
        0xFE, 0x80, 0, 0, 0, 0, 0, 0, 0x02, 0x11, 0x22, 0xFF, 0xFE, 0x33, 0x44, 0x55, 64
    };
    const auto payload {interface_fields()
        .option(option_comment, "uplink")
        .option(option_if_name, "eth0")
        .option(option_if_description, "Intel I210")
        .option(option_if_ipv4addr, Bytes {}.u32(0x0100A8C0).u32(0x00FFFFFF).data())
        .option(option_if_ipv6addr, ipv6)
        .option(option_if_macaddr, std::vector<byte_t> {0x00, 0x11, 0x22, 0x33, 0x44, 0x55})
        .option(option_if_euiaddr, std::vector<byte_t> {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08})
        .option(option_if_speed, Bytes {}.u64(1000000000).data())
        .option(option_if_tsresol, std::vector<byte_t> {6})
        .option(option_if_tzone, Bytes {}.u32(3600).data())
        .option(option_if_filter, Bytes {}.u8(0).text("tcp port 80").data())
        .option(option_if_os, "Linux")
        .option(option_if_fcslen, std::vector<byte_t> {4})
        .option(option_if_tsoffset, Bytes {}.u64(1700000000).data())
        .end_of_options()
        .data()};
    MemoryByteSource source {payload};

    const auto block {read_interface_description_block(source)};
    ASSERT_EQ(block.options.size(), 14);
    ASSERT_EQ(std::get<Comment>(block.options[0]).text, "uplink");
    ASSERT_EQ(std::get<idb::Name>(block.options[1]).text, "eth0");
    ASSERT_EQ(std::get<idb::Description>(block.options[2]).text, "Intel I210");

    const auto& ipv4 {std::get<idb::Ipv4Address>(block.options[3])};
    ASSERT_EQ(ipv4.address, 0x0100A8C0);
    ASSERT_EQ(ipv4.mask, 0x00FFFFFF);

    const auto& ipv6_opt {std::get<idb::Ipv6Address>(block.options[4])};
    ASSERT_EQ(ipv6_opt.address[0], 0xFE);
    ASSERT_EQ(ipv6_opt.address[15], 0x55);
    ASSERT_EQ(ipv6_opt.prefix_length, 64);

    ASSERT_EQ(std::get<idb::MacAddress>(block.options[5]).address, 0x554433221100);
    ASSERT_EQ(std::get<idb::EuiAddress>(block.options[6]).address, 0x0807060504030201);
    ASSERT_EQ(std::get<idb::Speed>(block.options[7]).value, 1000000000);

    const auto& resolution {std::get<idb::TimestampResolution>(block.options[8])};
    ASSERT_FALSE(resolution.is_power_of_two());
    ASSERT_EQ(resolution.exponent(), 6);

    ASSERT_EQ(std::get<idb::Timezone>(block.options[9]).value, 3600);

    const auto& filter {std::get<idb::Filter>(block.options[10])};
    ASSERT_EQ(filter.kind, 0);
    ASSERT_EQ(to_string(filter.data), "tcp port 80");

    ASSERT_EQ(std::get<idb::Os>(block.options[11]).text, "Linux");
    ASSERT_EQ(std::get<idb::FcsLength>(block.options[12]).value, 4);
    ASSERT_EQ(std::get<idb::TimestampOffset>(block.options[13]).value, 1700000000);
}

TEST(InterfaceDescription, PowerOfTwoResolution) {
    const auto payload {interface_fields()
        .option(option_if_tsresol, std::vector<byte_t> {0x8A})
        .end_of_options()
        .data()};
    MemoryByteSource source {payload};
    const auto block {read_interface_description_block(source)};
    const auto& resolution {std::get<idb::TimestampResolution>(block.options.at(0))};
    ASSERT_TRUE(resolution.is_power_of_two());
    ASSERT_EQ(resolution.exponent(), 10);
}

TEST(InterfaceDescription, UnknownOption) {
    const auto payload {interface_fields()
        .option(option_if_name, "eth0")
        .option(99, "what is this")
        .end_of_options()
        .data()};
    {
        MemoryByteSource source {payload};
        try {
            read_interface_description_block(source);
            FAIL() << "Must throw";
        } catch (const PcapngError& err) {
            ASSERT_EQ(err.code(), ErrorCode::unknown_option);
            ASSERT_EQ(err.kind(), ErrorKind::format);
        }
    }
    {
        MemoryByteSource source {payload};
        DecoderConfig config;
        config.unknown_options = UnknownOptionPolicy::preserve;
        const auto block {read_interface_description_block(source, config)};
        ASSERT_EQ(block.options.size(), 2);
        ASSERT_EQ(std::get<idb::Name>(block.options[0]).text, "eth0");
        const auto& unknown {std::get<UnknownOption>(block.options[1])};
        ASSERT_EQ(unknown.code, 99);
        ASSERT_EQ(to_string(unknown.data), "what is this");
    }
}

TEST(InterfaceDescription, ShortStructuredOption) {
    // if_ipv4addr must hold address and mask
    const auto payload {interface_fields()
        .option(option_if_ipv4addr, Bytes {}.u32(0x0100A8C0).data())
        .end_of_options()
        .data()};
    MemoryByteSource source {payload};
    ASSERT_EQ(error_code_of([&] { read_interface_description_block(source); }), ErrorCode::short_read);
}

TEST(InterfaceDescription, InvalidUtf8Name) {
    const auto payload {interface_fields()
        .option(option_if_name, std::vector<byte_t> {'e', 't', 'h', 0xFF})
        .end_of_options()
        .data()};
    MemoryByteSource source {payload};
    ASSERT_EQ(error_code_of([&] { read_interface_description_block(source); }), ErrorCode::invalid_utf8);
}
