#ifndef __PCAPNG_CONSTANTS_H__
#define __PCAPNG_CONSTANTS_H__
#include <cstdint>
#include <cstddef>

namespace pcapng_blocks::constants {
    constexpr uint32_t section_header_block {0x0A0D0D0A};
    constexpr uint32_t interface_block {1};
    constexpr uint32_t interface_statistics_block {5};
    constexpr uint32_t enhanced_packet_block {6};

    constexpr uint32_t byte_order_magic {0x1A2B3C4D};
    // section length value meaning "not specified"
    constexpr uint64_t unspecified_section_length {0xFFFFFFFFFFFFFFFF};

    // type + total length + trailing total length
    constexpr size_t block_base_len {3 * sizeof(uint32_t)};
    constexpr size_t blocks_alignment {sizeof(uint32_t)};

    constexpr uint16_t option_endofopt {0};
    constexpr uint16_t option_comment {1};

    constexpr uint16_t option_shb_hardware {2};
    constexpr uint16_t option_shb_os {3};
    constexpr uint16_t option_shb_userappl {4};

    constexpr uint16_t option_if_name {2};
    constexpr uint16_t option_if_description {3};
    constexpr uint16_t option_if_ipv4addr {4};
    constexpr uint16_t option_if_ipv6addr {5};
    constexpr uint16_t option_if_macaddr {6};
    constexpr uint16_t option_if_euiaddr {7};
    constexpr uint16_t option_if_speed {8};
    constexpr uint16_t option_if_tsresol {9};
    constexpr uint16_t option_if_tzone {10};
    constexpr uint16_t option_if_filter {11};
    constexpr uint16_t option_if_os {12};
    constexpr uint16_t option_if_fcslen {13};
    constexpr uint16_t option_if_tsoffset {14};

    constexpr uint16_t option_isb_starttime {2};
    constexpr uint16_t option_isb_endtime {3};
    constexpr uint16_t option_isb_ifrecv {4};
    constexpr uint16_t option_isb_ifdrop {5};
    constexpr uint16_t option_isb_filteraccept {6};
    constexpr uint16_t option_isb_osdrop {7};
    constexpr uint16_t option_isb_usrdeliv {8};

    constexpr uint16_t option_epb_flags {2};
    constexpr uint16_t option_epb_hash {3};
    constexpr uint16_t option_epb_dropcount {4};
}
#endif // __PCAPNG_CONSTANTS_H__
