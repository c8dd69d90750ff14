#ifndef __PCAPNG_BLOCK_H__
#define __PCAPNG_BLOCK_H__
#include <variant>
#include <vector>
#include "pcapng_byte_source.h"
#include "pcapng_options.h"

/*
    All structures inside this file represents block types from PcapNg standard which this
    library is able to decode. They are plain values, each decoder builds a block completely
    or throws PcapngError.

    Every read_*_block function takes block payload (block data without type and length fields,
    see read_raw_block) and consumes it up to the end of the options.
*/
namespace pcapng_blocks {
    enum class UnknownOptionPolicy {
        // unknown option code fails decoding of the whole block
        fail,
        // unknown option is stored as UnknownOption and decoding continues
        preserve
    };

    struct DecoderConfig {
        UnknownOptionPolicy unknown_options {UnknownOptionPolicy::fail};
    };

    struct SectionHeaderBlock {
        uint32_t magic {};
        Version version {};
        // constants::unspecified_section_length if not known
        uint64_t section_length {};
        std::vector<SectionHeaderOption> options;
    };

    struct InterfaceDescriptionBlock {
        uint16_t link_type {};
        uint32_t snapshot_length {};
        std::vector<InterfaceDescriptionOption> options;
    };

    struct InterfaceStatisticsBlock {
        uint32_t interface_id {};
        Timestamp timestamp {};
        std::vector<InterfaceStatisticsOption> options;
    };

    struct EnhancedPacketBlock {
        uint32_t interface_id {};
        Timestamp timestamp {};
        uint32_t captured_length {};
        uint32_t original_length {};
        std::vector<byte_t> packet_data;
        std::vector<EnhancedPacketOption> options;
    };

    using Block = std::variant<
        SectionHeaderBlock,
        InterfaceDescriptionBlock,
        InterfaceStatisticsBlock,
        EnhancedPacketBlock
    >;

    SectionHeaderBlock read_section_header_block(ByteSource& payload, const DecoderConfig& config = {});
    InterfaceDescriptionBlock read_interface_description_block(ByteSource& payload, const DecoderConfig& config = {});
    InterfaceStatisticsBlock read_interface_statistics_block(ByteSource& payload, const DecoderConfig& config = {});
    EnhancedPacketBlock read_enhanced_packet_block(ByteSource& payload, const DecoderConfig& config = {});

    // chooses decoder by block type, throws PcapngError with ErrorCode::unknown_block_type
    // for types which are not listed in Block
    Block decode_block(const RawBlock& raw, const DecoderConfig& config = {});
    // reads exactly one block from the source and decodes it
    Block read_block(ByteSource& source, const DecoderConfig& config = {});
}
#endif // __PCAPNG_BLOCK_H__
