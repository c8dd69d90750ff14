#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_constants.h"
#include "pcapng_blocks/pcapng_functions.h"
#include "pcapng_option_decoding.h"

using namespace pcapng_blocks;
using namespace pcapng_blocks::constants;

namespace {
    Timestamp read_timestamp(ByteSource& source) {
        Timestamp result;
        result.high = read_le<uint32_t>(source);
        result.low = read_le<uint32_t>(source);
        return result;
    }

    std::optional<InterfaceStatisticsOption> map_statistics_option(const RawOption& raw) {
        MemoryByteSource value {raw.data};
        switch (raw.code) {
            case option_comment:
                return Comment {functions::to_utf8_string(raw.data)};
            case option_isb_starttime:
                return isb::StartTime {read_timestamp(value)};
            case option_isb_endtime:
                return isb::EndTime {read_timestamp(value)};
            case option_isb_ifrecv:
                return isb::Received {read_le<uint64_t>(value)};
            case option_isb_ifdrop:
                return isb::Dropped {read_le<uint64_t>(value)};
            case option_isb_filteraccept:
                return isb::FilterAccepted {read_le<uint64_t>(value)};
            case option_isb_osdrop:
                return isb::OsDropped {read_le<uint64_t>(value)};
            case option_isb_usrdeliv:
                return isb::Delivered {read_le<uint64_t>(value)};
            default:
                return {};
        }
    }
} // namespace

InterfaceStatisticsBlock pcapng_blocks::read_interface_statistics_block(ByteSource& payload, const DecoderConfig& config) {
    //                         1                   2                   3
    //     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  0 |                         Interface ID                          |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  4 |                        Timestamp (High)                       |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    //  8 |                        Timestamp (Low)                        |
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    // 12 /                                                               /
    //    /                      Options (variable)                       /
    //    /                                                               /
    //    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
    InterfaceStatisticsBlock block;
    block.interface_id = read_le<uint32_t>(payload);
    block.timestamp = read_timestamp(payload);
    block.options = detail::read_options<InterfaceStatisticsOption>(payload, config, "interface statistics block", map_statistics_option);
    return block;
}
