#ifndef __PCAPNG_OPTION_DECODING_H__
#define __PCAPNG_OPTION_DECODING_H__
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "pcapng_blocks/pcapng_block.h"
#include "pcapng_blocks/pcapng_error.h"
#include "pcapng_blocks/pcapng_option_reader.h"

namespace pcapng_blocks::detail {
    /*
        Reads the option chain from payload and converts every raw option with map_option.
        map_option returns empty optional for codes which are unknown to the block, such
        options are handled according to config.unknown_options.
    */
    template<typename Option, typename MapFn>
    std::vector<Option> read_options(ByteSource& payload, const DecoderConfig& config, std::string_view block_name, MapFn&& map_option) {
        std::vector<Option> result;
        OptionReader reader {payload};
        while (auto raw = reader.next()) {
            std::optional<Option> opt {map_option(*raw)};
            if (opt) {
                result.emplace_back(std::move(*opt));
                continue;
            }
            if (config.unknown_options == UnknownOptionPolicy::fail) {
                throw PcapngDescriptiveError {ErrorCode::unknown_option,
                    "Unknown option code " + std::to_string(raw->code) + " in " + std::string {block_name}};
            }
            result.emplace_back(UnknownOption {raw->code, std::move(raw->data)});
        }
        return result;
    }
}
#endif // __PCAPNG_OPTION_DECODING_H__
