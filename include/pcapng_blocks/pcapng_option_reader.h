#ifndef __PCAPNG_OPTION_READER_H__
#define __PCAPNG_OPTION_READER_H__
#include <optional>
#include "pcapng_byte_source.h"

namespace pcapng_blocks {
    /*
        Walks the option chain of a block. Option codes are not interpreted here, every block
        type maps them on its own.
    */
    class OptionReader {
        public:
            explicit OptionReader(ByteSource& source);
            // returns next option; empty result means that end of options was reached
            // (either opt_endofopt was read or there are no more bytes in the source)
            std::optional<RawOption> next();

        private:
            ByteSource& source_;
            bool finished_ {false};
    };
}
#endif // __PCAPNG_OPTION_READER_H__
