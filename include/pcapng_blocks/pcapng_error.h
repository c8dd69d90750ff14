#ifndef __PCAPNG_ERROR_H__
#define __PCAPNG_ERROR_H__
#include <string>
#include <string_view>
#include <stdexcept>

namespace pcapng_blocks {
    enum class ErrorCode {
        undefined,
        // transport errors
        short_read,
        stream_failure,
        // format errors
        framing_mismatch,
        wrong_magic_number,
        unknown_option,
        invalid_utf8,
        unknown_block_type
    };

    enum class ErrorKind {
        transport,
        format
    };

    ErrorKind error_kind(ErrorCode code);

    /*
        Base class for every error thrown by the decoders. Use kind() to tell stream failures
        apart from malformed data.
    */
    class PcapngError : public std::exception {
        public:
            explicit PcapngError(ErrorCode code);
            ErrorCode code() const;
            ErrorKind kind() const;
            const char *what() const noexcept override;

        private:
            const ErrorCode code_;
    };

    class PcapngDescriptiveError : public PcapngError {
        public:
            PcapngDescriptiveError(ErrorCode code, std::string_view description);
            const char *what() const noexcept override;

        private:
            std::string description_;
    };
}
#endif // __PCAPNG_ERROR_H__
