#include "pcapng_blocks/pcapng_error.h"

using namespace pcapng_blocks;

ErrorKind pcapng_blocks::error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::short_read:
        case ErrorCode::stream_failure:
            return ErrorKind::transport;
        default:
            return ErrorKind::format;
    }
}

PcapngError::PcapngError(ErrorCode code)
    : code_ {code}
{    
}
    
ErrorCode PcapngError::code() const {
    return code_;
}

ErrorKind PcapngError::kind() const {
    return error_kind(code_);
}

const char* PcapngError::what() const noexcept {
    switch (code_) {
        case ErrorCode::short_read:
            return "Unexpected end of data";
        case ErrorCode::stream_failure:
            return "Unable to read from stream";
        case ErrorCode::framing_mismatch:
            return "Block length fields do not match";
        case ErrorCode::wrong_magic_number:
            return "Unsupported byte order magic";
        case ErrorCode::unknown_option:
            return "Unknown option code";
        case ErrorCode::invalid_utf8:
            return "Option is not a valid UTF-8 string";
        case ErrorCode::unknown_block_type:
            return "Unknown block type";
        case ErrorCode::undefined:
        default:
            return "Unknown error";
    }
}

PcapngDescriptiveError::PcapngDescriptiveError(ErrorCode code, std::string_view description)
    : PcapngError {code}, description_ {description}
{
}

const char* PcapngDescriptiveError::what() const noexcept {
    return description_.c_str();
}
