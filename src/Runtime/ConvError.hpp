#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace speccy {

/**
 * ConvError - conversion failure
 *
 * Raised when a conversion call cannot complete: a character with no
 * byte representation, an out-of-range line number, a bad command line
 * or an unreadable/unwritable file. Header corruption is never raised,
 * header decoders report it through their boolean result instead.
 */
class ConvError : public std::runtime_error {
public:
    ConvError(uint16_t errorCode, const std::string& message, uint32_t lineNumber = 0, size_t position = 0)
        : std::runtime_error(message), errorCode_(errorCode), lineNumber_(lineNumber), position_(position) {}

    uint16_t getErrorCode() const { return errorCode_; }
    uint32_t getLineNumber() const { return lineNumber_; }
    size_t getPosition() const { return position_; }

private:
    uint16_t errorCode_;
    uint32_t lineNumber_;
    size_t position_;
};

// Conversion error codes
namespace ErrorCodes {
    constexpr uint16_t ENCODING_ERROR = 1;
    constexpr uint16_t LINE_NUMBER_OUT_OF_RANGE = 2;
    constexpr uint16_t INVALID_HEADER_FIELD = 3;
    constexpr uint16_t CONFLICTING_OPTIONS = 10;
    constexpr uint16_t BAD_COMMAND_LINE = 11;
    constexpr uint16_t FILE_NOT_FOUND = 53;
    constexpr uint16_t PATH_FILE_ACCESS_ERROR = 75;
}

} // namespace speccy
