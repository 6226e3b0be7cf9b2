#pragma once

#include "ListingCommon.hpp"
#include "../Charset/Charset.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace speccy {

struct BasicDecodeOptions {
    CharsetVariant variant = CharsetVariant::Spectrum128;

    // Stop at a 0x1A byte. Ignored when a header gives the program length.
    bool stopAtSoftEof = false;

    // Tape header saved alongside the program (17 bytes, or 19 with flag and checksum)
    std::optional<std::vector<uint8_t>> tapeHeader;

    TraceCallback trace;
};

/**
 * Sinclair BASIC program decoder
 *
 * Lists a tokenized program the way the ROM would, one text line per
 * program line. Each line in memory is
 *
 *   line number (2 bytes, big-endian)
 *   line length (2 bytes, little-endian, unused here)
 *   text, with 0x0E followed by the 5-byte binary form of a number literal
 *   0x0D
 *
 * and the program is followed by the variables area, whose first byte has
 * bit 6 set, so it reads as a line number of 0x4000 or more.
 *
 * The end of the program is taken from, in order of trust: the +3DOS
 * header (program length of its +3 BASIC header, else the file length), a
 * tape header, the variables area, a soft-EOF byte when asked for, or the
 * end of the input.
 */
class BasicListing {
public:
    static constexpr size_t MAX_FILE_LENGTH = 32 * 1024 * 1024;  // +3DOS/CP/M limit
    static constexpr uint16_t FIRST_VARIABLE_LINE = 0x4000;
    static constexpr size_t LINE_HEADER_LENGTH = 4;
    static constexpr size_t NUMBER_LENGTH = 5;
    static constexpr int LINE_NUMBER_WIDTH = 4;

    explicit BasicListing(const BasicDecodeOptions& options = BasicDecodeOptions());

    /**
     * Decode a program file
     * @param input File contents, with or without a +3DOS header
     * @return UTF-8 listing, LF line endings, no byte-order mark
     */
    std::string decode(const std::vector<uint8_t>& input) const;

private:
    BasicDecodeOptions options;
    const Charset& charset;

    void trace(const std::string& message) const;
};

} // namespace speccy
