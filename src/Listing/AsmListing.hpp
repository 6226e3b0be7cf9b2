#pragma once

#include "ListingCommon.hpp"
#include "../Charset/Charset.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace speccy {

struct AsmDecodeOptions {
    bool includeLineNumbers = false;

    // Stop at a 0x1A byte. Ignored when a +3DOS header gives the length.
    bool stopAtSoftEof = false;

    TraceCallback trace;
};

struct AsmEncodeOptions {
    // Write a +3DOS header describing the file as CODE at 16384
    bool prependPlus3DosHeader = false;

    // Append a 0x1A byte, not counted in the +3DOS file length
    bool appendSoftEof = false;

    TraceCallback trace;
};

/**
 * HiSoft GEN assembler source codec
 *
 * GEN keeps its source as a sequence of lines, each a little-endian line
 * number followed by the line text and 0x0D. There are no tokens; the
 * character set is the 48K one with TAB kept as TAB. Some tools put the
 * byte count of the rest of the file in front of the first line.
 */
class AsmListing {
public:
    static constexpr uint16_t FIRST_LINE_NUMBER = 10;
    static constexpr uint16_t LINE_NUMBER_STEP = 10;
    static constexpr uint32_t MAX_LINE_NUMBER = 65535;
    static constexpr int LINE_NUMBER_WIDTH = 6;  // Plus two spaces: a TAB after it still lines up

    AsmListing();

    /**
     * Decode GEN source
     * @param input File contents, with or without a +3DOS header
     * @param options Decoding options
     * @return UTF-8 text, LF line endings, no byte-order mark
     */
    std::string decode(const std::vector<uint8_t>& input, const AsmDecodeOptions& options = AsmDecodeOptions()) const;

    /**
     * Encode text as GEN source
     *
     * Lines may start with their own line number; unnumbered lines continue
     * from the previous number in steps of 10, starting at 10.
     *
     * @param text UTF-8 text; a leading byte-order mark is ignored
     * @param options Encoding options
     * @return File contents
     * @throws ConvError ENCODING_ERROR for a character with no Spectrum
     *         byte, LINE_NUMBER_OUT_OF_RANGE for a line number above 65535,
     *         INVALID_HEADER_FIELD if a +3DOS header cannot describe the file
     */
    std::vector<uint8_t> encode(const std::string& text, const AsmEncodeOptions& options = AsmEncodeOptions()) const;

    /**
     * Tape header to save with an encoded file
     *
     * A CODE header at 16384 named after the file.
     *
     * @param fileName Name for the header; only the first 10 characters are kept
     * @param fileLength Length of the encoded file
     * @throws ConvError INVALID_HEADER_FIELD if the name cannot be stored or
     *         the file is too long for a tape header
     */
    static std::vector<uint8_t> tapeHeaderFor(const std::string& fileName, size_t fileLength);

private:
    const Charset& charset;
};

} // namespace speccy
