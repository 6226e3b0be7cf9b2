#include "BasicListing.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace speccy {

namespace {

/**
 * Text of one listed line, spaced like the ROM lists it: a keyword's
 * leading space is suppressed after a space (or at the start of the
 * line), and its trailing space only appears if something follows.
 */
class LineText {
public:
    void appendCharacter(const std::string& text) {
        flushSpace();
        line += text;
    }

    void appendKeyword(std::string keyword) {
        bool afterSpace = pendingSpace || line.empty() || line.back() == ' ';
        if (!keyword.empty() && keyword.front() == ' ' && afterSpace) {
            keyword.erase(0, 1);
        }
        flushSpace();
        if (!keyword.empty() && keyword.back() == ' ') {
            keyword.pop_back();
            pendingSpace = true;
        }
        line += keyword;
    }

    const std::string& str() const { return line; }

private:
    std::string line;
    bool pendingSpace = false;

    void flushSpace() {
        if (pendingSpace) {
            line += ' ';
            pendingSpace = false;
        }
    }
};

} // namespace

BasicListing::BasicListing(const BasicDecodeOptions& opts)
    : options(opts)
    , charset(Charset::get(opts.variant)) {
}

std::string BasicListing::decode(const std::vector<uint8_t>& input) const {
    size_t maxLength = MAX_FILE_LENGTH;
    bool programLengthKnown = false;
    bool stopAtSoftEof = options.stopAtSoftEof;

    if (options.tapeHeader) {
        FileHeader tapeHeader;
        if (!tapeHeader.decode(*options.tapeHeader)) {
            trace("Tape header rejected");
        } else if (tapeHeader.isProgram() && !tapeHeader.isZeroed()) {
            maxLength = std::min<size_t>(maxLength, tapeHeader.getProgramLength());
            programLengthKnown = true;
            stopAtSoftEof = false;
            trace("Tape header found, program " + std::to_string(maxLength) + " bytes");
        } else {
            trace("Tape header is not for a program, ignored");
        }
    }

    size_t pos = 0;
    auto plus3Header = readPlus3DosHeader(input);
    if (plus3Header) {
        pos = Plus3DosHeader::HEADER_LENGTH;
        size_t fileLength = plus3Header->getFileLength();
        maxLength = programLengthKnown ? std::min(maxLength, fileLength) : fileLength;

        const FileHeader& basicHeader = plus3Header->basicHeader();
        if (!basicHeader.isZeroed() && basicHeader.isProgram()) {
            maxLength = std::min<size_t>(maxLength, basicHeader.getProgramLength());
            programLengthKnown = true;
        }
        stopAtSoftEof = false;
        trace("+3DOS header found, payload " + std::to_string(maxLength) + " bytes");
    } else if (input.size() >= Plus3DosHeader::HEADER_LENGTH) {
        trace("No +3DOS header");
    }

    const size_t bound = pos + maxLength;
    std::ostringstream listing;

    while (pos < bound && bound - pos >= LINE_HEADER_LENGTH) {
        if (input.size() < pos + LINE_HEADER_LENGTH) {
            if (pos < input.size()) {
                trace("Input truncated at byte " + std::to_string(pos));
            }
            break;
        }

        uint8_t high = input[pos];
        uint8_t low = input[pos + 1];
        if (stopAtSoftEof && (high == Charset::SOFT_EOF || low == Charset::SOFT_EOF)) {
            trace("Soft-EOF at byte " + std::to_string(pos));
            break;
        }

        uint16_t lineNumber = static_cast<uint16_t>((high << 8) | low);
        if (!programLengthKnown && lineNumber >= FIRST_VARIABLE_LINE) {
            trace("Variables area at byte " + std::to_string(pos));
            break;
        }
        pos += LINE_HEADER_LENGTH;

        LineText text;
        bool complete = false;

        while (true) {
            if (pos >= bound) {
                complete = true;
                break;
            }
            if (pos >= input.size()) {
                trace("Input truncated in line " + std::to_string(lineNumber));
                break;
            }

            uint8_t byte = input[pos++];

            if (stopAtSoftEof && byte == Charset::SOFT_EOF) {
                trace("Soft-EOF in line " + std::to_string(lineNumber));
                break;
            }

            if (byte == Charset::NUMBER_MARKER) {
                pos += std::min(NUMBER_LENGTH, bound - pos);
                continue;
            }

            if (byte == Charset::END_OF_LINE) {
                complete = true;
                break;
            }

            if (charset.isToken(byte)) {
                text.appendKeyword(charset.decodeByte(byte));
            } else {
                text.appendCharacter(charset.decodeByte(byte));
            }
        }

        if (!complete) {
            break;
        }

        listing << std::setw(LINE_NUMBER_WIDTH) << lineNumber << ' ' << text.str() << '\n';
    }

    return listing.str();
}

void BasicListing::trace(const std::string& message) const {
    traceMessage(options.trace, "BasicListing", message);
}

} // namespace speccy
