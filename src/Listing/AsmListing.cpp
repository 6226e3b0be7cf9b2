#include "AsmListing.hpp"
#include "../FileHeader/FileHeader.hpp"
#include "../Runtime/ConvError.hpp"
#include "../Runtime/Utf8Text.hpp"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace speccy {

namespace {

const char* const COMPONENT = "AsmListing";

/**
 * Split a leading line number off a text line
 *
 * Matches optional spaces, decimal digits ending on a word boundary, and
 * up to two spaces; whatever follows is the line body. Numbers too large
 * to hold saturate, so they still fail the range check.
 */
bool splitLineNumber(const std::u32string& line, uint32_t& number, size_t& bodyStart) {
    size_t i = 0;
    while (i < line.size() && line[i] == U' ') {
        i++;
    }

    size_t digitsStart = i;
    uint64_t value = 0;
    while (i < line.size() && line[i] >= U'0' && line[i] <= U'9') {
        value = std::min<uint64_t>(value * 10 + (line[i] - U'0'), std::numeric_limits<uint32_t>::max());
        i++;
    }

    if (i == digitsStart) {
        return false;
    }
    if (i < line.size() && Utf8Text::isWordCharacter(line[i])) {
        return false;
    }

    for (int spaces = 0; spaces < 2 && i < line.size() && line[i] == U' '; spaces++) {
        i++;
    }

    number = static_cast<uint32_t>(value);
    bodyStart = i;
    return true;
}

std::string codePointName(char32_t c) {
    std::ostringstream oss;
    oss << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << static_cast<uint32_t>(c);
    return oss.str();
}

} // namespace

AsmListing::AsmListing()
    : charset(Charset::get(CharsetVariant::HisoftGenAsm)) {
}

std::string AsmListing::decode(const std::vector<uint8_t>& input, const AsmDecodeOptions& options) const {
    size_t pos = 0;
    size_t bound = input.size();
    bool stopAtSoftEof = options.stopAtSoftEof;

    auto plus3Header = readPlus3DosHeader(input);
    if (plus3Header) {
        pos = Plus3DosHeader::HEADER_LENGTH;
        bound = pos + plus3Header->getFileLength();
        stopAtSoftEof = false;
        traceMessage(options.trace, COMPONENT,
                     "+3DOS header found, payload " + std::to_string(plus3Header->getFileLength()) + " bytes");
    }

    std::ostringstream text;
    bool firstField = true;

    while (pos < bound && bound - pos > 2) {
        if (input.size() < pos + 2) {
            if (pos < input.size()) {
                traceMessage(options.trace, COMPONENT, "Input truncated at byte " + std::to_string(pos));
            }
            break;
        }

        uint8_t low = input[pos];
        uint8_t high = input[pos + 1];
        if (stopAtSoftEof && (low == Charset::SOFT_EOF || high == Charset::SOFT_EOF)) {
            traceMessage(options.trace, COMPONENT, "Soft-EOF at byte " + std::to_string(pos));
            break;
        }

        uint16_t lineNumber = static_cast<uint16_t>(low | (high << 8));
        pos += 2;

        if (firstField) {
            firstField = false;
            // Count of the bytes after it, or of the whole rest including itself
            size_t remaining = bound - pos;
            if (lineNumber == remaining || lineNumber == remaining + 2) {
                traceMessage(options.trace, COMPONENT, "Lead length field " + std::to_string(lineNumber) + " skipped");
                continue;
            }
        }

        std::string line;
        bool complete = false;

        while (true) {
            if (pos >= bound) {
                complete = true;
                break;
            }
            if (pos >= input.size()) {
                traceMessage(options.trace, COMPONENT, "Input truncated in line " + std::to_string(lineNumber));
                break;
            }

            uint8_t byte = input[pos++];

            if (stopAtSoftEof && byte == Charset::SOFT_EOF) {
                traceMessage(options.trace, COMPONENT, "Soft-EOF in line " + std::to_string(lineNumber));
                break;
            }

            if (byte == Charset::END_OF_LINE) {
                complete = true;
                break;
            }

            line += charset.decodeByte(byte);
        }

        if (!complete) {
            break;
        }

        if (options.includeLineNumbers) {
            text << std::setw(LINE_NUMBER_WIDTH) << lineNumber << "  ";
        }
        text << line << '\n';
    }

    return text.str();
}

std::vector<uint8_t> AsmListing::encode(const std::string& text, const AsmEncodeOptions& options) const {
    std::vector<uint8_t> output;

    if (options.prependPlus3DosHeader) {
        // Placeholder, rewritten once the length is known
        output.resize(Plus3DosHeader::HEADER_LENGTH, 0x00);
    }

    std::vector<std::u32string> lines = Utf8Text::splitLines(Utf8Text::decode(Utf8Text::stripByteOrderMark(text)));
    uint32_t lineNumber = FIRST_LINE_NUMBER;

    for (const auto& rawLine : lines) {
        std::u32string line = Utf8Text::trimRight(rawLine);

        size_t bodyStart = 0;
        uint32_t explicitNumber = 0;
        if (splitLineNumber(line, explicitNumber, bodyStart)) {
            lineNumber = explicitNumber;
        }

        if (lineNumber > MAX_LINE_NUMBER) {
            throw ConvError(ErrorCodes::LINE_NUMBER_OUT_OF_RANGE,
                            "Line number " + std::to_string(lineNumber) + " out of range", lineNumber);
        }

        output.push_back(static_cast<uint8_t>(lineNumber & 0xFF));
        output.push_back(static_cast<uint8_t>((lineNumber >> 8) & 0xFF));

        for (size_t i = bodyStart; i < line.size(); i++) {
            auto byte = charset.encodeChar(line[i]);
            if (!byte) {
                throw ConvError(ErrorCodes::ENCODING_ERROR,
                                "Character " + codePointName(line[i]) + " in line " + std::to_string(lineNumber) +
                                    " has no Spectrum equivalent",
                                lineNumber, i + 1);
            }
            output.push_back(*byte);
        }
        output.push_back(Charset::END_OF_LINE);

        lineNumber += LINE_NUMBER_STEP;
    }

    if (options.appendSoftEof) {
        output.push_back(Charset::SOFT_EOF);
    }

    if (options.prependPlus3DosHeader) {
        size_t payload = output.size() - Plus3DosHeader::HEADER_LENGTH - (options.appendSoftEof ? 1 : 0);

        Plus3DosHeader header;
        header.basicHeader().setCodeOrScreen();
        if (payload > std::numeric_limits<uint32_t>::max() || !header.setFileLength(static_cast<uint32_t>(payload))) {
            throw ConvError(ErrorCodes::INVALID_HEADER_FIELD,
                            "File too long for a +3DOS header: " + std::to_string(payload) + " bytes");
        }

        std::vector<uint8_t> headerBytes = header.encode();
        std::copy(headerBytes.begin(), headerBytes.end(), output.begin());
        traceMessage(options.trace, COMPONENT, "+3DOS header written, payload " + std::to_string(payload) + " bytes");
    }

    traceMessage(options.trace, COMPONENT,
                 "Encoded " + std::to_string(lines.size()) + " lines, " + std::to_string(output.size()) + " bytes");
    return output;
}

std::vector<uint8_t> AsmListing::tapeHeaderFor(const std::string& fileName, size_t fileLength) {
    std::u32string name = Utf8Text::decode(fileName);
    if (name.size() > FileHeader::FILE_NAME_MAX_LENGTH) {
        name.resize(FileHeader::FILE_NAME_MAX_LENGTH);
    }

    FileHeader header;
    if (!header.setFileName(Utf8Text::encode(name))) {
        throw ConvError(ErrorCodes::INVALID_HEADER_FIELD,
                        "File name \"" + Utf8Text::encode(name) + "\" cannot be stored in a tape header");
    }
    if (fileLength > std::numeric_limits<uint16_t>::max()) {
        throw ConvError(ErrorCodes::INVALID_HEADER_FIELD,
                        "File too long for a tape header: " + std::to_string(fileLength) + " bytes");
    }

    header.setFileLength(static_cast<uint16_t>(fileLength));
    header.setCodeOrScreen();
    return header.encode();
}

} // namespace speccy
