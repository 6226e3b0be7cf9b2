#include <catch2/catch_all.hpp>
#include "BasicListing.hpp"
#include "AsmListing.hpp"
#include "../Runtime/ConvError.hpp"

using namespace speccy;

namespace {

std::vector<uint8_t> withPlus3DosHeader(const Plus3DosHeader& header, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> file = header.encode();
    file.insert(file.end(), payload.begin(), payload.end());
    return file;
}

// Sinclair BASIC line: number (big-endian), length (little-endian), body, 0x0D
std::vector<uint8_t> basicLine(uint16_t number, const std::vector<uint8_t>& body) {
    uint16_t length = static_cast<uint16_t>(body.size() + 1);
    std::vector<uint8_t> line = {static_cast<uint8_t>(number >> 8), static_cast<uint8_t>(number & 0xFF),
                                 static_cast<uint8_t>(length & 0xFF), static_cast<uint8_t>(length >> 8)};
    line.insert(line.end(), body.begin(), body.end());
    line.push_back(0x0D);
    return line;
}

void append(std::vector<uint8_t>& to, const std::vector<uint8_t>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

} // namespace

TEST_CASE("Sinclair BASIC decoding", "[basic]") {
    BasicListing listing;

    SECTION("PRINT after a +3DOS header") {
        std::vector<uint8_t> payload = {0x00, 0x01, 0x06, 0x00, 0xF5, 0x0D};
        Plus3DosHeader header(static_cast<uint32_t>(payload.size()));
        REQUIRE(listing.decode(withPlus3DosHeader(header, payload)) == "   1 PRINT\n");
    }

    SECTION("Keyword spacing") {
        std::vector<uint8_t> program = basicLine(10, {0xF5, '"', 'H', 'I', '"'});
        append(program, basicLine(20, {0xFA, 'A', '=', '1', 0xCB, 0xEC, '1', '0'}));
        append(program, basicLine(30, {0xEB, 'I', '=', '1', 0xCC, '5', ':', 0xF3, 'I'}));
        append(program, basicLine(40, {0xF1, 'r', '=', 0xA5}));

        REQUIRE(listing.decode(program) ==
                "  10 PRINT \"HI\"\n"
                "  20 IF A=1 THEN GO TO 10\n"
                "  30 FOR I=1 TO 5: NEXT I\n"
                "  40 LET r=RND\n");
    }

    SECTION("Number literals are skipped") {
        // 0x0D inside the binary form must not end the line
        std::vector<uint8_t> program = basicLine(10, {0xF5, '1', '3', 0x0E, 0x00, 0x00, 0x0D, 0x00, 0x00});
        REQUIRE(listing.decode(program) == "  10 PRINT 13\n");
    }

    SECTION("Variables area ends the listing") {
        std::vector<uint8_t> program = basicLine(10, {0xFB});
        // Numeric variable "a" = 0
        append(program, {0x61, 0x00, 0x00, 0x00, 0x00, 0x00});
        REQUIRE(listing.decode(program) == "  10 CLS\n");
    }

    SECTION("Trailing bytes shorter than a line header are ignored") {
        std::vector<uint8_t> program = basicLine(10, {0xFB});
        append(program, {0x00, 0x14, 0x03});
        REQUIRE(listing.decode(program) == "  10 CLS\n");
    }

    SECTION("Unterminated last line is dropped") {
        std::vector<uint8_t> program = basicLine(10, {0xFB});
        append(program, {0x00, 0x14, 0x05, 0x00, 0xFB});
        REQUIRE(listing.decode(program) == "  10 CLS\n");
    }

    SECTION("Graphics and UDGs") {
        std::vector<uint8_t> program = basicLine(5, {0xF5, '"', 0x60, 0x8F, 0x90, '"'});
        REQUIRE(listing.decode(program) == "   5 PRINT \"\xC2\xA3\xE2\x96\x88\xF0\x9F\x85\xB0\"\n");
    }

    SECTION("PRINT comma becomes TAB") {
        std::vector<uint8_t> program = basicLine(1, {0xF5, 'a', 0x06, 'b'});
        REQUIRE(listing.decode(program) == "   1 PRINT a\tb\n");
    }

    SECTION("Empty program") {
        REQUIRE(listing.decode({}).empty());
    }
}

TEST_CASE("Sinclair BASIC token sets", "[basic]") {
    std::vector<uint8_t> program = basicLine(10, {0xF5, 0xA3});

    BasicDecodeOptions options;
    REQUIRE(BasicListing(options).decode(program) == "  10 PRINT SPECTRUM\n");

    options.variant = CharsetVariant::Spectrum48;
    REQUIRE(BasicListing(options).decode(program) == "  10 PRINT \xF0\x9F\x86\x83\n");
}

TEST_CASE("Sinclair BASIC soft-EOF", "[basic]") {
    std::vector<uint8_t> program = basicLine(10, {0xFB});
    append(program, basicLine(20, {0xF5, 'x', 0x1A, 'y'}));
    append(program, basicLine(30, {0xFB}));

    BasicDecodeOptions options;

    SECTION("Off by default") {
        REQUIRE(BasicListing(options).decode(program) == "  10 CLS\n  20 PRINT x\x1Ay\n  30 CLS\n");
    }

    SECTION("Stops without emitting the line") {
        options.stopAtSoftEof = true;
        REQUIRE(BasicListing(options).decode(program) == "  10 CLS\n");
    }

    SECTION("Soft-EOF in a line number") {
        options.stopAtSoftEof = true;
        std::vector<uint8_t> padded = basicLine(10, {0xFB});
        append(padded, std::vector<uint8_t>(16, 0x1A));
        REQUIRE(BasicListing(options).decode(padded) == "  10 CLS\n");
    }

    SECTION("Ignored when a +3DOS header gives the length") {
        options.stopAtSoftEof = true;
        Plus3DosHeader header(static_cast<uint32_t>(program.size()));
        REQUIRE(BasicListing(options).decode(withPlus3DosHeader(header, program)) ==
                "  10 CLS\n  20 PRINT x\x1Ay\n  30 CLS\n");
    }
}

TEST_CASE("Sinclair BASIC program length from headers", "[basic]") {
    std::vector<uint8_t> program = basicLine(10, {0xFB});
    // A line number past 0x4000 is still program text when the length is known
    append(program, basicLine(0x4000, {0xFE}));
    std::vector<uint8_t> variables = {0x61, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x0D};
    std::vector<uint8_t> file = program;
    append(file, variables);

    SECTION("+3 BASIC header program length") {
        Plus3DosHeader header;
        REQUIRE(header.basicHeader().setProgram(10, static_cast<uint16_t>(program.size())));
        REQUIRE(header.setFileLength(static_cast<uint32_t>(file.size())));

        std::vector<std::string> messages;
        BasicDecodeOptions options;
        options.trace = [&messages](const std::string& message) { messages.push_back(message); };

        REQUIRE(BasicListing(options).decode(withPlus3DosHeader(header, file)) == "  10 CLS\n16384 RETURN\n");
        REQUIRE_FALSE(messages.empty());
        REQUIRE(messages.front().rfind("[BasicListing] +3DOS header found", 0) == 0);
    }

    SECTION("Tape header program length") {
        FileHeader tapeHeader;
        REQUIRE(tapeHeader.setFileName("prog"));
        tapeHeader.setFileLength(static_cast<uint16_t>(file.size()));
        REQUIRE(tapeHeader.setProgram(FileHeader::NO_AUTO_START, static_cast<uint16_t>(program.size())));

        BasicDecodeOptions options;
        options.tapeHeader = tapeHeader.encode();
        REQUIRE(BasicListing(options).decode(file) == "  10 CLS\n16384 RETURN\n");

        options.tapeHeader = wrapTapeBlock(FileHeader::TAPE_HEADER_MARKER, tapeHeader.encode());
        REQUIRE(BasicListing(options).decode(file) == "  10 CLS\n16384 RETURN\n");
    }

    SECTION("Without a length the listing stops at 0x4000") {
        REQUIRE(BasicListing().decode(file) == "  10 CLS\n");
    }

    SECTION("A bad tape header is ignored") {
        BasicDecodeOptions options;
        options.tapeHeader = std::vector<uint8_t>(5, 0xFF);
        REQUIRE(BasicListing(options).decode(file) == "  10 CLS\n");
    }
}

TEST_CASE("HiSoft GEN decoding", "[asm]") {
    AsmListing listing;
    AsmDecodeOptions options;
    options.includeLineNumbers = true;

    std::vector<uint8_t> line10 = {0x0A, 0x00, 'L', 'D', ' ', 'A', ',', '1', 0x0D};

    SECTION("Lead length field counting the bytes after it") {
        std::vector<uint8_t> file = {0x09, 0x00};
        append(file, line10);
        REQUIRE(listing.decode(file, options) == "    10  LD A,1\n");
    }

    SECTION("Lead length field counting itself") {
        std::vector<uint8_t> file = {0x0B, 0x00};
        append(file, line10);
        REQUIRE(listing.decode(file, options) == "    10  LD A,1\n");
    }

    SECTION("A first line number matching the byte count is taken as a length") {
        // 10 bytes follow the first field, so line 10 reads as a lead length
        std::vector<uint8_t> file = {0x0A, 0x00, 'N', 'O', 'P', 0x0D, 0x14, 0x00, 'R', 'E', 'T', 0x0D};
        REQUIRE(listing.decode(file) == "P\nRET\n");
    }

    SECTION("No lead length field") {
        std::vector<uint8_t> file = line10;
        append(file, {0x14, 0x00, 'R', 'E', 'T', 0x0D});
        REQUIRE(listing.decode(file, options) == "    10  LD A,1\n    20  RET\n");
        REQUIRE(listing.decode(file) == "LD A,1\nRET\n");
    }

    SECTION("TAB stays TAB") {
        std::vector<uint8_t> file = {0x14, 0x00, '\t', 'N', 'O', 'P', '\t', ';', 0x60, 0x0D};
        REQUIRE(listing.decode(file) == "\tNOP\t;\xC2\xA3\n");
    }

    SECTION("Last line may end at end of file") {
        std::vector<uint8_t> file = {0x0A, 0x00, 'N', 'O', 'P', 0x0D, 0x14, 0x00, 'R', 'E', 'T'};
        REQUIRE(listing.decode(file) == "NOP\nRET\n");
    }

    SECTION("Soft-EOF") {
        std::vector<uint8_t> file = line10;
        append(file, {0x14, 0x00, 'R', 0x1A, 0x1A, 0x1A});
        options.stopAtSoftEof = true;
        REQUIRE(listing.decode(file, options) == "    10  LD A,1\n");
    }

    SECTION("+3DOS header bounds the source") {
        std::vector<uint8_t> payload = line10;
        Plus3DosHeader header;
        header.basicHeader().setCodeOrScreen();
        REQUIRE(header.setFileLength(static_cast<uint32_t>(payload.size())));

        std::vector<uint8_t> file = withPlus3DosHeader(header, payload);
        // CP/M pads the last record
        append(file, std::vector<uint8_t>(23, 0x1A));

        options.stopAtSoftEof = true;
        REQUIRE(listing.decode(file, options) == "    10  LD A,1\n");
    }

    SECTION("+3DOS header claiming more than the file holds") {
        Plus3DosHeader header(1000);
        std::vector<uint8_t> payload = line10;
        append(payload, {0x14, 0x00, 'R', 'E'});
        REQUIRE(listing.decode(withPlus3DosHeader(header, payload), options) == "    10  LD A,1\n");
    }
}

TEST_CASE("HiSoft GEN encoding", "[asm]") {
    AsmListing listing;

    SECTION("Numbering continues from an explicit number") {
        std::vector<uint8_t> expected = {20, 0, 'N', 'O', 'P', 0x0D, 30, 0, 'H', 'A', 'L', 'T', 0x0D};
        REQUIRE(listing.encode("20 NOP\nHALT\n") == expected);
    }

    SECTION("Numbering starts at 10") {
        std::vector<uint8_t> expected = {10, 0, 'N', 'O', 'P', 0x0D, 20, 0, 0x0D, 30, 0, 'R', 'E', 'T', 0x0D};
        REQUIRE(listing.encode("NOP\r\n\r\nRET") == expected);
    }

    SECTION("Line number prefix") {
        // At most two separating spaces are taken with the number
        std::vector<uint8_t> expected = {100, 0, ' ', '\t', 'L', 'D', 0x0D};
        REQUIRE(listing.encode("  100   \tLD") == expected);

        // Not a number when a letter follows
        expected = {10, 0, '1', '0', 'a', 0x0D};
        REQUIRE(listing.encode("10a") == expected);

        expected = {0x39, 0x05, 0x0D};
        REQUIRE(listing.encode("1337") == expected);
    }

    SECTION("Trailing whitespace is removed") {
        std::vector<uint8_t> expected = {10, 0, 'N', 'O', 'P', 0x0D};
        REQUIRE(listing.encode("NOP \t  \n") == expected);
    }

    SECTION("Byte-order mark and Spectrum characters") {
        std::vector<uint8_t> expected = {10, 0, ';', 0x60, 0x7F, 0x90, 0x0D};
        REQUIRE(listing.encode("\xEF\xBB\xBF;\xC2\xA3\xC2\xA9\xE2\x92\xB6") == expected);
    }

    SECTION("Line numbers above 65535") {
        REQUIRE(listing.encode("65535 NOP").size() == 6);
        REQUIRE_THROWS_AS(listing.encode("65536 NOP"), ConvError);
        REQUIRE_THROWS_AS(listing.encode("65530 NOP\nNOP"), ConvError);
        try {
            listing.encode("99999999999999999999 NOP");
            FAIL("Expected ConvError");
        } catch (const ConvError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::LINE_NUMBER_OUT_OF_RANGE);
        }
    }

    SECTION("Characters with no Spectrum byte") {
        try {
            listing.encode("NOP\nLD A,\xE2\x82\xAC");  // EURO SIGN
            FAIL("Expected ConvError");
        } catch (const ConvError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::ENCODING_ERROR);
            REQUIRE(e.getLineNumber() == 20);
            REQUIRE(e.getPosition() == 6);
        }
    }

    SECTION("Invalid UTF-8") {
        REQUIRE_THROWS_AS(listing.encode("NOP\xFF"), ConvError);
    }

    SECTION("+3DOS header and soft-EOF") {
        AsmEncodeOptions options;
        options.prependPlus3DosHeader = true;
        options.appendSoftEof = true;

        std::vector<uint8_t> file = listing.encode("10 LD A,1\n20 RET\n", options);
        const size_t payload = 9 + 6;
        REQUIRE(file.size() == Plus3DosHeader::HEADER_LENGTH + payload + 1);
        REQUIRE(file.back() == 0x1A);

        Plus3DosHeader header;
        REQUIRE(header.decode(std::vector<uint8_t>(file.begin(), file.begin() + Plus3DosHeader::HEADER_LENGTH)));
        REQUIRE(header.getFileLength() == payload);
        REQUIRE(header.basicHeader().getFileType() == FileHeader::FileType::CodeOrScreen);
        REQUIRE(header.basicHeader().getLoadAddress() == FileHeader::CODE_DEFAULT_ADDRESS);
        REQUIRE(header.basicHeader().getFileLength() == payload);

        AsmDecodeOptions decodeOptions;
        decodeOptions.includeLineNumbers = true;
        REQUIRE(listing.decode(file, decodeOptions) == "    10  LD A,1\n    20  RET\n");
    }
}

TEST_CASE("HiSoft GEN tape header", "[asm]") {
    std::vector<uint8_t> bytes = AsmListing::tapeHeaderFor("program.asm", 300);
    REQUIRE(bytes.size() == FileHeader::TAPE_HEADER_LENGTH);

    FileHeader header;
    REQUIRE(header.decode(bytes));
    REQUIRE(header.getFileType() == FileHeader::FileType::CodeOrScreen);
    REQUIRE(header.getFileName() == "program.as");
    REQUIRE(header.getFileLength() == 300);
    REQUIRE(header.getLoadAddress() == FileHeader::CODE_DEFAULT_ADDRESS);

    REQUIRE_THROWS_AS(AsmListing::tapeHeaderFor("big", 70000), ConvError);
    REQUIRE_THROWS_AS(AsmListing::tapeHeaderFor("\xE2\x82\xAC", 10), ConvError);
}
