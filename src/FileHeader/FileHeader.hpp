#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <variant>

namespace speccy {

/**
 * ZX Spectrum File Header
 *
 * The header the ROM writes ahead of every file saved to tape, and its
 * shorter variant embedded in a +3DOS file header ("+3 BASIC header").
 *
 * Tape layout (17 bytes):
 *   type(1) name(10) length(2) param1(2) param2(2)
 * +3 BASIC layout (8 bytes):
 *   type(1) length(2) param1(2) param2(2) pad(1)
 *
 * Parameters by file type:
 *   Program        param1 = auto-start line, param2 = program length (offset to variables)
 *   Numeric/Char   param1 = 0x00, array name letter; param2 = 0
 *   Code/Screen    param1 = load address, param2 = 0x8000 on tape, 0 on +3DOS
 *
 * On tape the 17 bytes travel in a block with a leading flag byte and a
 * trailing XOR checksum; decode() accepts that 19-byte form too.
 *
 * All integers are little-endian.
 */
class FileHeader {
public:
    enum class Layout {
        Tape,
        Plus3Basic
    };

    enum class FileType : uint8_t {
        Program = 0,
        NumericArray = 1,
        CharArray = 2,
        CodeOrScreen = 3
    };

    struct ProgramParams {
        uint16_t autoStartLine = 0;
        uint16_t programLength = 0;
    };

    struct ArrayParams {
        char32_t name = 0;
    };

    struct CodeParams {
        uint16_t loadAddress = 0;
    };

    // Exactly one parameter group is active, selected by the file type
    using Params = std::variant<ProgramParams, ArrayParams, CodeParams>;

    static constexpr size_t TAPE_HEADER_LENGTH = 17;
    static constexpr size_t PLUS3_BASIC_HEADER_LENGTH = 8;
    static constexpr size_t FILE_NAME_MAX_LENGTH = 10;

    static constexpr uint16_t NO_AUTO_START = 0x8000;
    static constexpr uint16_t MAX_AUTO_START_LINE = 9999;

    // Screen start: makes a mistaken "LOAD file CODE" obvious before a retry
    static constexpr uint16_t CODE_DEFAULT_ADDRESS = 16384;

    static constexpr uint8_t TAPE_HEADER_MARKER = 0x00;
    static constexpr uint8_t TAPE_DATA_MARKER = 0xFF;

    /**
     * Create a zeroed header
     *
     * As with +3DOS "open action 1": all fields zero, no file name.
     */
    explicit FileHeader(Layout layout = Layout::Tape, uint16_t fileLength = 0);

    Layout getLayout() const { return layout; }
    size_t headerLength() const;

    FileType getFileType() const { return fileType; }
    const Params& getParams() const { return params; }

    /**
     * Set the file name (tape layout only)
     * @param name UTF-8 name; surrounding whitespace is trimmed
     * @return false if the name is longer than 10 characters or has a
     *         character with no Spectrum representation
     */
    bool setFileName(const std::string& name);
    const std::string& getFileName() const { return fileName; }

    void setFileLength(uint16_t length) { fileLength = length; }
    uint16_t getFileLength() const { return fileLength; }

    // Subtype setters. Each returns false and leaves the header unchanged
    // when the argument is out of range.
    bool setProgram(uint16_t autoStartLine = NO_AUTO_START, uint16_t programLength = 0);
    bool setNumericArray(char32_t name);
    bool setCharArray(char32_t name);
    void setCodeOrScreen(uint16_t loadAddress = CODE_DEFAULT_ADDRESS);

    // Parameter accessors; zero when the file type has no such field
    uint16_t getAutoStartLine() const;
    uint16_t getProgramLength() const;
    char32_t getArrayName() const;
    uint16_t getLoadAddress() const;

    bool isProgram() const { return fileType == FileType::Program; }
    bool hasAutoStart() const;

    /**
     * Check if every field is zero
     */
    bool isZeroed() const;

    /**
     * Encode into headerLength() bytes
     *
     * No range checks are made, so anything decode() accepted or the
     * setters stored encodes back unchanged. A zeroed header without a
     * name encodes as all zeros.
     */
    std::vector<uint8_t> encode() const;

    /**
     * Decode from bytes
     *
     * Accepts headerLength() bytes, or for the tape layout the 19-byte block
     * form (0x00 flag + header + XOR checksum). An all-zero header decodes
     * as a zeroed header.
     *
     * @param bytes Header bytes
     * @return true if the bytes describe a sane header; on false the
     *         header is left zeroed
     */
    bool decode(const std::vector<uint8_t>& bytes);

    static bool isValidAutoStartLine(uint16_t line);
    static bool isValidArrayName(char32_t name);

private:
    Layout layout;
    FileType fileType;
    std::string fileName;  // UTF-8, absent in the +3 BASIC layout
    uint16_t fileLength;
    Params params;

    void reset();
    bool decodeFields(const std::vector<uint8_t>& bytes);
};

/**
 * Wrap data as a tape block: flag byte, data, XOR of flag and data
 *
 * Header blocks use flag 0x00, so their checksum is the XOR of the
 * header bytes alone.
 */
std::vector<uint8_t> wrapTapeBlock(uint8_t flag, const std::vector<uint8_t>& data);

} // namespace speccy
