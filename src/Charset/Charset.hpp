#pragma once

#include <string>
#include <array>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace speccy {

/**
 * Character set variants
 *
 * Spectrum128 and Spectrum48 differ only in bytes 0xA3/0xA4, which are the
 * SPECTRUM and PLAY keywords on the 128K/+2/+3 and the UDG letters T and U
 * on the 16K/48K. HisoftGenAsm is the Spectrum48 set with the PRINT-comma
 * (0x06) <-> TAB mapping removed, so a TAB in assembler source stays a TAB.
 */
enum class CharsetVariant {
    Spectrum128,
    Spectrum48,
    HisoftGenAsm
};

/**
 * ZX Spectrum character set
 *
 * Maps every byte to its Unicode rendition (graphics, UDGs and keyword
 * tokens included) and maps Unicode characters back to single bytes.
 * The reverse direction is many-to-one: UDG letters are accepted from
 * five different Unicode "enclosed letter" blocks and several space
 * characters all map to the blank graphic 0x80. Keywords are never
 * produced when encoding.
 *
 * Tables are built once per variant and shared read-only; use get().
 */
class Charset {
public:
    /**
     * Shared immutable table for a variant
     */
    static const Charset& get(CharsetVariant variant);

    explicit Charset(CharsetVariant variant);

    /**
     * Decode one byte
     * @param byte Spectrum byte
     * @return UTF-8 text for the byte (a keyword may expand to several characters)
     */
    const std::string& decodeByte(uint8_t byte) const { return byteToText[byte]; }

    /**
     * Encode one character
     * @param codePoint Unicode scalar value
     * @return Spectrum byte, or empty if the character has no representation
     */
    std::optional<uint8_t> encodeChar(char32_t codePoint) const;

    // True if byte decodes to a BASIC keyword in this variant
    bool isToken(uint8_t byte) const { return tokenBytes[byte]; }

    CharsetVariant getVariant() const { return variant; }

    // Special bytes
    static constexpr uint8_t PRINT_COMMA = 0x06;
    static constexpr uint8_t NUMBER_MARKER = 0x0E;  // Followed by a 5-byte number
    static constexpr uint8_t END_OF_LINE = 0x0D;
    static constexpr uint8_t SOFT_EOF = 0x1A;       // CP/M end-of-file marker
    static constexpr uint8_t FIRST_GRAPHIC = 0x80;
    static constexpr uint8_t FIRST_UDG = 0x90;
    static constexpr uint8_t FIRST_TOKEN_128K = 0xA3;
    static constexpr uint8_t FIRST_TOKEN_48K = 0xA5;

    static constexpr int UDG_COUNT_128K = 19;  // A..S
    static constexpr int UDG_COUNT_48K = 21;   // A..U

private:
    CharsetVariant variant;
    std::array<std::string, 256> byteToText;
    std::array<bool, 256> tokenBytes;
    std::unordered_map<char32_t, uint8_t> charToByte;

    // Initialization
    void initializeTables();
    void addCharacter(uint8_t byte, char32_t codePoint);
    void addDecodeOnly(uint8_t byte, char32_t codePoint);
    void addAlias(char32_t codePoint, uint8_t byte);
    void addUdgBlock(char32_t firstCodePoint, int count);
    void addKeyword(uint8_t byte, const std::string& keyword);
};

} // namespace speccy
