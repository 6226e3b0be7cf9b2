#include "Charset.hpp"
#include "../Runtime/Utf8Text.hpp"

namespace speccy {

const Charset& Charset::get(CharsetVariant variant) {
    static const Charset spectrum128(CharsetVariant::Spectrum128);
    static const Charset spectrum48(CharsetVariant::Spectrum48);
    static const Charset hisoftGenAsm(CharsetVariant::HisoftGenAsm);

    switch (variant) {
        case CharsetVariant::Spectrum128:
            return spectrum128;
        case CharsetVariant::Spectrum48:
            return spectrum48;
        case CharsetVariant::HisoftGenAsm:
            break;
    }
    return hisoftGenAsm;
}

Charset::Charset(CharsetVariant v) : variant(v) {
    initializeTables();
}

std::optional<uint8_t> Charset::encodeChar(char32_t codePoint) const {
    auto it = charToByte.find(codePoint);
    if (it != charToByte.end()) {
        return it->second;
    }

    // Everything else goes through as Latin-1
    if (codePoint <= 0xFF) {
        return static_cast<uint8_t>(codePoint);
    }
    return std::nullopt;
}

void Charset::initializeTables() {
    // Unmapped bytes decode as Latin-1
    for (int b = 0; b < 256; b++) {
        byteToText[b] = Utf8Text::encode(static_cast<char32_t>(b));
        tokenBytes[b] = false;
    }

    // PRINT comma. The assembler keeps real TABs, so it has no mapping here.
    if (variant != CharsetVariant::HisoftGenAsm) {
        addCharacter(PRINT_COMMA, U'\t');
    }
    addCharacter(END_OF_LINE, U'\n');
    // 0x17 (TAB control) is a two-byte sequence and is left alone

    addCharacter(0x5E, U'\u2191');  // UPWARDS ARROW
    addCharacter(0x60, U'\u00A3');  // POUND SIGN
    addCharacter(0x7F, U'\u00A9');  // COPYRIGHT SIGN

    // Block graphics 0x80-0x8F as Unicode block elements
    addCharacter(0x80, U'\u2800');  // BRAILLE PATTERN BLANK
    addCharacter(0x81, U'\u259D');  // QUADRANT UPPER RIGHT
    addCharacter(0x82, U'\u2598');  // QUADRANT UPPER LEFT
    addCharacter(0x83, U'\u2580');  // UPPER HALF BLOCK
    addCharacter(0x84, U'\u2597');  // QUADRANT LOWER RIGHT
    addCharacter(0x85, U'\u2590');  // RIGHT HALF BLOCK
    addCharacter(0x86, U'\u259A');  // QUADRANT UPPER LEFT AND LOWER RIGHT
    addCharacter(0x87, U'\u259C');  // QUADRANT UPPER LEFT AND UPPER RIGHT AND LOWER RIGHT
    addCharacter(0x88, U'\u2596');  // QUADRANT LOWER LEFT
    addCharacter(0x89, U'\u259E');  // QUADRANT UPPER RIGHT AND LOWER LEFT
    addCharacter(0x8A, U'\u258C');  // LEFT HALF BLOCK
    addCharacter(0x8B, U'\u259B');  // QUADRANT UPPER LEFT AND UPPER RIGHT AND LOWER LEFT
    addCharacter(0x8C, U'\u2584');  // LOWER HALF BLOCK
    addCharacter(0x8D, U'\u259F');  // QUADRANT UPPER RIGHT AND LOWER LEFT AND LOWER RIGHT
    addCharacter(0x8E, U'\u2599');  // QUADRANT UPPER LEFT AND LOWER LEFT AND LOWER RIGHT
    addCharacter(0x8F, U'\u2588');  // FULL BLOCK

    // Other spaces typed in a text editor for the blank graphic
    addAlias(U'\u00A0', 0x80);  // NO-BREAK SPACE
    addAlias(U'\u2002', 0x80);  // EN SPACE
    addAlias(U'\u2003', 0x80);  // EM SPACE
    addAlias(U'\u3000', 0x80);  // IDEOGRAPHIC SPACE

    // Default appearance of the UDGs: negative squared letters decode, and
    // every enclosed-letter block is accepted back.
    int udgCount = (variant == CharsetVariant::Spectrum128) ? UDG_COUNT_128K : UDG_COUNT_48K;
    for (int i = 0; i < udgCount; i++) {
        addDecodeOnly(static_cast<uint8_t>(FIRST_UDG + i), static_cast<char32_t>(0x1F170 + i));
    }
    addUdgBlock(0x24B6, UDG_COUNT_48K);   // CIRCLED LATIN CAPITAL LETTER A..U
    addUdgBlock(0x24D0, UDG_COUNT_48K);   // CIRCLED LATIN SMALL LETTER A..U
    addUdgBlock(0x1F130, UDG_COUNT_48K);  // SQUARED LATIN CAPITAL LETTER A..U
    addUdgBlock(0x1F150, UDG_COUNT_48K);  // NEGATIVE CIRCLED LATIN CAPITAL LETTER A..U
    addUdgBlock(0x1F170, UDG_COUNT_48K);  // NEGATIVE SQUARED LATIN CAPITAL LETTER A..U

    // Keyword tokens, spaced as the +3 prints them with
    //   10 FOR c = 163 TO 255: PRINT c; " ["; CHR$ (c); "]": NEXT c
    if (variant == CharsetVariant::Spectrum128) {
        addKeyword(0xA3, " SPECTRUM ");
        addKeyword(0xA4, " PLAY ");
    }
    addKeyword(0xA5, "RND");
    addKeyword(0xA6, "INKEY$");
    addKeyword(0xA7, "PI");
    addKeyword(0xA8, "FN ");
    addKeyword(0xA9, "POINT ");
    addKeyword(0xAA, "SCREEN$ ");
    addKeyword(0xAB, "ATTR ");
    addKeyword(0xAC, "AT ");
    addKeyword(0xAD, "TAB ");
    addKeyword(0xAE, "VAL$ ");
    addKeyword(0xAF, "CODE ");
    addKeyword(0xB0, "VAL ");
    addKeyword(0xB1, "LEN ");
    addKeyword(0xB2, "SIN ");
    addKeyword(0xB3, "COS ");
    addKeyword(0xB4, "TAN ");
    addKeyword(0xB5, "ASN ");
    addKeyword(0xB6, "ACS ");
    addKeyword(0xB7, "ATN ");
    addKeyword(0xB8, "LN ");
    addKeyword(0xB9, "EXP ");
    addKeyword(0xBA, "INT ");
    addKeyword(0xBB, "SQR ");
    addKeyword(0xBC, "SGN ");
    addKeyword(0xBD, "ABS ");
    addKeyword(0xBE, "PEEK ");
    addKeyword(0xBF, "IN ");
    addKeyword(0xC0, "USR ");
    addKeyword(0xC1, "STR$ ");
    addKeyword(0xC2, "CHR$ ");
    addKeyword(0xC3, "NOT ");
    addKeyword(0xC4, "BIN ");
    addKeyword(0xC5, " OR ");
    addKeyword(0xC6, " AND ");
    addKeyword(0xC7, "<=");
    addKeyword(0xC8, ">=");
    addKeyword(0xC9, "<>");
    addKeyword(0xCA, " LINE ");
    addKeyword(0xCB, " THEN ");
    addKeyword(0xCC, " TO ");
    addKeyword(0xCD, " STEP ");
    addKeyword(0xCE, " DEF FN ");
    addKeyword(0xCF, " CAT ");
    addKeyword(0xD0, " FORMAT ");
    addKeyword(0xD1, " MOVE ");
    addKeyword(0xD2, " ERASE ");
    addKeyword(0xD3, " OPEN #");
    addKeyword(0xD4, " CLOSE #");
    addKeyword(0xD5, " MERGE ");
    addKeyword(0xD6, " VERIFY ");
    addKeyword(0xD7, " BEEP ");
    addKeyword(0xD8, " CIRCLE ");
    addKeyword(0xD9, " INK ");
    addKeyword(0xDA, " PAPER ");
    addKeyword(0xDB, " FLASH ");
    addKeyword(0xDC, " BRIGHT ");
    addKeyword(0xDD, " INVERSE ");
    addKeyword(0xDE, " OVER ");
    addKeyword(0xDF, " OUT ");
    addKeyword(0xE0, " LPRINT ");
    addKeyword(0xE1, " LLIST ");
    addKeyword(0xE2, " STOP ");
    addKeyword(0xE3, " READ ");
    addKeyword(0xE4, " DATA ");
    addKeyword(0xE5, " RESTORE ");
    addKeyword(0xE6, " NEW ");
    addKeyword(0xE7, " BORDER ");
    addKeyword(0xE8, " CONTINUE ");
    addKeyword(0xE9, " DIM ");
    addKeyword(0xEA, " REM ");
    addKeyword(0xEB, " FOR ");
    addKeyword(0xEC, " GO TO ");
    addKeyword(0xED, " GO SUB ");
    addKeyword(0xEE, " INPUT ");
    addKeyword(0xEF, " LOAD ");
    addKeyword(0xF0, " LIST ");
    addKeyword(0xF1, " LET ");
    addKeyword(0xF2, " PAUSE ");
    addKeyword(0xF3, " NEXT ");
    addKeyword(0xF4, " POKE ");
    addKeyword(0xF5, " PRINT ");
    addKeyword(0xF6, " PLOT ");
    addKeyword(0xF7, " RUN ");
    addKeyword(0xF8, " SAVE ");
    addKeyword(0xF9, " RANDOMIZE ");
    addKeyword(0xFA, " IF ");
    addKeyword(0xFB, " CLS ");
    addKeyword(0xFC, " DRAW ");
    addKeyword(0xFD, " CLEAR ");
    addKeyword(0xFE, " RETURN ");
    addKeyword(0xFF, " COPY ");
}

void Charset::addCharacter(uint8_t byte, char32_t codePoint) {
    addDecodeOnly(byte, codePoint);
    addAlias(codePoint, byte);
}

void Charset::addDecodeOnly(uint8_t byte, char32_t codePoint) {
    byteToText[byte] = Utf8Text::encode(codePoint);
}

void Charset::addAlias(char32_t codePoint, uint8_t byte) {
    charToByte[codePoint] = byte;
}

void Charset::addUdgBlock(char32_t firstCodePoint, int count) {
    for (int i = 0; i < count; i++) {
        addAlias(firstCodePoint + static_cast<char32_t>(i), static_cast<uint8_t>(FIRST_UDG + i));
    }
}

void Charset::addKeyword(uint8_t byte, const std::string& keyword) {
    byteToText[byte] = keyword;
    tokenBytes[byte] = true;
}

} // namespace speccy
