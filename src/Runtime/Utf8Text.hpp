#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace speccy {

/**
 * UTF-8 text helpers
 *
 * Thin wrappers around ICU's UTF-8 macros and character properties, used
 * by the listing codecs to walk Unicode text one code point at a time and
 * to build their UTF-8 output.
 */
namespace Utf8Text {

/**
 * Decode UTF-8 text into code points
 * @param text UTF-8 encoded text
 * @return Code points in text order
 * @throws ConvError(ENCODING_ERROR) on a malformed sequence
 */
std::u32string decode(const std::string& text);

// Append the UTF-8 encoding of one code point
void append(std::string& out, char32_t codePoint);

// UTF-8 encoding of one code point
std::string encode(char32_t codePoint);

// UTF-8 encoding of a code point string
std::string encode(const std::u32string& text);

/**
 * Remove a leading UTF-8 byte-order mark, if present
 */
std::string stripByteOrderMark(const std::string& text);

/**
 * Split text into lines on LF, CR LF or CR
 *
 * Line terminators are not included. A terminator at the very end of the
 * text does not start an extra empty line.
 */
std::vector<std::u32string> splitLines(const std::u32string& text);

// Remove trailing whitespace (Unicode White_Space semantics)
std::u32string trimRight(const std::u32string& text);

// Remove leading and trailing whitespace
std::u32string trim(const std::u32string& text);

bool isAlphabetic(char32_t codePoint);
bool isWhitespace(char32_t codePoint);

// Letter, digit or underscore: the characters a regex word boundary separates
bool isWordCharacter(char32_t codePoint);

constexpr const char* BYTE_ORDER_MARK = "\xEF\xBB\xBF";

} // namespace Utf8Text

} // namespace speccy
