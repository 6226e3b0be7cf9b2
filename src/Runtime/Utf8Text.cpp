#include "Utf8Text.hpp"
#include "ConvError.hpp"
#include <unicode/utf8.h>
#include <unicode/uchar.h>
#include <limits>
#include <sstream>

namespace speccy {
namespace Utf8Text {

std::u32string decode(const std::string& text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw ConvError(ErrorCodes::ENCODING_ERROR, "Text too large to decode");
    }

    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;

    std::u32string result;
    result.reserve(text.size());

    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            std::ostringstream oss;
            oss << "Invalid UTF-8 sequence at byte offset " << start;
            throw ConvError(ErrorCodes::ENCODING_ERROR, oss.str(), 0, static_cast<size_t>(start));
        }
        result.push_back(static_cast<char32_t>(c));
    }

    return result;
}

void append(std::string& out, char32_t codePoint) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, static_cast<UChar32>(codePoint));
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

std::string encode(char32_t codePoint) {
    std::string result;
    append(result, codePoint);
    return result;
}

std::string encode(const std::u32string& text) {
    std::string result;
    result.reserve(text.size());
    for (char32_t c : text) {
        append(result, c);
    }
    return result;
}

std::string stripByteOrderMark(const std::string& text) {
    if (text.compare(0, 3, BYTE_ORDER_MARK) == 0) {
        return text.substr(3);
    }
    return text;
}

std::vector<std::u32string> splitLines(const std::u32string& text) {
    std::vector<std::u32string> lines;
    std::u32string current;
    size_t i = 0;

    while (i < text.size()) {
        char32_t c = text[i++];
        if (c == U'\n' || c == U'\r') {
            // CR LF counts as one terminator
            if (c == U'\r' && i < text.size() && text[i] == U'\n') {
                i++;
            }
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }

    return lines;
}

std::u32string trimRight(const std::u32string& text) {
    size_t end = text.size();
    while (end > 0 && isWhitespace(text[end - 1])) {
        end--;
    }
    return text.substr(0, end);
}

std::u32string trim(const std::u32string& text) {
    size_t start = 0;
    while (start < text.size() && isWhitespace(text[start])) {
        start++;
    }
    return trimRight(text.substr(start));
}

bool isAlphabetic(char32_t codePoint) {
    return u_isalpha(static_cast<UChar32>(codePoint));
}

bool isWhitespace(char32_t codePoint) {
    return u_isspace(static_cast<UChar32>(codePoint));
}

bool isWordCharacter(char32_t codePoint) {
    return codePoint == U'_' || u_isalnum(static_cast<UChar32>(codePoint));
}

} // namespace Utf8Text
} // namespace speccy
