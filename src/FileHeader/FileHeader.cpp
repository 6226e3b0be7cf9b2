#include "FileHeader.hpp"
#include "../Charset/Charset.hpp"
#include "../Runtime/Utf8Text.hpp"
#include <algorithm>

namespace speccy {

namespace {

uint16_t readWord(const std::vector<uint8_t>& bytes, size_t pos) {
    return static_cast<uint16_t>(bytes[pos] | (static_cast<uint16_t>(bytes[pos + 1]) << 8));
}

void writeWord(std::vector<uint8_t>& bytes, uint16_t value) {
    bytes.push_back(static_cast<uint8_t>(value & 0xFF));
    bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

} // namespace

FileHeader::FileHeader(Layout l, uint16_t length)
    : layout(l)
    , fileType(FileType::Program)
    , fileLength(length)
    , params(ProgramParams{}) {
}

size_t FileHeader::headerLength() const {
    return (layout == Layout::Tape) ? TAPE_HEADER_LENGTH : PLUS3_BASIC_HEADER_LENGTH;
}

bool FileHeader::setFileName(const std::string& name) {
    if (layout != Layout::Tape) {
        return false;
    }

    std::u32string trimmed = Utf8Text::trim(Utf8Text::decode(name));
    if (trimmed.size() > FILE_NAME_MAX_LENGTH) {
        return false;
    }

    const Charset& charset = Charset::get(CharsetVariant::Spectrum128);
    for (char32_t c : trimmed) {
        if (!charset.encodeChar(c)) {
            return false;
        }
    }

    fileName = Utf8Text::encode(trimmed);
    return true;
}

bool FileHeader::setProgram(uint16_t autoStartLine, uint16_t programLength) {
    if (!isValidAutoStartLine(autoStartLine)) {
        return false;
    }
    fileType = FileType::Program;
    params = ProgramParams{autoStartLine, programLength};
    return true;
}

bool FileHeader::setNumericArray(char32_t name) {
    if (!isValidArrayName(name)) {
        return false;
    }
    fileType = FileType::NumericArray;
    params = ArrayParams{name};
    return true;
}

bool FileHeader::setCharArray(char32_t name) {
    if (!isValidArrayName(name)) {
        return false;
    }
    fileType = FileType::CharArray;
    params = ArrayParams{name};
    return true;
}

void FileHeader::setCodeOrScreen(uint16_t loadAddress) {
    fileType = FileType::CodeOrScreen;
    params = CodeParams{loadAddress};
}

uint16_t FileHeader::getAutoStartLine() const {
    auto program = std::get_if<ProgramParams>(&params);
    return program ? program->autoStartLine : 0;
}

uint16_t FileHeader::getProgramLength() const {
    auto program = std::get_if<ProgramParams>(&params);
    return program ? program->programLength : 0;
}

char32_t FileHeader::getArrayName() const {
    auto array = std::get_if<ArrayParams>(&params);
    return array ? array->name : 0;
}

uint16_t FileHeader::getLoadAddress() const {
    auto code = std::get_if<CodeParams>(&params);
    return code ? code->loadAddress : 0;
}

bool FileHeader::hasAutoStart() const {
    uint16_t line = getAutoStartLine();
    return isProgram() && line >= 1 && line <= MAX_AUTO_START_LINE;
}

bool FileHeader::isZeroed() const {
    return fileType == FileType::Program &&
           fileLength == 0 &&
           getAutoStartLine() == 0 &&
           getProgramLength() == 0;
}

std::vector<uint8_t> FileHeader::encode() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(headerLength());

    // A zeroed record with no name encodes back to all zeros
    if (!isZeroed() || (layout == Layout::Tape && !fileName.empty())) {
        bytes.push_back(static_cast<uint8_t>(fileType));

        if (layout == Layout::Tape) {
            const Charset& charset = Charset::get(CharsetVariant::Spectrum128);
            std::u32string name = Utf8Text::decode(fileName);
            name.resize(FILE_NAME_MAX_LENGTH, U' ');
            for (char32_t c : name) {
                // setFileName() only stores representable names
                bytes.push_back(charset.encodeChar(c).value_or(static_cast<uint8_t>('?')));
            }
        }

        writeWord(bytes, fileLength);

        switch (fileType) {
            case FileType::Program:
                writeWord(bytes, getAutoStartLine());
                writeWord(bytes, getProgramLength());
                break;

            case FileType::NumericArray:
            case FileType::CharArray: {
                const Charset& charset = Charset::get(CharsetVariant::Spectrum128);
                bytes.push_back(0x00);
                bytes.push_back(charset.encodeChar(getArrayName()).value_or(0x00));
                bytes.push_back(0x00);
                bytes.push_back(0x00);
                break;
            }

            case FileType::CodeOrScreen:
                writeWord(bytes, getLoadAddress());
                // 0x8000 on tape for historical reasons
                writeWord(bytes, (layout == Layout::Tape) ? 0x8000 : 0x0000);
                break;
        }
    }

    bytes.resize(headerLength(), 0x00);
    return bytes;
}

bool FileHeader::decode(const std::vector<uint8_t>& bytes) {
    reset();

    std::vector<uint8_t> headerBytes = bytes;

    // Tape header extracted with its flag byte and checksum
    if (layout == Layout::Tape && headerBytes.size() == headerLength() + 2) {
        if (headerBytes.front() != TAPE_HEADER_MARKER) {
            return false;
        }

        uint8_t checkXor = headerBytes.back();
        headerBytes = std::vector<uint8_t>(headerBytes.begin() + 1, headerBytes.end() - 1);

        uint8_t computed = 0;
        for (uint8_t byte : headerBytes) {
            computed ^= byte;
        }
        if (computed != checkXor) {
            return false;
        }
    }

    if (headerBytes.size() != headerLength()) {
        return false;
    }

    if (std::all_of(headerBytes.begin(), headerBytes.end(), [](uint8_t b) { return b == 0; })) {
        return true;
    }

    if (!decodeFields(headerBytes)) {
        reset();
        return false;
    }
    return true;
}

bool FileHeader::decodeFields(const std::vector<uint8_t>& bytes) {
    // Field offsets after the name match the +3 BASIC layout
    size_t base = 0;

    if (layout == Layout::Tape) {
        // File names shouldn't hold tokens: the 48K table has more plain characters
        const Charset& charset = Charset::get(CharsetVariant::Spectrum48);
        std::string name;
        for (size_t i = 1; i <= FILE_NAME_MAX_LENGTH; i++) {
            name += charset.decodeByte(bytes[i]);
        }
        fileName = Utf8Text::encode(Utf8Text::trim(Utf8Text::decode(name)));
        base = FILE_NAME_MAX_LENGTH;
    }

    fileLength = readWord(bytes, base + 1);

    switch (bytes[0]) {
        case static_cast<uint8_t>(FileType::Program): {
            fileType = FileType::Program;
            ProgramParams program{readWord(bytes, base + 3), readWord(bytes, base + 5)};
            params = program;
            return isValidAutoStartLine(program.autoStartLine);
        }

        case static_cast<uint8_t>(FileType::NumericArray):
        case static_cast<uint8_t>(FileType::CharArray): {
            fileType = static_cast<FileType>(bytes[0]);
            std::u32string name = Utf8Text::decode(
                Charset::get(CharsetVariant::Spectrum128).decodeByte(bytes[base + 4]));
            if (name.size() != 1) {
                return false;
            }
            params = ArrayParams{name[0]};
            return isValidArrayName(name[0]);
        }

        case static_cast<uint8_t>(FileType::CodeOrScreen):
            fileType = FileType::CodeOrScreen;
            params = CodeParams{readWord(bytes, base + 3)};
            return true;

        default:
            return false;
    }
}

bool FileHeader::isValidAutoStartLine(uint16_t line) {
    return line == NO_AUTO_START || (line >= 1 && line <= MAX_AUTO_START_LINE);
}

bool FileHeader::isValidArrayName(char32_t name) {
    return Utf8Text::isAlphabetic(name) &&
           Charset::get(CharsetVariant::Spectrum128).encodeChar(name).has_value();
}

void FileHeader::reset() {
    fileType = FileType::Program;
    fileName.clear();
    fileLength = 0;
    params = ProgramParams{};
}

std::vector<uint8_t> wrapTapeBlock(uint8_t flag, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> block;
    block.reserve(data.size() + 2);
    block.push_back(flag);
    block.insert(block.end(), data.begin(), data.end());

    uint8_t checkXor = flag;
    for (uint8_t byte : data) {
        checkXor ^= byte;
    }
    block.push_back(checkXor);
    return block;
}

} // namespace speccy
