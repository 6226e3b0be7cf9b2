#include "Plus3DosHeader.hpp"
#include <algorithm>
#include <limits>

namespace speccy {

Plus3DosHeader::Plus3DosHeader(uint32_t fileLength)
    : issueNumber(DEFAULT_ISSUE)
    , versionNumber(DEFAULT_VERSION)
    , fileLengthWithHeader(HEADER_LENGTH)
    , basic(FileHeader::Layout::Plus3Basic) {
    if (fileLength <= std::numeric_limits<uint32_t>::max() - HEADER_LENGTH) {
        fileLengthWithHeader = static_cast<uint32_t>(HEADER_LENGTH + fileLength);
    }
}

bool Plus3DosHeader::setFileLength(uint32_t fileLength) {
    if (fileLength > std::numeric_limits<uint32_t>::max() - HEADER_LENGTH) {
        return false;
    }

    if (!basic.isZeroed()) {
        if (fileLength > std::numeric_limits<uint16_t>::max()) {
            return false;
        }
        basic.setFileLength(static_cast<uint16_t>(fileLength));
    }

    fileLengthWithHeader = static_cast<uint32_t>(HEADER_LENGTH + fileLength);
    return true;
}

std::vector<uint8_t> Plus3DosHeader::encode() const {
    std::vector<uint8_t> bytes(SIGNATURE.begin(), SIGNATURE.end());
    bytes.reserve(HEADER_LENGTH);

    bytes.push_back(issueNumber);
    bytes.push_back(versionNumber);
    for (int shift = 0; shift < 32; shift += 8) {
        bytes.push_back(static_cast<uint8_t>((fileLengthWithHeader >> shift) & 0xFF));
    }

    std::vector<uint8_t> basicBytes = basic.encode();
    bytes.insert(bytes.end(), basicBytes.begin(), basicBytes.end());

    bytes.resize(HEADER_LENGTH - 1, 0x00);
    bytes.push_back(checksum(bytes));
    return bytes;
}

bool Plus3DosHeader::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != HEADER_LENGTH) {
        return false;
    }

    if (!std::equal(SIGNATURE.begin(), SIGNATURE.end(), bytes.begin())) {
        return false;
    }

    if (checksum(bytes) != bytes[HEADER_LENGTH - 1]) {
        return false;
    }

    uint32_t total = 0;
    for (int i = 3; i >= 0; i--) {
        total = (total << 8) | bytes[11 + i];
    }
    if (total < HEADER_LENGTH) {
        return false;
    }

    FileHeader decoded(FileHeader::Layout::Plus3Basic);
    std::vector<uint8_t> basicBytes(bytes.begin() + BASIC_HEADER_OFFSET,
                                    bytes.begin() + BASIC_HEADER_OFFSET + FileHeader::PLUS3_BASIC_HEADER_LENGTH);
    if (!decoded.decode(basicBytes)) {
        return false;
    }

    issueNumber = bytes[9];
    versionNumber = bytes[10];
    fileLengthWithHeader = total;
    basic = decoded;
    return true;
}

uint8_t Plus3DosHeader::checksum(const std::vector<uint8_t>& bytes) {
    unsigned int sum = 0;
    size_t count = std::min(bytes.size(), HEADER_LENGTH - 1);
    for (size_t i = 0; i < count; i++) {
        sum += bytes[i];
    }
    return static_cast<uint8_t>(sum % 256);
}

} // namespace speccy
