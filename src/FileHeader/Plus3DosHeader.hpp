#pragma once

#include "FileHeader.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace speccy {

/**
 * +3DOS File Header
 *
 * The 128-byte record +3DOS keeps ahead of every file on disk (files
 * copied out of a DSK in CP/M mode carry it along). From the ZX Spectrum
 * +3 manual, "Guide to +3DOS", "File headers":
 *
 *   0   "PLUS3DOS" 0x1A   signature
 *   9   issue number
 *   10  version number
 *   11  file length including this header (4 bytes)
 *   15  +3 BASIC header (8 bytes)
 *   23  reserved, zero
 *   127 checksum: sum of bytes 0..126 modulo 256
 */
class Plus3DosHeader {
public:
    static constexpr size_t HEADER_LENGTH = 128;
    static constexpr size_t SIGNATURE_LENGTH = 9;
    static constexpr size_t BASIC_HEADER_OFFSET = 15;
    static constexpr std::array<uint8_t, SIGNATURE_LENGTH> SIGNATURE = {
        'P', 'L', 'U', 'S', '3', 'D', 'O', 'S', 0x1A
    };

    static constexpr uint8_t DEFAULT_ISSUE = 1;
    static constexpr uint8_t DEFAULT_VERSION = 0;

    /**
     * Create a header for a file of fileLength bytes (header excluded)
     *
     * The embedded +3 BASIC header starts zeroed.
     */
    explicit Plus3DosHeader(uint32_t fileLength = 0);

    /**
     * Set the file length, header excluded
     *
     * Also updates the embedded header's length unless it is zeroed.
     * @return false (nothing changed) if the length does not fit the total
     *         length field, or the embedded header's 16-bit length field
     */
    bool setFileLength(uint32_t fileLength);
    uint32_t getFileLength() const { return fileLengthWithHeader - HEADER_LENGTH; }
    uint32_t getFileLengthWithHeader() const { return fileLengthWithHeader; }

    uint8_t getIssueNumber() const { return issueNumber; }
    uint8_t getVersionNumber() const { return versionNumber; }

    FileHeader& basicHeader() { return basic; }
    const FileHeader& basicHeader() const { return basic; }

    /**
     * Encode into 128 bytes, recomputing the checksum
     */
    std::vector<uint8_t> encode() const;

    /**
     * Decode from 128 bytes
     *
     * Checks the signature, the checksum, the total length and the
     * embedded header.
     * @return true on success; on false this object is left unchanged
     */
    bool decode(const std::vector<uint8_t>& bytes);

    /**
     * Checksum of a header record: sum of its first 127 bytes modulo 256
     */
    static uint8_t checksum(const std::vector<uint8_t>& bytes);

private:
    uint8_t issueNumber;
    uint8_t versionNumber;
    uint32_t fileLengthWithHeader;
    FileHeader basic;
};

} // namespace speccy
