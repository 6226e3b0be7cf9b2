#pragma once

#include "CommandLine.hpp"
#include "../Listing/ListingCommon.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace speccy {

/**
 * File-level conversions
 *
 * Reads the whole input file, runs the codec on it, and writes the
 * output (and tape header, if asked for). The output is only written
 * once the conversion has succeeded. Text files are UTF-8; a leading
 * byte-order mark is skipped on input and written on output unless
 * disabled.
 */
class Converter {
public:
    explicit Converter(TraceCallback trace = nullptr);

    /**
     * Run the conversion a command line asks for
     * @throws ConvError on any failure
     */
    void run(const CommandLineOptions& options) const;

    /**
     * Read a whole file
     * @throws ConvError(FILE_NOT_FOUND) if it cannot be opened
     * @throws ConvError(PATH_FILE_ACCESS_ERROR) if it is a directory or a
     *         read fails
     */
    static std::vector<uint8_t> readFile(const std::string& path);

    /**
     * Create or replace a file
     * @throws ConvError(PATH_FILE_ACCESS_ERROR) if it cannot be written
     */
    static void writeFile(const std::string& path, const std::vector<uint8_t>& data);
    static void writeFile(const std::string& path, const std::string& data);

    // Last path component; both '/' and '\' separate
    static std::string baseName(const std::string& path);

private:
    TraceCallback trace;

    void basicToUnicode(const CommandLineOptions& options) const;
    void asmToUnicode(const CommandLineOptions& options) const;
    void unicodeToAsm(const CommandLineOptions& options) const;

    void writeText(const CommandLineOptions& options, const std::string& text) const;
};

} // namespace speccy
