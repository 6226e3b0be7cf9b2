#include "Converter.hpp"
#include "../Listing/AsmListing.hpp"
#include "../Listing/BasicListing.hpp"
#include "../Runtime/ConvError.hpp"
#include "../Runtime/Utf8Text.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace speccy {

Converter::Converter(TraceCallback traceCallback)
    : trace(std::move(traceCallback)) {
}

void Converter::run(const CommandLineOptions& options) const {
    switch (options.action) {
        case Action::BasicToUnicode:
            basicToUnicode(options);
            break;
        case Action::AsmToUnicode:
            asmToUnicode(options);
            break;
        case Action::UnicodeToAsm:
            unicodeToAsm(options);
            break;
    }
}

void Converter::basicToUnicode(const CommandLineOptions& options) const {
    BasicDecodeOptions decodeOptions;
    decodeOptions.variant = options.useSpectrum48KTokens ? CharsetVariant::Spectrum48 : CharsetVariant::Spectrum128;
    decodeOptions.stopAtSoftEof = options.useSoftEof;
    decodeOptions.trace = trace;
    if (options.tapeHeaderFile) {
        decodeOptions.tapeHeader = readFile(*options.tapeHeaderFile);
    }

    BasicListing listing(decodeOptions);
    writeText(options, listing.decode(readFile(options.inputFile)));
}

void Converter::asmToUnicode(const CommandLineOptions& options) const {
    AsmDecodeOptions decodeOptions;
    decodeOptions.includeLineNumbers = options.includeLineNumbers;
    decodeOptions.stopAtSoftEof = options.useSoftEof;
    decodeOptions.trace = trace;

    AsmListing listing;
    writeText(options, listing.decode(readFile(options.inputFile), decodeOptions));
}

void Converter::unicodeToAsm(const CommandLineOptions& options) const {
    std::vector<uint8_t> input = readFile(options.inputFile);

    AsmEncodeOptions encodeOptions;
    encodeOptions.prependPlus3DosHeader = options.prependPlus3DosHeader;
    encodeOptions.appendSoftEof = options.useSoftEof;
    encodeOptions.trace = trace;

    AsmListing listing;
    std::vector<uint8_t> output = listing.encode(std::string(input.begin(), input.end()), encodeOptions);

    // Built before anything is written, so a bad name leaves no files behind
    std::vector<uint8_t> tapeHeader;
    if (options.tapeHeaderFile) {
        tapeHeader = AsmListing::tapeHeaderFor(baseName(options.outputFile), output.size());
    }

    writeFile(options.outputFile, output);
    if (options.tapeHeaderFile) {
        writeFile(*options.tapeHeaderFile, tapeHeader);
    }
}

void Converter::writeText(const CommandLineOptions& options, const std::string& text) const {
    if (options.writeByteOrderMark) {
        writeFile(options.outputFile, Utf8Text::BYTE_ORDER_MARK + text);
    } else {
        writeFile(options.outputFile, text);
    }
}

std::vector<uint8_t> Converter::readFile(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw ConvError(ErrorCodes::PATH_FILE_ACCESS_ERROR, "'" + path + "' is a directory");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw ConvError(ErrorCodes::FILE_NOT_FOUND, "Cannot open file '" + path + "'");
    }

    // The file exists from here on, so failures are access errors
    std::vector<uint8_t> data;
    try {
        data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        throw ConvError(ErrorCodes::PATH_FILE_ACCESS_ERROR, "Cannot read file '" + path + "': " + e.what());
    }
    if (file.bad()) {
        throw ConvError(ErrorCodes::PATH_FILE_ACCESS_ERROR, "Cannot read file '" + path + "'");
    }
    return data;
}

void Converter::writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    writeFile(path, std::string(data.begin(), data.end()));
}

void Converter::writeFile(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw ConvError(ErrorCodes::PATH_FILE_ACCESS_ERROR, "Cannot create file '" + path + "'");
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (file.fail()) {
        throw ConvError(ErrorCodes::PATH_FILE_ACCESS_ERROR, "Cannot write file '" + path + "'");
    }
}

std::string Converter::baseName(const std::string& path) {
    size_t separator = path.find_last_of("/\\");
    return (separator == std::string::npos) ? path : path.substr(separator + 1);
}

} // namespace speccy
