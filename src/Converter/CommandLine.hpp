#pragma once

#include <optional>
#include <string>
#include <vector>

namespace speccy {

enum class Action {
    BasicToUnicode,  // bas2u
    AsmToUnicode,    // asm2u
    UnicodeToAsm     // u2asm
};

struct CommandLineOptions {
    Action action = Action::BasicToUnicode;
    std::string inputFile;
    std::string outputFile;  // Defaulted from inputFile when not given
    std::optional<std::string> tapeHeaderFile;

    bool useSpectrum48KTokens = false;   // bas2u
    bool includeLineNumbers = false;     // asm2u
    bool prependPlus3DosHeader = false;  // u2asm
    bool useSoftEof = false;             // Stop at it when reading, append it when writing
    bool writeByteOrderMark = true;      // Text output
    bool verbose = false;
    bool showHelp = false;
};

/**
 * speccy-conv command line
 *
 *   speccy-conv [options] <bas2u|asm2u|u2asm> <input> [output]
 */
class CommandLine {
public:
    /**
     * Parse the arguments after the program name
     * @throws ConvError BAD_COMMAND_LINE for unknown options or missing or
     *         extra arguments, CONFLICTING_OPTIONS for -t with -3 or -s
     */
    static CommandLineOptions parse(const std::vector<std::string>& args);

    static std::string usage(const std::string& programName);

    // Input name plus ".txt" for text output, ".asm" for u2asm
    static std::string defaultOutputFile(Action action, const std::string& inputFile);

    static std::optional<Action> parseAction(const std::string& name);
};

} // namespace speccy
