#include "CommandLine.hpp"
#include "../Runtime/ConvError.hpp"
#include <sstream>

namespace speccy {

namespace {

[[noreturn]] void badCommandLine(const std::string& message) {
    throw ConvError(ErrorCodes::BAD_COMMAND_LINE, message + " (try --help)");
}

// Set a boolean flag by its short letter; false if there is no such flag
bool setShortFlag(char letter, CommandLineOptions& options) {
    switch (letter) {
        case '4': options.useSpectrum48KTokens = true; return true;
        case 'l': options.includeLineNumbers = true; return true;
        case '3': options.prependPlus3DosHeader = true; return true;
        case 's': options.useSoftEof = true; return true;
        case 'v': options.verbose = true; return true;
        case 'h': options.showHelp = true; return true;
        default: return false;
    }
}

bool setLongFlag(const std::string& name, CommandLineOptions& options) {
    if (name == "--useSpectrum48KTokens") return setShortFlag('4', options);
    if (name == "--includeLineNumbers") return setShortFlag('l', options);
    if (name == "--prependPlus3DosHeader") return setShortFlag('3', options);
    if (name == "--useSoftEOF") return setShortFlag('s', options);
    if (name == "--verbose") return setShortFlag('v', options);
    if (name == "--help") return setShortFlag('h', options);
    if (name == "--noBOM") {
        options.writeByteOrderMark = false;
        return true;
    }
    return false;
}

} // namespace

CommandLineOptions CommandLine::parse(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::vector<std::string> positional;
    bool optionsEnded = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        if (arg.compare(0, 2, "--") == 0) {
            if (arg == "--tapeHeaderFile") {
                if (i + 1 >= args.size()) {
                    badCommandLine("--tapeHeaderFile needs a file name");
                }
                options.tapeHeaderFile = args[++i];
            } else if (arg.compare(0, 17, "--tapeHeaderFile=") == 0) {
                options.tapeHeaderFile = arg.substr(17);
            } else if (!setLongFlag(arg, options)) {
                badCommandLine("Unknown option " + arg);
            }
            continue;
        }

        // Short options, possibly grouped ("-ls"); -t takes the rest or the next argument
        for (size_t j = 1; j < arg.size(); j++) {
            if (arg[j] == 't') {
                if (j + 1 < arg.size()) {
                    options.tapeHeaderFile = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    options.tapeHeaderFile = args[++i];
                } else {
                    badCommandLine("-t needs a file name");
                }
                break;
            }
            if (!setShortFlag(arg[j], options)) {
                badCommandLine(std::string("Unknown option -") + arg[j]);
            }
        }
    }

    if (options.showHelp) {
        return options;
    }

    if (positional.size() < 2) {
        badCommandLine("Missing action or input file");
    }
    if (positional.size() > 3) {
        badCommandLine("Too many arguments");
    }

    auto action = parseAction(positional[0]);
    if (!action) {
        badCommandLine("Unknown action '" + positional[0] + "', expected bas2u, asm2u or u2asm");
    }
    options.action = *action;
    options.inputFile = positional[1];
    options.outputFile = (positional.size() == 3) ? positional[2] : defaultOutputFile(options.action, options.inputFile);

    if (options.tapeHeaderFile && (options.prependPlus3DosHeader || options.useSoftEof)) {
        throw ConvError(ErrorCodes::CONFLICTING_OPTIONS,
                        "Cannot use --tapeHeaderFile at the same time as disk options "
                        "--prependPlus3DosHeader or --useSoftEOF");
    }

    return options;
}

std::optional<Action> CommandLine::parseAction(const std::string& name) {
    if (name == "bas2u") return Action::BasicToUnicode;
    if (name == "asm2u") return Action::AsmToUnicode;
    if (name == "u2asm") return Action::UnicodeToAsm;
    return std::nullopt;
}

std::string CommandLine::defaultOutputFile(Action action, const std::string& inputFile) {
    return inputFile + (action == Action::UnicodeToAsm ? ".asm" : ".txt");
}

std::string CommandLine::usage(const std::string& programName) {
    std::ostringstream oss;
    oss << "ZX Spectrum <-> Unicode file converter\n";
    oss << "Supports Sinclair BASIC (BAS) and HiSoft GEN Assembler (ASM).\n";
    oss << "\n";
    oss << "Usage: " << programName << " [options] <action> <input> [output]\n";
    oss << "\n";
    oss << "Actions:\n";
    oss << "  bas2u   Sinclair BASIC to Unicode\n";
    oss << "  asm2u   HiSoft GEN Assembler to Unicode\n";
    oss << "  u2asm   Unicode to HiSoft GEN Assembler\n";
    oss << "\n";
    oss << "The output file defaults to the input file name plus \".txt\" (bas2u, asm2u)\n";
    oss << "or \".asm\" (u2asm).\n";
    oss << "\n";
    oss << "Options:\n";
    oss << "  -4, --useSpectrum48KTokens     Use 48K (not 128K) BASIC tokens (bas2u)\n";
    oss << "  -l, --includeLineNumbers       Include line numbers in the text (asm2u)\n";
    oss << "  -t, --tapeHeaderFile <file>    Tape header to read (bas2u) or write (u2asm)\n";
    oss << "  -3, --prependPlus3DosHeader    Prepend a +3DOS header (u2asm)\n";
    oss << "  -s, --useSoftEOF               Stop reading at Soft-EOF (1Ah), or append one (u2asm)\n";
    oss << "      --noBOM                    Write text without a byte-order mark\n";
    oss << "  -v, --verbose                  Report what was found in the input on stderr\n";
    oss << "  -h, --help                     Show this help\n";
    oss << "\n";
    oss << "Examples:\n";
    oss << "  " << programName << " bas2u GAME.BAS               # Writes GAME.BAS.txt\n";
    oss << "  " << programName << " -l asm2u SOURCE.GEN src.txt\n";
    oss << "  " << programName << " -3 -s u2asm src.txt SOURCE.GEN\n";
    return oss.str();
}

} // namespace speccy
