#include <iostream>
#include <string>
#include <vector>

#include "Converter/CommandLine.hpp"
#include "Converter/Converter.hpp"
#include "Runtime/ConvError.hpp"

using namespace speccy;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        CommandLineOptions options = CommandLine::parse(args);

        if (options.showHelp) {
            std::cout << CommandLine::usage(argv[0]);
            return 0;
        }

        TraceCallback trace;
        if (options.verbose) {
            trace = [](const std::string& message) { std::cerr << message << std::endl; };
        }

        Converter converter(trace);
        converter.run(options);
    } catch (const ConvError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
