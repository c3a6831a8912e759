#include "txt2html/TXT2HTMLConverter.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

static void printUsage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " <input.txt> [--encoding <name>]\n";
    os << "\nExample: " << prog << " notes.txt          (writes notes.html)\n";
}

// keys the converter reads from Options
static const std::unordered_set<std::string> kKnownParams { "encoding" };

int main(int argc, char* argv[]) {
    // Check for help/version flags first
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argv[0]);
            std::cout << "\nThe first \".txt\" in the input path is replaced by \".html\" to name the output;\n";
            std::cout << "a path without \".txt\" is converted in place.\n";
            std::cout << "\nParameters:\n";
            std::cout << "  --encoding <name> - Source encoding: utf-8, ascii, iso-8859-1 (default: utf-8)\n";
            std::cout << "Any other --key is rejected.\n";
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "txt2html v1.0.0\n";
            return 0;
        }
    }

    txt2html::Options opts;
    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.substr(0, 2) == "--") {
            // Parameter: --key value
            const std::string key = arg.substr(2);
            if (!kKnownParams.count(key)) {
                std::cerr << "Error: Unknown parameter " << arg << "\n";
                std::cerr << "Use --help for more information.\n";
                return 1;
            }
            if (i + 1 < argc) {
                opts.params[key] = argv[i + 1];
                ++i; // Skip the value in next iteration
            } else {
                std::cerr << "Error: Parameter " << arg << " requires a value\n";
                return 1;
            }
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.size() != 1) {
        printUsage(std::cerr, argv[0]);
        std::cerr << "Use --help for more information.\n";
        return 1;
    }

    try {
        const std::string out = txt2html::txt2html(inputs[0], opts);
        std::cout << "[txt2html] " << inputs[0] << " -> " << out << '\n';
    } catch (const std::exception& e) {
        std::cerr << "[txt2html] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
