#ifndef BEARDMOLD_CLI_COMMON_HPP
#define BEARDMOLD_CLI_COMMON_HPP

#include <iostream>
#include <stdexcept>
#include <string>

namespace beardmold::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;          // Also unexpected errors
constexpr int EXIT_INVALID_INPUT = 2;
constexpr int EXIT_EXPORT_FAILED = 3;  // Statistics sidecar kept

// Options and the two positional paths given after "--"
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::string kernel_name = "auto";
    bool verbose = false;
    bool help = false;
};

// Parse `[options] -- <input.json> <output.stl>`.
// Throws std::runtime_error on an unknown option, a missing separator or a
// wrong number of positional arguments. With -h/--help nothing else is
// required.
inline CommandContext parse_args(int argc, char** argv, int start_idx = 1) {
    CommandContext ctx;
    int i = start_idx;
    bool separator = false;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "--") {
            separator = true;
            ++i;
            break;
        } else if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-k" || arg == "--kernel") {
            if (i + 1 < argc) {
                ctx.kernel_name = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-k/--kernel requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.help) {
        return ctx;
    }
    if (!separator) {
        throw std::runtime_error("Missing '--' before <input.json> <output.stl>");
    }

    int positional = argc - i;
    if (positional != 2) {
        throw std::runtime_error("Expected 2 arguments after '--', got " + std::to_string(positional));
    }
    ctx.input_path = argv[i];
    ctx.output_path = argv[i + 1];
    return ctx;
}

inline void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] -- <input.json> <output.stl>\n";
    std::cerr << "\n";
    std::cerr << "Builds a printable beard-mold solid from a facial contour payload.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -k, --kernel <name>  Mesh kernel: native, manifold or auto (default: auto)\n";
    std::cerr << "  -v, --verbose        Debug logging\n";
    std::cerr << "  -h, --help           Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  input.json   - Payload with beardline, neckline, holeCenters and params\n";
    std::cerr << "  output.stl   - Binary STL; statistics go to <output.stl>.stats.json\n";
    std::cerr << "\n";
    std::cerr << "Exit codes:\n";
    std::cerr << "  0 success, 1 usage or unexpected error, 2 invalid input, 3 export failed\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BEARDMOLD_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

}  // namespace beardmold::cli

#endif // BEARDMOLD_CLI_COMMON_HPP
