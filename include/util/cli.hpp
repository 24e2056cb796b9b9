#pragma once

/**
 * CLI utilities for the rolldesk tool
 *
 * Provides command-line argument parsing and the help text.
 */

#include "string_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rolldesk {
namespace util {

/**
 * Command-line arguments for the rolldesk tool.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string config_path;           // empty: built-in defaults
    std::vector<std::string> symbols;  // overrides the configured watch-list
    int duration = 0;                  // 0 = until SIGINT/SIGTERM
};

inline void print_help() {
    std::cout << R"(
rolldesk - options market-data desk (simulated gateway)
=======================================================

Usage: rolldesk [options]

Options:
  -c, --config FILE      JSON config file (default: built-in defaults)
  -s, --symbols SYMS     Watch-list, comma-separated (default: QQQ,TQQQ)
  -d, --duration SECS    Run time in seconds (0 = until Ctrl+C)
  -v, --verbose          Debug logging
  -h, --help             Show this help

Examples:
  rolldesk                          # Preload QQQ and TQQQ until Ctrl+C
  rolldesk -s qqq -d 60             # One symbol, one minute
  rolldesk -c desk.json -v          # Config file, debug logging
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if ((arg == "--symbols" || arg == "-s") && i + 1 < argc) {
            args.symbols = split_symbols(argv[++i]);
        }
        else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
            try {
                args.duration = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid duration: " << argv[i] << "\n";
                return false;
            }
            if (args.duration < 0) {
                std::cerr << "Duration must not be negative\n";
                return false;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace rolldesk
