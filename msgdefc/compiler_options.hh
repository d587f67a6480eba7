#pragma once

#include "logger.hh"
#include <filesystem>
#include <string>
#include <vector>

namespace msgdef::driver {

/// Output mode for the compiler
enum class OutputMode {
    Compile,       // Normal compilation (default)
    PrintImports   // Print resolved imports in dependency order and exit
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // --input or positional
    std::filesystem::path output_dir;                // --output
    std::vector<std::filesystem::path> include_dirs; // -I paths

    // ========================================================================
    // Target Selection
    // ========================================================================

    std::vector<std::string> target_languages;       // "cpp", "typescript"

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    bool debug = false;                              // --debug
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never

    OutputMode output_mode = OutputMode::Compile;    // --print-imports
};

/// Languages accepted by --language
const std::vector<std::string>& known_languages();

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace msgdef::driver
