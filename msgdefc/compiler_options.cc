#include "compiler_options.hh"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace msgdef::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "--name value" / "-Xvalue" style options
static std::string require_value(int argc, char** argv, int& i, const char* prefix) {
    std::string value = get_option_value(argv[i], prefix);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static void add_language(CompilerOptions& opts, const std::string& language) {
    if (language == "all") {
        for (const auto& lang : known_languages()) {
            add_language(opts, lang);
        }
        return;
    }

    const auto& known = known_languages();
    if (std::find(known.begin(), known.end(), language) == known.end()) {
        std::string error_msg = "Unknown target language: " + language + "\n\nAvailable languages:";
        for (const auto& lang : known) {
            error_msg += "\n  - " + lang;
        }
        error_msg += "\n  - all";
        throw std::runtime_error(error_msg);
    }

    if (std::find(opts.target_languages.begin(), opts.target_languages.end(), language) ==
        opts.target_languages.end()) {
        opts.target_languages.push_back(language);
    }
}

static ColorMode parse_color_mode(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

const std::vector<std::string>& known_languages() {
    static const std::vector<std::string> languages = {"cpp", "typescript"};
    return languages;
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(get_option_value(arg, "--color="));
            continue;
        }

        if (std::strcmp(arg, "--print-imports") == 0) {
            opts.output_mode = OutputMode::PrintImports;
            continue;
        }

        // Input file
        if (std::strcmp(arg, "--input") == 0) {
            opts.input_files.push_back(require_value(argc, argv, i, "--input"));
            continue;
        }

        // Output directory
        if (std::strcmp(arg, "--output") == 0) {
            opts.output_dir = require_value(argc, argv, i, "--output");
            continue;
        }

        if (starts_with(arg, "-o")) {
            opts.output_dir = require_value(argc, argv, i, "-o");
            continue;
        }

        // Include paths
        if (starts_with(arg, "-I")) {
            opts.include_dirs.push_back(require_value(argc, argv, i, "-I"));
            continue;
        }

        // Target language
        if (std::strcmp(arg, "--language") == 0) {
            add_language(opts, require_value(argc, argv, i, "--language"));
            continue;
        }

        if (std::strcmp(arg, "--cpp") == 0) {
            add_language(opts, "cpp");
            continue;
        }

        if (std::strcmp(arg, "--ts") == 0) {
            add_language(opts, "typescript");
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.target_languages.empty()) {
        opts.target_languages.push_back("cpp");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input-files>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Input/Output:\n";
    std::cout << "  --input <file>          Schema file to compile (also accepted positionally)\n";
    std::cout << "  --output <dir>          Output directory (default: current directory)\n";
    std::cout << "  -I <dir>                Add import search path (MSGDEF_PATH is searched last)\n";
    std::cout << "  --print-imports         Print resolved imports in dependency order and exit\n";
    std::cout << "\n";

    std::cout << "Targets:\n";
    std::cout << "  --language <lang>       cpp, typescript or all (default: cpp)\n";
    std::cout << "  --cpp                   Same as --language cpp\n";
    std::cout << "  --ts                    Same as --language typescript\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --debug                 Debug output\n";
    std::cout << "  --color=<mode>          auto, always or never\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " messages.def\n";
    std::cout << "  " << program_name << " --input messages.def --output gen --language all\n";
    std::cout << "  " << program_name << " -I schemas --ts messages.def\n";
}

void print_version() {
    std::cout << "msgdef compiler v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace msgdef::driver
