//
// Created by igor on 06/12/2025.
//
// msgdefc: checks a schema and its imports and reports what the resolved model holds
//

#include <iostream>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

namespace {
    msgdef::driver::LogLevel log_level_of(const msgdef::driver::CompilerOptions& opts) {
        using msgdef::driver::LogLevel;
        if (opts.debug) return LogLevel::Debug;
        if (opts.verbose) return LogLevel::Verbose;
        if (opts.quiet) return LogLevel::Quiet;
        return LogLevel::Normal;
    }
}

int main(int argc, char* argv[]) {
    using namespace msgdef::driver;

    CompilerOptions opts;
    try {
        // --help and --version exit from here
        opts = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "msgdefc: " << e.what() << "\n"
                  << "Try '" << argv[0] << " --help' for more information." << std::endl;
        return 1;
    }

    Logger logger(log_level_of(opts), opts.color);
    Compiler compiler(opts, logger);
    return compiler.compile();
}
