#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <msgdef/compilation.hh>
#include <msgdef/model.hh>

namespace msgdef::driver {

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Compile input files
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Compilation Pipeline Stages
    // ========================================================================

    /// Stage 1: Parse the file and every transitive import
    void load_imports(compilation_context& ctx, const std::filesystem::path& main_file);

    /// Stage 2: Order the files and run the transform pipeline
    void run_transforms(compilation_context& ctx);

    /// Stage 3: Build the resolved model
    /// Returns true on success, false on error
    bool build_model(const compilation_context& ctx, semantic::build_result& out_result);

    /// Stage 4: Hand the model to the requested targets
    void report_targets(const semantic::model& resolved);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    /// Print diagnostic messages
    void print_diagnostics(const semantic::build_result& result);

    /// Print import dependencies (for --print-imports)
    int print_imports(const compilation_context& ctx);

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace msgdef::driver
