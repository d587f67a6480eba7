#include "compiler.hh"
#include <msgdef/parser_error.hh>
#include <iostream>

namespace msgdef::driver {

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        logger_.verbose("Starting compilation...");

        for (const auto& input_file : options_.input_files) {
            logger_.info("Compiling: " + input_file.string());

            compilation_context ctx;

            // Stage 1: Load file and imports
            load_imports(ctx, input_file);

            // Stage 2: Transform pipeline
            run_transforms(ctx);

            if (options_.output_mode == OutputMode::PrintImports) {
                return print_imports(ctx);
            }

            // Stage 3: Resolved model
            semantic::build_result result;
            if (!build_model(ctx, result)) {
                return 1;  // Errors occurred
            }

            // Stage 4: Targets
            report_targets(result.resolved.value());
        }

        logger_.success("Compilation successful");
        return 0;

    } catch (const parse_error& e) {
        logger_.error(std::string("Parse error: ") + e.what());
        return 1;
    } catch (const module_load_error& e) {
        logger_.error(std::string("Module load error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

void Compiler::load_imports(compilation_context& ctx, const std::filesystem::path& main_file) {
    logger_.verbose("Loading: " + main_file.string());

    std::vector<std::string> search_paths;
    for (const auto& dir : options_.include_dirs) {
        search_paths.push_back(dir.string());
    }
    ctx.search_paths = make_search_paths(search_paths);

    for (const auto& dir : ctx.search_paths) {
        logger_.debug("Search path: " + dir);
    }

    load_schema(ctx, main_file.string());

    for (const auto& file : ctx.load_order) {
        logger_.debug("Loaded: " + file);
    }
}

void Compiler::run_transforms(compilation_context& ctx) {
    logger_.verbose("Running transform pipeline on " + std::to_string(ctx.registry.size()) + " file(s)...");

    process_schema(ctx);

    for (const auto& file : ctx.dependency_order) {
        logger_.debug("Processed: " + file);
    }
}

bool Compiler::build_model(const compilation_context& ctx, semantic::build_result& out_result) {
    logger_.verbose("Building model...");

    out_result = build_schema_model(ctx);

    print_diagnostics(out_result);

    return !out_result.has_errors();
}

void Compiler::report_targets(const semantic::model& resolved) {
    std::filesystem::path output_dir = options_.output_dir;
    if (output_dir.empty()) {
        output_dir = std::filesystem::current_path();
    }

    for (const auto& language : options_.target_languages) {
        logger_.verbose("Model ready for " + language + " bindings in " + output_dir.string());
        logger_.item(language + ": " +
                       std::to_string(resolved.namespaces.size()) + " namespace(s), " +
                       std::to_string(resolved.messages.size()) + " message(s), " +
                       std::to_string(resolved.enums.size()) + " enum(s)");
    }
}

// ============================================================================
// Utility Methods
// ============================================================================

void Compiler::print_diagnostics(const semantic::build_result& result) {
    for (const auto& diag : result.diagnostics) {
        logger_.diagnostic(diag);
    }
    logger_.error_summary(result.error_count());
}

int Compiler::print_imports(const compilation_context& ctx) {
    // One imported file per line, dependencies first
    for (const auto& file : ctx.dependency_order) {
        if (file != ctx.root_file) {
            std::cout << file << "\n";
        }
    }
    return 0;
}

}  // namespace msgdef::driver
