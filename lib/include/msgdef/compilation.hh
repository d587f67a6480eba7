//
// Created by igor on 06/12/2025.
//

#pragma once

#include "model.hh"
#include "transform.hh"
#include <string>
#include <vector>

namespace msgdef {
    /// State of one compilation, passed explicitly to every loading call.
    struct compilation_context {
        std::vector<std::string> search_paths;   ///< -I paths, then MSGDEF_PATH entries
        model_registry registry;                 ///< Canonical path -> early model
        std::string root_file;                   ///< Canonical path of the root schema
        std::vector<std::string> load_order;     ///< Files in discovery (breadth-first) order
        std::vector<std::string> dependency_order; ///< Files dependencies-first, set by process_schema
    };

    /// User search paths followed by the entries of MSGDEF_PATH
    std::vector<std::string> make_search_paths(const std::vector<std::string>& user_paths);

    /// Locates an imported file: relative to the importing file's directory, then each
    /// search path. Returns the canonical path; throws import_not_found_error.
    std::string resolve_import_path(const std::string& import_path,
                                    const std::string& importing_file,
                                    const std::vector<std::string>& search_paths);

    /// Parses the root file and every transitive import exactly once into ctx.registry.
    /// Throws parse_error and module_load_error.
    void load_schema(compilation_context& ctx, const std::string& root_path);

    /// Sorts the loaded files and runs the transform pipeline on each of them.
    /// Throws circular_import_error.
    void process_schema(compilation_context& ctx);

    /// Builds the Model from the processed files of ctx
    semantic::build_result build_schema_model(const compilation_context& ctx);

    /// Load, transform and build in one call.
    /// Aborting errors (syntax, missing import, import cycle) are thrown; semantic
    /// errors are accumulated in the result.
    semantic::build_result compile_schema(const std::string& root_path,
                                          const std::vector<std::string>& search_paths = {});
}
