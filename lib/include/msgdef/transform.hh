//
// Transform pipeline over early models
//
// Passes run in a fixed order and each one may assume the postconditions of the
// passes before it:
//   1. add_file_level_namespace  - every file gets one root namespace named after its stem
//   2. dependency_sort           - orders the loaded files dependencies-first
//   3. attach_imported_models    - binds import statements to finished models
//   4. canonicalize_colons       - "A.B" -> "A::B" in every raw type name
//   5. qfn_reference             - resolves references to fully qualified names
//   6. promote_inline_enums      - lifts inline enum/options bodies to named enums
//
// Single-file passes take the model by value and hand it back, so a model has a
// single owner for the duration of a pass. Every single-file pass is idempotent.
//
// USAGE EXAMPLE:
//   model_registry registry;   // canonical path -> early model, filled by the loader
//   for (const auto& path : transform::dependency_sort(registry)) {
//       auto& slot = registry.at(path);
//       *slot = transform::run_pipeline(std::move(*slot), registry);
//   }
//

#pragma once

#include "early_model.hh"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace msgdef {
    /// Early models of one compilation keyed by canonical absolute path
    using model_registry = std::map<std::string, std::unique_ptr<early::early_model>>;
}

namespace msgdef::transform {

/// Wraps top-level items into a namespace named after the file stem, unless the
/// file already consists of exactly that namespace.
early::early_model add_file_level_namespace(early::early_model model);

/// Import graph: file -> files it imports (normalized paths)
using import_graph = std::map<std::string, std::vector<std::string>>;

/// Topological order, dependencies first. Throws circular_import_error naming
/// the files of the first cycle found.
std::vector<std::string> dependency_sort(const import_graph& graph);

/// Same, over the resolved imports of every model of a registry
std::vector<std::string> dependency_sort(const model_registry& registry);

/// Records the finished model of every import under its alias, else its path.
/// Throws pipeline_error if an imported file is not in the registry.
early::early_model attach_imported_models(early::early_model model, const model_registry& registry);

/// Rewrites legacy dotted qualifiers to "::" in type names, compound bases and parents
early::early_model canonicalize_colons(early::early_model model);

/// Replaces "." separators by "::"
std::string canonical_name(const std::string& name);

/// Assigns namespace QFNs and rewrites every resolvable reference to its QFN.
/// Unresolvable names are left as written. Throws pipeline_error unless the
/// model has exactly one file-level namespace.
early::early_model qfn_reference(early::early_model model);

/// Synthesizes "{Message}_{field}" enums/options for inline bodies and rewrites
/// the field to reference them.
early::early_model promote_inline_enums(early::early_model model);

/// Passes 1 and 3 to 6 for one file whose imports are already finished
early::early_model run_pipeline(early::early_model model, const model_registry& registry);

/// True for the spelling of a primitive type keyword
bool is_primitive_name(const std::string& name);

} // namespace msgdef::transform
