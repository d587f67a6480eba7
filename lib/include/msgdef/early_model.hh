//
// Early model: raw, provenance-tagged entities built from one parsed file.
//
// Nothing is resolved here. Type references are kept as the strings written in
// the source and inline enum/options bodies stay attached to their fields. The
// transform pipeline (transform.hh) rewrites these models in place until every
// reference is a fully qualified name; the model builder (model.hh) then binds
// them to entities.
//
// Namespaces live in an arena (early_model::namespaces) and refer to each other
// by index, so walks are deterministic and nothing holds a back pointer.
//

#pragma once

#include "ast.hh"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace msgdef::early {

/// Where an entity was declared.
struct provenance {
    std::string file;
    std::size_t line = 0;
    std::string ns;  ///< Enclosing namespace path as written ("A::B"), empty at file scope
};

/// Comments attached to a declaration.
struct comments {
    std::string doc;      ///< "///" comments only; propagated to generated code
    std::string comment;  ///< Every attached comment (doc, local, block) in source order
};

struct early_enum_value {
    std::string name;
    std::int64_t value = 0;    ///< Explicit, or numbered from the previous value
    bool is_explicit = false;
    provenance where;
    comments notes;
};

// ----------------------------------------------------------------------------
// Raw type descriptors
// ----------------------------------------------------------------------------

struct raw_type;

struct primitive_type {
    ast::primitive_kind kind;
};

/// Reference to a named entity; after QfnReference the name is a QFN when resolvable
struct ref_type {
    std::string type_name;
    bool resolved = false;  ///< Set once QfnReference found the entity in scope
};

/// Inline "enum { ... }" / "options { ... }" body, removed by PromoteInlineEnums
struct inline_enum_type {
    bool is_options = false;
    std::vector<early_enum_value> values;
};

struct compound_type {
    std::string base_type_raw;
    std::vector<std::string> components;
    bool base_resolved = false;  ///< Non-primitive base found in scope by QfnReference
};

struct array_type {
    std::unique_ptr<raw_type> element;
};

struct map_type {
    std::unique_ptr<raw_type> key;
    std::unique_ptr<raw_type> value;
};

using raw_type_node = std::variant<
    primitive_type,
    ref_type,
    inline_enum_type,
    compound_type,
    array_type,
    map_type
>;

struct raw_type {
    raw_type_node node;
};

// ----------------------------------------------------------------------------
// Entities
// ----------------------------------------------------------------------------

struct early_field {
    std::string name;
    raw_type type;
    std::vector<std::string> modifiers;             ///< "optional", "repeated", ... as written
    std::optional<std::string> default_value_raw;   ///< Default expression text, verbatim
    provenance where;
    comments notes;
};

struct early_message {
    std::string name;
    std::vector<early_field> fields;
    std::optional<std::string> parent_raw;
    bool parent_resolved = false;
    provenance where;
    comments notes;
};

/// Enum, or options set when is_options is set
struct early_enum {
    std::string name;
    std::vector<early_enum_value> values;
    std::optional<std::string> parent_raw;
    bool parent_resolved = false;
    bool is_open = false;
    bool is_options = false;
    provenance where;
    comments notes;
};

/// Standalone compound declaration: "float Position { x, y, z }"
struct early_compound {
    std::string name;
    std::string base_type_raw;
    std::vector<std::string> components;
    provenance where;
    comments notes;
};

struct early_namespace {
    std::string name;
    std::string qfn;                     ///< Assigned by QfnReference
    std::optional<std::size_t> parent;   ///< Arena index of the enclosing namespace
    std::vector<std::size_t> children;   ///< Arena indices of nested namespaces
    std::vector<early_message> messages;
    std::vector<early_enum> enums;
    std::vector<early_enum> options;
    std::vector<early_compound> compounds;
    provenance where;
    comments notes;
};

struct early_import {
    std::string path;                    ///< As written in the import statement
    std::optional<std::string> alias;
    std::string resolved_path;           ///< Canonical absolute path, filled by the module loader
    std::size_t line = 0;
};

struct early_model {
    std::string file;                    ///< Source file
    std::string file_namespace;          ///< Name of the file-level namespace (file stem)

    std::vector<early_namespace> namespaces;  ///< Arena of every namespace of the file
    std::vector<std::size_t> roots;           ///< Top-level namespaces

    // Top-level items outside any namespace (emptied by AddFileLevelNamespace)
    std::vector<early_message> messages;
    std::vector<early_enum> enums;
    std::vector<early_enum> options;
    std::vector<early_compound> compounds;

    std::vector<early_import> imports;

    /// Imported models keyed by alias, or by import path when no alias is given
    std::map<std::string, const early_model*> imported;

    /// Index of the single file-level namespace, if the model has exactly one root and no loose items
    [[nodiscard]] std::optional<std::size_t> file_level_namespace() const;

    /// Aliases and paths of imports that were given no alias
    [[nodiscard]] bool is_aliased_import(const std::string& key) const;
};

/// File stem used as the file-level namespace name ("dir/foo.def" -> "foo")
std::string file_stem(const std::string& path);

/// Walks the parse tree once into raw entities.
/// Enum values are numbered (explicit, else previous + 1, else 0);
/// option values are explicit, else 1 << position.
early_model build_early_model(const ast::module& tree,
                              const std::string& file_namespace,
                              const std::string& source_file);

} // namespace msgdef::early
