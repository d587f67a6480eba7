//
// Resolved semantic model
//
// The Model is the immutable, fully linked description of a compilation handed to
// code generators. Entities live in flat arenas owned by the model; every reference
// between entities is an entity_ref, a lookup key (kind, arena index, QFN) that
// never owns what it names.
//
// USAGE EXAMPLE:
//   auto result = compile_schema("schema.def", {"include"});
//
//   if (result.has_errors()) {
//       result.print_diagnostics(std::cerr);
//       return 1;
//   }
//
//   const auto& m = result.resolved.value();
//   for (const auto& msg : m.messages) {
//       for (const auto& f : msg.fields) {
//           if (f.type_ref && f.type_ref->kind == semantic::entity_kind::enum_) {
//               const auto& e = m.get_enum(*f.type_ref);   // bit_width, values, ...
//           }
//       }
//   }
//

#pragma once

#include "ast.hh"
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace msgdef::semantic {

// ============================================================================
// Diagnostics
// ============================================================================

/// Severity level for diagnostic messages.
enum class diagnostic_level {
    error,      ///< Prevents model completion
    warning,
    note,
    hint
};

/// Diagnostic codes.
///
/// - E001-E009: Symbol errors (unresolved, duplicate)
/// - E010-E019: Type and value errors
/// - E030-E039: Dependency errors (cycles, unresolved pipeline state)
namespace diag_codes {
    constexpr const char* E_UNRESOLVED_REFERENCE = "E001";  ///< Type or parent reference names no entity
    constexpr const char* E_DUPLICATE_DEFINITION = "E005";  ///< Entity or namespace QFN defined twice
    constexpr const char* E_DUPLICATE_ENUM_VALUE = "E006";  ///< Value name declared twice or redeclares an inherited one
    constexpr const char* E_DUPLICATE_FIELD = "E007";       ///< Field name used twice in a message
    constexpr const char* E_INVALID_DEFAULT = "E010";       ///< Default value does not fit the field type
    constexpr const char* E_KIND_MISMATCH = "E011";         ///< Reference names an entity of the wrong kind
    constexpr const char* E_CIRCULAR_INHERITANCE = "E030";  ///< Message or enum parent chain revisits itself
    constexpr const char* E_UNPROMOTED_INLINE = "E033";     ///< Inline enum/options body reached the model builder
}

/// A single diagnostic message.
///
/// Example:
///   shapes.def:12:5: error: unresolved type reference 'Colour' [E001]
///   shapes.def:3:1: note: did you mean 'shapes::Color'?
struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    ast::source_pos position;

    std::optional<ast::source_pos> related_position;  ///< e.g. previous definition
    std::optional<std::string> related_message;

    std::optional<std::string> suggestion;

    /// "file:line:column: error: message [code]" plus related note and suggestion lines
    [[nodiscard]] std::string format() const;
};

// ============================================================================
// Entities
// ============================================================================

enum class entity_kind {
    message,
    enum_,      ///< Enums and options sets
    compound    ///< Standalone compound declaration
};

/// Non-owning reference to an entity of the model
struct entity_ref {
    entity_kind kind;
    std::size_t index;   ///< Index into the arena of `kind`
    std::string qfn;

    bool operator==(const entity_ref&) const = default;
};

struct location {
    std::string file;
    std::size_t line = 0;
};

enum class type_kind {
    string_,
    int_,
    float_,
    bool_,
    byte_,
    enum_ref,
    options_ref,
    message_ref,
    compound,
    array,
    map
};

struct field_type {
    type_kind kind = type_kind::int_;
    std::optional<entity_ref> ref;          ///< enum_ref, options_ref, message_ref
    type_kind compound_base = type_kind::float_;
    std::vector<std::string> components;    ///< compound
    std::vector<field_type> args;           ///< array: element; map: key, value
};

struct enum_default {
    std::string name;
    std::int64_t value;
};

struct options_default {
    std::int64_t mask;                      ///< OR of every flag
    std::vector<std::string> names;         ///< Flags named in the expression
};

/// Default value text for field types with no reduced representation
struct raw_default {
    std::string text;
};

using default_value = std::variant<
    std::string,
    std::int64_t,
    double,
    bool,
    enum_default,
    options_default,
    raw_default
>;

struct field {
    std::string name;
    field_type type;
    std::optional<entity_ref> type_ref;     ///< Named entity of the type (array element, map value or key)
    bool optional = false;
    std::vector<std::string> modifiers;
    std::optional<default_value> default_val;
    location where;
    std::string doc;
    std::string comment;
};

struct message {
    std::string name;
    std::string qfn;
    std::size_t ns;                         ///< Arena index of the enclosing namespace
    std::optional<entity_ref> parent;
    std::vector<field> fields;
    location where;
    std::string doc;
    std::string comment;
};

struct enum_value {
    std::string name;
    std::int64_t value;
    bool inherited = false;
    location where;
    std::string doc;
    std::string comment;
};

struct enumeration {
    std::string name;
    std::string qfn;
    std::size_t ns;
    bool is_open = false;
    bool is_options = false;
    unsigned bit_width = 8;
    std::optional<entity_ref> parent;
    std::vector<enum_value> values;         ///< Inherited values first, then own values
    location where;
    std::string doc;
    std::string comment;

    [[nodiscard]] const enum_value* find_value(const std::string& value_name) const;
};

struct compound {
    std::string name;
    std::string qfn;
    std::size_t ns;
    type_kind base = type_kind::float_;
    std::vector<std::string> components;
    location where;
    std::string doc;
    std::string comment;
};

struct namespace_node {
    std::string name;
    std::string qfn;
    std::optional<std::size_t> parent;
    std::vector<std::size_t> children;
    std::vector<std::size_t> messages;      ///< Arena indices, declaration order
    std::vector<std::size_t> enums;
    std::vector<std::size_t> compounds;
    location where;
    std::string doc;
};

/// Finished model of a compilation; root files of every compiled file in dependency order
struct model {
    std::vector<std::string> files;
    std::vector<namespace_node> namespaces;
    std::vector<std::size_t> roots;         ///< File-level namespaces
    std::vector<message> messages;
    std::vector<enumeration> enums;
    std::vector<compound> compounds;
    std::map<std::string, entity_ref> symbols;

    [[nodiscard]] const entity_ref* find(const std::string& qfn) const;
    [[nodiscard]] const message* find_message(const std::string& qfn) const;
    [[nodiscard]] const enumeration* find_enum(const std::string& qfn) const;
    [[nodiscard]] const namespace_node* find_namespace(const std::string& qfn) const;

    [[nodiscard]] const message& get_message(const entity_ref& ref) const { return messages.at(ref.index); }
    [[nodiscard]] const enumeration& get_enum(const entity_ref& ref) const { return enums.at(ref.index); }
    [[nodiscard]] const compound& get_compound(const entity_ref& ref) const { return compounds.at(ref.index); }
};

// ============================================================================
// Build result
// ============================================================================

struct build_result {
    /// Present only if no error was reported
    std::optional<model> resolved;

    std::vector<diagnostic> diagnostics;

    [[nodiscard]] bool has_errors() const;
    [[nodiscard]] std::size_t error_count() const;
    [[nodiscard]] std::vector<diagnostic> get_errors() const;

    /// Every diagnostic followed by an "N errors generated." summary
    void print_diagnostics(std::ostream& os) const;
};

/// Minimum encoding width (8, 16, 32 or 64 bits) of an enum over its resolved values
unsigned enum_bit_width(const std::vector<std::int64_t>& values, bool is_open);

/// Spelling of a type kind in messages ("int", "enum", "map", ...)
const char* type_kind_name(type_kind kind);

} // namespace msgdef::semantic
