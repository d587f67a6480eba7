//
// Created by igor on 22/11/2025.
//

#pragma once
#include <string>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>
#include <memory>
#include <optional>

namespace msgdef::ast {
    struct source_pos {
        source_pos(std::string file_, std::size_t line_, std::size_t column_)
            : file(std::move(file_)),
              line(line_),
              column(column_) {
        }

        std::string file;
        std::size_t line;
        std::size_t column;
    };

    // -----------------------------
    // Comments
    // -----------------------------
    enum class comment_kind {
        doc,    // ///
        local,  // //
        block   // /* */
    };

    struct comment {
        source_pos pos;
        std::size_t end_line;
        comment_kind kind;
        std::string text;   // Without the comment markers, trimmed
        bool trailing;      // Code precedes the comment on its first line
    };

    // -----------------------------
    // Type node definitions
    // -----------------------------
    enum class primitive_kind {
        string_,
        int_,
        float_,
        bool_,
        byte_
    };

    struct primitive_type {
        source_pos pos;
        primitive_kind kind;
    };

    // Qualified name exactly as written, separators included ("A::B", "A.B")
    struct qualified_name {
        source_pos pos;
        std::string text;
    };

    struct value_item {
        source_pos pos;
        std::string name;
        std::optional<std::int64_t> value;
    };

    // Inline "enum { ... }" or "options { ... }" in a field's type position
    struct inline_enum_type {
        source_pos pos;
        bool is_options;
        std::vector<value_item> values;
    };

    struct compound_type {
        source_pos pos;
        std::string base;                     // Primitive keyword or type name
        std::vector<std::string> components;
    };

    struct type;

    struct array_type {
        source_pos pos;
        std::unique_ptr<type> element;
    };

    struct map_type {
        source_pos pos;
        std::unique_ptr<type> key;
        std::unique_ptr<type> value;
    };

    using type_node = std::variant<
        primitive_type,
        qualified_name,
        inline_enum_type,
        compound_type,
        array_type,
        map_type
    >;

    struct type {
        type_node node;
    };

    // -----------------------------
    // Declarations
    // -----------------------------
    struct field_def {
        source_pos pos;
        std::vector<std::string> modifiers;
        std::string name;
        type field_type;
        std::optional<std::string> default_value;  // Raw text of the default expression
    };

    struct message_def {
        source_pos pos;
        std::string name;
        std::optional<qualified_name> parent;
        std::vector<field_def> fields;
    };

    struct enum_def {
        source_pos pos;
        std::string name;
        bool is_open;
        std::optional<qualified_name> parent;
        std::vector<value_item> values;
    };

    struct options_def {
        source_pos pos;
        std::string name;
        std::vector<value_item> values;
    };

    // Standalone compound: "float Position { x, y, z }"
    struct compound_def {
        source_pos pos;
        std::string name;
        std::string base;
        std::vector<std::string> components;
    };

    struct namespace_def {
        source_pos pos;
        std::string name;
        std::vector<namespace_def> namespaces;
        std::vector<message_def> messages;
        std::vector<enum_def> enums;
        std::vector<options_def> options;
        std::vector<compound_def> compounds;
    };

    struct import_decl {
        source_pos pos;
        std::string path;
        std::optional<std::string> alias;
    };

    struct module {
        std::vector<import_decl> imports;
        std::vector<namespace_def> namespaces;
        std::vector<message_def> messages;
        std::vector<enum_def> enums;
        std::vector<options_def> options;
        std::vector<compound_def> compounds;
        std::vector<comment> comments;  // Every comment of the file, in source order
    };
}
