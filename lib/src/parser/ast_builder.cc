/*
 * C++ Bridge for the message definition parser
 * Provides extern "C" interface for C parser/lexer to call C++ parse tree building code
 */

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>
#include <deque>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#define MSGDEF_PARSER_CONTEXT_VISIBLE

#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/parser_context.h"

using namespace msgdef::ast;

namespace {
    source_pos make_pos(parser_context_t* ctx, const token_value_t* tok) {
        return source_pos{
            ctx->m_scanner->filename,
            static_cast <size_t>(tok ? tok->line : ctx->m_scanner->line),
            static_cast <size_t>(tok ? tok->column : ctx->m_scanner->column)
        };
    }

    ast_type_t* store_type(parser_context_t* ctx, type_node node) {
        ctx->ast_builder->temp_types.push_back(type{std::move(node)});
        return reinterpret_cast <ast_type_t*>(&ctx->ast_builder->temp_types.back());
    }

    ast_decl_t* store_decl(parser_context_t* ctx, ast_declaration decl) {
        ctx->ast_builder->temp_decls.push_back(std::move(decl));
        return reinterpret_cast <ast_decl_t*>(&ctx->ast_builder->temp_decls.back());
    }

    /* Module and namespace_def share the same item vectors */
    template<typename Scope>
    void add_declaration(Scope& scope, ast_declaration&& decl) {
        std::visit([&scope](auto&& d) {
            using T = std::decay_t <decltype(d)>;
            if constexpr (std::is_same_v <T, namespace_def>) {
                scope.namespaces.push_back(std::move(d));
            } else if constexpr (std::is_same_v <T, message_def>) {
                scope.messages.push_back(std::move(d));
            } else if constexpr (std::is_same_v <T, enum_def>) {
                scope.enums.push_back(std::move(d));
            } else if constexpr (std::is_same_v <T, options_def>) {
                scope.options.push_back(std::move(d));
            } else {
                scope.compounds.push_back(std::move(d));
            }
        }, std::move(decl));
    }
}

/* Helper to extract string from token (creates a std::string) */
static std::string extract_string(const token_value_t* tok) {
    if (!tok || !tok->start || !tok->end) {
        return {};
    }
    return std::string(tok->start, static_cast<size_t>(tok->end - tok->start));
}

/* Helper to strip quotes from a string literal token and resolve backslash escapes */
static std::string unquote_string(const token_value_t* tok) {
    std::string raw = extract_string(tok);
    if (raw.size() < 2) {
        return raw;
    }

    std::string result;
    result.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        char ch = raw[i];
        if (ch == '\\' && i + 2 < raw.size()) {
            char next = raw[++i];
            switch (next) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                default: result += next; break;
            }
        } else {
            result += ch;
        }
    }
    return result;
}

/* Helper to trim whitespace on both ends */
static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/* Helper to process comment text: strip markers, and for block comments the leading asterisks of each line */
static std::string process_comment(const token_value_t* tok, int kind) {
    const char* start = tok->start;
    const char* end = tok->end;

    if (kind == PARSER_COMMENT_DOC) {
        return trim(std::string(start + 3, end));
    }
    if (kind == PARSER_COMMENT_LOCAL) {
        return trim(std::string(start + 2, end));
    }

    // Skip /* and */
    if (end - start < 4) return {};
    start += 2;
    end -= 2;

    std::string result;
    bool at_line_start = false;

    for (const char* p = start; p < end; ++p) {
        char ch = *p;

        if (ch == '\n') {
            result += ch;
            at_line_start = true;
        } else if (at_line_start) {
            // Skip leading whitespace and * at start of line
            if (ch == ' ' || ch == '\t') {
                continue;
            } else if (ch == '*') {
                if (p + 1 < end && (*(p + 1) == ' ' || *(p + 1) == '\t')) {
                    ++p;
                }
                at_line_start = false;
            } else {
                result += ch;
                at_line_start = false;
            }
        } else {
            result += ch;
        }
    }

    return trim(result);
}

/* Helper to parse a signed integer literal (decimal or 0x hexadecimal) using std::from_chars
 * Returns std::nullopt on overflow or parse error */
static std::optional <std::int64_t> parse_integer_safe(
    const token_value_t* tok,
    parser_context_t* ctx) {
    if (!tok || !tok->start || !tok->end || tok->start == tok->end) {
        parser_set_error(ctx, PARSER_ERROR_INVALID_LITERAL,
                         "Invalid token for integer parsing");
        return std::nullopt;
    }

    const char* start = tok->start;
    const char* end = tok->end;

    bool negative = false;
    if (*start == '-') {
        negative = true;
        ++start;
    }

    int base = 10;
    if (end - start > 2 && start[0] == '0' && (start[1] == 'x' || start[1] == 'X')) {
        base = 16;
        start += 2;
    }

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(start, end, magnitude, base);

    if (ec == std::errc::invalid_argument || ptr != end) {
        parser_set_error_at(ctx, tok, PARSER_ERROR_INVALID_LITERAL,
                            "Invalid integer literal at line %d column %d", tok->line, tok->column);
        return std::nullopt;
    }

    constexpr std::uint64_t max_positive = static_cast<std::uint64_t>(INT64_MAX);
    if (ec == std::errc::result_out_of_range ||
        (!negative && magnitude > max_positive) ||
        (negative && magnitude > max_positive + 1)) {
        parser_set_error_at(ctx, tok, PARSER_ERROR_INVALID_LITERAL,
                            "Integer literal overflow at line %d column %d: value exceeds 64 bits",
                            tok->line, tok->column);
        return std::nullopt;
    }

    if (negative) {
        return magnitude == max_positive + 1 ? INT64_MIN : -static_cast<std::int64_t>(magnitude);
    }
    return static_cast<std::int64_t>(magnitude);
}

/* Helper structs to hold lists during parsing */
struct value_list_holder {
    std::vector <ast_value_item_t*> items;
};

struct name_list_holder {
    std::vector <std::string> names;
};

struct field_list_holder {
    std::vector <ast_field_def_t*> fields;
};

struct decl_list_holder {
    std::vector <ast_decl_t*> decls;
};

namespace msgdef::parser {
    struct value_list_deleter {
        void operator()(value_list_holder* p) const { delete p; }
    };

    struct name_list_deleter {
        void operator()(name_list_holder* p) const { delete p; }
    };

    struct field_list_deleter {
        void operator()(field_list_holder* p) const { delete p; }
    };

    struct decl_list_deleter {
        void operator()(decl_list_holder* p) const { delete p; }
    };

    using value_list_guard = std::unique_ptr <value_list_holder, value_list_deleter>;
    using name_list_guard = std::unique_ptr <name_list_holder, name_list_deleter>;
    using field_list_guard = std::unique_ptr <field_list_holder, field_list_deleter>;
    using decl_list_guard = std::unique_ptr <decl_list_holder, decl_list_deleter>;
}

/* Moves the values of a list out of temporary storage */
static std::vector <value_item> take_values(const value_list_holder& list) {
    std::vector <value_item> values;
    values.reserve(list.items.size());
    for (auto* item_ptr : list.items) {
        values.push_back(std::move(*reinterpret_cast <value_item*>(item_ptr)));
    }
    return values;
}

/* Returns the text of a qualified name node, or nullopt when the node is not one */
static std::optional <qualified_name> take_qualified_name(ast_type_t* node) {
    if (!node) {
        return std::nullopt;
    }
    auto* type_ptr = reinterpret_cast <type*>(node);
    if (auto* qname = std::get_if <qualified_name>(&type_ptr->node)) {
        return std::move(*qname);
    }
    return std::nullopt;
}

/* Spelling of a compound base: primitive keyword or qualified name text */
static std::string base_type_spelling(const type& base) {
    if (auto* prim = std::get_if <primitive_type>(&base.node)) {
        switch (prim->kind) {
            case primitive_kind::string_: return "string";
            case primitive_kind::int_: return "int";
            case primitive_kind::float_: return "float";
            case primitive_kind::bool_: return "bool";
            case primitive_kind::byte_: return "byte";
        }
    }
    if (auto* qname = std::get_if <qualified_name>(&base.node)) {
        return qname->text;
    }
    return {};
}

/* Type builders */
ast_type_t* parser_build_primitive_type(parser_context_t* ctx, int kind, token_value_t* kw_tok) {
    if (!ctx || !ctx->ast_builder || !kw_tok) {
        return nullptr;
    }

    try {
        return store_type(ctx, primitive_type{make_pos(ctx, kw_tok), static_cast <primitive_kind>(kind)});
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build primitive type: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_qualified_name_single(parser_context_t* ctx, token_value_t* ident_tok) {
    if (!ctx || !ctx->ast_builder || !ident_tok) {
        return nullptr;
    }

    try {
        return store_type(ctx, qualified_name{make_pos(ctx, ident_tok), extract_string(ident_tok)});
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build qualified name: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_qualified_name_append(parser_context_t* ctx, ast_type_t* qname, token_value_t* sep_tok,
                                               token_value_t* ident_tok) {
    if (!ctx || !qname || !sep_tok || !ident_tok) {
        return nullptr;
    }

    try {
        auto* qname_ptr = reinterpret_cast <type*>(qname);

        /* The separator is kept as written; legacy dots are canonicalized by a later pass */
        if (auto* qualified = std::get_if <qualified_name>(&qname_ptr->node)) {
            qualified->text += extract_string(sep_tok);
            qualified->text += extract_string(ident_tok);
        }

        return qname;
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to append to qualified name: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_array_type(parser_context_t* ctx, ast_type_t* element, token_value_t* bracket_tok) {
    if (!ctx || !ctx->ast_builder || !element) {
        return nullptr;
    }

    try {
        auto* element_ptr = reinterpret_cast <type*>(element);
        return store_type(ctx, array_type{
            make_pos(ctx, bracket_tok),
            std::make_unique <type>(std::move(*element_ptr))
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build array type: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_map_type(parser_context_t* ctx, token_value_t* map_tok, ast_type_t* key, ast_type_t* value) {
    if (!ctx || !ctx->ast_builder || !key || !value) {
        return nullptr;
    }

    try {
        auto* key_ptr = reinterpret_cast <type*>(key);
        auto* value_ptr = reinterpret_cast <type*>(value);
        return store_type(ctx, map_type{
            make_pos(ctx, map_tok),
            std::make_unique <type>(std::move(*key_ptr)),
            std::make_unique <type>(std::move(*value_ptr))
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build map type: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_inline_enum_type(parser_context_t* ctx, token_value_t* kw_tok, int is_options,
                                          ast_value_list_t* values) {
    // RAII guard ensures automatic cleanup on all paths
    msgdef::parser::value_list_guard value_guard(reinterpret_cast <value_list_holder*>(values));

    if (!ctx || !ctx->ast_builder || !value_guard) {
        return nullptr;
    }

    try {
        return store_type(ctx, inline_enum_type{
            make_pos(ctx, kw_tok),
            is_options != 0,
            take_values(*value_guard)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build inline enum: %s", e.what());
        return nullptr;
    }
}

ast_type_t* parser_build_compound_type(parser_context_t* ctx, ast_type_t* base, ast_name_list_t* components) {
    msgdef::parser::name_list_guard name_guard(reinterpret_cast <name_list_holder*>(components));

    if (!ctx || !ctx->ast_builder || !base || !name_guard) {
        return nullptr;
    }

    try {
        auto* base_ptr = reinterpret_cast <type*>(base);
        auto pos = std::visit([](const auto& n) { return n.pos; }, base_ptr->node);
        return store_type(ctx, compound_type{
            std::move(pos),
            base_type_spelling(*base_ptr),
            std::move(name_guard->names)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build compound type: %s", e.what());
        return nullptr;
    }
}

/* Enum / options value builders */
ast_value_item_t* parser_build_value_item(parser_context_t* ctx, token_value_t* name_tok, token_value_t* value_tok) {
    if (!ctx || !ctx->ast_builder || !name_tok) {
        return nullptr;
    }

    try {
        std::optional <std::int64_t> value;
        if (value_tok) {
            value = parse_integer_safe(value_tok, ctx);
            if (!value) {
                return nullptr;
            }
        }

        ctx->ast_builder->temp_value_items.push_back(value_item{
            make_pos(ctx, name_tok),
            extract_string(name_tok),
            value
        });
        return reinterpret_cast <ast_value_item_t*>(&ctx->ast_builder->temp_value_items.back());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build enum value: %s", e.what());
        return nullptr;
    }
}

ast_value_list_t* parser_build_value_list_empty(parser_context_t* ctx) {
    if (!ctx) {
        return nullptr;
    }

    try {
        return reinterpret_cast <ast_value_list_t*>(new value_list_holder());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to create value list: %s", e.what());
        return nullptr;
    }
}

ast_value_list_t* parser_build_value_list_append(parser_context_t* ctx, ast_value_list_t* list,
                                                 ast_value_item_t* item) {
    if (!ctx || !list || !item) {
        /* Clean up list on error - use guard for exception safety */
        msgdef::parser::value_list_guard list_guard(reinterpret_cast <value_list_holder*>(list));
        return nullptr;
    }

    try {
        reinterpret_cast <value_list_holder*>(list)->items.push_back(item);
        return list;
    } catch (const std::exception& e) {
        msgdef::parser::value_list_guard list_guard(reinterpret_cast <value_list_holder*>(list));
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to append enum value: %s", e.what());
        return nullptr;
    }
}

/* Identifier lists */
ast_name_list_t* parser_build_name_list_single(parser_context_t* ctx, token_value_t* ident_tok) {
    if (!ctx || !ident_tok) {
        return nullptr;
    }

    try {
        auto* list = new name_list_holder();
        /* RAII guard for exception safety - ensures cleanup if push_back throws */
        msgdef::parser::name_list_guard guard(list);
        list->names.push_back(extract_string(ident_tok));
        /* Release ownership to caller on success */
        return reinterpret_cast <ast_name_list_t*>(guard.release());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to create name list: %s", e.what());
        return nullptr;
    }
}

ast_name_list_t* parser_build_name_list_append(parser_context_t* ctx, ast_name_list_t* list, token_value_t* ident_tok) {
    if (!ctx || !list || !ident_tok) {
        msgdef::parser::name_list_guard list_guard(reinterpret_cast <name_list_holder*>(list));
        return nullptr;
    }

    try {
        reinterpret_cast <name_list_holder*>(list)->names.push_back(extract_string(ident_tok));
        return list;
    } catch (const std::exception& e) {
        msgdef::parser::name_list_guard list_guard(reinterpret_cast <name_list_holder*>(list));
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to append name: %s", e.what());
        return nullptr;
    }
}

/* Message builders */
ast_field_def_t* parser_build_field(parser_context_t* ctx, ast_name_list_t* modifiers, token_value_t* name_tok,
                                    ast_type_t* field_type, const token_value_t* default_span) {
    msgdef::parser::name_list_guard modifier_guard(reinterpret_cast <name_list_holder*>(modifiers));

    if (!ctx || !ctx->ast_builder || !name_tok || !field_type) {
        return nullptr;
    }

    try {
        auto* type_ptr = reinterpret_cast <type*>(field_type);

        std::optional <std::string> default_value;
        if (default_span && default_span->start) {
            default_value = extract_string(default_span);
        }

        std::vector <std::string> modifier_names;
        if (modifier_guard) {
            modifier_names = std::move(modifier_guard->names);
        }

        /* The field position is its name; modifiers share the line in practice */
        ctx->ast_builder->temp_fields.push_back(field_def{
            make_pos(ctx, name_tok),
            std::move(modifier_names),
            extract_string(name_tok),
            std::move(*type_ptr),
            std::move(default_value)
        });
        return reinterpret_cast <ast_field_def_t*>(&ctx->ast_builder->temp_fields.back());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build field: %s", e.what());
        return nullptr;
    }
}

ast_field_list_t* parser_build_field_list_empty(parser_context_t* ctx) {
    if (!ctx) {
        return nullptr;
    }

    try {
        return reinterpret_cast <ast_field_list_t*>(new field_list_holder());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to create field list: %s", e.what());
        return nullptr;
    }
}

ast_field_list_t* parser_build_field_list_append(parser_context_t* ctx, ast_field_list_t* list,
                                                 ast_field_def_t* field) {
    if (!ctx || !list || !field) {
        msgdef::parser::field_list_guard list_guard(reinterpret_cast <field_list_holder*>(list));
        return nullptr;
    }

    try {
        reinterpret_cast <field_list_holder*>(list)->fields.push_back(field);
        return list;
    } catch (const std::exception& e) {
        msgdef::parser::field_list_guard list_guard(reinterpret_cast <field_list_holder*>(list));
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to append field: %s", e.what());
        return nullptr;
    }
}

/* Declaration builders */
ast_decl_t* parser_build_message(parser_context_t* ctx, token_value_t* name_tok, ast_type_t* parent,
                                 ast_field_list_t* fields) {
    msgdef::parser::field_list_guard field_guard(reinterpret_cast <field_list_holder*>(fields));

    if (!ctx || !ctx->ast_builder || !name_tok || !field_guard) {
        return nullptr;
    }

    try {
        std::vector <field_def> message_fields;
        message_fields.reserve(field_guard->fields.size());
        for (auto* field_ptr : field_guard->fields) {
            message_fields.push_back(std::move(*reinterpret_cast <field_def*>(field_ptr)));
        }

        return store_decl(ctx, message_def{
            make_pos(ctx, name_tok),
            extract_string(name_tok),
            take_qualified_name(parent),
            std::move(message_fields)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build message: %s", e.what());
        return nullptr;
    }
}

ast_decl_t* parser_build_enum(parser_context_t* ctx, token_value_t* name_tok, int is_open, ast_type_t* parent,
                              ast_value_list_t* values) {
    msgdef::parser::value_list_guard value_guard(reinterpret_cast <value_list_holder*>(values));

    if (!ctx || !ctx->ast_builder || !name_tok || !value_guard) {
        return nullptr;
    }

    try {
        return store_decl(ctx, enum_def{
            make_pos(ctx, name_tok),
            extract_string(name_tok),
            is_open != 0,
            take_qualified_name(parent),
            take_values(*value_guard)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build enum: %s", e.what());
        return nullptr;
    }
}

ast_decl_t* parser_build_options(parser_context_t* ctx, token_value_t* name_tok, ast_value_list_t* values) {
    msgdef::parser::value_list_guard value_guard(reinterpret_cast <value_list_holder*>(values));

    if (!ctx || !ctx->ast_builder || !name_tok || !value_guard) {
        return nullptr;
    }

    try {
        return store_decl(ctx, options_def{
            make_pos(ctx, name_tok),
            extract_string(name_tok),
            take_values(*value_guard)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build options: %s", e.what());
        return nullptr;
    }
}

ast_decl_t* parser_build_compound_def(parser_context_t* ctx, ast_type_t* base, token_value_t* name_tok,
                                      ast_name_list_t* components) {
    msgdef::parser::name_list_guard name_guard(reinterpret_cast <name_list_holder*>(components));

    if (!ctx || !ctx->ast_builder || !base || !name_tok || !name_guard) {
        return nullptr;
    }

    try {
        auto* base_ptr = reinterpret_cast <type*>(base);
        return store_decl(ctx, compound_def{
            make_pos(ctx, name_tok),
            extract_string(name_tok),
            base_type_spelling(*base_ptr),
            std::move(name_guard->names)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build compound: %s", e.what());
        return nullptr;
    }
}

ast_decl_t* parser_build_namespace(parser_context_t* ctx, token_value_t* name_tok, ast_decl_list_t* items) {
    msgdef::parser::decl_list_guard decl_guard(reinterpret_cast <decl_list_holder*>(items));

    if (!ctx || !ctx->ast_builder || !name_tok || !decl_guard) {
        return nullptr;
    }

    try {
        namespace_def ns{make_pos(ctx, name_tok), extract_string(name_tok), {}, {}, {}, {}, {}};
        for (auto* decl_ptr : decl_guard->decls) {
            add_declaration(ns, std::move(*reinterpret_cast <ast_declaration*>(decl_ptr)));
        }
        return store_decl(ctx, std::move(ns));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build namespace: %s", e.what());
        return nullptr;
    }
}

ast_decl_list_t* parser_build_decl_list_empty(parser_context_t* ctx) {
    if (!ctx) {
        return nullptr;
    }

    try {
        return reinterpret_cast <ast_decl_list_t*>(new decl_list_holder());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to create declaration list: %s", e.what());
        return nullptr;
    }
}

ast_decl_list_t* parser_build_decl_list_append(parser_context_t* ctx, ast_decl_list_t* list, ast_decl_t* decl) {
    if (!ctx || !list || !decl) {
        msgdef::parser::decl_list_guard list_guard(reinterpret_cast <decl_list_holder*>(list));
        return nullptr;
    }

    try {
        reinterpret_cast <decl_list_holder*>(list)->decls.push_back(decl);
        return list;
    } catch (const std::exception& e) {
        msgdef::parser::decl_list_guard list_guard(reinterpret_cast <decl_list_holder*>(list));
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Failed to append declaration: %s", e.what());
        return nullptr;
    }
}

/* Module level */
void parser_add_top_level_decl(parser_context_t* ctx, ast_decl_t* decl) {
    if (!ctx || !ctx->ast_builder || !decl) {
        return;
    }

    try {
        add_declaration(*ctx->ast_builder->module, std::move(*reinterpret_cast <ast_declaration*>(decl)));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to add declaration: %s", e.what());
    }
}

void parser_build_import(parser_context_t* ctx, token_value_t* path_tok, token_value_t* alias_tok) {
    if (!ctx || !ctx->ast_builder || !path_tok) {
        return;
    }

    try {
        std::optional <std::string> alias;
        if (alias_tok) {
            alias = extract_string(alias_tok);
        }

        ctx->ast_builder->module->imports.push_back(import_decl{
            make_pos(ctx, path_tok),
            unquote_string(path_tok),
            std::move(alias)
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build import: %s", e.what());
    }
}

void parser_record_comment(parser_context_t* ctx, int kind, const token_value_t* tok, int end_line, int trailing) {
    if (!ctx || !ctx->ast_builder || !tok) {
        return;
    }

    try {
        ctx->ast_builder->module->comments.push_back(comment{
            make_pos(ctx, tok),
            static_cast <size_t>(end_line),
            static_cast <comment_kind>(kind),
            process_comment(tok, kind),
            trailing != 0
        });
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to record comment: %s", e.what());
    }
}

/* C-callable destructors for list holders - used by Lemon %destructor directives */
extern "C" {
void parser_destroy_value_list(ast_value_list_t* list) {
    delete reinterpret_cast <value_list_holder*>(list);
}

void parser_destroy_name_list(ast_name_list_t* list) {
    delete reinterpret_cast <name_list_holder*>(list);
}

void parser_destroy_field_list(ast_field_list_t* list) {
    delete reinterpret_cast <field_list_holder*>(list);
}

void parser_destroy_decl_list(ast_decl_list_t* list) {
    delete reinterpret_cast <decl_list_holder*>(list);
}
}
