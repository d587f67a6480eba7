/*
 * Parser bridge - C interface between the Lemon grammar / re2c scanner and the C++ parse tree
 */

#ifndef MSGDEF_AST_BUILDER_H
#define MSGDEF_AST_BUILDER_H

#include <stddef.h>
#include "parser/parser_context.h"
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Primitive type codes - match ast::primitive_kind enum values */
enum parser_primitive_kind {
    PARSER_PRIM_STRING = 0,
    PARSER_PRIM_INT = 1,
    PARSER_PRIM_FLOAT = 2,
    PARSER_PRIM_BOOL = 3,
    PARSER_PRIM_BYTE = 4
};

/* Comment codes - match ast::comment_kind enum values */
enum parser_comment_kind {
    PARSER_COMMENT_DOC = 0,
    PARSER_COMMENT_LOCAL = 1,
    PARSER_COMMENT_BLOCK = 2
};

/* Forward declarations for parse tree nodes (opaque pointers) */
typedef struct ast_type ast_type_t;
typedef struct ast_value_item ast_value_item_t;
typedef struct ast_value_list ast_value_list_t;
typedef struct ast_name_list ast_name_list_t;
typedef struct ast_field_def ast_field_def_t;
typedef struct ast_field_list ast_field_list_t;
typedef struct ast_decl ast_decl_t;
typedef struct ast_decl_list ast_decl_list_t;

/* Type builders */
ast_type_t* parser_build_primitive_type(parser_context_t* ctx, int kind, token_value_t* kw_tok);
ast_type_t* parser_build_qualified_name_single(parser_context_t* ctx, token_value_t* ident_tok);
ast_type_t* parser_build_qualified_name_append(parser_context_t* ctx, ast_type_t* qname, token_value_t* sep_tok,
                                               token_value_t* ident_tok);
ast_type_t* parser_build_array_type(parser_context_t* ctx, ast_type_t* element, token_value_t* bracket_tok);
ast_type_t* parser_build_map_type(parser_context_t* ctx, token_value_t* map_tok, ast_type_t* key, ast_type_t* value);
ast_type_t* parser_build_inline_enum_type(parser_context_t* ctx, token_value_t* kw_tok, int is_options,
                                          ast_value_list_t* values);
ast_type_t* parser_build_compound_type(parser_context_t* ctx, ast_type_t* base, ast_name_list_t* components);

/* Enum / options value builders */
ast_value_item_t* parser_build_value_item(parser_context_t* ctx, token_value_t* name_tok, token_value_t* value_tok);
ast_value_list_t* parser_build_value_list_empty(parser_context_t* ctx);
ast_value_list_t* parser_build_value_list_append(parser_context_t* ctx, ast_value_list_t* list,
                                                 ast_value_item_t* item);

/* Identifier lists (compound components, field modifiers) */
ast_name_list_t* parser_build_name_list_single(parser_context_t* ctx, token_value_t* ident_tok);
ast_name_list_t* parser_build_name_list_append(parser_context_t* ctx, ast_name_list_t* list, token_value_t* ident_tok);

/* Message builders */
ast_field_def_t* parser_build_field(parser_context_t* ctx, ast_name_list_t* modifiers, token_value_t* name_tok,
                                    ast_type_t* field_type, const token_value_t* default_span);
ast_field_list_t* parser_build_field_list_empty(parser_context_t* ctx);
ast_field_list_t* parser_build_field_list_append(parser_context_t* ctx, ast_field_list_t* list,
                                                 ast_field_def_t* field);

/* Declaration builders */
ast_decl_t* parser_build_message(parser_context_t* ctx, token_value_t* name_tok, ast_type_t* parent,
                                 ast_field_list_t* fields);
ast_decl_t* parser_build_enum(parser_context_t* ctx, token_value_t* name_tok, int is_open, ast_type_t* parent,
                              ast_value_list_t* values);
ast_decl_t* parser_build_options(parser_context_t* ctx, token_value_t* name_tok, ast_value_list_t* values);
ast_decl_t* parser_build_compound_def(parser_context_t* ctx, ast_type_t* base, token_value_t* name_tok,
                                      ast_name_list_t* components);
ast_decl_t* parser_build_namespace(parser_context_t* ctx, token_value_t* name_tok, ast_decl_list_t* items);
ast_decl_list_t* parser_build_decl_list_empty(parser_context_t* ctx);
ast_decl_list_t* parser_build_decl_list_append(parser_context_t* ctx, ast_decl_list_t* list, ast_decl_t* decl);

/* Module level */
void parser_add_top_level_decl(parser_context_t* ctx, ast_decl_t* decl);
void parser_build_import(parser_context_t* ctx, token_value_t* path_tok, token_value_t* alias_tok);

/* Called by the scanner for every comment it skips */
void parser_record_comment(parser_context_t* ctx, int kind, const token_value_t* tok, int end_line, int trailing);

/* C-callable destructors for list holders - used by Lemon %destructor directives */
void parser_destroy_value_list(ast_value_list_t* list);
void parser_destroy_name_list(ast_name_list_t* list);
void parser_destroy_field_list(ast_field_list_t* list);
void parser_destroy_decl_list(ast_decl_list_t* list);

#ifdef __cplusplus
}
#endif

#endif /* MSGDEF_AST_BUILDER_H */
