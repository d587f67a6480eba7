//
// Created by igor on 26/11/2025.
//
// Error state of one parse, reachable from the grammar actions and the scanner
//

#pragma once
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct parser_context parser_context_t;

enum parser_error_code {
    PARSER_OK = 0,
    PARSER_ERROR_SYNTAX = 1,
    PARSER_ERROR_MEMORY = 2,
    PARSER_ERROR_UNEXPECTED_TOKEN = 3,
    PARSER_ERROR_INVALID_LITERAL = 4,
    PARSER_ERROR_SEMANTIC = 6,
    PARSER_ERROR_INTERNAL = 99
};

/* Records an error at the scanner position */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...);

/* Records an error at a token unless an error is already recorded */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 4, 5)))
#endif
void parser_set_error_at(parser_context_t* ctx, const token_value_t* tok, enum parser_error_code code,
                         const char* format, ...);

/* Token name for syntax error messages */
const char* parser_get_token_name(int token_code);

#ifdef __cplusplus
}
#endif

#if defined(MSGDEF_PARSER_CONTEXT_VISIBLE)
#include "parser/ast_holder.hh"

typedef struct parser_error {
    enum parser_error_code code;
    char message[256];
    int line;
    int column;
} parser_error_t;

typedef struct parser_context {
    parser_error_t error;
    ast_module_holder* ast_builder;
    scanner_context_t* m_scanner;
} parser_context_t;
#endif
