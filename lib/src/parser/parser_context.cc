//
// Created by igor on 27/11/2025.
//
// Error recording and token names for messages
//

#include <cstdarg>
#include <cstdio>

#define MSGDEF_PARSER_CONTEXT_VISIBLE
#include "parser/parser_context.h"
#include "gen/msgdef_parser.h"

static void record_error(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                         const char* format, va_list args) {
    ctx->error.code = code;
    ctx->error.line = line;
    ctx->error.column = column;
    vsnprintf(ctx->error.message, sizeof(ctx->error.message), format, args);
}

void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...) {
    if (!ctx) return;

    va_list args;
    va_start(args, format);
    record_error(ctx, code, ctx->m_scanner->line, ctx->m_scanner->column, format, args);
    va_end(args);
}

void parser_set_error_at(parser_context_t* ctx, const token_value_t* tok, enum parser_error_code code,
                         const char* format, ...) {
    if (!ctx) return;

    /* The first error wins; Lemon reports follow-up errors while it recovers */
    if (ctx->error.code != PARSER_OK) return;

    va_list args;
    va_start(args, format);
    record_error(ctx, code,
                 tok ? tok->line : ctx->m_scanner->line,
                 tok ? tok->column : ctx->m_scanner->column,
                 format, args);
    va_end(args);
}

const char* parser_get_token_name(int token_code) {
    switch (token_code) {
        case 0: return "end of file";
        case TOKEN_IDENTIFIER: return "identifier";
        case TOKEN_INTEGER_LITERAL: return "integer literal";
        case TOKEN_FLOAT_LITERAL: return "float literal";
        case TOKEN_STRING_LITERAL: return "string literal";
        case TOKEN_IMPORT: return "'import'";
        case TOKEN_AS: return "'as'";
        case TOKEN_NAMESPACE: return "'namespace'";
        case TOKEN_MESSAGE: return "'message'";
        case TOKEN_ENUM: return "'enum'";
        case TOKEN_OPEN_ENUM: return "'open_enum'";
        case TOKEN_OPTIONS: return "'options'";
        case TOKEN_MAP: return "'Map'";
        case TOKEN_STRING: return "'string'";
        case TOKEN_INT: return "'int'";
        case TOKEN_FLOAT: return "'float'";
        case TOKEN_BOOL: return "'bool'";
        case TOKEN_BYTE: return "'byte'";
        case TOKEN_LBRACE: return "'{'";
        case TOKEN_RBRACE: return "'}'";
        case TOKEN_LBRACKET: return "'['";
        case TOKEN_RBRACKET: return "']'";
        case TOKEN_LT: return "'<'";
        case TOKEN_GT: return "'>'";
        case TOKEN_COMMA: return "','";
        case TOKEN_COLON: return "':'";
        case TOKEN_COLONCOLON: return "'::'";
        case TOKEN_DOT: return "'.'";
        case TOKEN_SEMICOLON: return "';'";
        case TOKEN_EQUALS: return "'='";
        case TOKEN_PIPE: return "'|'";
        default: return "unknown token";
    }
}
