//
// Created by igor on 26/11/2025.
//
// Plain C state shared by the re2c scanner, the Lemon grammar and the C++ driver
//

#pragma once

/* Token handed to the grammar: a slice of the input buffer plus its position */
typedef struct token_value {
    const char* start;  /* First character */
    const char* end;    /* One past the last character */
    int line;           /* 1-based */
    int column;         /* 1-based */
} token_value_t;

/* The input buffer is NUL padded past eof, so the scanner never checks bounds inside a token */
typedef struct scanner_context {
    const char* cursor;
    const char* eof;
    const char* line_start;   /* First character of the current line; columns count from here */
    int line;
    int column;               /* Column of the token being scanned */
    int last_token_line;      /* Line of the last token given to the grammar, 0 before the first */
    const char* filename;
} scanner_context_t;
