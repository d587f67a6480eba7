//
// Created by igor on 27/11/2025.
//
// Limits of the scanner and of the input buffer
//

#ifndef MSGDEF_PARSER_CONSTANTS_H
#define MSGDEF_PARSER_CONSTANTS_H

#include <cstddef>

namespace msgdef::parser {

/* NUL bytes appended to the input; re2c may look this far past the last token */
constexpr std::size_t INPUT_BUFFER_PADDING = 16;

constexpr std::size_t MAX_IDENTIFIER_LENGTH = 256;
constexpr std::size_t MAX_STRING_LITERAL_LENGTH = 64 * 1024;

} // namespace msgdef::parser

#endif // MSGDEF_PARSER_CONSTANTS_H
