/*
 * Message definition parser - C++ entry points
 *
 * Drives the re2c scanner and the Lemon parser over one input buffer and turns
 * the first recorded error into a parse_error.
 */

#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <msgdef/parser.hh>
#include <msgdef/ast.hh>
#include <msgdef/parser_error.hh>

#define MSGDEF_PARSER_CONTEXT_VISIBLE
#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/scanner_context.h"
#include "parser/parser_context.h"
#include "parser/parser_constants.h"

/* Lemon and re2c entry points */
extern "C" {
void* ParseAlloc(void* (* allocProc)(size_t));
void Parse(void* parser, int token, token_value_t* value, parser_context_t* ctx);
void ParseFree(void* parser, void (* freeProc)(void*));
int parser_scan_token(scanner_context_t* ctx, parser_context_t* pctx, token_value_t* token);
}

namespace {
    /* Owns the NUL padded copy of the input the scanner walks over */
    class source_buffer {
        public:
            source_buffer(const std::string& text, const std::string& filename)
                : data_(text.size() + msgdef::parser::INPUT_BUFFER_PADDING, '\0'),
                  filename_(filename) {
                std::memcpy(data_.data(), text.data(), text.size());

                state_.cursor = data_.data();
                state_.eof = data_.data() + text.size();
                state_.line_start = data_.data();
                state_.line = 1;
                state_.column = 1;
                state_.last_token_line = 0;
                state_.filename = filename_.c_str();
            }

            source_buffer(const source_buffer&) = delete;
            source_buffer& operator =(const source_buffer&) = delete;

            scanner_context_t* scanner() {
                return &state_;
            }

        private:
            std::vector<char> data_;
            std::string filename_;
            scanner_context_t state_{};
    };

    /* Tokens stay referenced from the Lemon stack until their rule reduces, so
     * every token of the parse keeps its address */
    class token_arena {
        public:
            token_value_t* next() {
                return &tokens_.emplace_back();
            }

        private:
            std::deque<token_value_t> tokens_;
    };

    struct lemon_deleter {
        void operator()(void* p) const {
            ParseFree(p, free);
        }
    };

    using lemon_parser = std::unique_ptr<void, lemon_deleter>;

    /* Returns false once an error is recorded in ctx */
    bool run_parser(parser_context_t& ctx, source_buffer& source) {
        lemon_parser parser(ParseAlloc(malloc));
        if (!parser) {
            parser_set_error(&ctx, PARSER_ERROR_MEMORY, "Cannot allocate parser");
            return false;
        }

        token_arena tokens;
        try {
            for (;;) {
                token_value_t* token = tokens.next();
                const int code = parser_scan_token(source.scanner(), &ctx, token);
                if (code < 0) {
                    return false;
                }
                if (code == 0) {
                    break;
                }
                Parse(parser.get(), code, token, &ctx);
                if (ctx.error.code != PARSER_OK) {
                    return false;
                }
            }

            /* End of input is token 0 for Lemon */
            Parse(parser.get(), 0, nullptr, &ctx);
        } catch (const std::exception& e) {
            parser_set_error(&ctx, PARSER_ERROR_INTERNAL, "Internal error: %s", e.what());
            return false;
        }
        return ctx.error.code == PARSER_OK;
    }
}

namespace msgdef {
    namespace {
        ast::module parse_msgdef_impl(const std::string& input, const std::string& filename) {
            source_buffer source(input, filename);
            ast_module_holder holder;

            parser_context ctx{};
            ctx.m_scanner = source.scanner();
            ctx.ast_builder = &holder;

            if (!run_parser(ctx, source)) {
                throw parse_error(filename + ": " + ctx.error.message, filename, ctx.error.line, ctx.error.column);
            }
            return std::move(*holder.module);
        }
    }

    ast::module parse_msgdef_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse_msgdef_impl(buffer.str(), path.string());
    }

    ast::module parse_msgdef(const std::string& text, const std::string& filename) {
        return parse_msgdef_impl(text, filename);
    }
} // namespace msgdef
