//
// Created by igor on 26/11/2025.
//
// Parse tree under construction, owned by the parser context while Lemon runs
//

#pragma once

#include <msgdef/ast.hh>
#include <deque>
#include <memory>
#include <variant>

/* Any declaration that can appear at file or namespace scope */
using ast_declaration = std::variant<
    msgdef::ast::namespace_def,
    msgdef::ast::message_def,
    msgdef::ast::enum_def,
    msgdef::ast::options_def,
    msgdef::ast::compound_def
>;

struct ast_module_holder {
    std::unique_ptr<msgdef::ast::module> module = std::make_unique<msgdef::ast::module>();

    /* Grammar actions hand out pointers into these pools; a deque never moves its elements.
     * A node is moved out when its parent rule reduces and stays behind in a moved-from state. */
    std::deque<msgdef::ast::type> temp_types;
    std::deque<msgdef::ast::value_item> temp_value_items;
    std::deque<msgdef::ast::field_def> temp_fields;
    std::deque<ast_declaration> temp_decls;
};
