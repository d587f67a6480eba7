//
// Created by igor on 20/11/2025.
//

#pragma once

#include <filesystem>
#include <string>

#include "ast.hh"
#include "parser_error.hh"

namespace msgdef {
    // Parse schema text; filename is used for positions and error messages
    ast::module parse_msgdef(const std::string& text, const std::string& filename = "<string>");

    // Read and parse a schema file
    ast::module parse_msgdef_file(const std::filesystem::path& path);
}
