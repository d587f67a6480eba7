//
// Module loading: import path resolution and breadth-first loading of a schema set
//

#include <msgdef/compilation.hh>
#include <msgdef/parser.hh>
#include <msgdef/parser_error.hh>
#include <filesystem>
#include <sstream>
#include <queue>
#include <cstdlib>

namespace fs = std::filesystem;

namespace msgdef {

// Build error message for import_not_found_error
std::string import_not_found_error::build_message(
    const std::string& name,
    const std::string& importing_file,
    const std::vector<std::string>& paths) {
    std::ostringstream oss;
    oss << "Import '" << name << "' of " << importing_file << " not found. Searched in:\n";
    for (const auto& path : paths) {
        oss << "  - " << path << "\n";
    }
    return oss.str();
}

// Build error message for circular_import_error
std::string circular_import_error::build_message(const std::vector<std::string>& files) {
    std::ostringstream oss;
    oss << "Circular import detected:\n";
    for (size_t i = 0; i < files.size(); ++i) {
        oss << (i == 0 ? "  " : "  -> ") << files[i] << "\n";
    }
    return oss.str();
}

namespace {
    // Helper: Add a candidate to the searched list and return its canonical path if it is a file
    std::string try_candidate(const fs::path& candidate, std::vector<std::string>& searched_paths) {
        searched_paths.push_back(candidate.string());

        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return fs::canonical(candidate).string();
        }
        return "";
    }

    // Helper: Parse a single file into an early model
    std::unique_ptr<early::early_model> load_file(const std::string& file_path) {
        ast::module tree = parse_msgdef_file(fs::path(file_path));
        return std::make_unique<early::early_model>(
            early::build_early_model(tree, early::file_stem(file_path), file_path));
    }

} // anonymous namespace

std::vector<std::string> make_search_paths(const std::vector<std::string>& user_paths) {
    std::vector<std::string> search_paths(user_paths.begin(), user_paths.end());

    // MSGDEF_PATH environment variable
    const char* env_path = std::getenv("MSGDEF_PATH");
    if (env_path) {
        std::string env_str(env_path);
        size_t pos = 0;
        while (pos < env_str.size()) {
            size_t next = env_str.find(':', pos);
            if (next == std::string::npos) {
                next = env_str.size();
            }
            std::string path = env_str.substr(pos, next - pos);
            if (!path.empty()) {
                search_paths.push_back(path);
            }
            pos = next + 1;
        }
    }
    return search_paths;
}

std::string resolve_import_path(const std::string& import_path,
                                const std::string& importing_file,
                                const std::vector<std::string>& search_paths) {
    std::vector<std::string> searched_paths;

    // a) Importing file's directory (highest priority)
    fs::path base = fs::path(importing_file).parent_path();
    if (base.empty()) {
        base = ".";
    }
    std::string found = try_candidate(base / import_path, searched_paths);

    // b) Search paths in order
    for (size_t i = 0; found.empty() && i < search_paths.size(); ++i) {
        found = try_candidate(fs::path(search_paths[i]) / import_path, searched_paths);
    }

    if (found.empty()) {
        throw import_not_found_error(import_path, importing_file, searched_paths);
    }
    return found;
}

void load_schema(compilation_context& ctx, const std::string& root_path) {
    if (!fs::is_regular_file(root_path)) {
        throw module_load_error("Cannot open schema file: " + root_path);
    }
    ctx.root_file = fs::canonical(root_path).string();

    // BFS traversal for imports; the registry doubles as the seen set
    std::queue<std::string> to_process;
    ctx.registry.emplace(ctx.root_file, load_file(ctx.root_file));
    ctx.load_order.push_back(ctx.root_file);
    to_process.push(ctx.root_file);

    while (!to_process.empty()) {
        std::string current = to_process.front();
        to_process.pop();

        // Registry entries are heap allocated, so this stays valid while the map grows
        early::early_model& model = *ctx.registry.at(current);

        for (auto& import : model.imports) {
            import.resolved_path = resolve_import_path(import.path, current, ctx.search_paths);

            if (ctx.registry.contains(import.resolved_path)) {
                continue;  // Already loaded (diamond or cycle), skip
            }

            ctx.registry.emplace(import.resolved_path, load_file(import.resolved_path));
            ctx.load_order.push_back(import.resolved_path);
            to_process.push(import.resolved_path);
        }
    }
}

} // namespace msgdef
