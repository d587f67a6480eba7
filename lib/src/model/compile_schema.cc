//
// Created by igor on 06/12/2025.
//

#include <msgdef/compilation.hh>
#include <msgdef/model_builder.hh>

namespace msgdef {
    void process_schema(compilation_context& ctx) {
        ctx.dependency_order = transform::dependency_sort(ctx.registry);

        // Dependencies come first, so every import is finished before its importers
        // take pointers to it; the slot itself never moves
        for (const auto& path : ctx.dependency_order) {
            auto& slot = ctx.registry.at(path);
            *slot = transform::run_pipeline(std::move(*slot), ctx.registry);
        }
    }

    semantic::build_result build_schema_model(const compilation_context& ctx) {
        std::vector<const early::early_model*> files;
        files.reserve(ctx.dependency_order.size());
        for (const auto& path : ctx.dependency_order) {
            files.push_back(ctx.registry.at(path).get());
        }
        return semantic::build_model(files);
    }

    semantic::build_result compile_schema(const std::string& root_path,
                                          const std::vector<std::string>& search_paths) {
        compilation_context ctx;
        ctx.search_paths = make_search_paths(search_paths);
        load_schema(ctx, root_path);
        process_schema(ctx);
        return build_schema_model(ctx);
    }
}
