//
// Created by igor on 03/12/2025.
//

#include <msgdef/transform.hh>
#include <msgdef/parser_error.hh>

namespace msgdef::transform {
    early::early_model attach_imported_models(early::early_model model, const model_registry& registry) {
        for (const auto& imp : model.imports) {
            const std::string& key = imp.resolved_path.empty() ? imp.path : imp.resolved_path;
            auto it = registry.find(key);
            if (it == registry.end() || !it->second) {
                throw pipeline_error(model.file + ":" + std::to_string(imp.line) +
                                     ": import '" + imp.path + "' has not been loaded");
            }
            model.imported[imp.alias ? *imp.alias : imp.path] = it->second.get();
        }
        return model;
    }
}
