//
// Created by igor on 04/12/2025.
//

#include <msgdef/transform.hh>

namespace msgdef::transform {
    bool is_primitive_name(const std::string& name) {
        return name == "string" || name == "int" || name == "float" || name == "bool" || name == "byte";
    }

    early::early_model run_pipeline(early::early_model model, const model_registry& registry) {
        model = add_file_level_namespace(std::move(model));
        model = attach_imported_models(std::move(model), registry);
        model = canonicalize_colons(std::move(model));
        model = qfn_reference(std::move(model));
        model = promote_inline_enums(std::move(model));
        return model;
    }
}
