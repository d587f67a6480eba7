//
// Created by igor on 03/12/2025.
//

#include <msgdef/transform.hh>

namespace msgdef::transform {
    early::early_model add_file_level_namespace(early::early_model model) {
        if (model.file_level_namespace()) {
            return model;
        }

        const std::size_t root = model.namespaces.size();
        {
            early::early_namespace ns;
            ns.name = model.file_namespace;
            ns.where = early::provenance{model.file, 1, ""};
            ns.messages = std::move(model.messages);
            ns.enums = std::move(model.enums);
            ns.options = std::move(model.options);
            ns.compounds = std::move(model.compounds);
            ns.children = model.roots;
            model.namespaces.push_back(std::move(ns));
        }
        model.messages.clear();
        model.enums.clear();
        model.options.clear();
        model.compounds.clear();

        for (auto idx : model.roots) {
            model.namespaces[idx].parent = root;
        }
        model.roots.assign(1, root);
        return model;
    }
}
