//
// Created by igor on 04/12/2025.
//

#include <msgdef/transform.hh>

namespace msgdef::transform {
    namespace {
        struct promoted {
            std::vector<early::early_enum> enums;
            std::vector<early::early_enum> options;
        };

        // Replaces every inline body in the type tree; returns true if one was found
        bool promote_type(early::raw_type& type, const early::early_message& msg, const early::early_field& field,
                          const std::string& scope_qfn, promoted& out) {
            if (auto* inl = std::get_if<early::inline_enum_type>(&type.node)) {
                early::early_enum e;
                e.name = msg.name + "_" + field.name;
                e.is_options = inl->is_options;
                e.values = std::move(inl->values);
                e.where = field.where;
                e.notes = field.notes;

                std::string ref = scope_qfn.empty() ? e.name : scope_qfn + "::" + e.name;
                if (e.is_options) {
                    out.options.push_back(std::move(e));
                } else {
                    out.enums.push_back(std::move(e));
                }
                // The promoted enum is declared in scope, so a qualified reference to it is resolved
                type.node = early::ref_type{std::move(ref), !scope_qfn.empty()};
                return true;
            }
            if (auto* arr = std::get_if<early::array_type>(&type.node)) {
                return promote_type(*arr->element, msg, field, scope_qfn, out);
            }
            if (auto* map = std::get_if<early::map_type>(&type.node)) {
                const bool key = promote_type(*map->key, msg, field, scope_qfn, out);
                const bool value = promote_type(*map->value, msg, field, scope_qfn, out);
                return key || value;
            }
            return false;
        }

        template<typename Scope>
        void promote_scope(Scope& scope, const std::string& scope_qfn) {
            promoted out;
            for (auto& m : scope.messages) {
                for (auto& f : m.fields) {
                    promote_type(f.type, m, f, scope_qfn, out);
                }
            }
            for (auto& e : out.enums) {
                scope.enums.push_back(std::move(e));
            }
            for (auto& o : out.options) {
                scope.options.push_back(std::move(o));
            }
        }
    }

    early::early_model promote_inline_enums(early::early_model model) {
        promote_scope(model, std::string{});
        for (auto& ns : model.namespaces) {
            promote_scope(ns, ns.qfn);
        }
        return model;
    }
}
