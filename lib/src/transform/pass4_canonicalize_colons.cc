//
// Created by igor on 03/12/2025.
//

#include <msgdef/transform.hh>

#include <type_traits>

namespace msgdef::transform {
    std::string canonical_name(const std::string& name) {
        std::string out;
        out.reserve(name.size() + 4);
        for (char c : name) {
            if (c == '.') {
                out += "::";
            } else {
                out += c;
            }
        }
        return out;
    }

    namespace {
        void canonicalize(early::raw_type& type) {
            std::visit([](auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, early::ref_type>) {
                    node.type_name = canonical_name(node.type_name);
                } else if constexpr (std::is_same_v<T, early::compound_type>) {
                    node.base_type_raw = canonical_name(node.base_type_raw);
                } else if constexpr (std::is_same_v<T, early::array_type>) {
                    canonicalize(*node.element);
                } else if constexpr (std::is_same_v<T, early::map_type>) {
                    canonicalize(*node.key);
                    canonicalize(*node.value);
                }
            }, type.node);
        }

        template<typename Scope>
        void canonicalize_scope(Scope& scope) {
            for (auto& m : scope.messages) {
                if (m.parent_raw) {
                    m.parent_raw = canonical_name(*m.parent_raw);
                }
                for (auto& f : m.fields) {
                    canonicalize(f.type);
                }
            }
            for (auto& e : scope.enums) {
                if (e.parent_raw) {
                    e.parent_raw = canonical_name(*e.parent_raw);
                }
            }
            for (auto& c : scope.compounds) {
                c.base_type_raw = canonical_name(c.base_type_raw);
            }
        }
    }

    early::early_model canonicalize_colons(early::early_model model) {
        canonicalize_scope(model);
        for (auto& ns : model.namespaces) {
            canonicalize_scope(ns);
        }
        return model;
    }
}
