//
// Created by igor on 04/12/2025.
//
// Scope rules:
//   unqualified  - declarations made directly in the enclosing namespaces, innermost
//                  first up to the file-level namespace, then the file-level
//                  namespace of every import given without an alias
//   qualified    - an absolute local QFN, then relative to each enclosing namespace,
//                  then "Alias::Rest" rooted at the aliased file, then the
//                  non-aliased imports (absolute, or relative to their root)
//
// Every name found is flagged resolved. The model builder binds flagged names only,
// so a name reachable through some other file of the build but not from this one
// is still an unresolved reference.
//

#include <msgdef/transform.hh>
#include <msgdef/parser_error.hh>

#include <optional>
#include <set>
#include <type_traits>

namespace msgdef::transform {
    namespace {
        constexpr const char* SEP = "::";

        template<typename Scope>
        void collect_names(const Scope& scope, std::set<std::string>& out) {
            for (const auto& m : scope.messages) out.insert(m.name);
            for (const auto& e : scope.enums) out.insert(e.name);
            for (const auto& o : scope.options) out.insert(o.name);
            for (const auto& c : scope.compounds) out.insert(c.name);
        }

        // Read-only view of a model's names: direct declarations per namespace and every entity QFN
        struct scope_table {
            std::vector<std::set<std::string>> direct;
            std::set<std::string> qfns;
            std::optional<std::size_t> root;

            explicit scope_table(const early::early_model& model)
                : direct(model.namespaces.size()), root(model.file_level_namespace()) {
                for (std::size_t i = 0; i < model.namespaces.size(); ++i) {
                    const auto& ns = model.namespaces[i];
                    collect_names(ns, direct[i]);
                    if (ns.qfn.empty()) {
                        continue;
                    }
                    for (const auto& name : direct[i]) {
                        qfns.insert(ns.qfn + SEP + name);
                    }
                }
            }

            [[nodiscard]] std::string root_qfn(const early::early_model& model) const {
                return root ? model.namespaces[*root].qfn : std::string{};
            }
        };

        class resolver {
            public:
                explicit resolver(early::early_model& model)
                    : model_(model) {
                }

                void run() {
                    const auto root = model_.file_level_namespace();
                    if (!root) {
                        throw pipeline_error(model_.file +
                                             ": name resolution requires exactly one file-level namespace '" +
                                             model_.file_namespace + "'");
                    }
                    assign_qfn(*root, "");

                    local_ = std::make_unique<scope_table>(model_);
                    for (const auto& [key, imported] : model_.imported) {
                        import_entry entry{key, imported, scope_table(*imported), model_.is_aliased_import(key)};
                        imports_.push_back(std::move(entry));
                    }

                    for (std::size_t i = 0; i < model_.namespaces.size(); ++i) {
                        resolve_namespace(i);
                    }
                }

            private:
                struct import_entry {
                    std::string key;
                    const early::early_model* model;
                    scope_table table;
                    bool aliased;
                };

                void assign_qfn(std::size_t idx, const std::string& prefix) {
                    auto& ns = model_.namespaces[idx];
                    ns.qfn = prefix.empty() ? ns.name : prefix + SEP + ns.name;
                    const std::string qfn = ns.qfn;
                    for (auto child : ns.children) {
                        assign_qfn(child, qfn);
                    }
                }

                void resolve_namespace(std::size_t idx) {
                    auto& ns = model_.namespaces[idx];
                    for (auto& m : ns.messages) {
                        if (m.parent_raw) {
                            resolve_in_place(*m.parent_raw, m.parent_resolved, idx);
                        }
                        for (auto& f : m.fields) {
                            resolve_type(f.type, idx);
                        }
                    }
                    for (auto& e : ns.enums) {
                        if (e.parent_raw) {
                            resolve_in_place(*e.parent_raw, e.parent_resolved, idx);
                        }
                    }
                    for (auto& c : ns.compounds) {
                        if (!is_primitive_name(c.base_type_raw)) {
                            bool ignored = false;
                            resolve_in_place(c.base_type_raw, ignored, idx);
                        }
                    }
                }

                void resolve_type(early::raw_type& type, std::size_t ns) {
                    std::visit([this, ns](auto& node) {
                        using T = std::decay_t<decltype(node)>;
                        if constexpr (std::is_same_v<T, early::ref_type>) {
                            resolve_in_place(node.type_name, node.resolved, ns);
                        } else if constexpr (std::is_same_v<T, early::compound_type>) {
                            if (!is_primitive_name(node.base_type_raw)) {
                                resolve_in_place(node.base_type_raw, node.base_resolved, ns);
                            }
                        } else if constexpr (std::is_same_v<T, early::array_type>) {
                            resolve_type(*node.element, ns);
                        } else if constexpr (std::is_same_v<T, early::map_type>) {
                            resolve_type(*node.key, ns);
                            resolve_type(*node.value, ns);
                        }
                    }, type.node);
                }

                // A name already marked resolved is a QFN from an earlier run and stays as is
                void resolve_in_place(std::string& name, bool& resolved, std::size_t ns) const {
                    if (resolved) {
                        return;
                    }
                    if (auto qfn = resolve(name, ns)) {
                        name = std::move(*qfn);
                        resolved = true;
                    }
                }

                [[nodiscard]] std::optional<std::string> resolve(const std::string& name, std::size_t ns) const {
                    if (name.find(SEP) == std::string::npos) {
                        return resolve_unqualified(name, ns);
                    }
                    return resolve_qualified(name, ns);
                }

                [[nodiscard]] std::optional<std::string> resolve_unqualified(const std::string& name,
                                                                             std::size_t ns) const {
                    for (std::optional<std::size_t> cur = ns; cur; cur = model_.namespaces[*cur].parent) {
                        if (local_->direct[*cur].contains(name)) {
                            return model_.namespaces[*cur].qfn + SEP + name;
                        }
                    }
                    for (const auto& imp : imports_) {
                        if (imp.aliased || !imp.table.root) {
                            continue;
                        }
                        if (imp.table.direct[*imp.table.root].contains(name)) {
                            return imp.table.root_qfn(*imp.model) + SEP + name;
                        }
                    }
                    return std::nullopt;
                }

                [[nodiscard]] std::optional<std::string> resolve_qualified(const std::string& name,
                                                                           std::size_t ns) const {
                    if (local_->qfns.contains(name)) {
                        return name;
                    }
                    for (std::optional<std::size_t> cur = ns; cur; cur = model_.namespaces[*cur].parent) {
                        std::string candidate = model_.namespaces[*cur].qfn + SEP + name;
                        if (local_->qfns.contains(candidate)) {
                            return candidate;
                        }
                    }

                    const auto split = name.find(SEP);
                    const std::string head = name.substr(0, split);
                    const std::string rest = name.substr(split + 2);
                    for (const auto& imp : imports_) {
                        if (!imp.aliased || imp.key != head) {
                            continue;
                        }
                        std::string candidate = imp.table.root_qfn(*imp.model) + SEP + rest;
                        if (imp.table.qfns.contains(candidate)) {
                            return candidate;
                        }
                    }

                    for (const auto& imp : imports_) {
                        if (imp.aliased) {
                            continue;
                        }
                        if (imp.table.qfns.contains(name)) {
                            return name;
                        }
                        std::string candidate = imp.table.root_qfn(*imp.model) + SEP + name;
                        if (imp.table.qfns.contains(candidate)) {
                            return candidate;
                        }
                    }
                    return std::nullopt;
                }

                early::early_model& model_;
                std::unique_ptr<scope_table> local_;
                std::vector<import_entry> imports_;
        };
    }

    early::early_model qfn_reference(early::early_model model) {
        resolver r(model);
        r.run();
        return model;
    }
}
