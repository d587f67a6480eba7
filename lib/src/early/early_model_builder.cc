//
// Created by igor on 02/12/2025.
//

#include <msgdef/early_model.hh>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace msgdef::early {
    std::optional<std::size_t> early_model::file_level_namespace() const {
        if (roots.size() != 1) {
            return std::nullopt;
        }
        if (!messages.empty() || !enums.empty() || !options.empty() || !compounds.empty()) {
            return std::nullopt;
        }
        const auto idx = roots.front();
        if (namespaces[idx].name != file_namespace) {
            return std::nullopt;
        }
        return idx;
    }

    bool early_model::is_aliased_import(const std::string& key) const {
        for (const auto& imp : imports) {
            if (imp.alias && *imp.alias == key) {
                return true;
            }
        }
        return false;
    }

    std::string file_stem(const std::string& path) {
        return std::filesystem::path(path).stem().string();
    }

    namespace {
        // Hands out the comments of a file to declarations; each comment attaches once.
        class comment_index {
            public:
                explicit comment_index(const std::vector<ast::comment>& all)
                    : comments_(all), consumed_(all.size(), false) {
                }

                comments attach(std::size_t line) {
                    std::vector<std::size_t> picked = leading(line);
                    std::optional<std::size_t> trailing_doc;

                    for (std::size_t i = 0; i < comments_.size(); ++i) {
                        const auto& c = comments_[i];
                        if (consumed_[i] || !c.trailing || c.pos.line != line) {
                            continue;
                        }
                        picked.push_back(i);
                        if (c.kind == ast::comment_kind::doc && !trailing_doc) {
                            trailing_doc = i;
                        }
                    }

                    comments result;
                    for (auto i : picked) {
                        consumed_[i] = true;
                        const auto& c = comments_[i];
                        if (c.kind == ast::comment_kind::doc && !c.trailing) {
                            append_line(result.doc, c.text);
                        }
                        append_line(result.comment, c.text);
                    }
                    if (result.doc.empty() && trailing_doc) {
                        result.doc = comments_[*trailing_doc].text;
                    }
                    return result;
                }

            private:
                // Contiguous run of own-line comments ending right above the declaration
                std::vector<std::size_t> leading(std::size_t line) const {
                    std::vector<std::size_t> run;
                    std::size_t expected_end = line;
                    bool first = true;

                    for (std::size_t k = comments_.size(); k-- > 0;) {
                        const auto& c = comments_[k];
                        if (c.pos.line > line) {
                            continue;
                        }
                        if (consumed_[k] || c.trailing) {
                            if (c.pos.line == line) {
                                continue;
                            }
                            break;
                        }
                        const bool adjacent = first
                                                  ? (c.end_line == line || c.end_line + 1 == line)
                                                  : (c.end_line == expected_end || c.end_line + 1 == expected_end);
                        if (!adjacent) {
                            break;
                        }
                        run.push_back(k);
                        expected_end = c.pos.line;
                        first = false;
                    }
                    return {run.rbegin(), run.rend()};
                }

                static void append_line(std::string& out, const std::string& text) {
                    if (text.empty()) {
                        return;
                    }
                    if (!out.empty()) {
                        out += '\n';
                    }
                    out += text;
                }

                const std::vector<ast::comment>& comments_;
                std::vector<bool> consumed_;
        };

        class builder {
            public:
                builder(const ast::module& tree, std::string file_namespace, std::string source_file)
                    : tree_(tree), comments_(tree.comments) {
                    model_.file = std::move(source_file);
                    model_.file_namespace = std::move(file_namespace);
                }

                early_model build() {
                    for (const auto& imp : tree_.imports) {
                        early_import out;
                        out.path = imp.path;
                        out.alias = imp.alias;
                        out.line = imp.pos.line;
                        model_.imports.push_back(std::move(out));
                    }

                    // Declarations are walked in source order so comments attach to
                    // the nearest declaration
                    for (const auto& decl : in_order(tree_)) {
                        std::visit([this](const auto* d) { add_top_level(*d); }, decl.item);
                    }
                    return std::move(model_);
                }

            private:
                struct ordered_decl {
                    std::size_t line;
                    std::size_t column;
                    std::variant<const ast::namespace_def*, const ast::message_def*, const ast::enum_def*,
                                 const ast::options_def*, const ast::compound_def*> item;
                };

                template<typename Container>
                static std::vector<ordered_decl> in_order(const Container& c) {
                    std::vector<ordered_decl> decls;
                    for (const auto& ns : c.namespaces) decls.push_back({ns.pos.line, ns.pos.column, &ns});
                    for (const auto& m : c.messages) decls.push_back({m.pos.line, m.pos.column, &m});
                    for (const auto& e : c.enums) decls.push_back({e.pos.line, e.pos.column, &e});
                    for (const auto& o : c.options) decls.push_back({o.pos.line, o.pos.column, &o});
                    for (const auto& cd : c.compounds) decls.push_back({cd.pos.line, cd.pos.column, &cd});
                    std::stable_sort(decls.begin(), decls.end(), [](const auto& a, const auto& b) {
                        return a.line != b.line ? a.line < b.line : a.column < b.column;
                    });
                    return decls;
                }

                provenance where(std::size_t line) const {
                    return provenance{model_.file, line, ns_path_};
                }

                // -- top level ------------------------------------------------------

                void add_top_level(const ast::namespace_def& ns) {
                    model_.roots.push_back(add_namespace(ns, std::nullopt));
                }

                void add_top_level(const ast::message_def& m) {
                    model_.messages.push_back(convert_message(m));
                }

                void add_top_level(const ast::enum_def& e) {
                    model_.enums.push_back(convert_enum(e));
                }

                void add_top_level(const ast::options_def& o) {
                    model_.options.push_back(convert_options(o));
                }

                void add_top_level(const ast::compound_def& c) {
                    model_.compounds.push_back(convert_compound(c));
                }

                // -- namespaces -----------------------------------------------------

                std::size_t add_namespace(const ast::namespace_def& ns, std::optional<std::size_t> parent) {
                    const std::size_t idx = model_.namespaces.size();
                    {
                        early_namespace node;
                        node.name = ns.name;
                        node.parent = parent;
                        node.where = where(ns.pos.line);
                        node.notes = comments_.attach(ns.pos.line);
                        model_.namespaces.push_back(std::move(node));
                    }

                    const std::string saved = ns_path_;
                    ns_path_ = ns_path_.empty() ? ns.name : ns_path_ + "::" + ns.name;

                    for (const auto& d : in_order(ns)) {
                        if (const auto* child = std::get_if<const ast::namespace_def*>(&d.item)) {
                            const auto child_idx = add_namespace(**child, idx);
                            model_.namespaces[idx].children.push_back(child_idx);
                        } else if (const auto* m = std::get_if<const ast::message_def*>(&d.item)) {
                            auto msg = convert_message(**m);
                            model_.namespaces[idx].messages.push_back(std::move(msg));
                        } else if (const auto* e = std::get_if<const ast::enum_def*>(&d.item)) {
                            auto en = convert_enum(**e);
                            model_.namespaces[idx].enums.push_back(std::move(en));
                        } else if (const auto* o = std::get_if<const ast::options_def*>(&d.item)) {
                            auto opts = convert_options(**o);
                            model_.namespaces[idx].options.push_back(std::move(opts));
                        } else if (const auto* c = std::get_if<const ast::compound_def*>(&d.item)) {
                            auto comp = convert_compound(**c);
                            model_.namespaces[idx].compounds.push_back(std::move(comp));
                        }
                    }

                    ns_path_ = saved;
                    return idx;
                }

                // -- entities -------------------------------------------------------

                early_message convert_message(const ast::message_def& m) {
                    early_message out;
                    out.name = m.name;
                    if (m.parent) {
                        out.parent_raw = m.parent->text;
                    }
                    out.where = where(m.pos.line);
                    out.notes = comments_.attach(m.pos.line);

                    for (const auto& f : m.fields) {
                        out.fields.push_back(convert_field(f));
                    }
                    return out;
                }

                early_field convert_field(const ast::field_def& f) {
                    early_field out;
                    out.name = f.name;
                    out.modifiers = f.modifiers;
                    out.default_value_raw = f.default_value;
                    out.where = where(f.pos.line);
                    out.notes = comments_.attach(f.pos.line);
                    out.type = convert_type(f.field_type);
                    return out;
                }

                early_enum convert_enum(const ast::enum_def& e) {
                    early_enum out;
                    out.name = e.name;
                    out.is_open = e.is_open;
                    if (e.parent) {
                        out.parent_raw = e.parent->text;
                    }
                    out.where = where(e.pos.line);
                    out.notes = comments_.attach(e.pos.line);
                    out.values = convert_values(e.values, false);
                    return out;
                }

                early_enum convert_options(const ast::options_def& o) {
                    early_enum out;
                    out.name = o.name;
                    out.is_options = true;
                    out.where = where(o.pos.line);
                    out.notes = comments_.attach(o.pos.line);
                    out.values = convert_values(o.values, true);
                    return out;
                }

                early_compound convert_compound(const ast::compound_def& c) {
                    early_compound out;
                    out.name = c.name;
                    out.base_type_raw = c.base;
                    out.components = c.components;
                    out.where = where(c.pos.line);
                    out.notes = comments_.attach(c.pos.line);
                    return out;
                }

                std::vector<early_enum_value> convert_values(const std::vector<ast::value_item>& items,
                                                             bool is_options) {
                    std::vector<early_enum_value> out;
                    for (std::size_t i = 0; i < items.size(); ++i) {
                        const auto& item = items[i];
                        early_enum_value v;
                        v.name = item.name;
                        v.is_explicit = item.value.has_value();
                        if (item.value) {
                            v.value = *item.value;
                        } else if (is_options) {
                            if (i >= 63) {
                                throw std::out_of_range("options '" + item.name + "' at line " +
                                                        std::to_string(item.pos.line) +
                                                        ": too many flags for automatic numbering");
                            }
                            v.value = std::int64_t{1} << i;
                        } else if (out.empty()) {
                            v.value = 0;
                        } else {
                            const auto& prev = out.back();
                            if (prev.value == std::numeric_limits<std::int64_t>::max()) {
                                throw std::out_of_range("enum value '" + item.name + "' at line " +
                                                        std::to_string(item.pos.line) + ": follows '" +
                                                        prev.name + "' = " + std::to_string(prev.value) +
                                                        " and cannot be numbered automatically");
                            }
                            v.value = prev.value + 1;
                        }
                        v.where = where(item.pos.line);
                        v.notes = comments_.attach(item.pos.line);
                        out.push_back(std::move(v));
                    }
                    return out;
                }

                // -- types ----------------------------------------------------------

                raw_type convert_type(const ast::type& t) {
                    return std::visit([this](const auto& node) -> raw_type { return convert_node(node); }, t.node);
                }

                raw_type convert_node(const ast::primitive_type& p) {
                    return raw_type{primitive_type{p.kind}};
                }

                raw_type convert_node(const ast::qualified_name& q) {
                    return raw_type{ref_type{q.text}};
                }

                raw_type convert_node(const ast::inline_enum_type& e) {
                    return raw_type{inline_enum_type{e.is_options, convert_values(e.values, e.is_options)}};
                }

                raw_type convert_node(const ast::compound_type& c) {
                    return raw_type{compound_type{c.base, c.components}};
                }

                raw_type convert_node(const ast::array_type& a) {
                    return raw_type{array_type{std::make_unique<raw_type>(convert_type(*a.element))}};
                }

                raw_type convert_node(const ast::map_type& m) {
                    return raw_type{map_type{
                        std::make_unique<raw_type>(convert_type(*m.key)),
                        std::make_unique<raw_type>(convert_type(*m.value))
                    }};
                }

                const ast::module& tree_;
                comment_index comments_;
                early_model model_;
                std::string ns_path_;
        };
    }

    early_model build_early_model(const ast::module& tree,
                                  const std::string& file_namespace,
                                  const std::string& source_file) {
        builder b(tree, file_namespace, source_file);
        return b.build();
    }
}
