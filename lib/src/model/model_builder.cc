//
// Created by igor on 05/12/2025.
//
// Model construction runs in phases over every file at once:
//   1. registration   - namespaces and entities enter the arenas and the QFN table
//   2. enums          - parents, inheritance cycles, value merge, bit widths
//   3. messages       - parents and inheritance cycles
//   4. fields         - type binding, type_ref, duplicate names, default reduction
//

#include <msgdef/model_builder.hh>
#include <msgdef/parser_error.hh>
#include <msgdef/transform.hh>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <set>
#include <type_traits>

namespace msgdef::semantic {
    namespace {
        constexpr const char* SEP = "::";

        std::string last_segment(const std::string& name) {
            const auto pos = name.rfind(SEP);
            return pos == std::string::npos ? name : name.substr(pos + 2);
        }

        std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return {};
            }
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        std::optional<std::int64_t> parse_integer(const std::string& text) {
            if (text.empty()) {
                return std::nullopt;
            }
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            bool negative = false;
            if (*begin == '-') {
                negative = true;
                ++begin;
            }
            int base = 10;
            if (end - begin > 2 && begin[0] == '0' && (begin[1] == 'x' || begin[1] == 'X')) {
                base = 16;
                begin += 2;
            }
            std::uint64_t magnitude = 0;
            auto [ptr, ec] = std::from_chars(begin, end, magnitude, base);
            if (ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            if (negative) {
                if (magnitude > static_cast<std::uint64_t>(INT64_MAX) + 1) {
                    return std::nullopt;
                }
                return static_cast<std::int64_t>(std::uint64_t{0} - magnitude);
            }
            if (magnitude > static_cast<std::uint64_t>(INT64_MAX)) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(magnitude);
        }

        std::optional<double> parse_float(const std::string& text) {
            if (text.empty()) {
                return std::nullopt;
            }
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<std::string> parse_string_literal(const std::string& text) {
            if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
                return std::nullopt;
            }
            std::string result;
            result.reserve(text.size() - 2);
            for (std::size_t i = 1; i + 1 < text.size(); ++i) {
                char ch = text[i];
                if (ch == '\\' && i + 2 < text.size()) {
                    char next = text[++i];
                    switch (next) {
                        case 'n': result += '\n'; break;
                        case 't': result += '\t'; break;
                        case 'r': result += '\r'; break;
                        case '0': result += '\0'; break;
                        default: result += next; break;
                    }
                } else {
                    result += ch;
                }
            }
            return result;
        }

        std::optional<type_kind> primitive_kind_of(const std::string& name) {
            if (name == "string") return type_kind::string_;
            if (name == "int") return type_kind::int_;
            if (name == "float") return type_kind::float_;
            if (name == "bool") return type_kind::bool_;
            if (name == "byte") return type_kind::byte_;
            return std::nullopt;
        }

        type_kind primitive_kind_of(ast::primitive_kind kind) {
            switch (kind) {
                case ast::primitive_kind::string_: return type_kind::string_;
                case ast::primitive_kind::int_: return type_kind::int_;
                case ast::primitive_kind::float_: return type_kind::float_;
                case ast::primitive_kind::bool_: return type_kind::bool_;
                case ast::primitive_kind::byte_: return type_kind::byte_;
            }
            return type_kind::int_;
        }

        ast::source_pos pos_of(const location& where) {
            return ast::source_pos(where.file, where.line, 1);
        }

        class model_builder {
            public:
                explicit model_builder(const std::vector<const early::early_model*>& files)
                    : files_(files) {
                }

                build_result build() {
                    for (const auto* file : files_) {
                        register_file(*file);
                    }
                    resolve_enums();
                    resolve_messages();
                    bind_fields();

                    build_result result;
                    result.diagnostics = std::move(diagnostics_);
                    if (!result.has_errors()) {
                        result.resolved = std::move(model_);
                    }
                    return result;
                }

            private:
                // Early entities waiting for phases 2 to 4, parallel to the model arenas
                struct pending_message {
                    const early::early_message* early;
                };

                struct pending_enum {
                    const early::early_enum* early;
                };

                struct pending_compound {
                    const early::early_compound* early;
                };

                // -- diagnostics ----------------------------------------------------

                diagnostic& error(const char* code, std::string msg, const location& where) {
                    diagnostic d{diagnostic_level::error, code, std::move(msg), pos_of(where),
                                 std::nullopt, std::nullopt, std::nullopt};
                    diagnostics_.push_back(std::move(d));
                    return diagnostics_.back();
                }

                void unresolved(const std::string& what, const std::string& name, const location& where) {
                    auto& d = error(diag_codes::E_UNRESOLVED_REFERENCE,
                                    "unresolved " + what + " '" + name + "'", where);
                    const std::string tail = SEP + last_segment(name);
                    for (const auto& [qfn, _] : model_.symbols) {
                        if (qfn != name && qfn.size() > tail.size() &&
                            qfn.compare(qfn.size() - tail.size(), tail.size(), tail) == 0) {
                            d.suggestion = "did you mean '" + qfn + "'?";
                            break;
                        }
                    }
                }

                // -- phase 1: registration ------------------------------------------

                void register_file(const early::early_model& file) {
                    model_.files.push_back(file.file);
                    for (auto root : file.roots) {
                        const auto idx = register_namespace(file, root, std::nullopt);
                        model_.roots.push_back(idx);
                    }
                }

                std::size_t register_namespace(const early::early_model& file, std::size_t early_idx,
                                               std::optional<std::size_t> parent) {
                    const auto& ens = file.namespaces[early_idx];
                    if (ens.qfn.empty()) {
                        throw pipeline_error(file.file + ": namespace '" + ens.name +
                                             "' has no qualified name; run the transform pipeline first");
                    }

                    const std::size_t idx = model_.namespaces.size();
                    {
                        namespace_node node;
                        node.name = ens.name;
                        node.qfn = ens.qfn;
                        node.parent = parent;
                        node.where = location{ens.where.file, ens.where.line};
                        node.doc = ens.notes.doc;
                        model_.namespaces.push_back(std::move(node));
                    }

                    if (auto it = namespace_sites_.find(ens.qfn); it != namespace_sites_.end()) {
                        auto& d = error(diag_codes::E_DUPLICATE_DEFINITION,
                                        "namespace '" + ens.qfn + "' is defined more than once",
                                        model_.namespaces[idx].where);
                        d.related_position = pos_of(it->second);
                        d.related_message = "previous definition is here";
                    } else {
                        namespace_sites_.emplace(ens.qfn, model_.namespaces[idx].where);
                    }

                    for (const auto& m : ens.messages) {
                        register_message(m, idx);
                    }
                    for (const auto& e : ens.enums) {
                        register_enum(e, idx);
                    }
                    for (const auto& o : ens.options) {
                        register_enum(o, idx);
                    }
                    for (const auto& c : ens.compounds) {
                        register_compound(c, idx);
                    }
                    for (auto child : ens.children) {
                        const auto child_idx = register_namespace(file, child, idx);
                        model_.namespaces[idx].children.push_back(child_idx);
                    }
                    return idx;
                }

                bool claim(const std::string& qfn, entity_kind kind, std::size_t index, const location& where) {
                    if (auto it = model_.symbols.find(qfn); it != model_.symbols.end()) {
                        auto& d = error(diag_codes::E_DUPLICATE_DEFINITION,
                                        "'" + qfn + "' is already defined", where);
                        d.related_position = pos_of(location_of(it->second));
                        d.related_message = "previous definition is here";
                        return false;
                    }
                    model_.symbols.emplace(qfn, entity_ref{kind, index, qfn});
                    return true;
                }

                location location_of(const entity_ref& ref) const {
                    switch (ref.kind) {
                        case entity_kind::message: return model_.messages[ref.index].where;
                        case entity_kind::enum_: return model_.enums[ref.index].where;
                        case entity_kind::compound: return model_.compounds[ref.index].where;
                    }
                    return {};
                }

                void register_message(const early::early_message& m, std::size_t ns) {
                    const std::string qfn = model_.namespaces[ns].qfn + SEP + m.name;
                    const location where{m.where.file, m.where.line};
                    if (!claim(qfn, entity_kind::message, model_.messages.size(), where)) {
                        return;
                    }
                    message out;
                    out.name = m.name;
                    out.qfn = qfn;
                    out.ns = ns;
                    out.where = where;
                    out.doc = m.notes.doc;
                    out.comment = m.notes.comment;
                    model_.namespaces[ns].messages.push_back(model_.messages.size());
                    model_.messages.push_back(std::move(out));
                    pending_messages_.push_back({&m});
                }

                void register_enum(const early::early_enum& e, std::size_t ns) {
                    const std::string qfn = model_.namespaces[ns].qfn + SEP + e.name;
                    const location where{e.where.file, e.where.line};
                    if (!claim(qfn, entity_kind::enum_, model_.enums.size(), where)) {
                        return;
                    }
                    enumeration out;
                    out.name = e.name;
                    out.qfn = qfn;
                    out.ns = ns;
                    out.is_open = e.is_open;
                    out.is_options = e.is_options;
                    out.where = where;
                    out.doc = e.notes.doc;
                    out.comment = e.notes.comment;
                    model_.namespaces[ns].enums.push_back(model_.enums.size());
                    model_.enums.push_back(std::move(out));
                    pending_enums_.push_back({&e});
                }

                void register_compound(const early::early_compound& c, std::size_t ns) {
                    const std::string qfn = model_.namespaces[ns].qfn + SEP + c.name;
                    const location where{c.where.file, c.where.line};
                    if (!claim(qfn, entity_kind::compound, model_.compounds.size(), where)) {
                        return;
                    }
                    compound out;
                    out.name = c.name;
                    out.qfn = qfn;
                    out.ns = ns;
                    out.components = c.components;
                    out.where = where;
                    out.doc = c.notes.doc;
                    out.comment = c.notes.comment;
                    model_.namespaces[ns].compounds.push_back(model_.compounds.size());
                    model_.compounds.push_back(std::move(out));
                    pending_compounds_.push_back({&c});
                }

                // -- inheritance ----------------------------------------------------

                // Only names QfnReference resolved in the declaring file are looked up;
                // anything else was out of that file's scope
                std::optional<entity_ref> resolve_parent(const std::string& raw, bool in_scope, entity_kind expected,
                                                         const char* what, const location& where) {
                    const auto* ref = in_scope ? model_.find(raw) : nullptr;
                    if (!ref) {
                        unresolved(std::string(what) + " parent", raw, where);
                        return std::nullopt;
                    }
                    if (ref->kind != expected) {
                        error(diag_codes::E_KIND_MISMATCH,
                              "parent '" + raw + "' of " + what + " is not " +
                              (expected == entity_kind::message ? "a message" : "an enum"), where);
                        return std::nullopt;
                    }
                    return *ref;
                }

                // Marks every entity on a parent cycle; reports each cycle once
                template<typename Arena>
                std::vector<bool> find_cycles(const Arena& arena, const char* what) {
                    std::vector<bool> cyclic(arena.size(), false);
                    std::vector<bool> cleared(arena.size(), false);

                    for (std::size_t start = 0; start < arena.size(); ++start) {
                        std::vector<std::size_t> chain;
                        std::set<std::size_t> visited;
                        std::optional<std::size_t> cur = start;
                        while (cur && !cleared[*cur] && !cyclic[*cur]) {
                            if (visited.contains(*cur)) {
                                auto first = std::find(chain.begin(), chain.end(), *cur);
                                std::string path;
                                for (auto it = first; it != chain.end(); ++it) {
                                    cyclic[*it] = true;
                                    path += arena[*it].qfn + " -> ";
                                }
                                path += arena[*cur].qfn;
                                error(diag_codes::E_CIRCULAR_INHERITANCE,
                                      std::string("circular ") + what + " inheritance: " + path,
                                      arena[*cur].where);
                                break;
                            }
                            visited.insert(*cur);
                            chain.push_back(*cur);
                            const auto& parent = arena[*cur].parent;
                            cur = parent ? std::optional<std::size_t>(parent->index) : std::nullopt;
                        }
                        for (auto i : chain) {
                            if (!cyclic[i]) {
                                cleared[i] = true;
                            }
                        }
                    }
                    return cyclic;
                }

                // -- phase 2: enums -------------------------------------------------

                void resolve_enums() {
                    for (std::size_t i = 0; i < model_.enums.size(); ++i) {
                        const auto& early = *pending_enums_[i].early;
                        if (early.parent_raw) {
                            model_.enums[i].parent = resolve_parent(*early.parent_raw, early.parent_resolved,
                                                                    entity_kind::enum_, "enum",
                                                                    model_.enums[i].where);
                        }
                    }

                    enum_cycles_ = find_cycles(model_.enums, "enum");
                    merged_.assign(model_.enums.size(), false);
                    for (std::size_t i = 0; i < model_.enums.size(); ++i) {
                        merge_enum(i);
                    }
                }

                void merge_enum(std::size_t idx) {
                    if (merged_[idx]) {
                        return;
                    }
                    merged_[idx] = true;

                    auto& e = model_.enums[idx];
                    const auto& early = *pending_enums_[idx].early;

                    std::set<std::string> own_names;
                    std::vector<enum_value> own;
                    for (const auto& v : early.values) {
                        const location where{v.where.file, v.where.line};
                        if (!own_names.insert(v.name).second) {
                            error(diag_codes::E_DUPLICATE_ENUM_VALUE,
                                  "value '" + v.name + "' is declared twice in '" + e.qfn + "'", where);
                            continue;
                        }
                        own.push_back(enum_value{v.name, v.value, false, where, v.notes.doc, v.notes.comment});
                    }

                    std::vector<enum_value> values;
                    if (e.parent && !enum_cycles_[idx]) {
                        merge_enum(e.parent->index);
                        const auto& parent = model_.enums[e.parent->index];
                        for (const auto& inherited : parent.values) {
                            if (own_names.contains(inherited.name)) {
                                const auto& dup = *std::find_if(own.begin(), own.end(),
                                    [&inherited](const auto& v) { return v.name == inherited.name; });
                                auto& d = error(diag_codes::E_DUPLICATE_ENUM_VALUE,
                                                "value '" + inherited.name + "' of '" + e.qfn +
                                                "' redeclares a value inherited from '" + parent.qfn + "'",
                                                dup.where);
                                d.related_position = pos_of(inherited.where);
                                d.related_message = "inherited value is declared here";
                                continue;
                            }
                            enum_value copy = inherited;
                            copy.inherited = true;
                            values.push_back(std::move(copy));
                        }
                    }
                    for (auto& v : own) {
                        values.push_back(std::move(v));
                    }

                    std::vector<std::int64_t> numbers;
                    numbers.reserve(values.size());
                    for (const auto& v : values) {
                        numbers.push_back(v.value);
                    }
                    e.bit_width = enum_bit_width(numbers, e.is_open);
                    e.values = std::move(values);
                }

                // -- phase 3: messages ----------------------------------------------

                void resolve_messages() {
                    for (std::size_t i = 0; i < model_.messages.size(); ++i) {
                        const auto& early = *pending_messages_[i].early;
                        if (early.parent_raw) {
                            model_.messages[i].parent = resolve_parent(*early.parent_raw, early.parent_resolved,
                                                                       entity_kind::message, "message",
                                                                       model_.messages[i].where);
                        }
                    }
                    find_cycles(model_.messages, "message");

                    for (std::size_t i = 0; i < model_.compounds.size(); ++i) {
                        resolve_compound(i);
                    }
                }

                void resolve_compound(std::size_t idx) {
                    auto& c = model_.compounds[idx];
                    const auto& raw = pending_compounds_[idx].early->base_type_raw;
                    if (auto kind = primitive_kind_of(raw)) {
                        c.base = *kind;
                        return;
                    }
                    error(diag_codes::E_KIND_MISMATCH,
                          "base type '" + raw + "' of compound '" + c.qfn + "' is not a primitive type", c.where);
                }

                // -- phase 4: fields ------------------------------------------------

                void bind_fields() {
                    for (std::size_t i = 0; i < model_.messages.size(); ++i) {
                        auto& msg = model_.messages[i];
                        std::set<std::string> names;
                        for (const auto& ef : pending_messages_[i].early->fields) {
                            field f;
                            f.name = ef.name;
                            f.modifiers = ef.modifiers;
                            f.optional = std::find(ef.modifiers.begin(), ef.modifiers.end(), "optional") !=
                                         ef.modifiers.end();
                            f.where = location{ef.where.file, ef.where.line};
                            f.doc = ef.notes.doc;
                            f.comment = ef.notes.comment;

                            if (!names.insert(ef.name).second) {
                                error(diag_codes::E_DUPLICATE_FIELD,
                                      "field '" + ef.name + "' is declared twice in '" + msg.qfn + "'", f.where);
                                continue;
                            }

                            auto type = bind_type(ef.type, f.where);
                            if (!type) {
                                msg.fields.push_back(std::move(f));
                                continue;
                            }
                            f.type = std::move(*type);
                            f.type_ref = type_ref_of(f.type);
                            if (ef.default_value_raw) {
                                f.default_val = reduce_default(*ef.default_value_raw, f);
                            }
                            msg.fields.push_back(std::move(f));
                        }
                    }
                }

                std::optional<field_type> bind_type(const early::raw_type& type, const location& where) {
                    return std::visit([this, &where](const auto& node) -> std::optional<field_type> {
                        using T = std::decay_t<decltype(node)>;
                        if constexpr (std::is_same_v<T, early::primitive_type>) {
                            field_type out;
                            out.kind = primitive_kind_of(node.kind);
                            return out;
                        } else if constexpr (std::is_same_v<T, early::ref_type>) {
                            return bind_reference(node, where);
                        } else if constexpr (std::is_same_v<T, early::inline_enum_type>) {
                            error(diag_codes::E_UNPROMOTED_INLINE,
                                  std::string("inline ") + (node.is_options ? "options" : "enum") +
                                  " body was not promoted to a named type", where);
                            return std::nullopt;
                        } else if constexpr (std::is_same_v<T, early::compound_type>) {
                            return bind_compound(node, where);
                        } else if constexpr (std::is_same_v<T, early::array_type>) {
                            auto element = bind_type(*node.element, where);
                            if (!element) {
                                return std::nullopt;
                            }
                            field_type out;
                            out.kind = type_kind::array;
                            out.args.push_back(std::move(*element));
                            return out;
                        } else {
                            auto key = bind_type(*node.key, where);
                            auto value = bind_type(*node.value, where);
                            if (!key || !value) {
                                return std::nullopt;
                            }
                            field_type out;
                            out.kind = type_kind::map;
                            out.args.push_back(std::move(*key));
                            out.args.push_back(std::move(*value));
                            return out;
                        }
                    }, type.node);
                }

                std::optional<field_type> bind_reference(const early::ref_type& node, const location& where) {
                    const auto* ref = node.resolved ? model_.find(node.type_name) : nullptr;
                    if (!ref) {
                        unresolved("type reference", node.type_name, where);
                        return std::nullopt;
                    }
                    field_type out;
                    switch (ref->kind) {
                        case entity_kind::message:
                            out.kind = type_kind::message_ref;
                            out.ref = *ref;
                            break;
                        case entity_kind::enum_:
                            out.kind = model_.enums[ref->index].is_options ? type_kind::options_ref : type_kind::enum_ref;
                            out.ref = *ref;
                            break;
                        case entity_kind::compound: {
                            const auto& c = model_.compounds[ref->index];
                            out.kind = type_kind::compound;
                            out.compound_base = c.base;
                            out.components = c.components;
                            break;
                        }
                    }
                    return out;
                }

                std::optional<field_type> bind_compound(const early::compound_type& node, const location& where) {
                    field_type out;
                    out.kind = type_kind::compound;
                    out.components = node.components;
                    if (auto kind = primitive_kind_of(node.base_type_raw)) {
                        out.compound_base = *kind;
                        return out;
                    }
                    const auto* ref = node.base_resolved ? model_.find(node.base_type_raw) : nullptr;
                    if (!ref) {
                        unresolved("compound base type", node.base_type_raw, where);
                        return std::nullopt;
                    }
                    if (ref->kind != entity_kind::compound) {
                        error(diag_codes::E_KIND_MISMATCH,
                              "compound base '" + node.base_type_raw + "' is neither a primitive nor a compound",
                              where);
                        return std::nullopt;
                    }
                    out.compound_base = model_.compounds[ref->index].base;
                    return out;
                }

                static std::optional<entity_ref> type_ref_of(const field_type& type) {
                    if (type.ref) {
                        return type.ref;
                    }
                    if (type.kind == type_kind::array) {
                        return type_ref_of(type.args.front());
                    }
                    if (type.kind == type_kind::map) {
                        if (auto value = type_ref_of(type.args[1])) {
                            return value;
                        }
                        return type_ref_of(type.args[0]);
                    }
                    return std::nullopt;
                }

                // -- defaults -------------------------------------------------------

                std::optional<default_value> reduce_default(const std::string& raw, const field& f) {
                    auto invalid = [&](const std::string& why) -> std::optional<default_value> {
                        error(diag_codes::E_INVALID_DEFAULT,
                              "invalid default '" + raw + "' for " + type_kind_name(f.type.kind) + " field '" +
                              f.name + "': " + why, f.where);
                        return std::nullopt;
                    };
                    const std::string text = trim(raw);

                    switch (f.type.kind) {
                        case type_kind::string_:
                            if (auto s = parse_string_literal(text)) {
                                return default_value{std::move(*s)};
                            }
                            return invalid("expected a string literal");
                        case type_kind::int_:
                        case type_kind::byte_:
                            if (auto v = parse_integer(text)) {
                                if (f.type.kind == type_kind::byte_ && (*v < 0 || *v > 255)) {
                                    return invalid("byte value out of range");
                                }
                                return default_value{*v};
                            }
                            return invalid("expected an integer");
                        case type_kind::float_:
                            if (auto v = parse_float(text)) {
                                return default_value{*v};
                            }
                            return invalid("expected a number");
                        case type_kind::bool_:
                            if (text == "true" || text == "false") {
                                return default_value{text == "true"};
                            }
                            return invalid("expected true or false");
                        case type_kind::enum_ref: {
                            const auto& e = model_.enums[f.type.ref->index];
                            const std::string name = last_segment(transform::canonical_name(text));
                            if (const auto* v = e.find_value(name)) {
                                return default_value{enum_default{v->name, v->value}};
                            }
                            return invalid("'" + name + "' is not a value of '" + e.qfn + "'");
                        }
                        case type_kind::options_ref:
                            return reduce_options_default(text, f, invalid);
                        default:
                            return default_value{raw_default{text}};
                    }
                }

                template<typename Invalid>
                std::optional<default_value> reduce_options_default(const std::string& text, const field& f,
                                                                    Invalid& invalid) {
                    const auto& e = model_.enums[f.type.ref->index];
                    options_default out{0, {}};
                    std::size_t start = 0;
                    while (start <= text.size()) {
                        auto bar = text.find('|', start);
                        if (bar == std::string::npos) {
                            bar = text.size();
                        }
                        const std::string part = trim(text.substr(start, bar - start));
                        start = bar + 1;

                        if (auto v = parse_integer(part)) {
                            out.mask |= *v;
                            continue;
                        }
                        const std::string name = last_segment(transform::canonical_name(part));
                        const auto* v = e.find_value(name);
                        if (!v) {
                            return invalid("'" + part + "' is not a flag of '" + e.qfn + "'");
                        }
                        out.mask |= v->value;
                        out.names.push_back(v->name);
                    }
                    return default_value{std::move(out)};
                }

                const std::vector<const early::early_model*>& files_;
                model model_;
                std::vector<diagnostic> diagnostics_;
                std::map<std::string, location> namespace_sites_;
                std::vector<pending_message> pending_messages_;
                std::vector<pending_enum> pending_enums_;
                std::vector<pending_compound> pending_compounds_;
                std::vector<bool> enum_cycles_;
                std::vector<bool> merged_;
        };
    }

    build_result build_model(const std::vector<const early::early_model*>& files) {
        model_builder builder(files);
        return builder.build();
    }
}
