//
// Early model construction: numbering, provenance, comments, raw types
//

#include <doctest/doctest.h>
#include "../test_helpers.hh"
#include <limits>
#include <stdexcept>

using namespace msgdef;
using namespace msgdef::early;
using namespace msgdef::testing;

TEST_SUITE("Early Model - Values") {
    TEST_CASE("Enum values continue from the previous one") {
        auto model = early_from("enum E { A, B, C = 10, D }");

        REQUIRE(model.enums.size() == 1);
        const auto& values = model.enums[0].values;
        REQUIRE(values.size() == 4);
        CHECK(values[0].value == 0);
        CHECK(values[1].value == 1);
        CHECK(values[2].value == 10);
        CHECK(values[3].value == 11);

        CHECK_FALSE(values[0].is_explicit);
        CHECK(values[2].is_explicit);
    }

    TEST_CASE("Negative and hexadecimal enum values") {
        auto model = early_from("enum E { Low = -2, Next, High = 0x10 }");

        const auto& values = model.enums[0].values;
        REQUIRE(values.size() == 3);
        CHECK(values[0].value == -2);
        CHECK(values[1].value == -1);
        CHECK(values[2].value == 16);
    }

    TEST_CASE("Largest enum value") {
        auto model = early_from("enum E { Low = 9223372036854775806, Max }  enum F { Top = 0x7FFFFFFFFFFFFFFF }");

        REQUIRE(model.enums.size() == 2);
        CHECK(model.enums[0].values[1].value == std::numeric_limits<std::int64_t>::max());
        CHECK(model.enums[1].values[0].value == std::numeric_limits<std::int64_t>::max());
    }

    TEST_CASE("No automatic value after the largest one") {
        CHECK_THROWS_WITH_AS(early_from("enum E {\n  Max = 0x7FFFFFFFFFFFFFFF,\n  Next\n}"),
                             "enum value 'Next' at line 3: follows 'Max' = 9223372036854775807 "
                             "and cannot be numbered automatically",
                             std::out_of_range);
    }

    TEST_CASE("Options get one bit per position") {
        auto model = early_from("options Access { Read, Write, Execute }");

        REQUIRE(model.options.size() == 1);
        const auto& opts = model.options[0];
        CHECK(opts.is_options);
        REQUIRE(opts.values.size() == 3);
        CHECK(opts.values[0].value == 1);
        CHECK(opts.values[1].value == 2);
        CHECK(opts.values[2].value == 4);
    }

    TEST_CASE("Explicit option values do not shift later positions") {
        auto model = early_from("options Mode { A = 8, B, C }");

        const auto& values = model.options[0].values;
        REQUIRE(values.size() == 3);
        CHECK(values[0].value == 8);
        CHECK(values[1].value == 2);
        CHECK(values[2].value == 4);
    }

    TEST_CASE("Inline bodies are numbered like declarations") {
        auto model = early_from(R"(
            message M {
                state: enum { Idle, Busy = 5, Done }
                flags: options { A, B }
            }
        )");

        REQUIRE(model.messages.size() == 1);
        const auto& fields = model.messages[0].fields;

        const auto* state = std::get_if<inline_enum_type>(&fields[0].type.node);
        REQUIRE(state != nullptr);
        CHECK_FALSE(state->is_options);
        REQUIRE(state->values.size() == 3);
        CHECK(state->values[2].value == 6);

        const auto* flags = std::get_if<inline_enum_type>(&fields[1].type.node);
        REQUIRE(flags != nullptr);
        CHECK(flags->is_options);
        CHECK(flags->values[1].value == 2);
    }

    TEST_CASE("Open enums and enum parents") {
        auto model = early_from(R"(
            enum Color { Red, Green }
            open_enum Code : Color { Other = 100 }
        )");

        REQUIRE(model.enums.size() == 2);
        CHECK_FALSE(model.enums[0].is_open);
        CHECK(model.enums[1].is_open);
        REQUIRE(model.enums[1].parent_raw.has_value());
        CHECK(*model.enums[1].parent_raw == "Color");
    }
}

TEST_SUITE("Early Model - Structure") {
    TEST_CASE("Top-level items stay loose") {
        auto model = early_from(R"(
            message A {}
            enum B { X }
            options C { Y }
            float D { x, y }
        )", "schemas/shapes.def");

        CHECK(model.file == "schemas/shapes.def");
        CHECK(model.file_namespace == "shapes");
        CHECK(model.namespaces.empty());
        CHECK(model.roots.empty());
        CHECK(model.messages.size() == 1);
        CHECK(model.enums.size() == 1);
        CHECK(model.options.size() == 1);
        REQUIRE(model.compounds.size() == 1);
        CHECK(model.compounds[0].base_type_raw == "float");
        CHECK(model.compounds[0].components == std::vector<std::string>{"x", "y"});
        CHECK_FALSE(model.file_level_namespace().has_value());
    }

    TEST_CASE("Namespaces form an arena") {
        auto model = early_from(R"(
            namespace outer {
                message A {}
                namespace inner {
                    message B {}
                }
            }
            namespace other {}
        )");

        REQUIRE(model.namespaces.size() == 3);
        REQUIRE(model.roots.size() == 2);

        const auto& outer = model.namespaces[model.roots[0]];
        CHECK(outer.name == "outer");
        CHECK_FALSE(outer.parent.has_value());
        REQUIRE(outer.children.size() == 1);
        CHECK(outer.messages.size() == 1);

        const auto& inner = model.namespaces[outer.children[0]];
        CHECK(inner.name == "inner");
        REQUIRE(inner.parent.has_value());
        CHECK(*inner.parent == model.roots[0]);
        REQUIRE(inner.messages.size() == 1);
        CHECK(inner.messages[0].name == "B");

        CHECK(model.namespaces[model.roots[1]].name == "other");
    }

    TEST_CASE("File-level namespace is recognized") {
        auto model = early_from("namespace file { message A {} }");
        auto idx = model.file_level_namespace();
        REQUIRE(idx.has_value());
        CHECK(model.namespaces[*idx].name == "file");
    }

    TEST_CASE("Provenance") {
        auto model = early_from("namespace a {\n"
                                "  namespace b {\n"
                                "    message M {\n"
                                "      x: int\n"
                                "    }\n"
                                "  }\n"
                                "}\n", "dir/prov.def");

        const auto* m = find_message(model, "M");
        REQUIRE(m != nullptr);
        CHECK(m->where.file == "dir/prov.def");
        CHECK(m->where.line == 3);
        CHECK(m->where.ns == "a::b");

        REQUIRE(m->fields.size() == 1);
        CHECK(m->fields[0].where.line == 4);
        CHECK(m->fields[0].where.ns == "a::b");

        CHECK(model.namespaces[model.roots[0]].where.ns.empty());
    }

    TEST_CASE("Types are kept as written") {
        auto model = early_from(R"(
            message M {
                a: legacy.Thing
                b: Item[]
                c: Map<string, Value>
                d: float { x, y }
            }
        )");

        const auto& fields = model.messages[0].fields;
        REQUIRE(fields.size() == 4);
        CHECK(ref_name(fields[0].type) == "legacy.Thing");
        CHECK(ref_name(fields[1].type) == "Item");
        CHECK(ref_name(fields[2].type) == "Value");

        const auto* map = std::get_if<map_type>(&fields[2].type.node);
        REQUIRE(map != nullptr);
        const auto* key = std::get_if<early::primitive_type>(&map->key->node);
        REQUIRE(key != nullptr);
        CHECK(key->kind == ast::primitive_kind::string_);

        const auto* comp = std::get_if<compound_type>(&fields[3].type.node);
        REQUIRE(comp != nullptr);
        CHECK(comp->base_type_raw == "float");
        CHECK(comp->components.size() == 2);
    }

    TEST_CASE("Defaults and modifiers are verbatim") {
        auto model = early_from(R"(
            message M {
                optional a: int = 0x1F
                b: Flags = Read | Write
                c: string = "hi"
                d: int
            }
        )");

        const auto& fields = model.messages[0].fields;
        REQUIRE(fields.size() == 4);
        CHECK(fields[0].modifiers == std::vector<std::string>{"optional"});
        CHECK(*fields[0].default_value_raw == "0x1F");
        CHECK(*fields[1].default_value_raw == "Read | Write");
        CHECK(*fields[2].default_value_raw == "\"hi\"");
        CHECK_FALSE(fields[3].default_value_raw.has_value());
    }

    TEST_CASE("Imports") {
        auto model = early_from("import \"a/b.def\"\n"
                                "import \"c.def\" as C\n"
                                "message M {}\n");

        REQUIRE(model.imports.size() == 2);
        CHECK(model.imports[0].path == "a/b.def");
        CHECK_FALSE(model.imports[0].alias.has_value());
        CHECK(model.imports[0].line == 1);
        CHECK(model.imports[0].resolved_path.empty());
        CHECK(*model.imports[1].alias == "C");
        CHECK(model.imports[1].line == 2);

        CHECK(model.is_aliased_import("C"));
        CHECK_FALSE(model.is_aliased_import("a/b.def"));
        CHECK(model.imported.empty());
    }
}

TEST_SUITE("Early Model - Comments") {
    TEST_CASE("Leading doc and trailing comments") {
        auto model = early_from("/// Person record\n"
                                "message Person {\n"
                                "    /// Full name\n"
                                "    name: string // shown in lists\n"
                                "    age: int\n"
                                "}\n");

        const auto* person = find_message(model, "Person");
        REQUIRE(person != nullptr);
        CHECK(person->notes.doc == "Person record");
        CHECK(person->notes.comment == "Person record");

        const auto* name = find_field(*person, "name");
        REQUIRE(name != nullptr);
        CHECK(name->notes.doc == "Full name");
        CHECK(name->notes.comment == "Full name\nshown in lists");

        const auto* age = find_field(*person, "age");
        REQUIRE(age != nullptr);
        CHECK(age->notes.doc.empty());
        CHECK(age->notes.comment.empty());
    }

    TEST_CASE("Consecutive doc lines are joined") {
        auto model = early_from("/// First line\n"
                                "/// Second line\n"
                                "enum E { A }\n");

        CHECK(model.enums[0].notes.doc == "First line\nSecond line");
    }

    TEST_CASE("Local comments are not documentation") {
        auto model = early_from("// internal note\n"
                                "message M {}\n");

        CHECK(model.messages[0].notes.doc.empty());
        CHECK(model.messages[0].notes.comment == "internal note");
    }

    TEST_CASE("A blank line detaches a comment") {
        auto model = early_from("/// Orphan\n"
                                "\n"
                                "message M {}\n");

        CHECK(model.messages[0].notes.doc.empty());
        CHECK(model.messages[0].notes.comment.empty());
    }

    TEST_CASE("Trailing doc comment becomes the doc") {
        auto model = early_from("enum E {\n"
                                "    A /// first\n"
                                "    B\n"
                                "}\n");

        const auto& values = model.enums[0].values;
        REQUIRE(values.size() == 2);
        CHECK(values[0].notes.doc == "first");
        CHECK(values[1].notes.doc.empty());
    }

    TEST_CASE("Each comment attaches once") {
        auto model = early_from("message M { /// on the message line\n"
                                "    x: int\n"
                                "}\n");

        const auto& m = model.messages[0];
        CHECK(m.notes.doc == "on the message line");
        CHECK(m.fields[0].notes.comment.empty());
    }
}
