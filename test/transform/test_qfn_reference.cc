//
// QfnReference: namespace QFNs and reference resolution
//

#include <doctest/doctest.h>
#include <msgdef/parser_error.hh>
#include "../test_helpers.hh"

using namespace msgdef;
using namespace msgdef::testing;

namespace {
    // Registry holding one finished imported file
    model_registry registry_with(const std::string& text, const std::string& file) {
        model_registry registry;
        registry.emplace(file, std::make_unique<early::early_model>(pipeline_from(text, file)));
        return registry;
    }

    const early::early_namespace* find_namespace(const early::early_model& model, const std::string& qfn) {
        for (const auto& ns : model.namespaces) {
            if (ns.qfn == qfn) {
                return &ns;
            }
        }
        return nullptr;
    }

    // Every reference name in a type tree, compound bases included
    void collect_references(const early::raw_type& type, std::vector<std::string>& out) {
        if (const auto* ref = std::get_if<early::ref_type>(&type.node)) {
            out.push_back(ref->type_name);
        } else if (const auto* comp = std::get_if<early::compound_type>(&type.node)) {
            if (!transform::is_primitive_name(comp->base_type_raw)) {
                out.push_back(comp->base_type_raw);
            }
        } else if (const auto* arr = std::get_if<early::array_type>(&type.node)) {
            collect_references(*arr->element, out);
        } else if (const auto* map = std::get_if<early::map_type>(&type.node)) {
            collect_references(*map->key, out);
            collect_references(*map->value, out);
        }
    }
}

TEST_SUITE("Transform - QFN Reference") {
    TEST_CASE("Namespaces get qualified names") {
        auto model = pipeline_from(R"(
            namespace N {
                namespace Inner {}
            }
            namespace O {}
        )");

        CHECK(find_namespace(model, "file") != nullptr);
        CHECK(find_namespace(model, "file::N") != nullptr);
        CHECK(find_namespace(model, "file::N::Inner") != nullptr);
        CHECK(find_namespace(model, "file::O") != nullptr);
    }

    TEST_CASE("Unqualified names search enclosing namespaces") {
        auto model = pipeline_from(R"(
            namespace N {
                message A {}
                namespace Inner {
                    message B : A {
                        x: A
                    }
                }
            }
        )");

        const auto* b = find_message(model, "B");
        REQUIRE(b != nullptr);
        CHECK(*b->parent_raw == "file::N::A");
        CHECK(ref_name(b->fields[0].type) == "file::N::A");
    }

    TEST_CASE("Innermost declaration wins") {
        auto model = pipeline_from(R"(
            message A {}
            namespace N {
                message A {}
                message B { x: A }
            }
            message C { y: A }
        )");

        CHECK(ref_name(find_message(model, "B")->fields[0].type) == "file::N::A");
        CHECK(ref_name(find_message(model, "C")->fields[0].type) == "file::A");
    }

    TEST_CASE("Declarations of the file-level namespace are visible everywhere") {
        auto model = pipeline_from(R"(
            message M {}
            namespace N {
                message Holder { items: M[] }
            }
        )");

        const auto* holder = find_message(model, "Holder");
        REQUIRE(holder != nullptr);
        CHECK(ref_name(holder->fields[0].type) == "file::M");
    }

    TEST_CASE("Qualified names are relative or absolute") {
        auto model = pipeline_from(R"(
            namespace N { message A {} }
            message B {
                rel: N::A
                abs: file::N::A
                dotted: N.A
            }
        )");

        const auto* b = find_message(model, "B");
        REQUIRE(b != nullptr);
        CHECK(ref_name(b->fields[0].type) == "file::N::A");
        CHECK(ref_name(b->fields[1].type) == "file::N::A");
        CHECK(ref_name(b->fields[2].type) == "file::N::A");
    }

    TEST_CASE("Enum parents, map keys and compound bases") {
        auto model = pipeline_from(R"(
            enum Base { A }
            enum Derived : Base { B }
            float Vec { x, y }
            message M {
                index: Map<Base, Vec { x, y }>
            }
        )");

        const auto& root = file_namespace(model);
        REQUIRE(root.enums.size() == 2);
        CHECK(*root.enums[1].parent_raw == "file::Base");

        const auto* map = std::get_if<early::map_type>(&root.messages[0].fields[0].type.node);
        REQUIRE(map != nullptr);
        CHECK(ref_name(*map->key) == "file::Base");
        const auto* comp = std::get_if<early::compound_type>(&map->value->node);
        REQUIRE(comp != nullptr);
        CHECK(comp->base_type_raw == "file::Vec");
    }

    TEST_CASE("Primitive compound bases are not references") {
        auto model = pipeline_from("message M { pos: float { x, y } }");

        const auto* comp = std::get_if<early::compound_type>(&file_namespace(model).messages[0].fields[0].type.node);
        REQUIRE(comp != nullptr);
        CHECK(comp->base_type_raw == "float");
    }

    TEST_CASE("Unresolvable names are left as written") {
        auto model = pipeline_from(R"(
            message M : Missing {
                a: Ghost
                b: Nowhere::Thing
            }
        )");

        const auto& m = file_namespace(model).messages[0];
        CHECK(*m.parent_raw == "Missing");
        CHECK(ref_name(m.fields[0].type) == "Ghost");
        CHECK(ref_name(m.fields[1].type) == "Nowhere::Thing");
    }

    TEST_CASE("Aliased import is reached through its alias only") {
        auto registry = registry_with("message AA {}", "x.def");
        auto model = transform::run_pipeline(early_from(R"(
            import "x.def" as L
            message M {
                a: L::AA
                b: AA
                c: L.AA
            }
        )"), registry);

        const auto& m = file_namespace(model).messages[0];
        CHECK(ref_name(m.fields[0].type) == "x::AA");
        CHECK(ref_name(m.fields[1].type) == "AA");
        CHECK(ref_name(m.fields[2].type) == "x::AA");
    }

    TEST_CASE("Resolved references are flagged") {
        auto registry = registry_with("message AA {}", "x.def");
        auto model = transform::run_pipeline(early_from(R"(
            import "x.def" as L
            message Base {}
            message M : Base {
                a: L::AA
                b: x::AA
                c: Ghost
                d: enum { On, Off }
            }
        )"), registry);

        const auto* m = find_message(model, "M");
        REQUIRE(m != nullptr);
        CHECK(m->parent_resolved);
        CHECK(std::get<early::ref_type>(m->fields[0].type.node).resolved);
        CHECK_FALSE(std::get<early::ref_type>(m->fields[1].type.node).resolved);
        CHECK_FALSE(std::get<early::ref_type>(m->fields[2].type.node).resolved);
        CHECK(std::get<early::ref_type>(m->fields[3].type.node).resolved);
    }

    TEST_CASE("Non-aliased import contributes its file-level names") {
        auto registry = registry_with("namespace Sub { message Deep {} } message AA {}", "x.def");
        auto model = transform::run_pipeline(early_from(R"(
            import "x.def"
            message M {
                a: AA
                b: x::AA
                c: Sub::Deep
                d: x::Sub::Deep
            }
        )"), registry);

        const auto& m = file_namespace(model).messages[0];
        CHECK(ref_name(m.fields[0].type) == "x::AA");
        CHECK(ref_name(m.fields[1].type) == "x::AA");
        CHECK(ref_name(m.fields[2].type) == "x::Sub::Deep");
        CHECK(ref_name(m.fields[3].type) == "x::Sub::Deep");
    }

    TEST_CASE("Local declarations shadow imported ones") {
        auto registry = registry_with("message AA {}", "x.def");
        auto model = transform::run_pipeline(early_from(R"(
            import "x.def"
            message AA {}
            message M { a: AA }
        )"), registry);

        CHECK(ref_name(find_message(model, "M")->fields[0].type) == "file::AA");
    }

    TEST_CASE("Running twice changes nothing") {
        auto once = pipeline_from(R"(
            namespace N { message A {} }
            message B : N::A { a: N::A  b: Ghost }
        )");
        auto twice = transform::qfn_reference(pipeline_from(R"(
            namespace N { message A {} }
            message B : N::A { a: N::A  b: Ghost }
        )"));

        const auto* b1 = find_message(once, "B");
        const auto* b2 = find_message(twice, "B");
        REQUIRE(b1 != nullptr);
        REQUIRE(b2 != nullptr);
        CHECK(*b1->parent_raw == *b2->parent_raw);
        CHECK(ref_name(b1->fields[0].type) == ref_name(b2->fields[0].type));
        CHECK(ref_name(b2->fields[1].type) == "Ghost");
    }

    TEST_CASE("Requires the file-level namespace") {
        // Loose items have not been wrapped yet
        CHECK_THROWS_AS(transform::qfn_reference(early_from("message M {}")), pipeline_error);

        // Root with another name
        CHECK_THROWS_AS(transform::qfn_reference(early_from("namespace other {}")), pipeline_error);
    }

    TEST_CASE("Every reference is qualified after the pipeline") {
        auto registry = registry_with("namespace Sub { message Deep {} } enum Shared { A }", "x.def");
        auto model = transform::run_pipeline(early_from(R"(
            import "x.def" as L
            float Vec { x, y }
            namespace outer {
                message Base {}
                namespace inner {
                    message Item : Base {
                        a: Base
                        b: Vec { u, v }
                        c: Item[]
                        d: Map<Base, L::Sub::Deep>
                        e: Map<string, enum { Low, High }>
                        f: options { R, W }[]
                        g: L::Shared
                        h: outer.Base
                    }
                }
            }
            message Top { all: outer::inner::Item[]  v: Vec }
        )"), registry);

        std::vector<std::string> names;
        std::size_t fields = 0;
        for (const auto& ns : model.namespaces) {
            for (const auto& m : ns.messages) {
                if (m.parent_raw) {
                    names.push_back(*m.parent_raw);
                }
                for (const auto& f : m.fields) {
                    collect_references(f.type, names);
                    ++fields;
                }
            }
        }

        CHECK(fields == 10);
        CHECK(names.size() == 12);
        for (const auto& name : names) {
            CAPTURE(name);
            CHECK(name.find("::") != std::string::npos);
            const bool local = name.rfind("file::", 0) == 0;
            const bool imported = name.rfind("x::", 0) == 0;
            CHECK((local || imported));
        }
    }
}
