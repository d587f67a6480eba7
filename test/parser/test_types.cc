//
// Parser tests: field type syntax
//

#include <doctest/doctest.h>
#include <msgdef/parser.hh>

using namespace msgdef;
using namespace msgdef::ast;

namespace {
    const type& field_type_of(const module& mod, std::size_t index = 0) {
        return mod.messages.at(0).fields.at(index).field_type;
    }
}

TEST_SUITE("Parser - Types") {
    TEST_CASE("All primitive types") {
        auto mod = parse_msgdef(std::string(R"(
            message P { a: string b: int c: float d: bool e: byte }
        )"));

        const primitive_kind expected[] = {
            primitive_kind::string_, primitive_kind::int_, primitive_kind::float_,
            primitive_kind::bool_, primitive_kind::byte_
        };
        REQUIRE(mod.messages[0].fields.size() == 5);
        for (std::size_t i = 0; i < 5; ++i) {
            const auto* prim = std::get_if<primitive_type>(&field_type_of(mod, i).node);
            REQUIRE(prim != nullptr);
            CHECK(prim->kind == expected[i]);
        }
    }

    TEST_CASE("Qualified references keep their spelling") {
        auto mod = parse_msgdef(std::string(R"(
            message M {
                a: Foo
                b: ns::Bar
                c: legacy.Baz
            }
        )"));

        CHECK(std::get<qualified_name>(field_type_of(mod, 0).node).text == "Foo");
        CHECK(std::get<qualified_name>(field_type_of(mod, 1).node).text == "ns::Bar");
        CHECK(std::get<qualified_name>(field_type_of(mod, 2).node).text == "legacy.Baz");
    }

    TEST_CASE("Array of primitive and of reference") {
        auto mod = parse_msgdef(std::string(R"(
            message M { values: int[]; items: Item[] }
        )"));

        const auto* arr = std::get_if<array_type>(&field_type_of(mod, 0).node);
        REQUIRE(arr != nullptr);
        REQUIRE(arr->element != nullptr);
        CHECK(std::holds_alternative<primitive_type>(arr->element->node));

        const auto* items = std::get_if<array_type>(&field_type_of(mod, 1).node);
        REQUIRE(items != nullptr);
        CHECK(std::get<qualified_name>(items->element->node).text == "Item");
    }

    TEST_CASE("Nested arrays are rejected") {
        CHECK_THROWS_AS(parse_msgdef(std::string("message M { grid: int[][] }")), parse_error);
    }

    TEST_CASE("Map types") {
        auto mod = parse_msgdef(std::string(R"(
            message M {
                simple: Map<string, int>
                nested: Map<int, Map<string, Item[]>>
            }
        )"));

        const auto* simple = std::get_if<map_type>(&field_type_of(mod, 0).node);
        REQUIRE(simple != nullptr);
        CHECK(std::get<primitive_type>(simple->key->node).kind == primitive_kind::string_);
        CHECK(std::get<primitive_type>(simple->value->node).kind == primitive_kind::int_);

        const auto* nested = std::get_if<map_type>(&field_type_of(mod, 1).node);
        REQUIRE(nested != nullptr);
        const auto* inner = std::get_if<map_type>(&nested->value->node);
        REQUIRE(inner != nullptr);
        CHECK(std::holds_alternative<array_type>(inner->value->node));
    }

    TEST_CASE("Inline enum and options bodies") {
        auto mod = parse_msgdef(std::string(R"(
            message M {
                state: enum { Idle, Running = 3, Done }
                access: options { Read, Write }
            }
        )"));

        const auto* state = std::get_if<inline_enum_type>(&field_type_of(mod, 0).node);
        REQUIRE(state != nullptr);
        CHECK_FALSE(state->is_options);
        REQUIRE(state->values.size() == 3);
        CHECK(*state->values[1].value == 3);

        const auto* access = std::get_if<inline_enum_type>(&field_type_of(mod, 1).node);
        REQUIRE(access != nullptr);
        CHECK(access->is_options);
        CHECK(access->values.size() == 2);
    }

    TEST_CASE("Compound field types") {
        auto mod = parse_msgdef(std::string(R"(
            message M {
                position: float { x, y, z }
                color: byte { r, g, b, a, }
            }
        )"));

        const auto* pos = std::get_if<compound_type>(&field_type_of(mod, 0).node);
        REQUIRE(pos != nullptr);
        CHECK(pos->base == "float");
        CHECK(pos->components == std::vector<std::string>{"x", "y", "z"});

        const auto* color = std::get_if<compound_type>(&field_type_of(mod, 1).node);
        REQUIRE(color != nullptr);
        CHECK(color->base == "byte");
        CHECK(color->components.size() == 4);
    }
}
