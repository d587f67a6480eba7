//
// Parser tests: declarations
//

#include <doctest/doctest.h>
#include <msgdef/parser.hh>

using namespace msgdef;
using namespace msgdef::ast;

TEST_SUITE("Parser - Declarations") {
    TEST_CASE("Empty input") {
        auto mod = parse_msgdef(std::string(""));

        CHECK(mod.messages.empty());
        CHECK(mod.namespaces.empty());
        CHECK(mod.imports.empty());
    }

    TEST_CASE("Message with fields") {
        auto mod = parse_msgdef(std::string(R"(
            message Person {
                name: string;
                age: int
                score: float;
            }
        )"));

        REQUIRE(mod.messages.size() == 1);
        const auto& msg = mod.messages[0];
        CHECK(msg.name == "Person");
        CHECK_FALSE(msg.parent.has_value());
        REQUIRE(msg.fields.size() == 3);
        CHECK(msg.fields[0].name == "name");
        CHECK(msg.fields[1].name == "age");
        CHECK(msg.fields[2].name == "score");

        const auto* prim = std::get_if<primitive_type>(&msg.fields[1].field_type.node);
        REQUIRE(prim != nullptr);
        CHECK(prim->kind == primitive_kind::int_);
    }

    TEST_CASE("Message with parent") {
        auto mod = parse_msgdef(std::string(R"(
            message Base { id: int }
            message Derived : Base { extra: string }
        )"));

        REQUIRE(mod.messages.size() == 2);
        REQUIRE(mod.messages[1].parent.has_value());
        CHECK(mod.messages[1].parent->text == "Base");
    }

    TEST_CASE("Field modifiers and defaults") {
        auto mod = parse_msgdef(std::string(R"(
            message Config {
                optional timeout: int = 30;
                optional label: string = "none"
                mode: Mode = Mode::Fast
                flags: Flags = Read | Write;
            }
        )"));

        REQUIRE(mod.messages.size() == 1);
        const auto& fields = mod.messages[0].fields;
        REQUIRE(fields.size() == 4);

        REQUIRE(fields[0].modifiers.size() == 1);
        CHECK(fields[0].modifiers[0] == "optional");
        REQUIRE(fields[0].default_value.has_value());
        CHECK(*fields[0].default_value == "30");

        CHECK(*fields[1].default_value == "\"none\"");
        CHECK(*fields[2].default_value == "Mode::Fast");
        CHECK(*fields[3].default_value == "Read | Write");
        CHECK(fields[3].modifiers.empty());
    }

    TEST_CASE("Enums with explicit and implicit values") {
        auto mod = parse_msgdef(std::string(R"(
            enum Color { Red, Green = 5, Blue }
            open_enum Code : Color { Other = 100; }
        )"));

        REQUIRE(mod.enums.size() == 2);
        const auto& color = mod.enums[0];
        CHECK(color.name == "Color");
        CHECK_FALSE(color.is_open);
        REQUIRE(color.values.size() == 3);
        CHECK_FALSE(color.values[0].value.has_value());
        REQUIRE(color.values[1].value.has_value());
        CHECK(*color.values[1].value == 5);

        const auto& code = mod.enums[1];
        CHECK(code.is_open);
        REQUIRE(code.parent.has_value());
        CHECK(code.parent->text == "Color");
        REQUIRE(code.values.size() == 1);
        CHECK(*code.values[0].value == 100);
    }

    TEST_CASE("Enum values accept hex, negative and missing separators") {
        auto mod = parse_msgdef(std::string(R"(
            enum E {
                A = 0x10
                B = -1
                C
            }
        )"));

        REQUIRE(mod.enums.size() == 1);
        REQUIRE(mod.enums[0].values.size() == 3);
        CHECK(*mod.enums[0].values[0].value == 16);
        CHECK(*mod.enums[0].values[1].value == -1);
    }

    TEST_CASE("Keywords as value and field names") {
        auto mod = parse_msgdef(std::string(R"(
            enum DataType { string, int = 4, float; bool byte Map }
            options Part { message, options, enum }
            message Column {
                string: DataType = DataType::string
                optional int: int = 7
                Map: Map<string, int>
                kind: DataType = float
            }
        )"));

        REQUIRE(mod.enums.size() == 1);
        const auto& values = mod.enums[0].values;
        REQUIRE(values.size() == 6);
        CHECK(values[0].name == "string");
        CHECK(values[1].name == "int");
        CHECK(*values[1].value == 4);
        CHECK(values[5].name == "Map");

        REQUIRE(mod.options.size() == 1);
        CHECK(mod.options[0].values[1].name == "options");

        REQUIRE(mod.messages.size() == 1);
        const auto& fields = mod.messages[0].fields;
        REQUIRE(fields.size() == 4);
        CHECK(fields[0].name == "string");
        CHECK(*fields[0].default_value == "DataType::string");
        CHECK(fields[1].name == "int");
        CHECK(fields[1].modifiers == std::vector<std::string>{"optional"});
        CHECK(fields[2].name == "Map");
        CHECK(*fields[3].default_value == "float");
    }

    TEST_CASE("Options declaration") {
        auto mod = parse_msgdef(std::string(R"(
            options Access { Read, Write, Execute = 8, }
        )"));

        REQUIRE(mod.options.size() == 1);
        CHECK(mod.options[0].name == "Access");
        REQUIRE(mod.options[0].values.size() == 3);
        CHECK(mod.options[0].values[2].name == "Execute");
    }

    TEST_CASE("Standalone compound declaration") {
        auto mod = parse_msgdef(std::string(R"(
            float Position { x, y, z }
        )"));

        REQUIRE(mod.compounds.size() == 1);
        CHECK(mod.compounds[0].name == "Position");
        CHECK(mod.compounds[0].base == "float");
        CHECK(mod.compounds[0].components == std::vector<std::string>{"x", "y", "z"});
    }

    TEST_CASE("Nested namespaces") {
        auto mod = parse_msgdef(std::string(R"(
            namespace Outer {
                message A {}
                namespace Inner {
                    enum E { X }
                }
            }
        )"));

        REQUIRE(mod.namespaces.size() == 1);
        const auto& outer = mod.namespaces[0];
        CHECK(outer.name == "Outer");
        CHECK(outer.messages.size() == 1);
        REQUIRE(outer.namespaces.size() == 1);
        CHECK(outer.namespaces[0].name == "Inner");
        CHECK(outer.namespaces[0].enums.size() == 1);
    }

    TEST_CASE("Imports with and without alias") {
        auto mod = parse_msgdef(std::string(R"(
            import "common/types.def"
            import "other.def" as O
            message M { t: O::Thing }
        )"));

        REQUIRE(mod.imports.size() == 2);
        CHECK(mod.imports[0].path == "common/types.def");
        CHECK_FALSE(mod.imports[0].alias.has_value());
        CHECK(mod.imports[1].path == "other.def");
        REQUIRE(mod.imports[1].alias.has_value());
        CHECK(*mod.imports[1].alias == "O");
    }

    TEST_CASE("Source lines are recorded") {
        auto mod = parse_msgdef(std::string("message A {\n  x: int\n  y: int\n}\n"), "lines.def");

        REQUIRE(mod.messages.size() == 1);
        CHECK(mod.messages[0].pos.file == "lines.def");
        CHECK(mod.messages[0].pos.line == 1);
        CHECK(mod.messages[0].fields[0].pos.line == 2);
        CHECK(mod.messages[0].fields[1].pos.line == 3);
    }
}

TEST_SUITE("Parser - Errors") {
    TEST_CASE("Missing closing brace") {
        CHECK_THROWS_AS(parse_msgdef(std::string("message A { x: int")), parse_error);
    }

    TEST_CASE("Error carries file and line") {
        try {
            parse_msgdef(std::string("message A {\n  x = 1\n}\n"), "broken.def");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.file() == "broken.def");
            CHECK(e.line() == 2);
            CHECK(std::string(e.what()).find("broken.def") != std::string::npos);
        }
    }

    TEST_CASE("Unexpected character") {
        CHECK_THROWS_AS(parse_msgdef(std::string("message A { x: int @ }")), parse_error);
    }

    TEST_CASE("Unterminated block comment") {
        CHECK_THROWS_AS(parse_msgdef(std::string("/* never closed\nmessage A {}")), parse_error);
    }

    TEST_CASE("Reading a missing file fails") {
        CHECK_THROWS(parse_msgdef_file("/nonexistent/path/none.def"));
    }
}
