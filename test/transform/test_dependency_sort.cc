//
// DependencySort and AttachImportedModels
//

#include <doctest/doctest.h>
#include <msgdef/parser_error.hh>
#include "../test_helpers.hh"
#include <algorithm>

using namespace msgdef;
using namespace msgdef::testing;

namespace {
    std::ptrdiff_t position_of(const std::vector<std::string>& order, const std::string& file) {
        return std::distance(order.begin(), std::find(order.begin(), order.end(), file));
    }
}

TEST_SUITE("Transform - Dependency Sort") {
    TEST_CASE("Importer comes after the imported file") {
        transform::import_graph graph{
            {"A", {"B"}},
            {"B", {}}
        };

        auto order = transform::dependency_sort(graph);
        CHECK(order == std::vector<std::string>{"B", "A"});
    }

    TEST_CASE("Diamond") {
        transform::import_graph graph{
            {"main", {"left", "right"}},
            {"left", {"base"}},
            {"right", {"base"}},
            {"base", {}}
        };

        auto order = transform::dependency_sort(graph);
        REQUIRE(order.size() == 4);
        CHECK(order.front() == "base");
        CHECK(order.back() == "main");
        CHECK(position_of(order, "left") < position_of(order, "main"));
        CHECK(position_of(order, "right") < position_of(order, "main"));
    }

    TEST_CASE("Files without imports keep a stable order") {
        transform::import_graph graph{
            {"c", {}},
            {"a", {}},
            {"b", {}}
        };

        CHECK(transform::dependency_sort(graph) == std::vector<std::string>{"a", "b", "c"});
    }

    TEST_CASE("Cycle names every file on it") {
        transform::import_graph graph{
            {"A", {"B"}},
            {"B", {"A"}}
        };

        try {
            auto order = transform::dependency_sort(graph);
            FAIL("Expected circular_import_error");
        } catch (const circular_import_error& e) {
            CHECK(e.files() == std::vector<std::string>{"A", "B", "A"});

            std::string msg = e.what();
            CHECK(msg.find("A") != std::string::npos);
            CHECK(msg.find("B") != std::string::npos);
        }
    }

    TEST_CASE("Self import is a cycle") {
        transform::import_graph graph{{"A", {"A"}}};
        CHECK_THROWS_AS(transform::dependency_sort(graph), circular_import_error);
    }

    TEST_CASE("Longer cycle behind an acyclic prefix") {
        transform::import_graph graph{
            {"a", {"b"}},
            {"b", {"c"}},
            {"c", {"d"}},
            {"d", {"b"}}
        };

        try {
            auto order = transform::dependency_sort(graph);
            FAIL("Expected circular_import_error");
        } catch (const circular_import_error& e) {
            CHECK(e.files() == std::vector<std::string>{"b", "c", "d", "b"});
        }
    }

    TEST_CASE("Registry graph uses resolved paths") {
        model_registry registry;
        auto a = std::make_unique<early::early_model>(early_from("import \"b.def\"\nmessage A {}", "/s/a.def"));
        a->imports[0].resolved_path = "/s/b.def";
        registry.emplace("/s/a.def", std::move(a));
        registry.emplace("/s/b.def", std::make_unique<early::early_model>(early_from("message B {}", "/s/b.def")));

        auto order = transform::dependency_sort(registry);
        CHECK(order == std::vector<std::string>{"/s/b.def", "/s/a.def"});
    }
}

TEST_SUITE("Transform - Attach Imports") {
    TEST_CASE("Imported models are keyed by alias or path") {
        model_registry registry;
        registry.emplace("x.def", std::make_unique<early::early_model>(pipeline_from("message X {}", "x.def")));
        registry.emplace("y.def", std::make_unique<early::early_model>(pipeline_from("message Y {}", "y.def")));

        auto model = transform::attach_imported_models(
            early_from("import \"x.def\" as L\nimport \"y.def\"\nmessage M {}"), registry);

        REQUIRE(model.imported.size() == 2);
        CHECK(model.imported.at("L") == registry.at("x.def").get());
        CHECK(model.imported.at("y.def") == registry.at("y.def").get());
    }

    TEST_CASE("Missing registry entry") {
        model_registry registry;
        CHECK_THROWS_AS(transform::attach_imported_models(early_from("import \"x.def\"\nmessage M {}"), registry),
                        pipeline_error);
    }
}
