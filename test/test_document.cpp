// test_document.cpp - Tests for the document graph and build_tree

#include <catch2/catch_all.hpp>
#include <semdiff/document.h>

#include <stdexcept>
#include <string>

using namespace semdiff;

TEST_CASE("Document node creation", "[document][basic]") {
    Document doc;
    REQUIRE(doc.empty());
    REQUIRE_FALSE(doc.root().has_value());

    auto n = doc.add_number(2.5);
    auto s = doc.add_string("hi");
    REQUIRE(doc.size() == 2);
    REQUIRE(doc.node(n).kind == ValueKind::Number);
    REQUIRE(doc.node(n).number == 2.5);
    REQUIRE(doc.node(s).text == "hi");

    SECTION("children only on containers") {
        REQUIRE_THROWS_AS(doc.append(n, s), std::invalid_argument);
        REQUIRE_THROWS_AS(doc.insert(s, "k", n), std::invalid_argument);
        auto arr = doc.add_array();
        REQUIRE_THROWS_AS(doc.insert(arr, "k", n), std::invalid_argument);
    }

    SECTION("unknown ids") {
        auto arr = doc.add_array();
        REQUIRE_THROWS_AS(doc.append(arr, 99), std::out_of_range);
        REQUIRE_THROWS_AS(doc.set_root(99), std::out_of_range);
        REQUIRE_THROWS_AS(doc.node(99), std::out_of_range);
    }
}

TEST_CASE("build_tree conversion", "[document][tree]") {
    SECTION("empty document is null") {
        Document doc;
        REQUIRE(build_tree(doc).is_null());
    }

    SECTION("scalars and containers") {
        Document doc;
        auto root = doc.add_object();
        auto list = doc.add_array();
        doc.append(list, doc.add_number(1));
        doc.append(list, doc.add_bool(true));
        doc.append(list, doc.add_null());
        doc.insert(root, "name", doc.add_string("Alice"));
        doc.insert(root, "list", list);
        doc.set_root(root);

        Value tree = build_tree(doc);
        auto expected = Value::object({
            {"name", "Alice"},
            {"list", Value::array({1, true, nullptr})},
        });
        REQUIRE(tree == expected);

        const auto& o = *tree.get_if<ValueObject>();
        REQUIRE(o.entry(0).key == "name");
        REQUIRE(o.entry(1).key == "list");
    }

    SECTION("duplicate keys keep the first position and the last value") {
        Document doc;
        auto root = doc.add_object();
        doc.insert(root, "a", doc.add_number(1));
        doc.insert(root, "b", doc.add_number(2));
        doc.insert(root, "a", doc.add_number(3));
        doc.set_root(root);

        Value tree = build_tree(doc);
        const auto& o = *tree.get_if<ValueObject>();
        REQUIRE(o.size() == 2);
        REQUIRE(o.entry(0).key == "a");
        REQUIRE(tree.at("a").as_number() == 3.0);
    }
}

TEST_CASE("build_tree aliases", "[document][alias]") {
    SECTION("aliased container is shared") {
        Document doc;
        auto root = doc.add_object();
        auto shared = doc.add_array();
        doc.append(shared, doc.add_string("x"));
        doc.insert(root, "first", shared);
        doc.insert(root, "second", shared);
        doc.set_root(root);

        Value tree = build_tree(doc);
        const auto& o = *tree.get_if<ValueObject>();
        REQUIRE(&o.find_box("first")->get() == &o.find_box("second")->get());
        REQUIRE(tree.at("second") == Value::array({"x"}));
    }

    SECTION("self reference is rejected") {
        Document doc;
        auto root = doc.add_object();
        auto inner = doc.add_object();
        doc.insert(root, "node", inner);
        doc.insert(inner, "self", inner);
        doc.set_root(root);

        try {
            (void)build_tree(doc);
            FAIL("expected CyclicReferenceError");
        } catch (const CyclicReferenceError& e) {
            REQUIRE(e.pointer() == "/node/self");
        }
    }

    SECTION("root cycle through an array") {
        Document doc;
        auto arr = doc.add_array();
        doc.append(arr, arr);
        doc.set_root(arr);
        REQUIRE_THROWS_AS(build_tree(doc), CyclicReferenceError);
    }
}

TEST_CASE("build_tree depth limit", "[document][depth]") {
    // {"a": {"b": {"c": 1}}}
    Document doc;
    auto root = doc.add_object();
    auto a = doc.add_object();
    auto b = doc.add_object();
    doc.insert(b, "c", doc.add_number(1));
    doc.insert(a, "b", b);
    doc.insert(root, "a", a);
    doc.set_root(root);

    SECTION("within the limit") {
        TreeBuildOptions options;
        options.max_depth = 3;
        REQUIRE(build_tree(doc, options).at("a").at("b").at("c").as_number() == 1.0);
    }

    SECTION("beyond the limit") {
        TreeBuildOptions options;
        options.max_depth = 2;
        REQUIRE_THROWS_AS(build_tree(doc, options), CyclicReferenceError);
    }
}
