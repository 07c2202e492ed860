// test_value.cpp - Tests for Value, builders and equivalence

#include <catch2/catch_all.hpp>
#include <semdiff/builders.h>
#include <semdiff/value.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace semdiff;

// ============================================================
// Construction and kinds
// ============================================================

TEST_CASE("Value construction", "[value][basic]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.kind() == ValueKind::Null);
    }

    SECTION("scalars") {
        REQUIRE(Value{true}.is_bool());
        REQUIRE(Value{42}.is_number());
        REQUIRE(Value{3.5}.is_number());
        REQUIRE(Value{"text"}.is_string());
        REQUIRE(Value{std::string{"text"}}.is_string());
        REQUIRE(Value{nullptr}.is_null());
    }

    SECTION("integers are stored as doubles") {
        Value v{30};
        REQUIRE(v.as_number() == 30.0);
        REQUIRE(Value{30} == Value{30.0});
        REQUIRE(Value{std::int64_t{7}} == Value{7u});
    }

    SECTION("containers") {
        auto arr = Value::array({1, "two", true});
        REQUIRE(arr.is_array());
        REQUIRE(arr.size() == 3);
        REQUIRE(arr.at(1).as_string() == "two");

        auto obj = Value::object({{"name", "Alice"}, {"age", 30}});
        REQUIRE(obj.is_object());
        REQUIRE(obj.is_container());
        REQUIRE(obj.size() == 2);
        REQUIRE(obj.at("age").as_number() == 30.0);
    }
}

TEST_CASE("Value kind names", "[value][basic]") {
    REQUIRE(kind_name(ValueKind::Null) == std::string_view{"null"});
    REQUIRE(kind_name(ValueKind::Object) == std::string_view{"object"});
}

TEST_CASE("Value access misses", "[value][access]") {
    auto obj = Value::object({{"a", 1}});

    SECTION("missing key yields null") {
        REQUIRE(obj.at("missing").is_null());
        REQUIRE_FALSE(obj.contains("missing"));
    }

    SECTION("index on an object yields null") {
        REQUIRE(obj.at(0).is_null());
    }

    SECTION("typed accessors fall back to defaults") {
        REQUIRE(obj.at("a").as_string("none") == "none");
        REQUIRE(Value{"x"}.as_number(-1.0) == -1.0);
        REQUIRE_FALSE(Value{1}.as_bool());
        REQUIRE(Value{1}.as_string_view().empty());
    }
}

// ============================================================
// Objects
// ============================================================

TEST_CASE("Object keeps insertion order", "[value][object]") {
    auto obj = Value::object({{"zeta", 1}, {"alpha", 2}, {"mid", 3}});
    const auto& o = *obj.get_if<ValueObject>();

    std::vector<std::string> keys;
    for (const auto& entry : o) {
        keys.push_back(entry.key);
    }
    REQUIRE(keys == std::vector<std::string>{"zeta", "alpha", "mid"});

    SECTION("replacing a key keeps its position") {
        auto updated = o.set("zeta", ValueBox{Value{10}});
        REQUIRE(updated.size() == 3);
        REQUIRE(updated.entry(0).key == "zeta");
        REQUIRE(updated.find("zeta")->as_number() == 10.0);
        // Original untouched
        REQUIRE(o.find("zeta")->as_number() == 1.0);
    }

    SECTION("new keys go last") {
        auto updated = o.set("new", ValueBox{Value{4}});
        REQUIRE(updated.entry(3).key == "new");
        REQUIRE(updated.find_box("new") != nullptr);
        REQUIRE(updated.find_box("absent") == nullptr);
    }
}

TEST_CASE("ObjectBuilder", "[value][builder]") {
    SECTION("builds in order") {
        Value v = ObjectBuilder()
            .set("width", 1920)
            .set("height", 1080)
            .set("title", "main")
            .finish();

        const auto& o = *v.get_if<ValueObject>();
        REQUIRE(o.size() == 3);
        REQUIRE(o.entry(0).key == "width");
        REQUIRE(o.entry(2).key == "title");
        REQUIRE(v.at("title").as_string() == "main");
    }

    SECTION("duplicate key: first position, last value") {
        ObjectBuilder builder;
        builder.set("a", 1).set("b", 2).set("a", 3);
        REQUIRE(builder.size() == 2);
        REQUIRE(builder.contains("a"));

        Value v = builder.finish();
        const auto& o = *v.get_if<ValueObject>();
        REQUIRE(o.entry(0).key == "a");
        REQUIRE(o.entry(0).value->as_number() == 3.0);
    }

    SECTION("set_box shares the sub-tree") {
        ValueBox shared{Value::array({1, 2})};
        Value v = ObjectBuilder().set_box("x", shared).set_box("y", shared).finish();
        const auto& o = *v.get_if<ValueObject>();
        REQUIRE(&o.find_box("x")->get() == &o.find_box("y")->get());
    }
}

TEST_CASE("ArrayBuilder", "[value][builder]") {
    Value v = ArrayBuilder()
        .push_back(1)
        .push_back("two")
        .push_back(Value::object({{"k", nullptr}}))
        .finish();

    REQUIRE(v.size() == 3);
    REQUIRE(v.at(0).as_number() == 1.0);
    REQUIRE(v.at(2).at("k").is_null());
    REQUIRE(v.at(3).is_null());
}

// ============================================================
// Equality and equivalence
// ============================================================

TEST_CASE("Value equality", "[value][equality]") {
    SECTION("object equality ignores key order") {
        auto a = Value::object({{"x", 1}, {"y", 2}});
        auto b = Value::object({{"y", 2}, {"x", 1}});
        REQUIRE(a == b);
    }

    SECTION("array equality is ordered") {
        REQUIRE_FALSE(Value::array({1, 2}) == Value::array({2, 1}));
        REQUIRE(Value::array({1, 2}) == Value::array({1, 2}));
    }

    SECTION("kinds never match across") {
        REQUIRE_FALSE(Value{1} == Value{"1"});
        REQUIRE_FALSE(Value{false} == Value{0});
        REQUIRE_FALSE(Value{} == Value{false});
        REQUIRE_FALSE(Value::array({}) == Value::object({}));
    }

    SECTION("NaN equals itself") {
        Value nan{std::numeric_limits<double>::quiet_NaN()};
        REQUIRE(nan == nan);
        REQUIRE(nan == Value{std::numeric_limits<double>::quiet_NaN()});
    }

    SECTION("zero and negative zero differ") {
        REQUIRE_FALSE(Value{0.0} == Value{-0.0});
    }
}

TEST_CASE("Equivalence options", "[value][equality]") {
    SECTION("ignore_whitespace") {
        Equivalence eq;
        eq.ignore_whitespace = true;
        REQUIRE(equivalent(Value{"  hello \t world\n"}, Value{"hello world"}, eq));
        REQUIRE_FALSE(equivalent(Value{"helloworld"}, Value{"hello world"}, eq));
        REQUIRE_FALSE(equivalent(Value{"a  b"}, Value{"a b"}));
    }

    SECTION("null_as_missing") {
        Equivalence eq;
        eq.null_as_missing = true;
        auto a = Value::object({{"a", 1}});
        auto b = Value::object({{"a", 1}, {"b", nullptr}});
        REQUIRE(equivalent(a, b, eq));
        REQUIRE(equivalent(b, a, eq));
        REQUIRE_FALSE(equivalent(a, b));
    }

    SECTION("nested") {
        Equivalence eq;
        eq.ignore_whitespace = true;
        auto a = Value::object({{"list", Value::array({"x  y"})}});
        auto b = Value::object({{"list", Value::array({"x y"})}});
        REQUIRE(equivalent(a, b, eq));
    }
}

TEST_CASE("normalize_whitespace", "[value][string]") {
    REQUIRE(normalize_whitespace("") == "");
    REQUIRE(normalize_whitespace("   ") == "");
    REQUIRE(normalize_whitespace(" a\t\tb \r\n c ") == "a b c");
    REQUIRE(normalize_whitespace("plain") == "plain");
}
