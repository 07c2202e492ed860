// test_serialization.cpp - Tests for the JSON reader and writer

#include <catch2/catch_all.hpp>
#include <semdiff/builders.h>
#include <semdiff/serialization.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using namespace semdiff;

// ============================================================
// Reading
// ============================================================

TEST_CASE("from_json scalars", "[serialization][read]") {
    REQUIRE(from_json("null").is_null());
    REQUIRE(from_json("true") == Value{true});
    REQUIRE(from_json(" false ") == Value{false});
    REQUIRE(from_json("42") == Value{42});
    REQUIRE(from_json("-0.5") == Value{-0.5});
    REQUIRE(from_json("1e3") == Value{1000});
    REQUIRE(from_json("30.0") == from_json("30"));
    REQUIRE(from_json(R"("hi")") == Value{"hi"});
}

TEST_CASE("from_json containers", "[serialization][read]") {
    auto v = from_json(R"({"name": "Alice", "tags": ["a", "b"], "nested": {"x": null}})");
    REQUIRE(v.is_object());
    REQUIRE(v.at("name").as_string() == "Alice");
    REQUIRE(v.at("tags") == Value::array({"a", "b"}));
    REQUIRE(v.at("nested").contains("x"));

    SECTION("key order follows the source") {
        const auto& o = *v.get_if<ValueObject>();
        REQUIRE(o.entry(0).key == "name");
        REQUIRE(o.entry(1).key == "tags");
        REQUIRE(o.entry(2).key == "nested");
    }

    SECTION("empty containers") {
        REQUIRE(from_json("{}") == Value::object({}));
        REQUIRE(from_json("[ ]") == Value::array({}));
    }

    SECTION("duplicate keys: last value wins") {
        REQUIRE(from_json(R"({"a": 1, "a": 2})").at("a").as_number() == 2.0);
    }
}

TEST_CASE("from_json string escapes", "[serialization][read]") {
    REQUIRE(from_json(R"("a\"b\\c\/d")").as_string() == "a\"b\\c/d");
    REQUIRE(from_json(R"("\n\t\r\b\f")").as_string() == "\n\t\r\b\f");
    REQUIRE(from_json(R"("\u00e9")").as_string() == "\xC3\xA9");
    // U+1F600 as a surrogate pair
    REQUIRE(from_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("from_json rejects malformed input", "[serialization][read][error]") {
    REQUIRE_THROWS_AS(from_json(""), ParseError);
    REQUIRE_THROWS_AS(from_json("{"), ParseError);
    REQUIRE_THROWS_AS(from_json("[1, 2,]"), ParseError);
    REQUIRE_THROWS_AS(from_json(R"({"a": 1,})"), ParseError);
    REQUIRE_THROWS_AS(from_json("{} []"), ParseError);
    REQUIRE_THROWS_AS(from_json("01"), ParseError);
    REQUIRE_THROWS_AS(from_json("1."), ParseError);
    REQUIRE_THROWS_AS(from_json("+1"), ParseError);
    REQUIRE_THROWS_AS(from_json("tru"), ParseError);
    REQUIRE_THROWS_AS(from_json(R"({a: 1})"), ParseError);
    REQUIRE_THROWS_AS(from_json("\"unterminated"), ParseError);
    REQUIRE_THROWS_AS(from_json("\"tab\there\""), ParseError);
    REQUIRE_THROWS_AS(from_json(R"("\ud83d")"), ParseError);
    REQUIRE_THROWS_AS(from_json(R"("\x")"), ParseError);
    REQUIRE_THROWS_AS(from_json("1e400"), ParseError);
}

TEST_CASE("ParseError position", "[serialization][read][error]") {
    try {
        (void)read_json("{\n  \"a\": 1,\n  \"b\": ?\n}");
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        REQUIRE(e.line() == 3);
        REQUIRE(e.column() == 8);
        REQUIRE(std::string{e.what()}.find("line 3") != std::string::npos);
    }
}

TEST_CASE("read_json produces a document graph", "[serialization][read]") {
    auto doc = read_json(R"([1, {"k": "v"}])");
    REQUIRE(doc.root().has_value());
    const auto& root = doc.node(*doc.root());
    REQUIRE(root.kind == ValueKind::Array);
    REQUIRE(root.items.size() == 2);
    REQUIRE(doc.node(root.items[1]).members.front().first == "k");
}

// ============================================================
// Writing
// ============================================================

TEST_CASE("to_json compact", "[serialization][write]") {
    auto v = ObjectBuilder()
        .set("name", "Alice")
        .set("age", 30)
        .set("ratio", 0.25)
        .set("tags", Value::array({"a", nullptr, false}))
        .finish();

    REQUIRE(to_json(v, true) == R"({"name":"Alice","age":30,"ratio":0.25,"tags":["a",null,false]})");
}

TEST_CASE("to_json pretty", "[serialization][write]") {
    auto v = ObjectBuilder()
        .set("a", 1)
        .set("list", Value::array({true}))
        .set("empty", Value::object({}))
        .finish();

    const std::string expected =
        "{\n"
        "  \"a\": 1,\n"
        "  \"list\": [\n"
        "    true\n"
        "  ],\n"
        "  \"empty\": {}\n"
        "}";
    REQUIRE(to_json(v) == expected);
}

TEST_CASE("JSON numbers", "[serialization][write]") {
    auto number = [](double d) {
        std::string out;
        write_json_number(out, d);
        return out;
    };

    REQUIRE(number(3.0) == "3");
    REQUIRE(number(-12.0) == "-12");
    REQUIRE(number(-0.0) == "-0");
    REQUIRE(number(0.1) == "0.1");
    REQUIRE(number(std::numeric_limits<double>::quiet_NaN()) == "null");
    REQUIRE(number(std::numeric_limits<double>::infinity()) == "null");
}

TEST_CASE("JSON strings", "[serialization][write]") {
    std::string out;
    write_json_string(out, "q\"b\\n\nt\t\x01");
    REQUIRE(out == R"("q\"b\\n\nt\t\u0001")");
}

TEST_CASE("Value stream output", "[serialization][write]") {
    std::ostringstream os;
    os << Value::object({{"k", Value::array({1, "x"})}});
    REQUIRE(os.str() == R"({"k":[1,"x"]})");
}

TEST_CASE("JSON read and write agree", "[serialization][roundtrip]") {
    const std::string text = R"({"z":[1,2.5,"s",{"n":null}],"a":true})";
    REQUIRE(to_json(from_json(text), true) == text);
}
