// test_document_io.cpp - Tests for document loading and format detection

#include <catch2/catch_all.hpp>
#include <semdiff/document_io.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace semdiff;

namespace {

namespace fs = std::filesystem;

/// Temporary file removed at scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / ("semdiff_test_" + name))
    {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

Value load(const std::string& source, FormatHint hint = FormatHint::Auto) {
    return build_tree(load_document(source, hint));
}

} // namespace

TEST_CASE("Format hints", "[io][format]") {
    REQUIRE(parse_format_hint("auto") == FormatHint::Auto);
    REQUIRE(parse_format_hint("json") == FormatHint::Json);
    REQUIRE(parse_format_hint("yaml") == FormatHint::Yaml);
    REQUIRE(to_string(FormatHint::Yaml) == "yaml");
    REQUIRE_THROWS_AS(parse_format_hint("toml"), std::invalid_argument);
}

TEST_CASE("Format from extension", "[io][format]") {
    REQUIRE(format_from_extension("config.json") == FormatHint::Json);
    REQUIRE(format_from_extension("deploy.YAML") == FormatHint::Yaml);
    REQUIRE(format_from_extension("/etc/app/values.yml") == FormatHint::Yaml);
    REQUIRE(format_from_extension("notes.txt") == FormatHint::Auto);
    REQUIRE(format_from_extension("Makefile") == FormatHint::Auto);
    REQUIRE(format_from_extension("dir.json/file") == FormatHint::Auto);
}

TEST_CASE("parse_document", "[io][parse]") {
    SECTION("auto detects JSON") {
        auto doc = parse_document(R"({"a": [1, 2]})", FormatHint::Auto);
        REQUIRE(build_tree(doc).at("a").size() == 2);
    }

    SECTION("auto falls back to YAML") {
        auto doc = parse_document("a:\n  - 1\n  - 2\n", FormatHint::Auto);
        REQUIRE(build_tree(doc).at("a").size() == 2);
    }

    SECTION("forced JSON reports JSON errors with the origin") {
        try {
            (void)parse_document("a: 1", FormatHint::Json, "input.txt");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(std::string{e.what()}.rfind("input.txt: JSON: ", 0) == 0);
        }
    }
}

TEST_CASE("load_document from files", "[io][file]") {
    SECTION("json by extension") {
        TempFile file("load.json", R"({"name": "svc", "port": 80})");
        auto v = load(file.path());
        REQUIRE(v.at("port") == Value{80});
    }

    SECTION("yaml by extension") {
        TempFile file("load.yaml", "name: svc\nport: 80\n");
        auto v = load(file.path());
        REQUIRE(v.at("name") == Value{"svc"});
    }

    SECTION("JSON and YAML files normalize identically") {
        TempFile json_file("same.json", R"({"a": 1, "b": [true, null]})");
        TempFile yaml_file("same.yml", "a: 1.0\nb:\n  - true\n  - ~\n");
        REQUIRE(load(json_file.path()) == load(yaml_file.path()));
    }

    SECTION("hint overrides the extension") {
        TempFile file("hint.txt", "[1, 2, 3]");
        REQUIRE(load(file.path(), FormatHint::Json).size() == 3);
    }

    SECTION("malformed file") {
        TempFile file("broken.json", R"({"a": )");
        REQUIRE_THROWS_AS(load(file.path()), ParseError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(load("/nonexistent/semdiff/missing.json"), ParseError);
    }

    SECTION("directory") {
        const auto dir = fs::temp_directory_path() / "semdiff_test_dir";
        fs::create_directories(dir);
        REQUIRE_THROWS_AS(load(dir.string()), ParseError);
        REQUIRE_THROWS_AS(load(dir.string(), FormatHint::Yaml), ParseError);
        std::error_code ec;
        fs::remove(dir, ec);
    }
}

TEST_CASE("load_document from a stream", "[io][stdin]") {
    std::istringstream input(R"({"from": "stdin"})");
    auto doc = load_document("-", FormatHint::Auto, input);
    REQUIRE(build_tree(doc).at("from") == Value{"stdin"});
}

TEST_CASE("load_value", "[io][value]") {
    TempFile file("cycle.yaml", "a: &x\n  b: *x\n");
    REQUIRE_THROWS_AS(load_value(file.path()), CyclicReferenceError);

    TreeBuildOptions shallow;
    shallow.max_depth = 1;
    TempFile deep("deep.json", R"({"a": {"b": {"c": 1}}})");
    REQUIRE_THROWS_AS(load_value(deep.path(), FormatHint::Auto, shallow), CyclicReferenceError);
}
