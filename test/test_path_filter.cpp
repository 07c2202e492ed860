// test_path_filter.cpp - Tests for glob path patterns and ChangeSet filtering

#include <catch2/catch_all.hpp>
#include <semdiff/path_filter.h>

#include <string>

using namespace semdiff;

namespace {

bool glob(std::string_view pattern, const Path& path) {
    return PathPattern::parse(pattern).matches(path);
}

ChangeSet sample_changes() {
    ChangeSet set;
    set.push_back(Change::modified(Path{"metadata", "timestamp"}, ValueBox{Value{1}}, ValueBox{Value{2}}));
    set.push_back(Change::added(Path{"spec", "replicas"}, ValueBox{Value{3}}));
    set.push_back(Change::removed(Path{"spec", "containers", 0, "image"}, ValueBox{Value{"nginx"}}));
    set.push_back(Change::unchanged(Path{"kind"}, ValueBox{Value{"Deployment"}}));
    return set;
}

} // namespace

// ============================================================
// PathPattern
// ============================================================

TEST_CASE("PathPattern parsing", "[filter][parse]") {
    SECTION("segments") {
        auto pattern = PathPattern::parse("a.*.**");
        REQUIRE(pattern.text() == "a.*.**");
        REQUIRE(pattern.segments().size() == 3);
        REQUIRE(pattern.segments()[0].kind == PathPattern::Segment::Kind::Literal);
        REQUIRE(pattern.segments()[0].text == "a");
        REQUIRE(pattern.segments()[1].kind == PathPattern::Segment::Kind::AnyOne);
        REQUIRE(pattern.segments()[2].kind == PathPattern::Segment::Kind::AnyMany);
    }

    SECTION("malformed patterns") {
        REQUIRE_THROWS_AS(PathPattern::parse(""), PatternError);
        REQUIRE_THROWS_AS(PathPattern::parse("a..b"), PatternError);
        REQUIRE_THROWS_AS(PathPattern::parse(".a"), PatternError);
        REQUIRE_THROWS_AS(PathPattern::parse("a."), PatternError);
        REQUIRE_THROWS_AS(PathPattern::parse("a*"), PatternError);
        REQUIRE_THROWS_AS(PathPattern::parse("a.***"), PatternError);
    }

    SECTION("error carries the pattern") {
        try {
            (void)PathPattern::parse("x.b*");
            FAIL("expected PatternError");
        } catch (const PatternError& e) {
            REQUIRE(e.pattern() == "x.b*");
        }
    }

    SECTION("PatternError is an invalid_argument") {
        REQUIRE_THROWS_AS(FilterConfig{}.ignore("a..b"), std::invalid_argument);
    }
}

TEST_CASE("PathPattern matching", "[filter][match]") {
    SECTION("literal") {
        REQUIRE(glob("a.b", Path{"a", "b"}));
        REQUIRE_FALSE(glob("a.b", Path{"a"}));
        REQUIRE_FALSE(glob("a.b", Path{"a", "b", "c"}));
    }

    SECTION("single wildcard") {
        REQUIRE(glob("users.*.name", Path{"users", 0, "name"}));
        REQUIRE(glob("users.*.name", Path{"users", "admin", "name"}));
        REQUIRE_FALSE(glob("users.*.name", Path{"users", "name"}));
    }

    SECTION("indices match by their decimal text") {
        REQUIRE(glob("items.0", Path{"items", 0}));
        REQUIRE_FALSE(glob("items.1", Path{"items", 0}));
    }

    SECTION("leading double wildcard") {
        REQUIRE(glob("**.timestamp", Path{"metadata", "timestamp"}));
        REQUIRE(glob("**.timestamp", Path{"a", "b", "c", "timestamp"}));
        REQUIRE(glob("**.timestamp", Path{"timestamp"}));
        REQUIRE_FALSE(glob("**.timestamp", Path{"timestamptag"}));
        REQUIRE_FALSE(glob("**.timestamp", Path{"timestamp", "x"}));
    }

    SECTION("trailing double wildcard matches the prefix itself") {
        REQUIRE(glob("spec.**", Path{"spec"}));
        REQUIRE(glob("spec.**", Path{"spec", "x"}));
        REQUIRE(glob("spec.**", Path{"spec", "x", "y"}));
        REQUIRE_FALSE(glob("spec.**", Path{"status"}));
    }

    SECTION("double wildcard in the middle") {
        REQUIRE(glob("a.**.z", Path{"a", "z"}));
        REQUIRE(glob("a.**.z", Path{"a", "b", "c", "z"}));
        REQUIRE_FALSE(glob("a.**.z", Path{"a", "b", "c"}));
    }

    SECTION("root") {
        REQUIRE(glob("**", Path{}));
        REQUIRE_FALSE(glob("*", Path{}));
    }
}

// ============================================================
// FilterConfig / filter_changes
// ============================================================

TEST_CASE("FilterConfig should_include", "[filter][config]") {
    SECTION("no filters includes everything") {
        FilterConfig filter;
        REQUIRE_FALSE(filter.has_filters());
        REQUIRE(filter.should_include(Path{"anything"}));
    }

    SECTION("ignore wins over only") {
        FilterConfig filter;
        filter.only("spec.**").ignore("spec.replicas");
        REQUIRE(filter.has_filters());
        REQUIRE(filter.should_include(Path{"spec", "image"}));
        REQUIRE_FALSE(filter.should_include(Path{"spec", "replicas"}));
        REQUIRE_FALSE(filter.should_include(Path{"metadata"}));
    }

    SECTION("several only patterns") {
        FilterConfig filter;
        filter.only("a").only("b");
        REQUIRE(filter.only_patterns().size() == 2);
        REQUIRE(filter.should_include(Path{"b"}));
        REQUIRE_FALSE(filter.should_include(Path{"c"}));
    }
}

TEST_CASE("filter_changes", "[filter][changes]") {
    const auto changes = sample_changes();

    SECTION("without filters the set is unchanged") {
        auto result = filter_changes(changes, FilterConfig{});
        REQUIRE(result.size() == changes.size());
        REQUIRE(result.stats() == changes.stats());
    }

    SECTION("ignore") {
        FilterConfig filter;
        filter.ignore("**.timestamp");
        auto result = filter_changes(changes, filter);
        REQUIRE(result.size() == 3);
        REQUIRE(result[0].path == Path{"spec", "replicas"});
        REQUIRE(result.stats().modified == 0);
        REQUIRE(result.stats().added == 1);
    }

    SECTION("only keeps order and recounts") {
        FilterConfig filter;
        filter.only("spec.**");
        auto result = filter_changes(changes, filter);
        REQUIRE(result.size() == 2);
        REQUIRE(result[0].type == ChangeType::Added);
        REQUIRE(result[1].type == ChangeType::Removed);
        REQUIRE(result.stats() == DiffStats{1, 1, 0, 0});
    }

    SECTION("filtering everything leaves an empty set") {
        FilterConfig filter;
        filter.ignore("**");
        auto result = filter_changes(changes, filter);
        REQUIRE(result.size() == 0);
        REQUIRE(result.is_empty());
    }

    SECTION("idempotent") {
        FilterConfig filter;
        filter.ignore("metadata.*").only("**.image").only("kind");
        auto once = filter_changes(changes, filter);
        auto twice = filter_changes(once, filter);
        REQUIRE(once.size() == twice.size());
        REQUIRE(once.stats() == twice.stats());
        for (std::size_t i = 0; i < once.size(); ++i) {
            REQUIRE(once[i].path == twice[i].path);
            REQUIRE(once[i].type == twice[i].type);
        }
    }
}
