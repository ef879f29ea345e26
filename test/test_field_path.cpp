// test_field_path.cpp - Tests for field paths and ignore matching
// Module 2: field_path.h

#include <catch2/catch_all.hpp>
#include <diffit/field_path.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace diffit;

TEST_CASE("FieldPath rendering", "[path]") {
    FieldPath path;
    REQUIRE(path.empty());
    REQUIRE(path.to_string().empty());

    path.push_back("items");
    path.push_back(FilterPlaceholder{0});
    path.push_back("name");

    SECTION("dotted form with placeholders") {
        REQUIRE(path.to_string() == "items.$[elem0].name");
    }

    SECTION("logical form drops placeholders") {
        REQUIRE(path.logical_string() == "items.name");
    }

    SECTION("element indexes render as numbers and are not logical") {
        FieldPath scanned{"items"};
        scanned.push_back(ElementIndex{3});
        scanned.push_back("secret");
        REQUIRE(scanned.to_string() == "items.3.secret");
        REQUIRE(scanned.logical_string() == "items.secret");
    }

    SECTION("push and pop") {
        path.pop_back();
        REQUIRE(path.to_string() == "items.$[elem0]");
        REQUIRE(path.child("qty").to_string() == "items.$[elem0].qty");
        REQUIRE(path.size() == 2);
    }
}

TEST_CASE("FieldPath::parse", "[path]") {
    SECTION("fields and placeholders") {
        auto path = FieldPath::parse("a.$[elem12].b");
        REQUIRE(path.size() == 3);
        REQUIRE(std::get<FilterPlaceholder>(path.segments()[1]).id == 12);
        REQUIRE(path.to_string() == "a.$[elem12].b");
    }

    SECTION("starts_with") {
        auto path = FieldPath::parse("a.b.c");
        REQUIRE(path.starts_with(FieldPath{"a", "b"}));
        REQUIRE_FALSE(path.starts_with(FieldPath{"a", "c"}));
        REQUIRE(path.starts_with(FieldPath{}));
    }

    SECTION("malformed input") {
        REQUIRE_THROWS_AS(FieldPath::parse("a..b"), std::runtime_error);
        REQUIRE_THROWS_AS(FieldPath::parse("a."), std::runtime_error);
        REQUIRE_THROWS_AS(FieldPath::parse("a.$[x]"), std::runtime_error);
        REQUIRE_THROWS_AS(FieldPath::parse("a.$[elem]"), std::runtime_error);
    }

    SECTION("empty text is the root") {
        REQUIRE(FieldPath::parse("").empty());
    }
}

TEST_CASE("path_is_under", "[path]") {
    REQUIRE(path_is_under("a.b", "a.b"));
    REQUIRE(path_is_under("a.b.c", "a.b"));
    REQUIRE_FALSE(path_is_under("a.bc", "a.b"));
    REQUIRE_FALSE(path_is_under("a", "a.b"));
    REQUIRE(path_is_under("anything", ""));
}

TEST_CASE("IgnoreSet matches exact paths and nested paths", "[path][ignore]") {
    IgnoreSet ignored{std::vector<std::string>{"audit", "profile.secret"}};

    REQUIRE(ignored.matches("audit"));
    REQUIRE(ignored.matches("audit.created_by"));
    REQUIRE(ignored.matches("profile.secret"));
    REQUIRE(ignored.matches("profile.secret.hash"));
    REQUIRE_FALSE(ignored.matches("profile"));
    REQUIRE_FALSE(ignored.matches("profile.name"));
    REQUIRE_FALSE(ignored.matches("auditor"));

    SECTION("placeholders are transparent") {
        FieldPath path{"profile"};
        path.push_back(FilterPlaceholder{3});
        path.push_back("secret");
        REQUIRE(ignored.matches(path));
    }

    SECTION("empty set ignores nothing") {
        IgnoreSet none;
        REQUIRE(none.empty());
        REQUIRE_FALSE(none.matches("audit"));
    }
}
