// test_path.cpp - Tests for Path rendering, parsing and dotted path helpers
// Module 3: paths

#include <catch2/catch_all.hpp>
#include <yamldiff/path.h>

#include <stdexcept>
#include <string>

using namespace yamldiff;

// ============================================================
// PathBuilder and rendering
// ============================================================

TEST_CASE("PathBuilder", "[path][builder]") {
    SECTION("fluent rvalue chain") {
        Path p = PathBuilder{}.key("items").index(0).key("name").path();
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p[0]) == "items");
        REQUIRE(std::get<std::size_t>(p[1]) == 0);
    }

    SECTION("lvalue builder") {
        PathBuilder b;
        b.key("a");
        b.index(2);
        REQUIRE(b.path().size() == 2);
    }
}

TEST_CASE("path_to_string", "[path][render]") {
    SECTION("empty path") {
        REQUIRE(path_to_string(Path{}).empty());
    }

    SECTION("keys and indices") {
        Path p = PathBuilder{}.key("spec").key("containers").index(1).key("image").path();
        REQUIRE(path_to_string(p) == "spec.containers.1.image");
    }

    SECTION("document prefix") {
        Path p = PathBuilder{}.key(document_prefix(1)).key("metadata").key("name").path();
        REQUIRE(path_to_string(p) == "[1].metadata.name");
    }

    SECTION("root list index") {
        Path p = PathBuilder{}.index(0).path();
        REQUIRE(path_to_string(p) == "0");
    }
}

// ============================================================
// Parsing
// ============================================================

TEST_CASE("parse_dotted_path", "[path][parse]") {
    SECTION("plain keys") {
        auto p = parse_dotted_path("spec.template.metadata");
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p[2]) == "metadata");
    }

    SECTION("key with index") {
        auto p = parse_dotted_path("items[1].name");
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p[0]) == "items");
        REQUIRE(std::get<std::size_t>(p[1]) == 1);
        REQUIRE(std::get<std::string>(p[2]) == "name");
    }

    SECTION("bare index") {
        auto p = parse_dotted_path("[2]");
        REQUIRE(p.size() == 1);
        REQUIRE(std::get<std::size_t>(p[0]) == 2);
    }

    SECTION("empty and repeated dots") {
        REQUIRE(parse_dotted_path("").empty());
        REQUIRE(parse_dotted_path("a..b").size() == 2);
    }

    SECTION("malformed paths") {
        REQUIRE_THROWS_AS(parse_dotted_path("items[0"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items]0["), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[[0]]"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[]"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[x]"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[-1]"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[0][1]"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_dotted_path("items[0]x"), std::invalid_argument);
    }
}

// ============================================================
// Dotted path helpers
// ============================================================

TEST_CASE("Dotted path helpers", "[path][helpers]") {
    SECTION("path_depth") {
        REQUIRE(path_depth("a") == 0);
        REQUIRE(path_depth("a.b.c") == 2);
    }

    SECTION("root_segment") {
        REQUIRE(root_segment("spec.replicas") == "spec");
        REQUIRE(root_segment("name") == "name");
        REQUIRE(root_segment("[0].spec") == "[0]");
    }

    SECTION("parent_path") {
        REQUIRE(parent_path("a.b.c") == std::optional<std::string_view>{"a.b"});
        REQUIRE_FALSE(parent_path("a").has_value());
    }

    SECTION("path_matches") {
        REQUIRE(path_matches("spec", "spec"));
        REQUIRE(path_matches("spec.replicas", "spec"));
        REQUIRE(path_matches("items[0]", "items"));
        REQUIRE_FALSE(path_matches("specs.replicas", "spec"));
        REQUIRE_FALSE(path_matches("sp", "spec"));
    }
}
