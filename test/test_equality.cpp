// test_equality.cpp - Tests for values_equal and deep_equal
// Module 4: equality engine

#include <catch2/catch_all.hpp>
#include <yamldiff/equality.h>

#include <limits>

using namespace yamldiff;

TEST_CASE("values_equal on scalars", "[equality][scalar]") {
    Options opts;

    REQUIRE(values_equal(Node{1}, Node{1}, opts));
    REQUIRE_FALSE(values_equal(Node{1}, Node{2}, opts));
    REQUIRE_FALSE(values_equal(Node{1}, Node{1.0}, opts));
    REQUIRE_FALSE(values_equal(Node{"1"}, Node{1}, opts));
    REQUIRE(values_equal(Node{}, Node{}, opts));
    REQUIRE(values_equal(Node{true}, Node{true}, opts));
}

TEST_CASE("NaN scalars", "[equality][nan]") {
    Options opts;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("NaN equals NaN") {
        REQUIRE(values_equal(Node{nan}, Node{nan}, opts));
        REQUIRE(deep_equal(Node{nan}, Node{nan}, opts));
        REQUIRE(Node{nan} == Node{nan});
    }

    SECTION("NaN differs from numbers") {
        REQUIRE_FALSE(values_equal(Node{nan}, Node{0.0}, opts));
        REQUIRE_FALSE(values_equal(Node{1.5}, Node{nan}, opts));
    }

    SECTION("NaN inside containers") {
        auto a = Node::map({{"a", nan}, {"l", Node::list({nan})}});
        auto b = Node::map({{"l", Node::list({nan})}, {"a", nan}});
        REQUIRE(deep_equal(a, b, opts));
    }
}

TEST_CASE("values_equal with ignore_whitespace_changes", "[equality][whitespace]") {
    Options opts;
    opts.ignore_whitespace_changes = true;

    SECTION("leading and trailing whitespace is ignored") {
        REQUIRE(values_equal(Node{"bar"}, Node{"bar "}, opts));
        REQUIRE(values_equal(Node{"  bar\n"}, Node{"bar"}, opts));
        REQUIRE(values_equal(Node{"\tbar"}, Node{"bar\t"}, opts));
    }

    SECTION("unicode whitespace is ignored") {
        // U+00A0 NBSP, U+2028 LINE SEPARATOR
        REQUIRE(values_equal(Node{"\xC2\xA0" "bar"}, Node{"bar" "\xE2\x80\xA8"}, opts));
        // U+3000 IDEOGRAPHIC SPACE, U+0085 NEL, U+2009 THIN SPACE
        REQUIRE(values_equal(Node{"\xE3\x80\x80" "bar" "\xC2\x85"}, Node{"bar"}, opts));
        REQUIRE(values_equal(Node{" \xE2\x80\x89\t" "bar"}, Node{"bar"}, opts));
        REQUIRE(values_equal(Node{"\xC2\xA0"}, Node{""}, opts));
    }

    SECTION("interior whitespace still counts") {
        REQUIRE_FALSE(values_equal(Node{"a b"}, Node{"a  b"}, opts));
        REQUIRE_FALSE(values_equal(Node{"a" "\xC2\xA0" "b"}, Node{"ab"}, opts));
    }

    SECTION("non-space multibyte text is kept") {
        // U+00E9 and U+4E2D share lead bytes with spaces
        REQUIRE_FALSE(values_equal(Node{"\xC3\xA9"}, Node{""}, opts));
        REQUIRE(values_equal(Node{"\xE4\xB8\xAD "}, Node{"\xE4\xB8\xAD"}, opts));
        REQUIRE_FALSE(values_equal(Node{"\xE4\xB8\xAD"}, Node{""}, opts));
    }

    SECTION("off by default") {
        REQUIRE_FALSE(values_equal(Node{"bar"}, Node{"bar "}, Options{}));
    }

    SECTION("non-strings are unaffected") {
        REQUIRE_FALSE(values_equal(Node{" 1"}, Node{1}, opts));
    }
}

TEST_CASE("deep_equal on containers", "[equality][deep]") {
    Options opts;

    SECTION("maps ignore key order") {
        auto a = Node::map({{"x", 1}, {"y", Node::map({{"p", 1}, {"q", 2}})}});
        auto b = Node::map({{"y", Node::map({{"q", 2}, {"p", 1}})}, {"x", 1}});
        REQUIRE(deep_equal(a, b, opts));
    }

    SECTION("maps with different key sets") {
        REQUIRE_FALSE(deep_equal(Node::map({{"x", 1}}), Node::map({{"y", 1}}), opts));
        REQUIRE_FALSE(deep_equal(Node::map({{"x", 1}}), Node::map({{"x", 1}, {"y", 2}}), opts));
    }

    SECTION("lists compare positionally") {
        REQUIRE(deep_equal(Node::list({1, 2, 3}), Node::list({1, 2, 3}), opts));
        REQUIRE_FALSE(deep_equal(Node::list({1, 2, 3}), Node::list({3, 2, 1}), opts));
        REQUIRE_FALSE(deep_equal(Node::list({1, 2}), Node::list({1, 2, 3}), opts));
    }

    SECTION("different kinds are unequal") {
        REQUIRE_FALSE(deep_equal(Node::map({}), Node::list({}), opts));
        REQUIRE_FALSE(deep_equal(Node{}, Node{0}, opts));
    }

    SECTION("whitespace option reaches nested strings") {
        Options ws;
        ws.ignore_whitespace_changes = true;
        auto a = Node::map({{"k", Node::list({"v "})}});
        auto b = Node::map({{"k", Node::list({" v"})}});
        REQUIRE(deep_equal(a, b, ws));
        REQUIRE_FALSE(deep_equal(a, b, opts));
    }

    SECTION("shared subtrees") {
        auto shared = Node::list({Node::map({{"a", 1}})});
        REQUIRE(deep_equal(shared, shared, opts));
    }
}
