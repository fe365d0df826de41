// test_node.cpp - Tests for Node and OrderedMap
// Module 1: document tree model

#include <catch2/catch_all.hpp>
#include <yamldiff/node.h>

#include <cmath>
#include <string>
#include <vector>

using namespace yamldiff;

namespace {

std::vector<std::string> keys_of(const OrderedMap& m) {
    std::vector<std::string> result;
    for (const auto& k : m.keys()) {
        result.push_back(k);
    }
    return result;
}

} // namespace

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Node default construction", "[node][construction]") {
    Node n;
    REQUIRE(n.is_null());
    REQUIRE(n.kind() == NodeKind::Null);
    REQUIRE_FALSE(n.is_scalar());
}

TEST_CASE("Node scalar construction", "[node][construction]") {
    SECTION("bool") {
        Node n{true};
        REQUIRE(n.kind() == NodeKind::Bool);
        REQUIRE(n.as_bool());
    }

    SECTION("int widens to int64") {
        Node n{42};
        REQUIRE(n.is<std::int64_t>());
        REQUIRE(n.as_int() == 42);
    }

    SECTION("double") {
        Node n{1.5};
        REQUIRE(n.kind() == NodeKind::Float);
        REQUIRE(n.as_double() == 1.5);
    }

    SECTION("string literal") {
        Node n{"hello"};
        REQUIRE(n.is_string());
        REQUIRE(n.as_string() == "hello");
    }

    SECTION("accessor defaults on type mismatch") {
        Node n{"text"};
        REQUIRE(n.as_int(7) == 7);
        REQUIRE(n.as_bool(true));
        REQUIRE(n.as_double(2.5) == 2.5);
    }
}

TEST_CASE("Node container construction", "[node][construction]") {
    auto m = Node::map({{"b", 1}, {"a", 2}});
    auto l = Node::list({1, "two", 3.0});

    REQUIRE(m.is_map());
    REQUIRE(m.size() == 2);
    REQUIRE(l.is_list());
    REQUIRE(l.size() == 3);
    REQUIRE(l.at(std::size_t{1}).as_string() == "two");
}

// ============================================================
// OrderedMap Tests
// ============================================================

TEST_CASE("OrderedMap keeps insertion order", "[node][ordered_map]") {
    OrderedMap m;
    m = m.set("zebra", Node{1});
    m = m.set("apple", Node{2});
    m = m.set("mango", Node{3});

    REQUIRE(keys_of(m) == std::vector<std::string>{"zebra", "apple", "mango"});
    REQUIRE(m.find("apple")->as_int() == 2);
    REQUIRE(m.find("missing") == nullptr);
}

TEST_CASE("OrderedMap set and insert", "[node][ordered_map]") {
    OrderedMap base;
    base = base.set("a", Node{1});
    base = base.set("b", Node{2});

    SECTION("set replaces the value and keeps the position") {
        auto m = base.set("a", Node{10});
        REQUIRE(keys_of(m) == std::vector<std::string>{"a", "b"});
        REQUIRE(m.find("a")->as_int() == 10);
        REQUIRE(m.size() == 2);
    }

    SECTION("insert does not override existing keys") {
        auto m = base.insert("a", Node{10}).insert("c", Node{3});
        REQUIRE(keys_of(m) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(m.find("a")->as_int() == 1);
        REQUIRE(m.find("c")->as_int() == 3);
    }

    SECTION("original is untouched") {
        auto m = base.set("c", Node{3});
        REQUIRE(base.size() == 2);
        REQUIRE_FALSE(base.contains("c"));
        REQUIRE(m.contains("c"));
    }

    SECTION("key order and lookup agree") {
        auto m = base.set("c", Node{3}).insert("a", Node{0}).set("b", Node{5});
        REQUIRE(m.keys().size() == m.size());
        for (const auto& k : m.keys()) {
            REQUIRE(m.find(k) != nullptr);
        }
    }
}

TEST_CASE("OrderedMap for_each visits in key order", "[node][ordered_map]") {
    auto n = Node::map({{"z", 1}, {"a", 2}, {"m", 3}});
    std::vector<std::string> visited;
    std::int64_t sum = 0;
    n.get_if<OrderedMap>()->for_each([&](const std::string& k, const Node& v) {
        visited.push_back(k);
        sum += v.as_int();
    });
    REQUIRE(visited == std::vector<std::string>{"z", "a", "m"});
    REQUIRE(sum == 6);
}

// ============================================================
// Access Tests
// ============================================================

TEST_CASE("Node at() lookups", "[node][access]") {
    auto n = Node::map({
        {"name", "web"},
        {"ports", Node::list({80, 443})}
    });

    REQUIRE(n.at("name").as_string() == "web");
    REQUIRE(n.at("ports").at(std::size_t{1}).as_int() == 443);

    SECTION("misses return null") {
        REQUIRE(n.at("missing").is_null());
        REQUIRE(n.at("ports").at(std::size_t{5}).is_null());
        REQUIRE(n.at("name").at("nested").is_null());
    }

    SECTION("contains") {
        REQUIRE(n.contains("ports"));
        REQUIRE_FALSE(n.contains("missing"));
        REQUIRE_FALSE(Node{1}.contains("x"));
    }
}

// ============================================================
// Equality and Rendering
// ============================================================

TEST_CASE("Node equality", "[node][equality]") {
    SECTION("map key order does not matter") {
        REQUIRE(Node::map({{"a", 1}, {"b", 2}}) == Node::map({{"b", 2}, {"a", 1}}));
    }

    SECTION("list order matters") {
        REQUIRE_FALSE(Node::list({1, 2}) == Node::list({2, 1}));
    }

    SECTION("int and float are distinct") {
        REQUIRE_FALSE(Node{1} == Node{1.0});
    }

    SECTION("null equals null") {
        REQUIRE(Node{} == Node{});
    }
}

TEST_CASE("value_to_string", "[node][string]") {
    REQUIRE(value_to_string(Node{"x"}) == "\"x\"");
    REQUIRE(value_to_string(Node{42}) == "42");
    REQUIRE(value_to_string(Node{1.5}) == "1.5");
    REQUIRE(value_to_string(Node{false}) == "false");
    REQUIRE(value_to_string(Node{}) == "null");
    REQUIRE(value_to_string(Node::map({{"a", 1}})) == "{map:1}");
    REQUIRE(value_to_string(Node::list({1, 2})) == "[list:2]");
}

TEST_CASE("scalar_to_string", "[node][string]") {
    REQUIRE(scalar_to_string(Node{"alice"}) == "alice");
    REQUIRE(scalar_to_string(Node{5}) == "5");
    REQUIRE(scalar_to_string(Node{1.5}) == "1.5");
    REQUIRE(scalar_to_string(Node{0.1}) == "0.1");
    REQUIRE(scalar_to_string(Node{true}) == "true");
}
