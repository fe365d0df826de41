// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief Node: the parsed YAML value tree.
///
/// A Node is a closed tagged union over:
/// - Null (std::monostate)
/// - Scalars: bool, int64, double, string
/// - OrderedMap: string keys in source order, backed by immer containers
/// - NodeList: immer::vector of boxed Nodes
///
/// Trees are immutable once built. Copying a Node shares its containers,
/// so the `from` tree, the `to` tree and every Difference referencing a
/// subtree all point at the same storage.

#pragma once

#include <yamldiff/yamldiff_config.h>
#include <yamldiff/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace yamldiff {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if YAMLDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if YAMLDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_message(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if YAMLDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

/// Thread-safe memory policy: atomic refcount + thread-safe free lists.
/// Trees built by separate `compare` calls may be copied and released on
/// separate threads at the same time.
using memory_policy = immer::default_memory_policy;

struct Node;

using NodeBox  = immer::box<Node, memory_policy>;
using NodeList = immer::vector<NodeBox, memory_policy>;

// ============================================================
// OrderedMap
//
// Key order and key lookup live in one type. The only way to add a key
// is set()/insert(), both of which update the two views together, so a
// key can never be in one and missing from the other.
// ============================================================

class YAMLDIFF_API OrderedMap
{
public:
    using key_list   = immer::vector<std::string, memory_policy>;
    using lookup_map = immer::map<std::string,
                                  NodeBox,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  memory_policy>;

    OrderedMap() = default;

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }
    [[nodiscard]] bool contains(const std::string& key) const { return values_.count(key) > 0; }

    /// Keys in first-insertion (source document) order
    [[nodiscard]] const key_list& keys() const noexcept { return keys_; }

    /// @return pointer to the value for key, or nullptr when absent
    [[nodiscard]] const Node* find(const std::string& key) const;

    /// Insert a new key at the end, or replace the value of an existing key
    /// in place (its position is kept).
    [[nodiscard]] OrderedMap set(std::string key, Node value) const;

    /// Insert only when the key is absent; existing entries win.
    [[nodiscard]] OrderedMap insert(std::string key, Node value) const;

    /// Visit entries in key order: fn(const std::string&, const Node&)
    template <typename Fn>
    void for_each(Fn&& fn) const;

private:
    key_list keys_;
    lookup_map values_;
};

enum class NodeKind : std::uint8_t { Null, Bool, Int, Float, String, Map, List };

struct YAMLDIFF_API Node
{
    // Alternative order must match NodeKind
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 OrderedMap,
                 NodeList>
        data;

    Node() noexcept : data(std::monostate{}) {}
    Node(bool v) noexcept : data(v) {}
    Node(int v) noexcept : data(static_cast<std::int64_t>(v)) {}
    Node(std::int64_t v) noexcept : data(v) {}
    Node(double v) noexcept : data(v) {}
    Node(const std::string& v) : data(v) {}
    Node(std::string&& v) noexcept : data(std::move(v)) {}
    Node(const char* v) : data(std::in_place_type<std::string>, v) {}
    Node(OrderedMap v) : data(std::move(v)) {}
    Node(NodeList v) : data(std::move(v)) {}

    static Node map(std::initializer_list<std::pair<std::string, Node>> init) {
        OrderedMap m;
        for (const auto& [key, val] : init) {
            m = m.set(key, val);
        }
        return Node{std::move(m)};
    }

    static Node list(std::initializer_list<Node> init) {
        auto t = NodeList{}.transient();
        for (const auto& val : init) {
            t.push_back(NodeBox{val});
        }
        return Node{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<OrderedMap>(); }
    [[nodiscard]] bool is_list() const noexcept { return is<NodeList>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_scalar() const noexcept {
        return !is_null() && !is_map() && !is_list();
    }

    [[nodiscard]] Node at(const std::string& key) const {
        if (auto* m = get_if<OrderedMap>()) {
            if (auto* found = m->find(key)) return *found;
        }
        detail::log_key_error("Node::at", key, "not found or type mismatch");
        return Node{};
    }

    [[nodiscard]] Node at(std::size_t index) const {
        if (auto* v = get_if<NodeList>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Node::at", index, "out of range or type mismatch");
        return Node{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<OrderedMap>()) return m->contains(key);
        return false;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::int64_t as_int(std::int64_t default_val = 0) const {
        if (auto* p = get_if<std::int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<OrderedMap>()) return m->size();
        if (auto* v = get_if<NodeList>()) return v->size();
        return 0;
    }
};

// ============================================================
// OrderedMap inline members (need the complete Node type)
// ============================================================

inline const Node* OrderedMap::find(const std::string& key) const
{
    if (auto* box = values_.find(key)) {
        return &box->get();
    }
    return nullptr;
}

inline OrderedMap OrderedMap::set(std::string key, Node value) const
{
    OrderedMap result = *this;
    if (!values_.count(key)) {
        result.keys_ = keys_.push_back(key);
    }
    result.values_ = values_.set(std::move(key), NodeBox{std::move(value)});
    return result;
}

inline OrderedMap OrderedMap::insert(std::string key, Node value) const
{
    if (values_.count(key)) {
        return *this;
    }
    return set(std::move(key), std::move(value));
}

template <typename Fn>
void OrderedMap::for_each(Fn&& fn) const
{
    for (const auto& key : keys_) {
        fn(key, values_.find(key)->get());
    }
}

// ============================================================
// Comparison operators
//
// Structural equality: maps compare by key set and values (key order is
// ignored), lists compare positionally. Defined in equality.cpp.
// ============================================================

[[nodiscard]] YAMLDIFF_API bool operator==(const Node& a, const Node& b);
[[nodiscard]] YAMLDIFF_API bool operator==(const OrderedMap& a, const OrderedMap& b);

// ============================================================
// Utility functions
// ============================================================

/// One-line rendering: "text", 42, 1.5, true, null, {map:N}, [list:N]
[[nodiscard]] YAMLDIFF_API std::string value_to_string(const Node& val);

/// Plain form of a scalar as used in identifier path segments (alice, 5, 1.5, true).
/// Non-scalars fall back to value_to_string().
[[nodiscard]] YAMLDIFF_API std::string scalar_to_string(const Node& val);

/// Print a Node with indentation
YAMLDIFF_API void print_node(const Node& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace yamldiff
