// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// equality.cpp

#include <yamldiff/equality.h>

#include <array>
#include <cmath>
#include <string_view>

namespace yamldiff {

namespace {

// UTF-8 encodings of the non-ASCII code points with the White_Space property
constexpr std::array<std::string_view, 19> unicode_spaces = {
    "\xC2\x85",                                     // U+0085 NEL
    "\xC2\xA0",                                     // U+00A0 NBSP
    "\xE1\x9A\x80",                                 // U+1680
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", // U+2000..U+200A
    "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
    "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88",
    "\xE2\x80\x89", "\xE2\x80\x8A",
    "\xE2\x80\xA8",                                 // U+2028 LINE SEPARATOR
    "\xE2\x80\xA9",                                 // U+2029 PARAGRAPH SEPARATOR
    "\xE2\x80\xAF",                                 // U+202F
    "\xE2\x81\x9F",                                 // U+205F
    "\xE3\x80\x80",                                 // U+3000 IDEOGRAPHIC SPACE
};

constexpr std::string_view ascii_spaces = " \t\n\r\f\v";

// Byte length of the whitespace code point at the front of s, or 0
std::size_t leading_space(std::string_view s) noexcept
{
    if (s.empty()) {
        return 0;
    }
    if (ascii_spaces.find(s.front()) != std::string_view::npos) {
        return 1;
    }
    for (auto sp : unicode_spaces) {
        if (s.starts_with(sp)) {
            return sp.size();
        }
    }
    return 0;
}

std::size_t trailing_space(std::string_view s) noexcept
{
    if (s.empty()) {
        return 0;
    }
    if (ascii_spaces.find(s.back()) != std::string_view::npos) {
        return 1;
    }
    for (auto sp : unicode_spaces) {
        if (s.ends_with(sp)) {
            return sp.size();
        }
    }
    return 0;
}

std::string_view trim(std::string_view s) noexcept
{
    while (auto n = leading_space(s)) {
        s.remove_prefix(n);
    }
    while (auto n = trailing_space(s)) {
        s.remove_suffix(n);
    }
    return s;
}

bool maps_equal(const OrderedMap& a, const OrderedMap& b, const Options& opts)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& key : a.keys()) {
        const Node* other = b.find(key);
        if (!other || !deep_equal(*a.find(key), *other, opts)) {
            return false;
        }
    }
    return true;
}

bool lists_equal(const NodeList& a, const NodeList& b, const Options& opts)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        // Shared box: same subtree
        if (&a[i].get() == &b[i].get()) {
            continue;
        }
        if (!deep_equal(a[i].get(), b[i].get(), opts)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool values_equal(const Node& a, const Node& b, const Options& opts)
{
    if (opts.ignore_whitespace_changes) {
        auto* sa = a.get_if<std::string>();
        auto* sb = b.get_if<std::string>();
        if (sa && sb) {
            return trim(*sa) == trim(*sb);
        }
    }

    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, OrderedMap> || std::is_same_v<T, NodeList>) {
            return deep_equal(a, b, opts);
        } else if constexpr (std::is_same_v<T, double>) {
            // NaN equals NaN
            const double rhs = std::get<double>(b.data);
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else {
            return lhs == std::get<T>(b.data);
        }
    }, a.data);
}

bool deep_equal(const Node& a, const Node& b, const Options& opts)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }
    if (auto* ma = a.get_if<OrderedMap>()) {
        return maps_equal(*ma, *b.get_if<OrderedMap>(), opts);
    }
    if (auto* la = a.get_if<NodeList>()) {
        return lists_equal(*la, *b.get_if<NodeList>(), opts);
    }
    return values_equal(a, b, opts);
}

// ============================================================
// Comparison operators
// ============================================================

bool operator==(const Node& a, const Node& b)
{
    return deep_equal(a, b, Options{});
}

bool operator==(const OrderedMap& a, const OrderedMap& b)
{
    return maps_equal(a, b, Options{});
}

} // namespace yamldiff
