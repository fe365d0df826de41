// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file list_matching.h
/// @brief Strategy selection for comparing two lists.
///
/// The predicates here only inspect list shapes; they never produce
/// differences. The comparator asks select_list_strategy() which walk to
/// run and then runs it.

#pragma once

#include <yamldiff/node.h>
#include <yamldiff/options.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace yamldiff {

enum class ListStrategy : std::uint8_t {
    Identifier,     ///< Match map entries by name/id (or an additional identifier)
    Unordered,      ///< ignore_order_changes: greedy multiset matching
    Heterogeneous,  ///< Single-key variant maps: matched as a multiset
    Positional      ///< Pairwise by index
};

/// Identifier value usable as a lookup key
using IdentifierKey = std::variant<bool, std::int64_t, double, std::string>;

/// Value of the first identifier field present on a map entry:
/// each of additional_identifiers in order, then "name", then "id".
/// @return nullptr when item is not a map or carries none of the fields
[[nodiscard]] YAMLDIFF_API const Node* identifier_field(
    const Node& item, const std::vector<std::string>& additional_identifiers);

/// A scalar (bool, int, non-NaN float, string) can serve as an identifier;
/// null and nested collections cannot.
[[nodiscard]] YAMLDIFF_API bool is_usable_identifier(const Node* id) noexcept;

/// Identifier of a list entry, or nullopt when it has no usable one
[[nodiscard]] YAMLDIFF_API std::optional<IdentifierKey> identifier_key(
    const Node& item, const Options& opts);

/// Non-empty, every element a map, and at least one usable identifier
[[nodiscard]] YAMLDIFF_API bool can_match_by_identifier(const NodeList& list, const Options& opts);

/// Every element on both sides is a single-key map and the keys across
/// both sides are not all the same (e.g. {namespaceSelector} vs {ipBlock}).
[[nodiscard]] YAMLDIFF_API bool are_list_items_heterogeneous(const NodeList& from, const NodeList& to);

[[nodiscard]] YAMLDIFF_API ListStrategy select_list_strategy(
    const NodeList& from, const NodeList& to, const Options& opts);

[[nodiscard]] YAMLDIFF_API std::string_view to_string(ListStrategy strategy) noexcept;

} // namespace yamldiff
