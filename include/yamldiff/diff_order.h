// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_order.h
/// @brief Presentation order of a difference list.
///
/// PathOrder records the position at which every path first occurs while
/// walking the source documents (from side first, then to side). List
/// entries with a usable identifier are recorded under the identifier, the
/// same segment the comparator puts in their paths.
///
/// sort_differences() is a stable sort on:
///   1. document index
///   2. root-level additions first
///   3. root segment, in source order (string order when unknown)
///   4. exact path, in source order; a known path before an unknown one
///   5. nearest known ancestor, in source order
///   6. fewer segments first, then string order

#pragma once

#include <yamldiff/difference.h>
#include <yamldiff/node.h>
#include <yamldiff/options.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yamldiff {

class YAMLDIFF_API PathOrder {
public:
    PathOrder() = default;

    /// Record path unless already known
    void register_path(const std::string& path);

    /// Walk a document and record every non-empty path below prefix
    void add_document(const Node& doc, const std::string& prefix, const Options& opts);

    [[nodiscard]] std::optional<std::size_t> find(std::string_view path) const;

    /// Order of the path itself or of its nearest recorded ancestor
    [[nodiscard]] std::optional<std::size_t> find_nearest(std::string_view path) const;

    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }
    void clear() noexcept;

private:
    std::map<std::string, std::size_t, std::less<>> order_;
    std::size_t next_ = 0;
};

/// Path ends in an index ("items.0", "[2]") or the value is a map carrying
/// name/id, i.e. the difference describes a whole list entry
[[nodiscard]] YAMLDIFF_API bool is_list_entry(const Difference& diff);

/// Added, at the root of its document, and not a list entry
[[nodiscard]] YAMLDIFF_API bool is_root_addition(const Difference& diff);

YAMLDIFF_API void sort_differences(std::vector<Difference>& diffs, const PathOrder& order);

} // namespace yamldiff
