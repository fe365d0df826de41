// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparator.h
/// @brief Structural comparison of Node trees.
///
/// Comparator walks a from/to pair and collects a flat list of Difference
/// records. Null on either side stands for "absent":
///
///   from   | to     | result
///   -------+--------+----------------------------------------------
///   null   | null   | nothing
///   null   | value  | Added
///   value  | null   | Modified with to = null (unless ignoring values)
///   kind A | kind B | Modified (unless ignoring values)
///   map    | map    | keys walked in source order, then additions
///   list   | list   | strategy from select_list_strategy()
///   scalar | scalar | Modified when !values_equal (unless ignoring values)
///
/// Results come out in walk order. compare() in compare.h sorts them for
/// presentation.
///
/// Usage:
/// @code
///   Comparator comparator{opts};
///   comparator.compare(from_docs, to_docs);
///   auto diffs = comparator.take_diffs();
///   sort_differences(diffs, comparator.path_order());
/// @endcode

#pragma once

#include <yamldiff/diff_order.h>
#include <yamldiff/difference.h>
#include <yamldiff/document.h>
#include <yamldiff/node.h>
#include <yamldiff/options.h>
#include <yamldiff/path.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace yamldiff {

class YAMLDIFF_API Comparator {
public:
    explicit Comparator(Options opts = {});

    /// Compare two document streams. Kubernetes matching applies when
    /// detect_kubernetes is set and either side holds a resource; otherwise
    /// documents are paired by position. Previous results are cleared.
    void compare(const DocumentList& from, const DocumentList& to);

    /// Compare a single pair of trees rooted at path (appends to results)
    void compare_nodes(const Node& from, const Node& to, Path path = {});

    [[nodiscard]] const std::vector<Difference>& get_diffs() const noexcept { return diffs_; }
    [[nodiscard]] std::vector<Difference> take_diffs() noexcept;

    /// First-occurrence order of the paths seen by compare()
    [[nodiscard]] const PathOrder& path_order() const noexcept { return order_; }

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    void clear();
    [[nodiscard]] bool has_changes() const noexcept { return !diffs_.empty(); }

private:
    void compare_positional_documents(const DocumentList& from, const DocumentList& to);
    void compare_kubernetes_documents(const DocumentList& from, const DocumentList& to);
    void compare_document_pair(const Node& from, const Node& to, std::size_t doc_index,
                               const std::string& prefix);

    void diff_value(const Node& from, const Node& to, Path& current_path);
    void diff_map(const OrderedMap& from, const OrderedMap& to, Path& current_path);
    void diff_list(const NodeList& from, const NodeList& to, Path& current_path);
    void diff_list_positional(const NodeList& from, const NodeList& to, Path& current_path);
    void diff_list_by_identifier(const NodeList& from, const NodeList& to, Path& current_path);
    void diff_list_unordered(const NodeList& from, const NodeList& to,
                             const std::vector<std::size_t>& from_indices,
                             const std::vector<std::size_t>& to_indices,
                             Path& current_path);

    void emit(Difference::Type type, const Path& path,
              std::optional<Node> from, std::optional<Node> to);

    Options opts_;
    std::vector<Difference> diffs_;
    PathOrder order_;
    std::size_t document_index_ = 0;
};

/// One-shot comparison of a single tree pair, unsorted
[[nodiscard]] YAMLDIFF_API std::vector<Difference> compare_nodes(
    const Node& from, const Node& to, const Options& opts, Path path = {});

} // namespace yamldiff
