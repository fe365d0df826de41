// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Logical paths into a Node tree.
///
/// Paths are built as a vector of elements while the comparator walks the
/// trees, and rendered to the dotted form carried by Difference:
///
///   ["spec", "containers", "nginx", "image"]  ->  "spec.containers.nginx.image"
///   ["items", 0]                              ->  "items.0"
///   ["[1]", "metadata", "name"]               ->  "[1].metadata.name"
///
/// The dotted-with-brackets syntax used for chroot ("items[0].name") is
/// parsed back into a Path by parse_dotted_path().

#pragma once

#include <yamldiff/api.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace yamldiff {

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Fluent Path construction
/// @example Path p = PathBuilder{}.key("items").index(0).key("name").path();
class PathBuilder {
public:
    PathBuilder() = default;

    PathBuilder& key(std::string k) & {
        path_.emplace_back(std::move(k));
        return *this;
    }
    PathBuilder&& key(std::string k) && {
        path_.emplace_back(std::move(k));
        return std::move(*this);
    }

    PathBuilder& index(std::size_t i) & {
        path_.emplace_back(i);
        return *this;
    }
    PathBuilder&& index(std::size_t i) && {
        path_.emplace_back(i);
        return std::move(*this);
    }

    [[nodiscard]] const Path& path() const& noexcept { return path_; }
    [[nodiscard]] Path path() && noexcept { return std::move(path_); }

private:
    Path path_;
};

/// Render a Path in dotted form ("a.b.0.c"); the empty path renders as ""
[[nodiscard]] YAMLDIFF_API std::string path_to_string(const Path& path);

/// Prefix segment used for multi-document streams: "[index]"
[[nodiscard]] YAMLDIFF_API std::string document_prefix(std::size_t index);

/// Parse "a.b[0].c" / "[1]" into a Path.
/// @throws std::invalid_argument on unbalanced/nested brackets, empty or
///         non-numeric indices
[[nodiscard]] YAMLDIFF_API Path parse_dotted_path(std::string_view path_str);

// ============================================================
// Helpers on rendered (dotted) paths
// ============================================================

/// Number of '.' separators ("a" -> 0, "a.b.c" -> 2)
[[nodiscard]] YAMLDIFF_API std::size_t path_depth(std::string_view path) noexcept;

/// Segment before the first '.'
[[nodiscard]] YAMLDIFF_API std::string_view root_segment(std::string_view path) noexcept;

/// Path with the last segment removed, or nullopt for a single segment
[[nodiscard]] YAMLDIFF_API std::optional<std::string_view> parent_path(std::string_view path) noexcept;

/// True when path equals prefix, or starts with prefix followed by '.' or '['
[[nodiscard]] YAMLDIFF_API bool path_matches(std::string_view path, std::string_view prefix) noexcept;

} // namespace yamldiff
