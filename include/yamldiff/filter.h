// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// filter.h - Include/exclude filtering of a difference list by path

#pragma once

#include <yamldiff/difference.h>

#include <string>
#include <vector>

namespace yamldiff {

struct FilterOptions {
    /// Keep only differences under one of these paths (prefix match on
    /// '.' or '[' boundaries)
    std::vector<std::string> include_paths;
    /// Drop differences under one of these paths
    std::vector<std::string> exclude_paths;
    /// Keep only differences whose path matches one of these (ECMAScript, search)
    std::vector<std::string> include_regex;
    /// Drop differences whose path matches one of these
    std::vector<std::string> exclude_regex;

    [[nodiscard]] bool empty() const noexcept {
        return include_paths.empty() && exclude_paths.empty() &&
               include_regex.empty() && exclude_regex.empty();
    }
};

/// Apply includes, then excludes. Relative order is preserved.
/// @throws std::invalid_argument when a regular expression does not compile
[[nodiscard]] YAMLDIFF_API std::vector<Difference> filter_differences(std::vector<Difference> diffs,
                                                                      const FilterOptions& filter);

} // namespace yamldiff
