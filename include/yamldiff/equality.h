// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// equality.h - Structural equality between Node trees

#pragma once

#include <yamldiff/node.h>
#include <yamldiff/options.h>

namespace yamldiff {

/// Scalar equality. With ignore_whitespace_changes, two strings compare equal
/// when they match after trimming leading/trailing whitespace.
[[nodiscard]] YAMLDIFF_API bool values_equal(const Node& a, const Node& b, const Options& opts);

/// Recursive equality: maps by key set and values (key order ignored),
/// lists positionally, scalars through values_equal().
[[nodiscard]] YAMLDIFF_API bool deep_equal(const Node& a, const Node& b, const Options& opts);

} // namespace yamldiff
