// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// options.h - Comparison options

#pragma once

#include <string>
#include <vector>

namespace yamldiff {

/// Options for one comparison. Built once by the caller and read-only
/// for the whole compare() call.
struct Options {
    /// Compare lists as multisets when no identifier applies
    bool ignore_order_changes = false;
    /// Ignore leading/trailing whitespace when comparing two strings
    bool ignore_whitespace_changes = false;
    /// Drop Modified results (value and type changes)
    bool ignore_value_changes = false;
    /// Match documents by apiVersion/kind/namespace/name
    bool detect_kubernetes = false;
    /// Pair unmatched Kubernetes documents by content similarity
    bool detect_renames = false;
    /// Extra identifier fields for list entries, checked before name and id
    std::vector<std::string> additional_identifiers;
    /// Exchange from and to before comparing
    bool swap = false;

    /// Re-root both sides at this path
    std::string chroot;
    /// Re-root only the from side (ignored when chroot is set)
    std::string chroot_from;
    /// Re-root only the to side (ignored when chroot is set)
    std::string chroot_to;
    /// When the chroot target is a list, treat each element as a document
    bool chroot_list_to_documents = false;
};

} // namespace yamldiff
