// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// kubernetes.h - Kubernetes resource detection and document matching

#pragma once

#include <yamldiff/document.h>
#include <yamldiff/node.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace yamldiff {

/// A map with string apiVersion and kind, and a metadata map carrying a
/// non-null name (or, failing that, generateName)
[[nodiscard]] YAMLDIFF_API bool is_kubernetes_resource(const Node& doc);

/// "apiVersion:kind:namespace/name", or "apiVersion:kind:name" without a
/// namespace. Empty for anything that is not a Kubernetes resource.
[[nodiscard]] YAMLDIFF_API std::string kubernetes_identifier(const Node& doc);

/// True when any document on either side is a Kubernetes resource
[[nodiscard]] YAMLDIFF_API bool has_kubernetes_documents(const DocumentList& from, const DocumentList& to);

struct DocumentMatch {
    std::vector<std::pair<std::size_t, std::size_t>> matched;  // (from, to), in from order
    std::vector<std::size_t> unmatched_from;
    std::vector<std::size_t> unmatched_to;
};

/// Pair documents with equal identifiers. Each from document claims the
/// first not yet claimed to document with its identifier.
[[nodiscard]] YAMLDIFF_API DocumentMatch match_kubernetes_documents(const DocumentList& from, const DocumentList& to);

} // namespace yamldiff
