// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file chroot.h
/// @brief Re-rooting documents at a sub-path before comparison.
///
/// Path syntax: dot-separated keys with optional list indices, e.g.
/// "spec.template", "items[0].name", "[1]". An empty path is the root.

#pragma once

#include <yamldiff/document.h>
#include <yamldiff/node.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace yamldiff {

/// Chroot path that is malformed or does not resolve
class YAMLDIFF_API ChrootError : public std::runtime_error {
public:
    ChrootError(std::string path, const std::string& message);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Walk keys through maps and indices through lists.
/// @throws ChrootError on a syntax error, missing key, index out of range
///         or type mismatch
[[nodiscard]] YAMLDIFF_API Node navigate_to_path(const Node& doc, std::string_view path);

/// Re-root every document at path. With list_to_documents, a list target
/// contributes each of its elements as a separate document.
/// @throws ChrootError when the path does not resolve in some document
[[nodiscard]] YAMLDIFF_API DocumentList apply_chroot_to_documents(const DocumentList& docs,
                                                                  std::string_view path,
                                                                  bool list_to_documents = false);

} // namespace yamldiff
