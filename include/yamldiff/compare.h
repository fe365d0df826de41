// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare.h
/// @brief Entry point: YAML text in, ordered differences out.
///
/// Pipeline: parse both streams, exchange them when `swap` is set, apply
/// `chroot` (or `chroot_from` / `chroot_to`), compare document by document,
/// then sort into presentation order (see diff_order.h).
///
/// Each call owns its own trees and Options copy, so independent calls may
/// run concurrently.
///
/// @code
///   yamldiff::Options opts;
///   opts.detect_kubernetes = true;
///   for (const auto& d : yamldiff::compare(from_text, to_text, opts)) {
///       std::cout << yamldiff::to_string(d) << "\n";
///   }
/// @endcode

#pragma once

#include <yamldiff/chroot.h>
#include <yamldiff/difference.h>
#include <yamldiff/document.h>
#include <yamldiff/options.h>

#include <string_view>
#include <vector>

namespace yamldiff {

/// @throws ParseError on malformed YAML in either input
/// @throws ChrootError when a chroot path does not resolve
[[nodiscard]] YAMLDIFF_API std::vector<Difference> compare(std::string_view from,
                                                           std::string_view to,
                                                           const Options& opts = {});

/// Same as compare() on already parsed documents
/// @throws ChrootError when a chroot path does not resolve
[[nodiscard]] YAMLDIFF_API std::vector<Difference> compare_documents(DocumentList from,
                                                                     DocumentList to,
                                                                     const Options& opts = {});

} // namespace yamldiff
