// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document.h
/// @brief YAML stream parsing into Node trees (yaml-cpp backed).
///
/// A stream holds zero or more `---` separated documents. Each document
/// decodes to one root Node; an empty document decodes to Null, and a stream
/// with no documents at all yields a single Null document.
///
/// Decoding rules:
/// - mappings become OrderedMap in source order; a `<<` key merges the
///   referenced map (or sequence of maps) without overriding explicit keys
/// - sequences become NodeList in source order
/// - plain scalars resolve to bool, int, float or string (in that order),
///   quoted scalars and `!!str` stay strings; a failed resolution keeps the
///   literal text
/// - an alias that refers back to a node still being decoded yields Null

#pragma once

#include <yamldiff/node.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace yamldiff {

using DocumentList = std::vector<Node>;

/// Malformed YAML input. Line/column are 1-based when known.
class YAMLDIFF_API ParseError : public std::runtime_error {
public:
    ParseError(std::string message,
               std::optional<std::size_t> line = std::nullopt,
               std::optional<std::size_t> column = std::nullopt);

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] std::optional<std::size_t> line() const noexcept { return line_; }
    [[nodiscard]] std::optional<std::size_t> column() const noexcept { return column_; }

private:
    std::string message_;
    std::optional<std::size_t> line_;
    std::optional<std::size_t> column_;
};

/// Parse a (possibly multi-document) YAML stream.
/// @throws ParseError on malformed input
[[nodiscard]] YAMLDIFF_API DocumentList parse_documents(std::string_view content);

/// Serialize a Node back to block-style YAML text
[[nodiscard]] YAMLDIFF_API std::string to_yaml_string(const Node& node);

} // namespace yamldiff
