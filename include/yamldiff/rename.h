// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file rename.h
/// @brief Pairing of renamed Kubernetes documents by content similarity.
///
/// Documents left unmatched by identifier are serialized to YAML and
/// compared line by line. Each non-blank line is hashed (DJB, seed 5381)
/// into a multiset; the score of a pair is the percentage of shared lines
/// relative to the longer document. Pairs scoring at least
/// kRenameScoreThreshold are assigned greedily, best score first.

#pragma once

#include <yamldiff/document.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace yamldiff {

inline constexpr int kRenameScoreThreshold = 60;     // Minimum similarity percentage
inline constexpr std::size_t kRenameLimit = 50;      // Max candidates on either side

class YAMLDIFF_API SimilarityIndex {
public:
    explicit SimilarityIndex(std::string_view text);

    /// Similarity 0..100
    [[nodiscard]] int score(const SimilarityIndex& other) const;

    [[nodiscard]] std::size_t line_count() const noexcept { return num_lines_; }

private:
    std::unordered_map<std::uint32_t, int> hashes_;
    std::size_t num_lines_ = 0;
};

struct RenameMatch {
    std::vector<std::pair<std::size_t, std::size_t>> matched;  // (from, to), by from index
    std::vector<std::size_t> remaining_from;
    std::vector<std::size_t> remaining_to;
};

/// Pair unmatched Kubernetes documents by similarity. Non-Kubernetes and
/// Null documents pass straight through to the remaining lists.
[[nodiscard]] YAMLDIFF_API RenameMatch detect_renames(const DocumentList& from,
                                                      const DocumentList& to,
                                                      const std::vector<std::size_t>& unmatched_from,
                                                      const std::vector<std::size_t>& unmatched_to);

} // namespace yamldiff
