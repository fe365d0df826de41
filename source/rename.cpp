// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// rename.cpp

#include <yamldiff/rename.h>
#include <yamldiff/kubernetes.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

namespace yamldiff {

SimilarityIndex::SimilarityIndex(std::string_view text)
{
    std::size_t start = 0;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        if (i != text.size() && text[i] != '\n') {
            continue;
        }
        auto line = text.substr(start, i - start);
        start = i + 1;

        if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
            continue;
        }

        std::uint32_t h = 5381;
        for (unsigned char c : line) {
            h = h * 33 + c;
        }
        ++hashes_[h];
        ++num_lines_;
    }
}

int SimilarityIndex::score(const SimilarityIndex& other) const
{
    std::size_t max_lines = std::max(num_lines_, other.num_lines_);
    if (max_lines == 0) {
        return 0;
    }

    std::size_t matching = 0;
    for (const auto& [h, count] : other.hashes_) {
        if (auto it = hashes_.find(h); it != hashes_.end()) {
            matching += static_cast<std::size_t>(std::min(it->second, count));
        }
    }
    return static_cast<int>(matching * 100 / max_lines);
}

namespace {

struct Candidate {
    std::size_t index;
    SimilarityIndex similarity;
    std::size_t byte_len;
};

struct ScoredPair {
    std::size_t from;
    std::size_t to;
    int score;
};

/// Serialize Kubernetes candidates; everything else goes to `remaining`
std::vector<Candidate> collect_candidates(const DocumentList& docs,
                                          const std::vector<std::size_t>& indices,
                                          std::vector<std::size_t>& remaining)
{
    std::vector<Candidate> candidates;
    for (auto idx : indices) {
        if (docs[idx].is_null() || !is_kubernetes_resource(docs[idx])) {
            remaining.push_back(idx);
            continue;
        }
        try {
            std::string text = to_yaml_string(docs[idx]);
            candidates.push_back(Candidate{idx, SimilarityIndex{text}, text.size()});
        } catch (const std::runtime_error& e) {
            detail::log_message("detect_renames", std::string("document not serializable: ") + e.what());
            remaining.push_back(idx);
        }
    }
    return candidates;
}

bool size_ratio_rejected(std::size_t a, std::size_t b) noexcept
{
    auto [min_len, max_len] = std::minmax(a, b);
    return max_len > 0 && min_len * 100 / max_len < static_cast<std::size_t>(kRenameScoreThreshold);
}

} // anonymous namespace

RenameMatch detect_renames(const DocumentList& from,
                           const DocumentList& to,
                           const std::vector<std::size_t>& unmatched_from,
                           const std::vector<std::size_t>& unmatched_to)
{
    RenameMatch result;
    if (unmatched_from.empty() || unmatched_to.empty()) {
        result.remaining_from = unmatched_from;
        result.remaining_to = unmatched_to;
        return result;
    }

    // Count Kubernetes candidates before paying for serialization
    auto count_k8s = [](const DocumentList& docs, const std::vector<std::size_t>& indices) {
        return static_cast<std::size_t>(std::ranges::count_if(indices, [&](std::size_t i) {
            return is_kubernetes_resource(docs[i]);
        }));
    };
    if (std::max(count_k8s(from, unmatched_from), count_k8s(to, unmatched_to)) > kRenameLimit) {
        result.remaining_from = unmatched_from;
        result.remaining_to = unmatched_to;
        return result;
    }

    auto from_candidates = collect_candidates(from, unmatched_from, result.remaining_from);
    auto to_candidates = collect_candidates(to, unmatched_to, result.remaining_to);

    std::vector<ScoredPair> pairs;
    for (const auto& fc : from_candidates) {
        for (const auto& tc : to_candidates) {
            if (size_ratio_rejected(fc.byte_len, tc.byte_len)) {
                continue;
            }
            int s = fc.similarity.score(tc.similarity);
            if (s >= kRenameScoreThreshold) {
                pairs.push_back(ScoredPair{fc.index, tc.index, s});
            }
        }
    }

    std::ranges::stable_sort(pairs, [](const ScoredPair& a, const ScoredPair& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.from != b.from) return a.from < b.from;
        return a.to < b.to;
    });

    std::map<std::size_t, std::size_t> assigned;  // from -> to
    std::vector<bool> to_taken(to.size(), false);
    for (const auto& pair : pairs) {
        if (assigned.contains(pair.from) || to_taken[pair.to]) {
            continue;
        }
        assigned.emplace(pair.from, pair.to);
        to_taken[pair.to] = true;
    }

    for (const auto& [f, t] : assigned) {
        result.matched.emplace_back(f, t);
    }
    for (const auto& fc : from_candidates) {
        if (!assigned.contains(fc.index)) {
            result.remaining_from.push_back(fc.index);
        }
    }
    for (const auto& tc : to_candidates) {
        if (!to_taken[tc.index]) {
            result.remaining_to.push_back(tc.index);
        }
    }

    std::ranges::sort(result.remaining_from);
    std::ranges::sort(result.remaining_to);
    return result;
}

} // namespace yamldiff
