// comparator.cpp - Structural comparison of Node trees

#include <yamldiff/comparator.h>
#include <yamldiff/equality.h>
#include <yamldiff/kubernetes.h>
#include <yamldiff/list_matching.h>
#include <yamldiff/rename.h>

#include <algorithm>
#include <map>

namespace yamldiff {

Comparator::Comparator(Options opts) : opts_(std::move(opts)) {}

void Comparator::compare(const DocumentList& from, const DocumentList& to)
{
    clear();

    if (opts_.detect_kubernetes && has_kubernetes_documents(from, to)) {
        compare_kubernetes_documents(from, to);
    } else {
        compare_positional_documents(from, to);
    }
}

void Comparator::compare_nodes(const Node& from, const Node& to, Path path)
{
    const auto prefix = path_to_string(path);
    order_.add_document(from, prefix, opts_);
    order_.add_document(to, prefix, opts_);
    diff_value(from, to, path);
}

std::vector<Difference> Comparator::take_diffs() noexcept
{
    auto result = std::move(diffs_);
    diffs_.clear();
    return result;
}

void Comparator::clear()
{
    diffs_.clear();
    order_.clear();
    document_index_ = 0;
}

// ============================================================
// Document level
// ============================================================

void Comparator::compare_positional_documents(const DocumentList& from, const DocumentList& to)
{
    const std::size_t max_len = std::max(from.size(), to.size());
    const Node missing{};

    for (std::size_t i = 0; i < max_len; ++i) {
        const Node& from_doc = i < from.size() ? from[i] : missing;
        const Node& to_doc = i < to.size() ? to[i] : missing;
        compare_document_pair(from_doc, to_doc, i, max_len > 1 ? document_prefix(i) : std::string{});
    }
}

void Comparator::compare_kubernetes_documents(const DocumentList& from, const DocumentList& to)
{
    auto match = match_kubernetes_documents(from, to);
    auto matched = std::move(match.matched);
    auto unmatched_from = std::move(match.unmatched_from);
    auto unmatched_to = std::move(match.unmatched_to);

    if (opts_.detect_renames) {
        auto renames = detect_renames(from, to, unmatched_from, unmatched_to);
        matched.insert(matched.end(), renames.matched.begin(), renames.matched.end());
        std::ranges::sort(matched);
        unmatched_from = std::move(renames.remaining_from);
        unmatched_to = std::move(renames.remaining_to);
    }

    const bool multi = from.size() > 1 || to.size() > 1;
    for (const auto& [fi, ti] : matched) {
        compare_document_pair(from[fi], to[ti], fi, multi ? document_prefix(fi) : std::string{});
    }

    for (auto fi : unmatched_from) {
        if (from[fi].is_null()) {
            continue;
        }
        document_index_ = fi;
        order_.register_path(document_prefix(fi));
        emit(Difference::Type::Removed, Path{document_prefix(fi)}, from[fi], std::nullopt);
    }

    for (auto ti : unmatched_to) {
        if (to[ti].is_null()) {
            continue;
        }
        document_index_ = ti;
        order_.register_path(document_prefix(ti));
        emit(Difference::Type::Added, Path{document_prefix(ti)}, std::nullopt, to[ti]);
    }
}

void Comparator::compare_document_pair(const Node& from, const Node& to, std::size_t doc_index,
                                       const std::string& prefix)
{
    document_index_ = doc_index;
    order_.add_document(from, prefix, opts_);
    order_.add_document(to, prefix, opts_);

    Path current_path;
    current_path.reserve(16);
    if (!prefix.empty()) {
        current_path.emplace_back(prefix);
    }
    diff_value(from, to, current_path);
}

// ============================================================
// Node level
// ============================================================

void Comparator::diff_value(const Node& from, const Node& to, Path& current_path)
{
    if (&from.data == &to.data) {
        return;
    }

    if (from.is_null() && to.is_null()) {
        return;
    }
    if (from.is_null()) {
        emit(Difference::Type::Added, current_path, std::nullopt, to);
        return;
    }
    if (to.is_null()) {
        // A key set to null still exists: a value change, not a removal
        if (!opts_.ignore_value_changes) {
            emit(Difference::Type::Modified, current_path, from, Node{});
        }
        return;
    }

    if (from.kind() != to.kind()) [[unlikely]] {
        if (!opts_.ignore_value_changes) {
            emit(Difference::Type::Modified, current_path, from, to);
        }
        return;
    }

    std::visit([&](const auto& from_arg) {
        using T = std::decay_t<decltype(from_arg)>;

        if constexpr (std::is_same_v<T, OrderedMap>) {
            diff_map(from_arg, std::get<OrderedMap>(to.data), current_path);
        } else if constexpr (std::is_same_v<T, NodeList>) {
            diff_list(from_arg, std::get<NodeList>(to.data), current_path);
        } else {
            if (!values_equal(from, to, opts_) && !opts_.ignore_value_changes) {
                emit(Difference::Type::Modified, current_path, from, to);
            }
        }
    }, from.data);
}

void Comparator::diff_map(const OrderedMap& from, const OrderedMap& to, Path& current_path)
{
    // Source order of from, then keys only present in to
    from.for_each([&](const std::string& key, const Node& from_val) {
        current_path.emplace_back(key);
        if (const Node* to_val = to.find(key)) {
            diff_value(from_val, *to_val, current_path);
        } else {
            emit(Difference::Type::Removed, current_path, from_val, std::nullopt);
        }
        current_path.pop_back();
    });

    to.for_each([&](const std::string& key, const Node& to_val) {
        if (from.contains(key)) {
            return;
        }
        current_path.emplace_back(key);
        emit(Difference::Type::Added, current_path, std::nullopt, to_val);
        current_path.pop_back();
    });
}

void Comparator::diff_list(const NodeList& from, const NodeList& to, Path& current_path)
{
    switch (select_list_strategy(from, to, opts_)) {
        case ListStrategy::Identifier:
            diff_list_by_identifier(from, to, current_path);
            break;
        case ListStrategy::Unordered:
        case ListStrategy::Heterogeneous: {
            std::vector<std::size_t> from_indices(from.size());
            std::vector<std::size_t> to_indices(to.size());
            for (std::size_t i = 0; i < from_indices.size(); ++i) from_indices[i] = i;
            for (std::size_t i = 0; i < to_indices.size(); ++i) to_indices[i] = i;
            diff_list_unordered(from, to, from_indices, to_indices, current_path);
            break;
        }
        case ListStrategy::Positional:
            diff_list_positional(from, to, current_path);
            break;
    }
}

void Comparator::diff_list_positional(const NodeList& from, const NodeList& to, Path& current_path)
{
    const std::size_t from_size = from.size();
    const std::size_t to_size = to.size();
    const std::size_t common_size = std::min(from_size, to_size);

    for (std::size_t i = 0; i < common_size; ++i) {
        current_path.emplace_back(i);
        diff_value(from[i].get(), to[i].get(), current_path);
        current_path.pop_back();
    }

    // Removed tail elements
    for (std::size_t i = common_size; i < from_size; ++i) {
        current_path.emplace_back(i);
        emit(Difference::Type::Removed, current_path, from[i].get(), std::nullopt);
        current_path.pop_back();
    }

    // Added tail elements
    for (std::size_t i = common_size; i < to_size; ++i) {
        current_path.emplace_back(i);
        emit(Difference::Type::Added, current_path, std::nullopt, to[i].get());
        current_path.pop_back();
    }
}

void Comparator::diff_list_by_identifier(const NodeList& from, const NodeList& to, Path& current_path)
{
    using IndexedIds = std::vector<std::pair<IdentifierKey, std::size_t>>;

    // First occurrence of each identifier is matched by identifier;
    // duplicates and entries without one are matched as a multiset.
    auto partition = [&](const NodeList& list,
                         std::map<IdentifierKey, std::size_t>& index,
                         IndexedIds& with_id,
                         std::vector<std::size_t>& without_id) {
        for (std::size_t i = 0; i < list.size(); ++i) {
            auto key = identifier_key(list[i].get(), opts_);
            if (key && index.try_emplace(*key, i).second) {
                with_id.emplace_back(std::move(*key), i);
            } else {
                without_id.push_back(i);
            }
        }
    };

    std::map<IdentifierKey, std::size_t> from_index;
    std::map<IdentifierKey, std::size_t> to_index;
    IndexedIds from_ids;
    IndexedIds to_ids;
    std::vector<std::size_t> from_no_id;
    std::vector<std::size_t> to_no_id;
    partition(from, from_index, from_ids, from_no_id);
    partition(to, to_index, to_ids, to_no_id);

    for (const auto& [key, fi] : from_ids) {
        const Node& from_item = from[fi].get();
        if (auto it = to_index.find(key); it != to_index.end()) {
            const Node* id = identifier_field(from_item, opts_.additional_identifiers);
            current_path.emplace_back(scalar_to_string(*id));
            diff_value(from_item, to[it->second].get(), current_path);
            current_path.pop_back();
        } else {
            // Whole entry removed: reported at the list itself
            emit(Difference::Type::Removed, current_path, from_item, std::nullopt);
        }
    }

    for (const auto& [key, ti] : to_ids) {
        if (!from_index.contains(key)) {
            emit(Difference::Type::Added, current_path, std::nullopt, to[ti].get());
        }
    }

    diff_list_unordered(from, to, from_no_id, to_no_id, current_path);
}

void Comparator::diff_list_unordered(const NodeList& from, const NodeList& to,
                                     const std::vector<std::size_t>& from_indices,
                                     const std::vector<std::size_t>& to_indices,
                                     Path& current_path)
{
    std::vector<bool> to_matched(to_indices.size(), false);

    for (auto fi : from_indices) {
        const Node& from_item = from[fi].get();
        bool found = false;
        for (std::size_t j = 0; j < to_indices.size(); ++j) {
            if (to_matched[j]) {
                continue;
            }
            if (deep_equal(from_item, to[to_indices[j]].get(), opts_)) {
                to_matched[j] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            current_path.emplace_back(fi);
            emit(Difference::Type::Removed, current_path, from_item, std::nullopt);
            current_path.pop_back();
        }
    }

    for (std::size_t j = 0; j < to_indices.size(); ++j) {
        if (to_matched[j]) {
            continue;
        }
        current_path.emplace_back(to_indices[j]);
        emit(Difference::Type::Added, current_path, std::nullopt, to[to_indices[j]].get());
        current_path.pop_back();
    }
}

void Comparator::emit(Difference::Type type, const Path& path,
                      std::optional<Node> from, std::optional<Node> to)
{
    auto& diff = diffs_.emplace_back(type, path_to_string(path), std::move(from), std::move(to));
    diff.document_index = document_index_;
}

// ============================================================
// Free function
// ============================================================

std::vector<Difference> compare_nodes(const Node& from, const Node& to, const Options& opts, Path path)
{
    Comparator comparator{opts};
    comparator.compare_nodes(from, to, std::move(path));
    return comparator.take_diffs();
}

} // namespace yamldiff
