// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// diff_order.cpp

#include <yamldiff/diff_order.h>
#include <yamldiff/list_matching.h>
#include <yamldiff/path.h>

#include <algorithm>
#include <cctype>

namespace yamldiff {

// ============================================================
// PathOrder
// ============================================================

void PathOrder::register_path(const std::string& path)
{
    if (path.empty()) {
        return;
    }
    if (order_.try_emplace(path, next_).second) {
        ++next_;
    }
}

void PathOrder::add_document(const Node& doc, const std::string& prefix, const Options& opts)
{
    auto join = [](const std::string& base, const std::string& segment) {
        return base.empty() ? segment : base + "." + segment;
    };

    register_path(prefix);

    if (auto* m = doc.get_if<OrderedMap>()) {
        m->for_each([&](const std::string& key, const Node& child) {
            add_document(child, join(prefix, key), opts);
        });
    } else if (auto* list = doc.get_if<NodeList>()) {
        for (std::size_t i = 0; i < list->size(); ++i) {
            const Node& item = (*list)[i].get();
            const Node* id = identifier_field(item, opts.additional_identifiers);
            std::string segment = is_usable_identifier(id) ? scalar_to_string(*id) : std::to_string(i);
            add_document(item, join(prefix, segment), opts);
        }
    }
}

std::optional<std::size_t> PathOrder::find(std::string_view path) const
{
    if (auto it = order_.find(path); it != order_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::size_t> PathOrder::find_nearest(std::string_view path) const
{
    std::optional<std::string_view> current = path;
    while (current) {
        if (auto found = find(*current)) {
            return found;
        }
        current = parent_path(*current);
    }
    return std::nullopt;
}

void PathOrder::clear() noexcept
{
    order_.clear();
    next_ = 0;
}

// ============================================================
// Sorting
// ============================================================

bool is_list_entry(const Difference& diff)
{
    std::string_view path = diff.path;

    if (!path.empty() && path.back() == ']') {
        return true;
    }

    if (path.size() > 1) {
        auto last_dot = path.rfind('.');
        if (last_dot != std::string_view::npos && last_dot < path.size() - 1) {
            auto suffix = path.substr(last_dot + 1);
            if (std::ranges::all_of(suffix, [](unsigned char c) { return std::isdigit(c); })) {
                return true;
            }
        }
    }

    const Node* val = nullptr;
    if (diff.to && !diff.to->is_null()) {
        val = &*diff.to;
    } else if (diff.from) {
        val = &*diff.from;
    }
    return val && (val->contains("name") || val->contains("id"));
}

bool is_root_addition(const Difference& diff)
{
    return diff.type == Difference::Type::Added &&
           diff.path.find('.') == std::string::npos &&
           !is_list_entry(diff);
}

void sort_differences(std::vector<Difference>& diffs, const PathOrder& order)
{
    std::ranges::stable_sort(diffs, [&](const Difference& a, const Difference& b) {
        if (a.document_index != b.document_index) {
            return a.document_index < b.document_index;
        }

        bool root_add_a = is_root_addition(a);
        bool root_add_b = is_root_addition(b);
        if (root_add_a != root_add_b) {
            return root_add_a;
        }

        auto root_a = root_segment(a.path);
        auto root_b = root_segment(b.path);
        if (root_a != root_b) {
            auto oa = order.find(root_a);
            auto ob = order.find(root_b);
            if (oa && ob) {
                return *oa < *ob;
            }
            return root_a < root_b;
        }

        auto exact_a = order.find(a.path);
        auto exact_b = order.find(b.path);
        if (exact_a && exact_b) {
            return *exact_a < *exact_b;
        }
        if (exact_a || exact_b) {
            return exact_a.has_value();
        }

        auto parent_a = order.find_nearest(a.path);
        auto parent_b = order.find_nearest(b.path);
        if (parent_a && parent_b && *parent_a != *parent_b) {
            return *parent_a < *parent_b;
        }

        auto depth_a = path_depth(a.path);
        auto depth_b = path_depth(b.path);
        if (depth_a != depth_b) {
            return depth_a < depth_b;
        }
        return a.path < b.path;
    });
}

} // namespace yamldiff
