// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// list_matching.cpp

#include <yamldiff/list_matching.h>

#include <cmath>
#include <set>

namespace yamldiff {

const Node* identifier_field(const Node& item, const std::vector<std::string>& additional_identifiers)
{
    auto* m = item.get_if<OrderedMap>();
    if (!m) {
        return nullptr;
    }
    for (const auto& field : additional_identifiers) {
        if (auto* v = m->find(field)) {
            return v;
        }
    }
    if (auto* v = m->find("name")) {
        return v;
    }
    return m->find("id");
}

bool is_usable_identifier(const Node* id) noexcept
{
    if (!id || !id->is_scalar()) {
        return false;
    }
    if (auto* d = id->get_if<double>()) {
        return !std::isnan(*d);
    }
    return true;
}

std::optional<IdentifierKey> identifier_key(const Node& item, const Options& opts)
{
    const Node* id = identifier_field(item, opts.additional_identifiers);
    if (!is_usable_identifier(id)) {
        return std::nullopt;
    }
    return std::visit([](const auto& v) -> std::optional<IdentifierKey> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
                      std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return IdentifierKey{v};
        } else {
            return std::nullopt;
        }
    }, id->data);
}

bool can_match_by_identifier(const NodeList& list, const Options& opts)
{
    if (list.empty()) {
        return false;
    }

    bool has_identifier = false;
    for (const auto& box : list) {
        const Node& item = box.get();
        if (!item.is_map()) {
            return false;
        }
        if (!has_identifier && identifier_key(item, opts)) {
            has_identifier = true;
        }
    }
    return has_identifier;
}

bool are_list_items_heterogeneous(const NodeList& from, const NodeList& to)
{
    std::set<std::string> all_keys;
    bool single_key_maps = true;

    auto scan = [&](const NodeList& list) {
        for (const auto& box : list) {
            auto* m = box.get().get_if<OrderedMap>();
            if (!m) {
                single_key_maps = false;
                continue;
            }
            if (m->size() != 1) {
                single_key_maps = false;
            }
            for (const auto& key : m->keys()) {
                all_keys.insert(key);
            }
        }
    };

    scan(from);
    scan(to);

    if (all_keys.empty()) {
        return false;
    }
    return single_key_maps && all_keys.size() > 1;
}

ListStrategy select_list_strategy(const NodeList& from, const NodeList& to, const Options& opts)
{
    if (can_match_by_identifier(from, opts) && can_match_by_identifier(to, opts)) {
        return ListStrategy::Identifier;
    }
    if (opts.ignore_order_changes) {
        return ListStrategy::Unordered;
    }
    if (are_list_items_heterogeneous(from, to)) {
        return ListStrategy::Heterogeneous;
    }
    return ListStrategy::Positional;
}

std::string_view to_string(ListStrategy strategy) noexcept
{
    switch (strategy) {
        case ListStrategy::Identifier:    return "identifier";
        case ListStrategy::Unordered:     return "unordered";
        case ListStrategy::Heterogeneous: return "heterogeneous";
        case ListStrategy::Positional:    return "positional";
    }
    return "unknown";
}

} // namespace yamldiff
