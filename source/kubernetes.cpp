// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// kubernetes.cpp

#include <yamldiff/kubernetes.h>

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace yamldiff {

namespace {

// Scalars render as text; maps and lists render as their YAML content
std::string identity_part(const Node& node)
{
    return node.is_scalar() ? scalar_to_string(node) : to_yaml_string(node);
}

} // anonymous namespace

bool is_kubernetes_resource(const Node& doc)
{
    auto* m = doc.get_if<OrderedMap>();
    if (!m) {
        return false;
    }

    auto* api_version = m->find("apiVersion");
    if (!api_version || !api_version->is_string()) {
        return false;
    }
    auto* kind = m->find("kind");
    if (!kind || !kind->is_string()) {
        return false;
    }

    auto* metadata = m->find("metadata");
    if (!metadata) {
        return false;
    }
    auto* meta = metadata->get_if<OrderedMap>();
    if (!meta) {
        return false;
    }

    auto* name = meta->find("name");
    auto* generate_name = meta->find("generateName");
    return (name && !name->is_null()) || (generate_name && !generate_name->is_null());
}

std::string kubernetes_identifier(const Node& doc)
{
    if (!is_kubernetes_resource(doc)) {
        return "";
    }

    const auto& m = *doc.get_if<OrderedMap>();
    const auto& meta = *m.find("metadata")->get_if<OrderedMap>();

    const Node* name = meta.find("name");
    if (!name || name->is_null()) {
        name = meta.find("generateName");
    }

    std::string id = m.find("apiVersion")->as_string() + ":" + m.find("kind")->as_string() + ":";
    if (auto* ns = meta.find("namespace"); ns && !ns->is_null()) {
        id += identity_part(*ns) + "/";
    }
    return id + identity_part(*name);
}

bool has_kubernetes_documents(const DocumentList& from, const DocumentList& to)
{
    return std::ranges::any_of(from, is_kubernetes_resource) ||
           std::ranges::any_of(to, is_kubernetes_resource);
}

DocumentMatch match_kubernetes_documents(const DocumentList& from, const DocumentList& to)
{
    DocumentMatch result;

    // Identifier -> to indices not yet claimed, in document order
    std::unordered_map<std::string, std::deque<std::size_t>> to_index;
    std::vector<bool> to_matched(to.size(), false);

    for (std::size_t i = 0; i < to.size(); ++i) {
        if (auto id = kubernetes_identifier(to[i]); !id.empty()) {
            to_index[id].push_back(i);
        }
    }

    for (std::size_t i = 0; i < from.size(); ++i) {
        auto id = kubernetes_identifier(from[i]);
        if (!id.empty()) {
            auto it = to_index.find(id);
            if (it != to_index.end() && !it->second.empty()) {
                std::size_t to_idx = it->second.front();
                it->second.pop_front();
                result.matched.emplace_back(i, to_idx);
                to_matched[to_idx] = true;
                continue;
            }
        }
        result.unmatched_from.push_back(i);
    }

    for (std::size_t i = 0; i < to.size(); ++i) {
        if (!to_matched[i]) {
            result.unmatched_to.push_back(i);
        }
    }

    return result;
}

} // namespace yamldiff
