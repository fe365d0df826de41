// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// chroot.cpp

#include <yamldiff/chroot.h>
#include <yamldiff/path.h>

namespace yamldiff {

namespace {

std::string_view kind_name(const Node& node) noexcept
{
    switch (node.kind()) {
        case NodeKind::Null:   return "null";
        case NodeKind::Bool:   return "bool";
        case NodeKind::Int:    return "int";
        case NodeKind::Float:  return "float";
        case NodeKind::String: return "string";
        case NodeKind::Map:    return "map";
        case NodeKind::List:   return "list";
    }
    return "unknown";
}

} // anonymous namespace

ChrootError::ChrootError(std::string path, const std::string& message)
    : std::runtime_error("chroot path \"" + path + "\": " + message)
    , path_(std::move(path))
{}

Node navigate_to_path(const Node& doc, std::string_view path)
{
    Path elements;
    try {
        elements = parse_dotted_path(path);
    } catch (const std::invalid_argument& e) {
        throw ChrootError(std::string(path), e.what());
    }

    Node current = doc;
    for (const auto& elem : elements) {
        if (auto* index = std::get_if<std::size_t>(&elem)) {
            auto* list = current.get_if<NodeList>();
            if (!list) {
                throw ChrootError(std::string(path),
                                  "expected list at [" + std::to_string(*index) + "], got " +
                                      std::string(kind_name(current)));
            }
            if (*index >= list->size()) {
                throw ChrootError(std::string(path),
                                  "index " + std::to_string(*index) + " out of bounds (list has " +
                                      std::to_string(list->size()) + " items)");
            }
            current = (*list)[*index].get();
        } else {
            const auto& key = std::get<std::string>(elem);
            auto* m = current.get_if<OrderedMap>();
            if (!m) {
                throw ChrootError(std::string(path),
                                  "expected map at \"" + key + "\", got " + std::string(kind_name(current)));
            }
            const Node* found = m->find(key);
            if (!found) {
                throw ChrootError(std::string(path), "key \"" + key + "\" not found");
            }
            current = *found;
        }
    }
    return current;
}

DocumentList apply_chroot_to_documents(const DocumentList& docs, std::string_view path, bool list_to_documents)
{
    if (path.empty()) {
        return docs;
    }

    DocumentList result;
    for (const auto& doc : docs) {
        Node target = navigate_to_path(doc, path);
        if (auto* list = target.get_if<NodeList>(); list && list_to_documents) {
            for (const auto& box : *list) {
                result.push_back(box.get());
            }
        } else {
            result.push_back(std::move(target));
        }
    }
    return result;
}

} // namespace yamldiff
