// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// document.cpp
// yaml-cpp stream -> Node tree conversion, and Node -> YAML text

#include <yamldiff/document.h>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace yamldiff {

ParseError::ParseError(std::string message,
                       std::optional<std::size_t> line,
                       std::optional<std::size_t> column)
    : std::runtime_error(line ? "yaml: line " + std::to_string(*line) + ": " + message
                              : "yaml: " + message)
    , message_(std::move(message))
    , line_(line)
    , column_(column)
{}

namespace {

constexpr std::string_view kStrTag   = "tag:yaml.org,2002:str";
constexpr std::string_view kBoolTag  = "tag:yaml.org,2002:bool";
constexpr std::string_view kIntTag   = "tag:yaml.org,2002:int";
constexpr std::string_view kFloatTag = "tag:yaml.org,2002:float";
constexpr std::string_view kNullTag  = "tag:yaml.org,2002:null";
constexpr std::string_view kMergeKey = "<<";

template <typename T>
bool try_decode(const YAML::Node& node, T& out)
{
    return YAML::convert<T>::decode(node, out);
}

/// Resolve an untagged plain scalar: bool, then int, then float, else string
Node resolve_plain_scalar(const YAML::Node& node)
{
    bool b = false;
    if (try_decode(node, b)) {
        return Node{b};
    }
    std::int64_t i = 0;
    if (try_decode(node, i)) {
        return Node{i};
    }
    double d = 0.0;
    if (try_decode(node, d)) {
        return Node{d};
    }
    return Node{node.Scalar()};
}

Node resolve_scalar(const YAML::Node& node)
{
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    // "!" marks a quoted (non-plain) scalar, "?" an untagged plain one
    if (tag == "!" || tag == kStrTag) {
        return Node{text};
    }
    if (tag == "?" || tag.empty()) {
        return resolve_plain_scalar(node);
    }

    if (tag == kBoolTag) {
        bool b = false;
        if (try_decode(node, b)) return Node{b};
    } else if (tag == kIntTag) {
        std::int64_t i = 0;
        if (try_decode(node, i)) return Node{i};
    } else if (tag == kFloatTag) {
        double d = 0.0;
        if (try_decode(node, d)) return Node{d};
    } else if (tag == kNullTag) {
        return Node{};
    } else {
        // Custom tags carry their literal text
        return Node{text};
    }

    detail::log_message("resolve_scalar", "'" + text + "' does not match tag " + tag + ", kept as string");
    return Node{text};
}

std::string emit_flow(const YAML::Node& node)
{
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

/// Converts one YAML::Node tree. Holds the stack of nodes under construction
/// so an alias pointing back into it can be detected.
class Decoder
{
public:
    Node decode(const YAML::Node& node)
    {
        switch (node.Type()) {
            case YAML::NodeType::Scalar:
                return resolve_scalar(node);
            case YAML::NodeType::Sequence:
            case YAML::NodeType::Map:
                break;
            default:
                return Node{};
        }

        if (is_active(node)) {
            detail::log_message("Decoder::decode", "alias cycle detected, resolved as null");
            return Node{};
        }

        ActiveGuard guard{active_, node};
        return node.IsMap() ? decode_map(node) : decode_sequence(node);
    }

private:
    struct ActiveGuard
    {
        std::vector<YAML::Node>& stack;

        ActiveGuard(std::vector<YAML::Node>& s, const YAML::Node& node) : stack(s) { stack.push_back(node); }
        ~ActiveGuard() { stack.pop_back(); }

        ActiveGuard(const ActiveGuard&) = delete;
        ActiveGuard& operator=(const ActiveGuard&) = delete;
    };

    bool is_active(const YAML::Node& node) const
    {
        return std::ranges::any_of(active_, [&](const YAML::Node& n) { return n.is(node); });
    }

    Node decode_sequence(const YAML::Node& node)
    {
        auto items = NodeList{}.transient();
        for (const auto& child : node) {
            items.push_back(NodeBox{decode(child)});
        }
        return Node{items.persistent()};
    }

    Node decode_map(const YAML::Node& node)
    {
        OrderedMap result;
        for (const auto& entry : node) {
            const YAML::Node& key = entry.first;
            const YAML::Node& value = entry.second;

            if (key.IsScalar() && key.Scalar() == kMergeKey) {
                result = merge_into(std::move(result), value);
                continue;
            }
            result = result.set(key_to_string(key), decode(value));
        }
        return Node{std::move(result)};
    }

    /// `<<: *base` or `<<: [*a, *b]`; keys already present win
    OrderedMap merge_into(OrderedMap target, const YAML::Node& source)
    {
        auto merge_one = [&](const Node& merged) {
            if (auto* m = merged.get_if<OrderedMap>()) {
                m->for_each([&](const std::string& k, const Node& v) {
                    target = target.insert(k, v);
                });
            }
        };

        if (source.IsSequence()) {
            for (const auto& item : source) {
                merge_one(decode(item));
            }
        } else {
            merge_one(decode(source));
        }
        return target;
    }

    static std::string key_to_string(const YAML::Node& key)
    {
        if (key.IsScalar()) {
            return key.Scalar();
        }
        if (!key.IsDefined() || key.IsNull()) {
            return "null";
        }
        return emit_flow(key);
    }

    std::vector<YAML::Node> active_;
};

void emit_node(YAML::Emitter& out, const Node& node)
{
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out << YAML::Null;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            out << static_cast<long long>(v);
        } else if constexpr (std::is_same_v<T, OrderedMap>) {
            out << YAML::BeginMap;
            v.for_each([&](const std::string& key, const Node& child) {
                out << YAML::Key << key << YAML::Value;
                emit_node(out, child);
            });
            out << YAML::EndMap;
        } else if constexpr (std::is_same_v<T, NodeList>) {
            out << YAML::BeginSeq;
            for (const auto& box : v) {
                emit_node(out, box.get());
            }
            out << YAML::EndSeq;
        } else {
            out << v;
        }
    }, node.data);
}

} // anonymous namespace

DocumentList parse_documents(std::string_view content)
{
    std::vector<YAML::Node> raw;
    try {
        raw = YAML::LoadAll(std::string(content));
    } catch (const YAML::Exception& e) {
        if (e.mark.is_null()) {
            throw ParseError(e.msg);
        }
        throw ParseError(e.msg,
                         static_cast<std::size_t>(e.mark.line) + 1,
                         static_cast<std::size_t>(e.mark.column) + 1);
    }

    DocumentList docs;
    docs.reserve(std::max<std::size_t>(raw.size(), 1));
    for (const auto& root : raw) {
        Decoder decoder;
        docs.push_back(decoder.decode(root));
    }

    if (docs.empty()) {
        docs.emplace_back();
    }
    return docs;
}

std::string to_yaml_string(const Node& node)
{
    YAML::Emitter out;
    emit_node(out, node);
    if (!out.good()) {
        throw std::runtime_error("to_yaml_string: " + out.GetLastError());
    }
    return out.c_str();
}

} // namespace yamldiff
