// difference.h - One reported change between two YAML documents

#pragma once

#include <yamldiff/api.h>
#include <yamldiff/node.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace yamldiff {

struct Difference {
    enum class Type { Added, Removed, Modified, OrderChanged };

    Type type = Type::Added;
    std::string path;               // Dotted path, "" for a document root
    std::optional<Node> from;       // Absent for Added
    std::optional<Node> to;         // Absent for Removed; Null when a value became null
    std::size_t document_index = 0;

    Difference() = default;

    Difference(Type t, std::string p, std::optional<Node> f, std::optional<Node> n)
        : type(t), path(std::move(p)), from(std::move(f)), to(std::move(n)) {}

    /// The value that was added/removed/changed
    /// For Added: returns to
    /// For Removed: returns from
    /// For Modified: returns to (use get_from() for the previous value)
    [[nodiscard]] const Node& value() const {
        return (type == Type::Removed) ? get_from() : get_to();
    }

    [[nodiscard]] const Node& get_from() const {
        if (!from) throw std::runtime_error("Difference: from value not available");
        return *from;
    }

    [[nodiscard]] const Node& get_to() const {
        if (!to) throw std::runtime_error("Difference: to value not available");
        return *to;
    }
};

[[nodiscard]] YAMLDIFF_API std::string_view to_string(Difference::Type type) noexcept;

/// One-line rendering, e.g. "MODIFIED b: 2 -> 3"
[[nodiscard]] YAMLDIFF_API std::string to_string(const Difference& diff);

} // namespace yamldiff
