// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// difference.cpp

#include <yamldiff/difference.h>

namespace yamldiff {

std::string_view to_string(Difference::Type type) noexcept
{
    switch (type) {
        case Difference::Type::Added:        return "ADDED";
        case Difference::Type::Removed:      return "REMOVED";
        case Difference::Type::Modified:     return "MODIFIED";
        case Difference::Type::OrderChanged: return "ORDER_CHANGED";
    }
    return "UNKNOWN";
}

std::string to_string(const Difference& diff)
{
    std::string result{to_string(diff.type)};
    result += ' ';
    result += diff.path.empty() ? "(root)" : diff.path;
    result += ": ";

    auto render = [](const std::optional<Node>& v) {
        return v ? value_to_string(*v) : std::string("<none>");
    };

    switch (diff.type) {
        case Difference::Type::Added:
            result += render(diff.to);
            break;
        case Difference::Type::Removed:
            result += render(diff.from);
            break;
        case Difference::Type::Modified:
        case Difference::Type::OrderChanged:
            result += render(diff.from) + " -> " + render(diff.to);
            break;
    }
    return result;
}

} // namespace yamldiff
