// node.cpp
// Node rendering helpers

#include <yamldiff/node.h>

#include <charconv>
#include <iostream>

namespace yamldiff {

namespace {

/// Shortest round-trip form (1.5, 0.1, 1e+21)
std::string format_double(double d)
{
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        return std::to_string(d);
    }
    return std::string(buf, end);
}

} // anonymous namespace

std::string value_to_string(const Node& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(arg);
        } else if constexpr (std::is_same_v<T, OrderedMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, NodeList>) {
            return "[list:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::string scalar_to_string(const Node& val)
{
    if (auto* s = val.get_if<std::string>()) {
        return *s;
    }
    if (auto* d = val.get_if<double>()) {
        return format_double(*d);
    }
    return value_to_string(val);
}

void print_node(const Node& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, OrderedMap>) {
                arg.for_each([&](const std::string& k, const Node& v) {
                    std::cout << std::string(depth * 2, ' ') << prefix << k << ":\n";
                    print_node(v, "", depth + 1);
                });
            } else if constexpr (std::is_same_v<T, NodeList>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "["
                              << i << "]:\n";
                    print_node(arg[i].get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                std::cout << std::string(depth * 2, ' ') << prefix << arg << "\n";
            } else {
                std::cout << std::string(depth * 2, ' ') << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

} // namespace yamldiff
