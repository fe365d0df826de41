// path.cpp
// Dotted path rendering and parsing

#include <yamldiff/path.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace yamldiff {

namespace {

bool is_array_index(std::string_view s)
{
    if (s.empty()) {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

/// Split on '.' outside brackets; empty parts are dropped
std::vector<std::string_view> split_dotted(std::string_view path_str)
{
    std::vector<std::string_view> parts;
    bool in_bracket = false;
    std::size_t start = 0;

    for (std::size_t i = 0; i < path_str.size(); ++i) {
        switch (path_str[i]) {
            case '.':
                if (!in_bracket) {
                    if (i > start) {
                        parts.push_back(path_str.substr(start, i - start));
                    }
                    start = i + 1;
                }
                break;
            case '[':
                if (in_bracket) {
                    throw std::invalid_argument("invalid path syntax \"" + std::string(path_str) + "\"");
                }
                in_bracket = true;
                break;
            case ']':
                if (!in_bracket) {
                    throw std::invalid_argument("invalid path syntax \"" + std::string(path_str) + "\"");
                }
                in_bracket = false;
                break;
            default:
                break;
        }
    }
    if (in_bracket) {
        throw std::invalid_argument("invalid path syntax \"" + std::string(path_str) + "\"");
    }
    if (start < path_str.size()) {
        parts.push_back(path_str.substr(start));
    }
    return parts;
}

} // anonymous namespace

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        if (!result.empty()) {
            result += '.';
        }
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += v;
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

std::string document_prefix(std::size_t index)
{
    return "[" + std::to_string(index) + "]";
}

Path parse_dotted_path(std::string_view path_str)
{
    PathBuilder builder;

    for (auto part : split_dotted(path_str)) {
        auto open = part.find('[');
        if (open == std::string_view::npos) {
            builder.key(std::string(part));
            continue;
        }

        // key[index] or [index]; exactly one bracket pair, closing the part
        if (std::ranges::count(part, '[') != 1 || std::ranges::count(part, ']') != 1 ||
            part.back() != ']') {
            throw std::invalid_argument("invalid list index syntax \"" + std::string(part) + "\"");
        }

        auto key = part.substr(0, open);
        auto index_str = part.substr(open + 1, part.size() - open - 2);
        if (index_str.empty()) {
            throw std::invalid_argument("empty list index in \"" + std::string(part) + "\"");
        }
        std::size_t index = 0;
        auto [end, ec] = std::from_chars(index_str.data(), index_str.data() + index_str.size(), index);
        if (!is_array_index(index_str) || ec != std::errc{} || end != index_str.data() + index_str.size()) {
            throw std::invalid_argument("invalid list index \"" + std::string(index_str) + "\"");
        }

        if (!key.empty()) {
            builder.key(std::string(key));
        }
        builder.index(index);
    }

    return std::move(builder).path();
}

std::size_t path_depth(std::string_view path) noexcept
{
    return static_cast<std::size_t>(std::ranges::count(path, '.'));
}

std::string_view root_segment(std::string_view path) noexcept
{
    auto dot = path.find('.');
    return dot == std::string_view::npos ? path : path.substr(0, dot);
}

std::optional<std::string_view> parent_path(std::string_view path) noexcept
{
    auto dot = path.rfind('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    return path.substr(0, dot);
}

bool path_matches(std::string_view path, std::string_view prefix) noexcept
{
    if (path == prefix) {
        return true;
    }
    if (path.size() > prefix.size() && path.starts_with(prefix)) {
        char next = path[prefix.size()];
        return next == '.' || next == '[';
    }
    return false;
}

} // namespace yamldiff
