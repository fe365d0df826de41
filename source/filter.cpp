// filter.cpp

#include <yamldiff/filter.h>
#include <yamldiff/path.h>

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace yamldiff {

namespace {

std::vector<std::regex> compile_patterns(const std::vector<std::string>& patterns)
{
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("invalid regex pattern \"" + pattern + "\": " + e.what());
        }
    }
    return compiled;
}

bool matches_any_path(const std::string& path, const std::vector<std::string>& filters)
{
    return std::ranges::any_of(filters, [&](const std::string& f) { return path_matches(path, f); });
}

bool matches_any_regex(const std::string& path, const std::vector<std::regex>& patterns)
{
    return std::ranges::any_of(patterns, [&](const std::regex& re) { return std::regex_search(path, re); });
}

} // anonymous namespace

std::vector<Difference> filter_differences(std::vector<Difference> diffs, const FilterOptions& filter)
{
    if (filter.empty()) {
        return diffs;
    }

    const auto include_regex = compile_patterns(filter.include_regex);
    const auto exclude_regex = compile_patterns(filter.exclude_regex);
    const bool has_includes = !filter.include_paths.empty() || !include_regex.empty();

    std::erase_if(diffs, [&](const Difference& d) {
        if (has_includes &&
            !matches_any_path(d.path, filter.include_paths) &&
            !matches_any_regex(d.path, include_regex)) {
            return true;
        }
        return matches_any_path(d.path, filter.exclude_paths) ||
               matches_any_regex(d.path, exclude_regex);
    });
    return diffs;
}

} // namespace yamldiff
