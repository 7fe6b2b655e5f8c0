#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace zeroconf_cpp
{

// DNS names compare case-insensitively for ASCII only
inline char AsciiToLower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string ToLower(std::string_view str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(), AsciiToLower);
    return out;
}

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (AsciiToLower(lhs[i]) != AsciiToLower(rhs[i])) {
            return false;
        }
    }
    return true;
}

inline bool EndsWith(std::string_view str, std::string_view suffix)
{
    return str.size() >= suffix.size()
        && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool EndsWithIgnoreCase(std::string_view str, std::string_view suffix)
{
    return str.size() >= suffix.size()
        && EqualsIgnoreCase(str.substr(str.size() - suffix.size()), suffix);
}

// "a.b.c." -> {"a", "b", "c"}. Interior empty labels are kept.
inline std::vector<std::string_view> SplitLabels(std::string_view name)
{
    std::vector<std::string_view> labels;
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    if (name.empty()) {
        return labels;
    }
    std::size_t start = 0;
    while (true) {
        const auto dot = name.find('.', start);
        if (dot == std::string_view::npos) {
            labels.push_back(name.substr(start));
            break;
        }
        labels.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

}
