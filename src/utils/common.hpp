#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace mailkeep::utils {

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Group keys compare case-insensitively ("Acme" and "acme" share a budget).
inline std::string FoldGroupKey(const std::string& group_key) {
    return ToLower(group_key);
}

inline bool SameGroup(const std::string& left, const std::string& right) {
    return FoldGroupKey(left) == FoldGroupKey(right);
}

}  // namespace mailkeep::utils
