#include "core/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace ward {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string Basename(const std::string& path) {
    size_t pos = path.find_last_of("\\/");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string LowerExtension(const std::string& path) {
    std::string name = Basename(path);
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return ToLower(name.substr(dot));
}

bool WildcardMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0;
    size_t t = 0;
    size_t star_idx = std::string::npos;
    size_t match_idx = 0;

    while (t < text.length()) {
        if (p < pattern.length() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.length() && pattern[p] == '*') {
            star_idx = p;
            match_idx = t;
            ++p;
        } else if (star_idx != std::string::npos) {
            // Backtrack: let the last '*' absorb one more character
            p = star_idx + 1;
            ++match_idx;
            t = match_idx;
        } else {
            return false;
        }
    }

    while (p < pattern.length() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.length();
}

bool ParseUint32(const std::string& text, uint32_t& out) {
    if (text.empty() || text.size() > 10) {
        return false;
    }

    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }

    if (value > std::numeric_limits<uint32_t>::max()) {
        return false;
    }

    out = static_cast<uint32_t>(value);
    return true;
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace ward
