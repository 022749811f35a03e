#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ward {

std::string ToLower(std::string value);

// Last path component; accepts both '\' and '/' separators.
std::string Basename(const std::string& path);

// Extension of the last path component including the dot, lowercased.
// Empty when there is none.
std::string LowerExtension(const std::string& path);

// '*' matches any run of characters, '?' any single character. Case-sensitive;
// callers lowercase both sides when they want case-insensitive matching.
bool WildcardMatch(const std::string& pattern, const std::string& text);

// Strict unsigned parse: digits only, no sign, fits in 32 bits.
bool ParseUint32(const std::string& text, uint32_t& out);

std::string Join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace ward
