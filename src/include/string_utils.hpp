#pragma once

#include <string>
#include <vector>

namespace querygate {

/**
 * Trims whitespace from both ends of a string.
 * @param str The string to trim
 * @return Trimmed string
 */
std::string trimString(const std::string& str);

std::string toLowerString(std::string str);
std::string toUpperString(std::string str);

/**
 * Splits on a single character. Pieces are returned untrimmed and empty
 * pieces are kept, so "a,,b" yields three elements.
 */
std::vector<std::string> splitString(const std::string& str, char delimiter);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);
bool startsWithIgnoreCase(const std::string& str, const std::string& prefix);

// Replaces control characters with spaces and trims, for use in header values
std::string sanitizeHeaderValue(const std::string& str);

} // namespace querygate
