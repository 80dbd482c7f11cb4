#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace querygate {

std::string trimString(const std::string& str) {
    const auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    const auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

std::string toLowerString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char ch) { return std::tolower(ch); });
    return str;
}

std::string toUpperString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char ch) { return std::toupper(ch); });
    return str;
}

std::vector<std::string> splitString(const std::string& str, char delimiter) {
    std::vector<std::string> pieces;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            pieces.push_back(str.substr(start));
            break;
        }
        pieces.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return pieces;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLowerString(haystack).find(toLowerString(needle)) != std::string::npos;
}

bool startsWithIgnoreCase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) {
        return false;
    }
    return toLowerString(str.substr(0, prefix.size())) == toLowerString(prefix);
}

std::string sanitizeHeaderValue(const std::string& str) {
    std::string cleaned = str;
    std::replace_if(cleaned.begin(), cleaned.end(),
        [](unsigned char ch) { return std::iscntrl(ch); }, ' ');
    return trimString(cleaned);
}

} // namespace querygate
