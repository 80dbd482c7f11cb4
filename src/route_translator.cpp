#include "route_translator.hpp"

#include <algorithm>
#include <cstring>

namespace querygate {

std::string RouteTranslator::translateRoutePath(const std::string& templatePath, std::vector<std::string>& paramNames) {
    static const char* regex_specials = ".^$|()[]*+?\\";

    std::string pattern;
    pattern.reserve(templatePath.size() + 16);

    size_t i = 0;
    while (i < templatePath.size()) {
        char c = templatePath[i];
        if (c == '{') {
            auto close = templatePath.find('}', i + 1);
            if (close != std::string::npos) {
                paramNames.push_back(templatePath.substr(i + 1, close - i - 1));
                pattern += "([^/]+)";
                i = close + 1;
                continue;
            }
        }
        if (std::strchr(regex_specials, c) != nullptr || c == '{' || c == '}') {
            pattern += '\\';
        }
        pattern += c;
        ++i;
    }

    return "^" + pattern + "$";
}

CompiledRoute RouteTranslator::compile(const std::string& templatePath) {
    CompiledRoute route;
    std::string regexPattern = translateRoutePath(templatePath, route.variableNames);
    route.pattern = std::regex(regexPattern);
    return route;
}

bool RouteTranslator::matchAndExtractParams(const CompiledRoute& route, const std::string& actualPath,
                                            std::map<std::string, std::string>& pathParams) {
    std::smatch matches;
    if (!std::regex_match(actualPath, matches, route.pattern)) {
        return false;
    }

    for (size_t i = 1; i < matches.size() && i <= route.variableNames.size(); ++i) {
        pathParams[route.variableNames[i - 1]] = matches[i].str();
    }
    return true;
}

std::map<std::string, std::string> RouteTranslator::extractPathVariables(const std::string& templatePath,
                                                                         const std::string& actualPath) {
    std::map<std::string, std::string> variables;
    auto templateSegments = splitSegments(templatePath);
    auto pathSegments = splitSegments(actualPath);

    const size_t overlap = std::min(templateSegments.size(), pathSegments.size());
    for (size_t i = 0; i < overlap; ++i) {
        const auto& segment = templateSegments[i];
        if (isPlaceholder(segment)) {
            variables[segment.substr(1, segment.size() - 2)] = pathSegments[i];
        }
    }
    return variables;
}

std::vector<std::string> RouteTranslator::splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        segments.push_back(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

bool RouteTranslator::isPlaceholder(const std::string& segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

} // namespace querygate
