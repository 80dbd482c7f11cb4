#pragma once

#include <string>
#include <vector>
#include <regex>
#include <map>

namespace querygate {

struct CompiledRoute {
    std::regex pattern;
    std::vector<std::string> variableNames;
};

class RouteTranslator {
public:
    // "/users/{id}/orders" -> "^/users/([^/]+)/orders$", collecting variable names in order
    static std::string translateRoutePath(const std::string& templatePath, std::vector<std::string>& paramNames);
    static CompiledRoute compile(const std::string& templatePath);

    static bool matchAndExtractParams(const CompiledRoute& route, const std::string& actualPath,
                                      std::map<std::string, std::string>& pathParams);

    // Positional segment capture; only the overlapping prefix is used when segment counts differ
    static std::map<std::string, std::string> extractPathVariables(const std::string& templatePath,
                                                                   const std::string& actualPath);

private:
    static std::vector<std::string> splitSegments(const std::string& path);
    static bool isPlaceholder(const std::string& segment);
};

} // namespace querygate
