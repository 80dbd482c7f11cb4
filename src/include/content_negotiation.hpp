#pragma once

#include <algorithm>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#include "string_utils.hpp"

namespace querygate {

/**
 * Represents a parsed media type from Accept header.
 * e.g., "application/xml;q=0.9"
 */
struct MediaType {
    std::string type;           // e.g., "application"
    std::string subtype;        // e.g., "xml"
    double quality = 1.0;       // q parameter, default 1.0
    std::map<std::string, std::string> parameters;

    std::string fullType() const {
        return type + "/" + subtype;
    }

    bool mentions(const std::string& token) const {
        return fullType().find(token) != std::string::npos;
    }

    bool isWildcard() const {
        return type == "*" && subtype == "*";
    }
};

/**
 * Body encoding chosen for a response.
 */
enum class MediaFormat {
    JSON,
    XML
};

inline std::string contentTypeFor(MediaFormat format) {
    switch (format) {
        case MediaFormat::JSON:
            return "application/json";
        case MediaFormat::XML:
            return "application/xml";
    }
    return "application/json";
}

/**
 * Parse Accept header according to RFC 7231.
 * Returns media types sorted by quality value (highest first); entries
 * without a slash are skipped.
 */
inline std::vector<MediaType> parseAcceptHeader(const std::string& header) {
    std::vector<MediaType> result;

    for (const auto& raw_entry : splitString(header, ',')) {
        const std::string entry = trimString(raw_entry);
        if (entry.empty()) {
            continue;
        }

        auto parts = splitString(entry, ';');
        const std::string typeSubtype = trimString(parts[0]);
        auto slashPos = typeSubtype.find('/');
        if (slashPos == std::string::npos) {
            continue;
        }

        MediaType mediaType;
        mediaType.type = toLowerString(trimString(typeSubtype.substr(0, slashPos)));
        mediaType.subtype = toLowerString(trimString(typeSubtype.substr(slashPos + 1)));

        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string param = trimString(parts[i]);
            auto eqPos = param.find('=');
            if (eqPos == std::string::npos) {
                continue;
            }

            const std::string key = toLowerString(trimString(param.substr(0, eqPos)));
            const std::string value = trimString(param.substr(eqPos + 1));
            if (key == "q") {
                char* end = nullptr;
                double quality = std::strtod(value.c_str(), &end);
                if (end != value.c_str() && *end == '\0') {
                    mediaType.quality = std::clamp(quality, 0.0, 1.0);
                }
            } else {
                mediaType.parameters[key] = value;
            }
        }

        result.push_back(mediaType);
    }

    // Stable to preserve order for equal quality
    std::stable_sort(result.begin(), result.end(),
        [](const MediaType& a, const MediaType& b) {
            return a.quality > b.quality;
        });

    return result;
}

/**
 * Pick the response encoding from an Accept header.
 *
 * XML is chosen only when some acceptable media type mentions "xml" and none
 * mentions "json" or is the full wildcard. An absent or empty header means
 * JSON. Entries with q=0 are ignored.
 */
inline MediaFormat negotiateMediaFormat(const std::string& acceptHeader) {
    bool acceptsXml = false;
    bool acceptsJson = false;
    bool anyAcceptable = false;

    for (const auto& mediaType : parseAcceptHeader(acceptHeader)) {
        if (mediaType.quality <= 0.0) {
            continue;
        }
        anyAcceptable = true;
        acceptsXml = acceptsXml || mediaType.mentions("xml");
        acceptsJson = acceptsJson || mediaType.mentions("json") || mediaType.isWildcard();
    }

    if (!anyAcceptable) {
        return MediaFormat::JSON;
    }
    return acceptsXml && !acceptsJson ? MediaFormat::XML : MediaFormat::JSON;
}

} // namespace querygate
