#include "../../include/topic_harvest/common/UrlResolver.h"
#include "../../include/topic_harvest/common/UrlSanitizer.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace topic_harvest::common {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isSchemeChar(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

// Scheme of a reference ("http", "mailto"), or empty when the reference is relative
std::string schemeOf(const std::string& reference) {
    size_t colon = reference.find(':');
    if (colon == std::string::npos || colon == 0) {
        return "";
    }
    size_t delimiter = reference.find_first_of("/?#");
    if (delimiter != std::string::npos && delimiter < colon) {
        return "";
    }
    if (!std::isalpha(static_cast<unsigned char>(reference[0]))) {
        return "";
    }
    for (size_t i = 1; i < colon; ++i) {
        if (!isSchemeChar(static_cast<unsigned char>(reference[i]))) {
            return "";
        }
    }
    return toLower(reference.substr(0, colon));
}

bool isDefaultPort(const std::string& scheme, const std::string& port) {
    return (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
}

// Split "path?query#fragment" into its parts
void splitPathQueryFragment(const std::string& input, ParsedUrl& out) {
    std::string rest = input;

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        out.fragment = rest.substr(hash + 1);
        out.hasFragment = true;
        rest = rest.substr(0, hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        out.query = rest.substr(question + 1);
        out.hasQuery = true;
        rest = rest.substr(0, question);
    }

    out.path = rest;
}

std::string removeDotSegments(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    const bool absolute = path[0] == '/';
    std::vector<std::string> input;
    size_t start = absolute ? 1 : 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            input.push_back(path.substr(start));
            break;
        }
        input.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }

    std::vector<std::string> output;
    bool trailingSlash = false;
    for (size_t i = 0; i < input.size(); ++i) {
        const bool last = i + 1 == input.size();
        const std::string& segment = input[i];
        if (segment == ".") {
            trailingSlash = last;
            continue;
        }
        if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
            trailingSlash = last;
            continue;
        }
        output.push_back(segment);
        trailingSlash = false;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0) result += '/';
        result += output[i];
    }
    if (trailingSlash && !output.empty()) {
        result += '/';
    }
    return result;
}

// Parse the "//authority" part; returns false on malformed authority
bool parseAuthority(const std::string& authority, ParsedUrl& out) {
    std::string hostPort = authority;
    size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort[0] == '[') {
        size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            return false;
        }
        out.host = toLower(hostPort.substr(0, close + 1));
        std::string after = hostPort.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') return false;
            out.port = after.substr(1);
        }
    } else {
        size_t colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            out.port = hostPort.substr(colon + 1);
            hostPort = hostPort.substr(0, colon);
        }
        out.host = toLower(hostPort);
    }

    if (out.host.empty()) {
        return false;
    }
    for (unsigned char c : out.host) {
        if (std::isspace(c) || c == '/' || c == '\\') {
            return false;
        }
    }
    for (unsigned char c : out.port) {
        if (!std::isdigit(c)) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    const std::string scheme = schemeOf(url);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    const size_t afterScheme = scheme.size() + 1;
    if (url.compare(afterScheme, 2, "//") != 0) {
        return std::nullopt;
    }

    const size_t authorityStart = afterScheme + 2;
    const size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    const std::string authority = url.substr(authorityStart,
        authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);

    ParsedUrl parsed;
    parsed.scheme = scheme;
    if (!parseAuthority(authority, parsed)) {
        return std::nullopt;
    }

    if (authorityEnd != std::string::npos) {
        splitPathQueryFragment(url.substr(authorityEnd), parsed);
    }
    return parsed;
}

std::string toString(const ParsedUrl& url) {
    std::string out = url.scheme + "://" + url.host;
    if (!url.port.empty()) {
        out += ":" + url.port;
    }
    out += url.path;
    if (url.hasQuery) {
        out += "?" + url.query;
    }
    if (url.hasFragment) {
        out += "#" + url.fragment;
    }
    return out;
}

std::optional<std::string> resolveUrl(const std::string& baseUrl, const std::string& reference) {
    auto base = parseUrl(baseUrl);
    if (!base) {
        return std::nullopt;
    }

    const std::string ref = sanitizeUrl(reference);

    const std::string refScheme = schemeOf(ref);
    if (!refScheme.empty()) {
        auto absolute = parseUrl(ref);
        if (!absolute) {
            return std::nullopt;
        }
        absolute->path = removeDotSegments(absolute->path);
        return toString(*absolute);
    }

    ParsedUrl target;
    target.scheme = base->scheme;

    if (ref.compare(0, 2, "//") == 0) {
        auto networkPath = parseUrl(base->scheme + ":" + ref);
        if (!networkPath) {
            return std::nullopt;
        }
        networkPath->path = removeDotSegments(networkPath->path);
        return toString(*networkPath);
    }

    ParsedUrl refParts;
    splitPathQueryFragment(ref, refParts);

    target.host = base->host;
    target.port = base->port;
    target.fragment = refParts.fragment;
    target.hasFragment = refParts.hasFragment;

    if (refParts.path.empty()) {
        target.path = base->path;
        if (refParts.hasQuery) {
            target.query = refParts.query;
            target.hasQuery = true;
        } else {
            target.query = base->query;
            target.hasQuery = base->hasQuery;
        }
    } else {
        if (refParts.path[0] == '/') {
            target.path = removeDotSegments(refParts.path);
        } else {
            std::string merged;
            if (base->path.empty()) {
                merged = "/" + refParts.path;
            } else {
                merged = base->path.substr(0, base->path.rfind('/') + 1) + refParts.path;
            }
            target.path = removeDotSegments(merged);
        }
        target.query = refParts.query;
        target.hasQuery = refParts.hasQuery;
    }

    return toString(target);
}

std::optional<std::string> normalizeUrl(const std::string& url) {
    auto parsed = parseUrl(sanitizeUrl(url));
    if (!parsed) {
        return std::nullopt;
    }

    if (isDefaultPort(parsed->scheme, parsed->port)) {
        parsed->port.clear();
    }

    parsed->path = removeDotSegments(parsed->path);
    if (parsed->path.empty()) {
        parsed->path = "/";
    } else if (parsed->path.size() > 1 && parsed->path.back() == '/') {
        parsed->path.pop_back();
    }

    parsed->fragment.clear();
    parsed->hasFragment = false;

    parsed->query = stripTrackingParameters(parsed->query);
    parsed->hasQuery = !parsed->query.empty();

    return toString(*parsed);
}

std::string originOf(const std::string& url) {
    auto parsed = parseUrl(sanitizeUrl(url));
    if (!parsed) {
        return "";
    }
    std::string origin = parsed->scheme + "://" + parsed->host;
    if (!parsed->port.empty() && !isDefaultPort(parsed->scheme, parsed->port)) {
        origin += ":" + parsed->port;
    }
    return origin;
}

std::string hostOf(const std::string& url) {
    auto parsed = parseUrl(sanitizeUrl(url));
    return parsed ? parsed->host : "";
}

std::optional<std::string> unwrapArchiveUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed || (parsed->host != "web.archive.org" && parsed->host != "archive.org")) {
        return std::nullopt;
    }

    // /web/<14-digit timestamp><optional modifier like id_ or im_>/<original URL>
    const std::string& path = parsed->path;
    if (path.rfind("/web/", 0) != 0) {
        return std::nullopt;
    }
    const size_t stampStart = 5;
    const size_t slash = path.find('/', stampStart);
    if (slash == std::string::npos || slash == stampStart ||
        !std::isdigit(static_cast<unsigned char>(path[stampStart]))) {
        return std::nullopt;
    }

    std::string target = path.substr(slash + 1);
    if (parsed->hasQuery) {
        target += "?" + parsed->query;
    }
    // The archive collapses "//" after the scheme in some rewritten links
    for (const char* scheme : {"http:/", "https:/"}) {
        const std::string prefix = scheme;
        if (target.rfind(prefix, 0) == 0 && target.compare(prefix.size(), 1, "/") != 0) {
            target.insert(prefix.size(), "/");
        }
    }
    if (target.find("://") == std::string::npos) {
        // A colon before the first slash is another scheme (mailto:, javascript:, ...)
        const size_t colon = target.find(':');
        if (colon != std::string::npos && colon < target.find('/')) {
            return std::nullopt;
        }
        target = "http://" + target;
    }

    if (!parseUrl(target)) {
        return std::nullopt;
    }
    return target;
}

std::string percentEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace topic_harvest::common
