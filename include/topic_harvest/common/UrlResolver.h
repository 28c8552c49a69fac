#pragma once

#include <optional>
#include <string>

namespace topic_harvest::common {

// Components of an absolute http(s) URL. Scheme and host are lower-cased,
// port is empty when absent. Userinfo is discarded.
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool hasQuery = false;
    bool hasFragment = false;
};

// Parse an absolute http/https URL; std::nullopt for anything else
// (relative references, other schemes, empty host, non-numeric port).
std::optional<ParsedUrl> parseUrl(const std::string& url);

std::string toString(const ParsedUrl& url);

// RFC 3986 section 5.2 reference resolution against an absolute base URL.
// Returns std::nullopt when the base is not an http(s) URL or the reference
// targets another scheme (mailto:, javascript:, ...).
std::optional<std::string> resolveUrl(const std::string& baseUrl, const std::string& reference);

// Canonical form used as the visited-set key: sanitized, lower-case scheme and host,
// default port dropped, dot segments removed, fragment and tracking parameters removed,
// trailing slash removed except for the root path.
std::optional<std::string> normalizeUrl(const std::string& url);

// "scheme://host[:port]" (default ports omitted); empty string when unparsable.
std::string originOf(const std::string& url);

// Host part only; empty string when unparsable.
std::string hostOf(const std::string& url);

// Original address of a Wayback Machine snapshot link
// ("http://web.archive.org/web/20240101000000id_/https://example.com/x" -> "https://example.com/x").
// std::nullopt when the URL is not a snapshot of an http(s) page.
std::optional<std::string> unwrapArchiveUrl(const std::string& url);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string percentEncode(const std::string& value);

} // namespace topic_harvest::common
