#include "../../include/topic_harvest/common/UrlSanitizer.h"
#include "../../include/topic_harvest/common/Utf8.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace topic_harvest::common {

namespace {

struct CodepointRange {
    uint32_t first;
    uint32_t last;
};

// Format characters that survive copy/paste from chat apps and office documents
constexpr CodepointRange kDroppedRanges[] = {
    {0x0000, 0x001F},   // C0 controls
    {0x007F, 0x007F},   // DEL
    {0x200B, 0x200F},   // zero-width space/joiners, LRM, RLM
    {0x202A, 0x202E},   // bidi embeddings and overrides
    {0x2060, 0x2060},   // word joiner
    {0x2066, 0x2069},   // bidi isolates
    {0xFEFF, 0xFEFF},   // byte order mark
};

bool isDropped(uint32_t cp) {
    for (const auto& range : kDroppedRanges) {
        if (cp >= range.first && cp <= range.last) return true;
    }
    return false;
}

bool isTrimmable(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    auto first = std::find_if_not(input.begin(), input.end(), isTrimmable);
    auto last = std::find_if_not(input.rbegin(), std::string::const_reverse_iterator(first), isTrimmable).base();

    const std::string trimmed(first, last);
    std::string out;
    out.reserve(trimmed.size());
    for (size_t pos = 0; pos < trimmed.size();) {
        uint32_t cp = 0;
        const size_t length = decodeUtf8(trimmed, pos, cp);
        if (length == 0) {
            // A stray byte cannot be part of a usable URL
            ++pos;
            continue;
        }
        if (!isDropped(cp)) {
            out.append(trimmed, pos, length);
        }
        pos += length;
    }
    return out;
}

std::string stripTrackingParameters(const std::string& query) {
    if (query.empty()) return query;

    static const std::vector<std::string> trackingKeys = {"ref", "fbclid", "gclid", "text"};

    std::string out;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;

        std::string key = pair.substr(0, pair.find('='));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

        if (key.rfind("utm_", 0) == 0 ||
            std::find(trackingKeys.begin(), trackingKeys.end(), key) != trackingKeys.end()) {
            continue;
        }

        if (!out.empty()) out.push_back('&');
        out += pair;
    }
    return out;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

} // namespace topic_harvest::common
