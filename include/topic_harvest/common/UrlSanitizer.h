#pragma once

#include <string>

namespace topic_harvest::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// and strip ASCII control characters and surrounding ASCII whitespace.
// Specifically removes: U+200B, U+200C, U+200D, U+2060, U+FEFF, bidi marks and bytes < 0x20 or 0x7F.
std::string sanitizeUrl(const std::string& input);

// Drop query parameters that only carry campaign tracking (utm_*, ref, fbclid, gclid, text)
// so the same page reached from different referrers is visited once.
// The remaining parameters keep their original order and encoding.
std::string stripTrackingParameters(const std::string& query);

// Produce a compact hex dump of the given string for logging/debugging.
// Example: "68 74 74 70 73 3a 2f ..."
std::string hexDump(const std::string& input);

} // namespace topic_harvest::common
