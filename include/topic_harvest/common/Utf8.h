#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace topic_harvest::common {

/**
 * Decode the UTF-8 sequence starting at text[pos].
 * @param codepoint receives the decoded code point
 * @return the sequence length in bytes, or 0 when the bytes at pos are not a complete sequence
 */
size_t decodeUtf8(const std::string& text, size_t pos, uint32_t& codepoint);

void appendUtf8(std::string& out, uint32_t codepoint);

// Lower-case ASCII, Latin-1 Supplement, Latin Extended-A, Greek and Cyrillic letters.
// Everything else, malformed bytes included, is copied through unchanged.
std::string foldCase(const std::string& text);

} // namespace topic_harvest::common
