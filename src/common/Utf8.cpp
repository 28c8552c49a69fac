#include "../../include/topic_harvest/common/Utf8.h"

namespace topic_harvest::common {

namespace {

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

uint32_t foldCodepoint(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
    }

    // Latin-1 Supplement: À..Þ except the multiplication sign
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;

    // Latin Extended-A pairs upper/lower on alternating code points; the parity flips twice
    if (cp == 0x130) return 'i';
    if (cp >= 0x100 && cp <= 0x137) return cp | 1;
    if (cp >= 0x139 && cp <= 0x148) return (cp & 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return cp | 1;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp & 1) ? cp + 1 : cp;

    // Greek
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
    if (cp == 0x38C) return 0x3CC;
    if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;

    return cp;
}

} // namespace

size_t decodeUtf8(const std::string& text, size_t pos, uint32_t& codepoint) {
    if (pos >= text.size()) return 0;

    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length;
    uint32_t cp;
    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    for (size_t i = 1; i < length; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(c)) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    codepoint = cp;
    return length;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

std::string foldCase(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        uint32_t cp = 0;
        const size_t length = decodeUtf8(text, pos, cp);
        if (length == 0) {
            out.push_back(text[pos++]);
            continue;
        }
        if (length == 1) {
            out.push_back(static_cast<char>(foldCodepoint(cp)));
        } else {
            appendUtf8(out, foldCodepoint(cp));
        }
        pos += length;
    }
    return out;
}

} // namespace topic_harvest::common
