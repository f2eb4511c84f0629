/// @file text_utils.cpp
/// @brief UTF-8 decoding and character classes

#include "classifier/text_utils.h"

#include <re2/re2.h>

namespace promptguard::classifier {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

/// Decode one code point at pos; writes the sequence length to *len.
char32_t DecodeAt(std::string_view text, size_t pos, size_t* len) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t expected = 0;
    char32_t cp = 0;

    if (lead < 0x80) {
        *len = 1;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        expected = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        expected = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        expected = 4;
        cp = lead & 0x07;
    } else {
        *len = 1;
        return kReplacementChar;
    }

    if (pos + expected > text.size()) {
        *len = 1;
        return kReplacementChar;
    }
    for (size_t i = 1; i < expected; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!IsContinuation(byte)) {
            *len = 1;
            return kReplacementChar;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    // Reject overlong encodings, surrogates and values past U+10FFFF
    static constexpr char32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[expected] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        *len = 1;
        return kReplacementChar;
    }

    *len = expected;
    return cp;
}

/// UTF-8 bytes of a valid scalar value
std::string EncodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

// Non-ASCII code points are classified by Unicode general category
const RE2& UppercaseLetter() {
    static const RE2 kPattern(R"(\p{Lu})");
    return kPattern;
}

const RE2& LetterOrNumber() {
    static const RE2 kPattern(R"([\p{L}\p{N}])");
    return kPattern;
}

bool MatchesCategory(char32_t cp, const RE2& category) {
    if (cp == kReplacementChar || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
    }
    return RE2::FullMatch(EncodeUtf8(cp), category);
}

}  // namespace

std::vector<char32_t> DecodeUtf8(std::string_view text) {
    std::vector<char32_t> code_points;
    code_points.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = 1;
        code_points.push_back(DecodeAt(text, pos, &len));
        pos += len;
    }
    return code_points;
}

size_t Utf8SequenceLength(std::string_view text, size_t pos) {
    size_t len = 1;
    DecodeAt(text, pos, &len);
    return len;
}

bool IsWhitespace(char32_t cp) {
    if (cp < 0x80) {
        return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F);
    }
    switch (cp) {
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool IsUppercase(char32_t cp) {
    if (cp < 0x80) {
        return cp >= 'A' && cp <= 'Z';
    }
    return MatchesCategory(cp, UppercaseLetter());
}

bool IsAlphanumeric(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
               (cp >= '0' && cp <= '9');
    }
    return MatchesCategory(cp, LetterOrNumber());
}

bool IsBlank(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = 1;
        if (!IsWhitespace(DecodeAt(text, pos, &len))) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::string TruncateCodePoints(std::string_view text, size_t max_code_points) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < text.size() && count < max_code_points) {
        pos += Utf8SequenceLength(text, pos);
        ++count;
    }
    return std::string(text.substr(0, pos));
}

}  // namespace promptguard::classifier
