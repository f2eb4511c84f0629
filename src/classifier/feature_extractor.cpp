/// @file feature_extractor.cpp
/// @brief Feature extraction implementation

#include "classifier/feature_extractor.h"

#include <re2/re2.h>

#include "classifier/text_utils.h"

namespace promptguard::classifier {

namespace {

// Same white-space set as IsWhitespace(); RE2's \s is ASCII-only
constexpr char kWhitespaceClass[] =
    R"([\t\n\v\f\r \x{1c}-\x{1f}\x{85}\x{a0}\x{1680}\x{2000}-\x{200a}\x{2028}\x{2029}\x{202f}\x{205f}\x{3000}])";

RE2::Options CaseInsensitive() {
    RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    return options;
}

const RE2& DelimiterRunPattern() {
    static const RE2 kPattern(R"([#*_\-=]{3,})");
    return kPattern;
}

const RE2& SystemTagPattern() {
    static const RE2 kPattern(R"(<\||\[SYSTEM\]|\[INST\])", CaseInsensitive());
    return kPattern;
}

// Word boundaries are checked by hand; RE2's \b only knows ASCII word characters
const RE2& KeywordPattern() {
    static const RE2 kPattern(
        "ignore|disregard|forget|override|bypass|jailbreak", CaseInsensitive());
    return kPattern;
}

const RE2& CommandLinePattern() {
    static const RE2 kPattern(
        std::string("(?m)^") + kWhitespaceClass + R"(*[\p{L}\p{N}_\-]+:)");
    return kPattern;
}

bool IsWordChar(char32_t cp) {
    return cp == '_' || IsAlphanumeric(cp);
}

/// Code point ending just before byte offset pos (pos > 0)
char32_t CodePointBefore(std::string_view text, size_t pos) {
    size_t start = pos - 1;
    const size_t floor = pos >= 4 ? pos - 4 : 0;
    while (start > floor && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        --start;
    }
    if (start + Utf8SequenceLength(text, start) != pos) {
        // Stray continuation byte
        return 0xFFFD;
    }
    auto decoded = DecodeUtf8(text.substr(start, pos - start));
    return decoded.empty() ? 0xFFFD : decoded.front();
}

char32_t CodePointAt(std::string_view text, size_t pos) {
    auto decoded = DecodeUtf8(text.substr(pos, Utf8SequenceLength(text, pos)));
    return decoded.front();
}

}  // namespace

int64_t FeatureExtractor::CountSuspiciousKeywords(std::string_view text) {
    const re2::StringPiece input(text.data(), text.size());
    int64_t count = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        re2::StringPiece match;
        if (!KeywordPattern().Match(input, pos, text.size(), RE2::UNANCHORED, &match, 1)) {
            break;
        }
        const size_t start = static_cast<size_t>(match.data() - text.data());
        const size_t end = start + match.size();

        const bool left_ok = start == 0 || !IsWordChar(CodePointBefore(text, start));
        const bool right_ok = end == text.size() || !IsWordChar(CodePointAt(text, end));
        if (left_ok && right_ok) {
            ++count;
            pos = end;
        } else {
            pos = start + Utf8SequenceLength(text, start);
        }
    }
    return count;
}

FeatureVector FeatureExtractor::Extract(std::string_view text) {
    FeatureVector features;
    const std::vector<char32_t> code_points = DecodeUtf8(text);

    int64_t uppercase = 0;
    int64_t special = 0;
    int64_t word_count = 0;
    int64_t word_chars = 0;
    bool in_word = false;

    for (char32_t cp : code_points) {
        const bool space = IsWhitespace(cp);
        if (space) {
            in_word = false;
        } else {
            if (!in_word) {
                ++word_count;
                in_word = true;
            }
            ++word_chars;
            if (!IsAlphanumeric(cp)) {
                ++special;
            }
        }
        if (IsUppercase(cp)) {
            ++uppercase;
        }
    }

    features.length = static_cast<int64_t>(code_points.size());
    features.word_count = word_count;
    features.avg_word_length = word_count > 0
        ? static_cast<double>(word_chars) / static_cast<double>(word_count)
        : 0.0;

    if (features.length > 0) {
        const auto length = static_cast<double>(features.length);
        features.uppercase_ratio = static_cast<double>(uppercase) / length;
        features.special_char_ratio = static_cast<double>(special) / length;
    }

    const re2::StringPiece input(text.data(), text.size());
    features.has_multiple_delimiters = RE2::PartialMatch(input, DelimiterRunPattern());
    features.has_system_tags = RE2::PartialMatch(input, SystemTagPattern());
    features.suspicious_keyword_count = CountSuspiciousKeywords(text);
    features.command_like_structure = RE2::PartialMatch(input, CommandLinePattern());

    return features;
}

}  // namespace promptguard::classifier
