#pragma once

/// @file text_utils.h
/// @brief UTF-8 helpers shared by feature extraction, rule matching and the
///        HTTP layer. All "character" counts in promptguard are code points.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard::classifier {

/// @brief Decode UTF-8 into code points. Malformed bytes decode as one code
///        point each (U+FFFD) so decoding never fails.
std::vector<char32_t> DecodeUtf8(std::string_view text);

/// @brief Byte length of the UTF-8 sequence starting at text[pos] (1 for a
///        malformed lead byte). pos must be < text.size().
size_t Utf8SequenceLength(std::string_view text, size_t pos);

/// @brief Unicode white space (tab, newline, vertical tab, form feed,
///        carriage return, space, 0x1C-0x1F, U+0085, U+00A0, U+1680,
///        U+2000-U+200A, U+2028, U+2029, U+202F, U+205F, U+3000)
bool IsWhitespace(char32_t cp);

/// @brief Unicode uppercase letter (general category Lu)
bool IsUppercase(char32_t cp);

/// @brief Unicode letter or number (general categories L* and N*)
bool IsAlphanumeric(char32_t cp);

/// @brief True for empty text or text made only of white space
bool IsBlank(std::string_view text);

/// @brief First max_code_points code points of text, never splitting a
///        multi-byte sequence
std::string TruncateCodePoints(std::string_view text, size_t max_code_points);

}  // namespace promptguard::classifier
