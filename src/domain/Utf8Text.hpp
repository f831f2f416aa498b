/**
 * @file Utf8Text.hpp
 * @brief Small UTF-8 helpers shared by the Arabic text extractors.
 */

#pragma once
#include <cstddef>
#include <string>

namespace lexingest::domain::utf8 {

/**
 * @brief Regex fragment matching one ASCII or Arabic-Indic decimal digit.
 *
 * Spelled as an alternation of literal byte sequences; std::regex works on bytes.
 */
extern const char* const kDigitPattern;

/** @brief Number of Unicode code points in a UTF-8 string. */
std::size_t CodePointCount(const std::string& text);

/** @brief The leading @p count code points of @p text. */
std::string PrefixCodePoints(const std::string& text, std::size_t count);

/** @brief Removes leading and trailing ASCII whitespace. */
std::string Trim(const std::string& text);

/** @brief Lower-cases ASCII letters, leaves every other byte untouched. */
std::string AsciiLower(const std::string& text);

/** @brief Rewrites Arabic-Indic and Extended Arabic-Indic digits as ASCII digits. */
std::string ToAsciiDigits(const std::string& text);

/** @brief Replaces every run of ASCII whitespace with one space. */
std::string CollapseWhitespace(const std::string& text);

} // namespace lexingest::domain::utf8
