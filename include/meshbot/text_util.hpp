/**
 * @file text_util.hpp
 * @brief Small string helpers shared by every MeshBot layer (trim, split, clamp, durations).
 *
 * @details
 * ## Field Brief
 * Radio replies are short and the airtime is not ours to waste. Every string
 * that leaves the bot goes through the same handful of helpers so that the
 * length rules and the number formatting are identical everywhere.
 *
 * @par What This File Provides
 * - Whitespace handling: `trim()`, `split_ws()`, `join()`.
 * - Case folding for ASCII identifiers: `to_lower()`, `iequals()`.
 * - UTF-8 aware clamping: `utf8_length()`, `clamp()`.
 * - Human formatting: `format_duration()`, `format_age()`, `format_percent()`,
 *   `format_number()`.
 *
 * @par Clamping Rule
 * Length is counted in code points, never bytes. A clamped string is exactly
 * `n` code points long and its last code point is the ellipsis marker U+2026.
 * Multi-byte sequences are never split.
 *
 * @authors
 * @author Leo
 */
#ifndef MESHBOT_TEXT_UTIL_HPP
#define MESHBOT_TEXT_UTIL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshbot {

/// Truncation marker appended by clamp() (U+2026, three bytes in UTF-8).
static constexpr const char* ELLIPSIS = "\xE2\x80\xA6";

/// @brief Strip leading and trailing ASCII whitespace.
std::string trim(const std::string& s);

/// @brief ASCII lower-case copy. Non-ASCII bytes pass through untouched.
std::string to_lower(std::string s);

/// @brief Case-insensitive (ASCII) equality.
bool iequals(const std::string& a, const std::string& b);

/// @brief Split on runs of ASCII whitespace; empty tokens are never produced.
std::vector<std::string> split_ws(const std::string& s);

/// @brief Join parts with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

/**
 * @brief Number of UTF-8 code points in @p s.
 *
 * Continuation bytes (10xxxxxx) are not counted, so a malformed tail still
 * yields a sensible answer instead of an error.
 */
size_t utf8_length(const std::string& s);

/**
 * @brief Bound a string to @p n code points.
 *
 * @details
 * If `utf8_length(s) <= n` the input is returned unchanged. Otherwise the
 * first `n-1` code points are kept and ELLIPSIS is appended. For `n == 0`
 * the result is empty; for `n == 1` it is the marker alone.
 */
std::string clamp(const std::string& s, size_t n);

/// @brief "1d 2h 3m 4s"; zero day/hour/minute parts are omitted, seconds always shown.
std::string format_duration(uint64_t seconds);

/// @brief Coarse age: "42s", "17m", "3h 5m", "2d 4h".
std::string format_age(uint64_t seconds);

/// @brief "12%" for whole values, "12.5%" otherwise, "?" when missing.
std::string format_percent(const std::optional<double>& v);

/// @brief Shortest readable rendering of a radio reading ("7", "-7.25").
std::string format_number(double v);

} // namespace meshbot

#endif // MESHBOT_TEXT_UTIL_HPP
