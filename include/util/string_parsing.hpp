#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Text normalization shared by the note store and the command front end

 Key functions:
 - SafeParseInt / SafeParseInt64: Parse integer with bounds checking
 - TrimWhitespace: Strip surrounding ASCII whitespace
 - IsValidUtf8 / Utf8Length: Well-formedness and code point counting
 - SplitCommandLine: Tokenize a shell line with double-quote grouping

 Parsing functions validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace notekeep {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * Characters removed by TrimWhitespace: space, \t, \n, \v, \f, \r
 */
constexpr const char *WHITESPACE_CHARS = " \t\n\v\f\r";

/**
 * Remove leading and trailing ASCII whitespace
 *
 * Example:
 *   TrimWhitespace("  Groceries\n") -> "Groceries"
 */
std::string TrimWhitespace(const std::string &str);

/**
 * Check that str is well-formed UTF-8 (no overlongs, no surrogates,
 * nothing above U+10FFFF)
 */
bool IsValidUtf8(const std::string &str);

/**
 * Number of Unicode code points in a UTF-8 string
 * Counts non-continuation bytes; only meaningful for valid UTF-8.
 */
size_t Utf8Length(const std::string &str);

/**
 * Split a command line into arguments
 *
 * Whitespace separates arguments; double quotes group words and may be
 * escaped with a backslash inside quotes. Returns std::nullopt when a quote
 * is left open.
 *
 * Example:
 *   SplitCommandLine("add \"Groceries\" \"Milk, eggs\"")
 *     -> {"add", "Groceries", "Milk, eggs"}
 */
std::optional<std::vector<std::string>>
SplitCommandLine(const std::string &line);

} // namespace util
} // namespace notekeep
