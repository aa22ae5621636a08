/**
 * Mnemo Text Utilities
 *
 * Small string helpers shared across the pattern engine.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo {

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);

/**
 * Trim spaces, tabs and line breaks from both ends.
 */
std::string trim(std::string_view s);

/**
 * First letter upper, rest lower: "hELLO WORLD" -> "Hello world".
 */
std::string sentence_case(std::string_view s);

/**
 * Upper-case every letter that follows a non-letter, lower-case the rest.
 */
std::string title_case(std::string_view s);

std::string replace_all(std::string_view s, std::string_view from, std::string_view to);
std::string replace_first(std::string_view s, std::string_view from, std::string_view to);

/**
 * Split on every occurrence of delimiter; empty fields are kept.
 */
std::vector<std::string> split(std::string_view s, char delimiter);

/**
 * Parse a whole (optionally space-padded) decimal integer.
 * Returns nullopt for anything else, including trailing junk.
 */
std::optional<int64_t> parse_int(std::string_view s);

/**
 * parse_int(s) or fallback when s is empty or malformed.
 */
int64_t parse_int_or(std::string_view s, int64_t fallback);

/**
 * "1" -> "1st", "12" -> "12th", "23" -> "23rd".
 */
std::string get_ordinal(std::string_view number);

/**
 * Space-joined phonetic alphabet words, one per letter; non-letters are skipped.
 * style 0 or 1 selects NATO, anything else the older Adam/Baker table.
 */
std::string get_phonetic(std::string_view word, int style = 1);

/**
 * Subtractive-notation roman numerals. Empty for number <= 0.
 */
std::string to_roman(int64_t number);

}  // namespace mnemo
