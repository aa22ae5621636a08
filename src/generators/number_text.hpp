/**
 * Mnemo Number Words
 *
 * Reads a decimal number out as English words in title case:
 *   "123"     -> "One Hundred and Twenty Three"
 *   "-42"     -> "Minus Forty Two"
 *   "3.14"    -> "Three Point One Four"
 *   "1,000"   -> "One Thousand"
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mnemo {

// Whole parts longer than this are rejected
inline constexpr size_t MAX_NUMBER_DIGITS = 18;

/**
 * Convert number text to words.
 *
 * Invalid input yields "Error - Number improperly formed" and more than
 * MAX_NUMBER_DIGITS integer digits yield "Error - Number too large".
 */
std::string number_to_words(std::string_view number);

}  // namespace mnemo
