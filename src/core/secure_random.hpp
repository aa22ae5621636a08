/**
 * Mnemo Secure Random
 *
 * Weighted random primitives over a cryptographically strong source.
 *
 * Weighting narrows the range by repeated draws: each of |weight|
 * iterations draws d in [0,1) and sets ceiling = d*(ceiling-min)+min.
 * Positive weights reflect the result so it leans toward max, negative
 * weights leave it leaning toward min. weight == 0 behaves as 1.
 *
 * Everything here is stateless apart from the OpenSSL entropy pool and
 * may be called from any number of sessions concurrently.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo {

/**
 * Uniform real in [0, 1) drawn from OpenSSL RAND_bytes.
 * @throws std::runtime_error if the entropy source fails
 */
double secure_uniform();

/**
 * Weighted random integer in [min_val, max_val].
 *
 * max_val == 0 is the legacy shorthand for 9.
 */
int64_t weighted_rand(int64_t max_val = 9, int64_t min_val = 0, int weight = 1);

/**
 * Weighted random real in [min_val, max_val] rounded to decimal_places.
 * decimal_places == 0 rounds to a whole number.
 */
double weighted_rand_decimal(double max_val, double min_val, int weight, int decimal_places);

/**
 * True when weighted_rand(100, 1, weight) <= percent.
 */
bool chance(int percent, int weight = 1);

/**
 * Index in [0, n-1]; 0 for n <= 1 so the max == 0 shorthand never applies.
 */
size_t random_index(size_t n, int weight = 1);

/**
 * Pick one trimmed item from a delimited list, index weighted_rand(count-1, 0, weight).
 */
std::string pick_one(std::string_view items, int weight = 1, char delimiter = ' ');
std::string pick_one(const std::vector<std::string>& items, int weight = 1);

/**
 * Pick one character, index weighted_rand(length, 1, weight) - 1.
 * Returns an empty string for empty input.
 */
std::string pick_character(std::string_view characters, int weight = 0);

}  // namespace mnemo
