/**
 * Mnemo Secure Random Implementation
 */

#include "secure_random.hpp"
#include "text_utils.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace mnemo {

namespace {

// Shared by the integer and decimal forms; returns the unrounded ceiling.
double weighted_ceiling(double max_val, double min_val, int weight) {
    if (weight == 0) weight = 1;

    double ceiling = max_val;
    int iterations = std::abs(weight);
    for (int i = 0; i < iterations; ++i) {
        ceiling = secure_uniform() * (ceiling - min_val) + min_val;
    }

    if (weight > 0) {
        ceiling = max_val - (ceiling - min_val);
    }
    return ceiling;
}

}  // namespace

double secure_uniform() {
    unsigned char buf[8];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        throw std::runtime_error("Secure random source unavailable");
    }

    uint64_t bits = 0;
    for (unsigned char b : buf) {
        bits = (bits << 8) | b;
    }

    // Top 53 bits fill the double mantissa exactly
    return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

int64_t weighted_rand(int64_t max_val, int64_t min_val, int weight) {
    if (max_val == 0) max_val = 9;

    double ceiling = std::round(weighted_ceiling(static_cast<double>(max_val),
                                                 static_cast<double>(min_val), weight));

    // Doubles cannot hold every int64_t; keep the draw inside [lo, hi]
    int64_t lo = std::min(max_val, min_val);
    int64_t hi = std::max(max_val, min_val);
    if (ceiling <= static_cast<double>(lo)) return lo;
    if (ceiling >= static_cast<double>(hi)) return hi;
    return std::clamp(static_cast<int64_t>(ceiling), lo, hi);
}

double weighted_rand_decimal(double max_val, double min_val, int weight, int decimal_places) {
    if (max_val == 0.0) max_val = 9.0;

    double ceiling = weighted_ceiling(max_val, min_val, weight);
    if (decimal_places <= 0) {
        return std::round(ceiling);
    }

    double factor = std::pow(10.0, decimal_places);
    return std::round(ceiling * factor) / factor;
}

bool chance(int percent, int weight) {
    return weighted_rand(100, 1, weight) <= percent;
}

size_t random_index(size_t n, int weight) {
    if (n <= 1) return 0;
    return static_cast<size_t>(weighted_rand(static_cast<int64_t>(n - 1), 0, weight));
}

std::string pick_one(std::string_view items, int weight, char delimiter) {
    return pick_one(split(items, delimiter), weight);
}

std::string pick_one(const std::vector<std::string>& items, int weight) {
    if (items.empty()) return "";
    if (items.size() == 1) return trim(items[0]);

    int64_t index = weighted_rand(static_cast<int64_t>(items.size() - 1), 0, weight);
    return trim(items[static_cast<size_t>(index)]);
}

std::string pick_character(std::string_view characters, int weight) {
    if (characters.empty()) return "";

    int64_t index = weighted_rand(static_cast<int64_t>(characters.size()), 1, weight) - 1;
    return std::string(1, characters[static_cast<size_t>(index)]);
}

}  // namespace mnemo
