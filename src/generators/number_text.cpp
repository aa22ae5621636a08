/**
 * Mnemo Number Words Implementation
 */

#include "number_text.hpp"
#include "../core/text_utils.hpp"

#include <array>
#include <cctype>

namespace mnemo {

namespace {

constexpr std::array<std::string_view, 28> NUMBER_TEXT = {
    "Zero", "One", "Two", "Three", "Four", "Five", "Six", "Seven",
    "Eight", "Nine", "Ten", "Eleven", "Twelve", "Thirteen", "Fourteen",
    "Fifteen", "Sixteen", "Seventeen", "Eighteen", "Nineteen", "Twenty",
    "Thirty", "Forty", "Fifty", "Sixty", "Seventy", "Eighty", "Ninety"
};

constexpr size_t GROUP_DIGITS = 9;

// 0-999 as words, each followed by a space
std::string hundreds_tens_units(int64_t value, bool use_and = false) {
    std::string result;

    if (value > 99) {
        int64_t cardinal = value / 100;
        result = std::string(NUMBER_TEXT[cardinal]) + " Hundred ";
        value -= cardinal * 100;
    }

    if (use_and && value > 0) {
        result += "and ";
    }

    if (value > 20) {
        int64_t cardinal = value / 10;
        result += std::string(NUMBER_TEXT[cardinal + 18]) + " ";
        value -= cardinal * 10;
    }

    if (value > 0) {
        result += std::string(NUMBER_TEXT[value]) + " ";
    }

    return result;
}

// Optional sign, digits and commas, optional '.' and digits; at least one digit
bool is_well_formed(std::string_view s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) i++;

    bool any_digit = false;
    bool seen_point = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            any_digit = true;
        } else if (c == ',' && !seen_point) {
            continue;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            return false;
        }
    }
    return any_digit;
}

int64_t to_int(std::string_view digits) {
    int64_t value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

std::string number_to_words(std::string_view number) {
    std::string text = trim(number);
    if (!is_well_formed(text)) {
        return "Error - Number improperly formed";
    }

    std::string sign;
    std::string_view rest = text;
    if (rest.front() == '-') {
        sign = "Minus ";
        rest.remove_prefix(1);
    } else if (rest.front() == '+') {
        sign = "Plus ";
        rest.remove_prefix(1);
    }

    std::string_view decimal_part;
    std::string_view whole_text = rest;
    size_t point = rest.find('.');
    if (point != std::string_view::npos) {
        whole_text = rest.substr(0, point);
        decimal_part = rest.substr(point + 1);
    }

    std::string whole = replace_all(whole_text, ",", "");

    std::string big_whole;
    if (whole.size() > GROUP_DIGITS) {
        big_whole = whole.substr(0, whole.size() - GROUP_DIGITS);
        whole = whole.substr(whole.size() - GROUP_DIGITS);
    }
    if (big_whole.size() + whole.size() > MAX_NUMBER_DIGITS) {
        return "Error - Number too large";
    }

    std::string result;

    // Billions and up
    if (!big_whole.empty()) {
        int64_t value = to_int(big_whole);

        if (value > 999999) {
            int64_t cardinal = value / 1000000;
            result = hundreds_tens_units(cardinal) + "Quadrillion ";
            value -= cardinal * 1000000;
        }
        if (value > 999) {
            int64_t cardinal = value / 1000;
            result += hundreds_tens_units(cardinal) + "Trillion ";
            value -= cardinal * 1000;
        }
        if (value > 0) {
            result += hundreds_tens_units(value) + "Billion ";
        }
    }

    int64_t whole_value = to_int(whole);
    int64_t value = whole_value;

    if (value == 0 && big_whole.empty()) {
        result = "Zero ";
    }
    if (value > 999999) {
        int64_t cardinal = value / 1000000;
        result += hundreds_tens_units(cardinal) + "Million ";
        value -= cardinal * 1000000;
    }
    if (value > 999) {
        int64_t cardinal = value / 1000;
        result += hundreds_tens_units(cardinal) + "Thousand ";
        value -= cardinal * 1000;
    }
    if (value > 0) {
        bool use_and = whole_value >= 100 || !big_whole.empty();
        result += hundreds_tens_units(value, use_and);
    }

    if (point != std::string_view::npos && !decimal_part.empty()) {
        result += "Point";
        for (char c : decimal_part) {
            result += " ";
            result += NUMBER_TEXT[static_cast<size_t>(c - '0')];
        }
    }

    return sign + trim(result);
}

}  // namespace mnemo
