/**
 * Mnemo Text Utilities Implementation
 */

#include "text_utils.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

namespace mnemo {

std::string to_lower(std::string_view s) {
    std::string result(s);
    for (char& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    for (char& c : result) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return result;
}

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return std::string(s.substr(start, end - start));
}

std::string sentence_case(std::string_view s) {
    if (s.empty()) return std::string(s);
    std::string result = to_lower(s);
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

std::string title_case(std::string_view s) {
    std::string result(s);
    bool prev_alpha = false;
    for (char& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(prev_alpha ? std::tolower(uc) : std::toupper(uc));
            prev_alpha = true;
        } else {
            prev_alpha = false;
        }
    }
    return result;
}

std::string replace_all(std::string_view s, std::string_view from, std::string_view to) {
    if (from.empty()) return std::string(s);

    std::string result;
    result.reserve(s.size());
    size_t pos = 0;
    while (true) {
        size_t found = s.find(from, pos);
        if (found == std::string_view::npos) {
            result.append(s.substr(pos));
            break;
        }
        result.append(s.substr(pos, found - pos));
        result.append(to);
        pos = found + from.size();
    }
    return result;
}

std::string replace_first(std::string_view s, std::string_view from, std::string_view to) {
    if (from.empty()) return std::string(s);

    size_t found = s.find(from);
    if (found == std::string_view::npos) return std::string(s);

    std::string result(s.substr(0, found));
    result.append(to);
    result.append(s.substr(found + from.size()));
    return result;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<int64_t> parse_int(std::string_view s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;

    try {
        size_t consumed = 0;
        long long value = std::stoll(t, &consumed);
        if (consumed != t.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t parse_int_or(std::string_view s, int64_t fallback) {
    return parse_int(s).value_or(fallback);
}

std::string get_ordinal(std::string_view number) {
    std::string n(number);
    if (n.empty()) return n;

    std::string last_two = n.size() >= 2 ? n.substr(n.size() - 2) : n;
    if (last_two == "11" || last_two == "12" || last_two == "13") {
        return n + "th";
    }

    switch (n.back()) {
        case '1': return n + "st";
        case '2': return n + "nd";
        case '3': return n + "rd";
        default:  return n + "th";
    }
}

std::string get_phonetic(std::string_view word, int style) {
    static const std::array<const char*, 26> NATO = {
        "Alpha", "Bravo", "Charlie", "Delta", "Echo", "Foxtrot",
        "Golf", "Hotel", "India", "Juliet", "Kilo", "Lima", "Mike",
        "November", "Oscar", "Papa", "Quebec", "Romeo", "Sierra",
        "Tango", "Uniform", "Victor", "Whiskey", "X-Ray", "Yankee", "Zulu"
    };
    static const std::array<const char*, 26> LEGACY = {
        "Adam", "Baker", "Charles", "David", "Edward", "Frank",
        "George", "Henry", "Ida", "John", "King", "Lincoln", "Mary",
        "Nora", "Ocean", "Paul", "Queen", "Robert", "Sam",
        "Tom", "Union", "Victor", "William", "X-Ray", "Young", "Zebra"
    };
    const auto& table = (style == 0 || style == 1) ? NATO : LEGACY;

    std::string result;
    for (char c : word) {
        int idx = std::toupper(static_cast<unsigned char>(c)) - 'A';
        if (idx < 0 || idx >= 26) continue;
        if (!result.empty()) result += ' ';
        result += table[static_cast<size_t>(idx)];
    }
    return result;
}

std::string to_roman(int64_t number) {
    static const std::array<std::pair<int64_t, const char*>, 13> NUMERALS = {{
        {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"},
        {100, "C"}, {90, "XC"}, {50, "L"}, {40, "XL"},
        {10, "X"}, {9, "IX"}, {5, "V"}, {4, "IV"}, {1, "I"}
    }};

    if (number <= 0) return "";

    std::string result;
    for (const auto& [value, numeral] : NUMERALS) {
        while (number >= value) {
            result += numeral;
            number -= value;
        }
    }
    return result;
}

}  // namespace mnemo
