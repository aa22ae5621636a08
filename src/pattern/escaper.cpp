/**
 * Mnemo Escaper Implementation
 */

#include "escaper.hpp"

#include <array>

namespace mnemo {

namespace {

struct EscapeToken {
    char literal;
    const char* token;
};

// Backslash first so its token is never re-escaped by a later entry
constexpr std::array<EscapeToken, 9> TOKENS = {{
    {'\\', "#sla#"},
    {'+',  "#pls#"},
    {'{',  "#lbr#"},
    {'}',  "#rbr#"},
    {'[',  "#lba#"},
    {']',  "#rba#"},
    {'(',  "#lpa#"},
    {')',  "#rpa#"},
    {'|',  "#pip#"},
}};

constexpr size_t TOKEN_LENGTH = 5;

const char* token_for(char c) {
    for (const auto& t : TOKENS) {
        if (t.literal == c) return t.token;
    }
    return nullptr;
}

}  // namespace

std::string escape_pattern(std::string_view pattern) {
    std::string result;
    result.reserve(pattern.size());

    size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            if (const char* token = token_for(pattern[i + 1])) {
                result += token;
                i += 2;
                continue;
            }
        }
        result += pattern[i];
        i++;
    }
    return result;
}

std::string escape_value(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (char c : value) {
        if (const char* token = token_for(c)) {
            result += token;
        } else {
            result += c;
        }
    }
    return result;
}

std::string unescape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        if (text[i] == '#' && i + TOKEN_LENGTH <= text.size()) {
            std::string_view candidate = text.substr(i, TOKEN_LENGTH);
            for (const auto& t : TOKENS) {
                if (candidate == t.token) {
                    result += t.literal;
                    i += TOKEN_LENGTH;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            result += text[i];
            i++;
        }
    }
    return result;
}

}  // namespace mnemo
