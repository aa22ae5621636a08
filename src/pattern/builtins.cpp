/**
 * Mnemo Builtin Values Implementation
 */

#include "builtins.hpp"
#include "escaper.hpp"
#include "modifiers.hpp"
#include "../core/charsets.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace mnemo {

namespace {

std::string param_at(const std::vector<std::string>& params, size_t i) {
    return i < params.size() ? params[i] : std::string();
}

int64_t clamp_length(int64_t n) {
    return std::min(n, MAX_GENERATED_LENGTH);
}

std::string repeat_picks(std::string_view chars, int64_t count) {
    std::string result;
    for (int64_t i = 0; i < count; ++i) {
        result += pick_character(chars);
    }
    return result;
}

// Random run of length characters from s, or all of s when it is shorter
std::string window(std::string_view s, size_t length) {
    if (length >= s.size()) return std::string(s);
    auto start = static_cast<size_t>(weighted_rand(static_cast<int64_t>(s.size() - length), 0));
    return std::string(s.substr(start, length));
}

// "1.50" -> "1.5", "1.00" -> "1.0"; one decimal digit always stays
std::string trim_decimal_zeros(std::string text) {
    size_t point = text.find('.');
    if (point == std::string::npos) return text;
    while (text.size() > point + 2 && text.back() == '0') {
        text.pop_back();
    }
    return text;
}

}  // namespace

// -----------------------------------------------------------------------------
// Parameters
// -----------------------------------------------------------------------------

WordParams WordParams::from_params(const std::vector<std::string>& params) {
    WordParams p;
    std::string list = param_at(params, 0);
    if (!list.empty()) p.list = list;
    return p;
}

NumberParams NumberParams::from_params(const std::vector<std::string>& params) {
    NumberParams p;
    p.max = parse_int_or(param_at(params, 0), p.max);
    p.min = parse_int_or(param_at(params, 1), p.min);
    p.weight = static_cast<int>(std::clamp<int64_t>(parse_int_or(param_at(params, 2), p.weight), -100, 100));
    p.decimals = static_cast<int>(std::clamp<int64_t>(parse_int_or(param_at(params, 3), p.decimals), 0, 10));
    return p;
}

CountParams CountParams::from_params(const std::vector<std::string>& params) {
    CountParams p;
    p.count = clamp_length(parse_int_or(param_at(params, 0), p.count));
    return p;
}

LengthParams LengthParams::from_params(const std::vector<std::string>& params) {
    LengthParams p;
    p.length = clamp_length(parse_int_or(param_at(params, 0), p.length));
    if (p.length <= 0) p.length = 3;
    return p;
}

OrdinalParams OrdinalParams::from_params(const std::vector<std::string>& params) {
    OrdinalParams p;
    p.n = parse_int(param_at(params, 0));
    return p;
}

PhoneticParams PhoneticParams::from_params(const std::vector<std::string>& params) {
    PhoneticParams p;
    p.word = unescape(param_at(params, 0));
    p.style = static_cast<int>(parse_int_or(param_at(params, 1), p.style));
    return p;
}

// -----------------------------------------------------------------------------
// Generators
// -----------------------------------------------------------------------------

std::string get_sequence(int64_t length) {
    static constexpr std::string_view LETTERS = "abcdefghijklmnopqrstuvwxyz";
    static constexpr std::string_view NUMBERS = "1234567890";
    static constexpr std::string_view KEY1 = "qwertyuiop";
    static constexpr std::string_view KEY2 = "asdfghjkl";
    static constexpr std::string_view KEY3 = "zxcvbnm";
    static constexpr std::string_view KEY4 = "poiuytrewq";
    static constexpr std::string_view KEY5 = "lkjhgfdsa";
    static constexpr std::string_view KEY6 = "mnbvcxz";

    if (length <= 0) length = 3;
    length = clamp_length(length);
    auto len = static_cast<size_t>(length);

    std::string seq;
    int64_t choice = weighted_rand(19);

    switch (choice) {
        case 1: seq = window(LETTERS, len); break;
        case 2: seq = window(NUMBERS, len); break;
        case 3: seq = window(KEY1, len); break;
        case 4: seq = window(KEY2, len); break;
        case 5: seq = window(KEY3, len); break;
        case 6: seq = window(KEY4, len); break;
        case 7: seq = window(KEY5, len); break;
        case 8: seq = window(KEY6, len); break;

        // Column runs down (9) or up (10) the letter rows
        case 9:
        case 10: {
            auto i = static_cast<size_t>(weighted_rand(7, 1));
            size_t n = std::max<size_t>(1, len / 3);
            std::string top(KEY1.substr(i, n));
            std::string mid(KEY2.substr(i, n));
            std::string bottom(KEY3.substr(i, n));
            seq = (choice == 9) ? top + mid + bottom : bottom + mid + top;
            break;
        }

        // Zig-zag between two rows
        case 11:
        case 12:
        case 13: {
            auto i = static_cast<size_t>(weighted_rand(8, 1));
            while (seq.size() < len) {
                seq += KEY1[i];
                seq += KEY2[i];
                i = (i + 1) % KEY2.size();
            }
            break;
        }

        case 14: {
            auto i = static_cast<size_t>(weighted_rand(9, 1));
            while (seq.size() < len) {
                seq += KEY1[i];
                seq += NUMBERS[i];
                i = (i + 1) % NUMBERS.size();
            }
            break;
        }

        case 15:
        case 16: {
            auto i = static_cast<size_t>(weighted_rand(8, 1));
            while (seq.size() < len) {
                seq += KEY4[i];
                seq += KEY5[i];
                i = (i + 1) % KEY5.size();
            }
            break;
        }

        // Converge from both ends of one row
        case 17: {
            auto i = static_cast<size_t>(weighted_rand(9, 1));
            for (; seq.size() < len && i < KEY1.size(); ++i) {
                seq += KEY1[i];
                seq += KEY1[KEY1.size() - i - 1];
            }
            break;
        }

        case 18: {
            auto i = static_cast<size_t>(weighted_rand(8, 1));
            for (; seq.size() < len && i < KEY2.size(); ++i) {
                seq += KEY2[i];
                seq += KEY2[KEY2.size() - i - 1];
            }
            break;
        }

        default: {
            auto i = static_cast<size_t>(weighted_rand(6, 1));
            for (; seq.size() < len && i < KEY3.size(); ++i) {
                seq += KEY3[i];
                seq += KEY3[KEY3.size() - i - 1];
            }
            break;
        }
    }

    // Short runs repeat until they cover the requested length
    while (!seq.empty() && seq.size() < len) {
        seq += seq;
    }
    return seq.substr(0, len);
}

std::string get_number_pattern(int64_t length) {
    if (length <= 0) length = 3;
    length = clamp_length(length);

    std::vector<int64_t> digits(static_cast<size_t>(length) + 1, 0);
    digits[1] = weighted_rand(9);

    for (size_t i = 2; i <= static_cast<size_t>(length); ++i) {
        int64_t prev = digits[i - 1];

        switch (weighted_rand(3, 0)) {
            case 0:
                digits[i] = weighted_rand(9);
                break;
            case 1:
                digits[i] = digits[static_cast<size_t>(weighted_rand(static_cast<int64_t>(i - 1), 1))];
                break;
            case 2:
                digits[i] = (prev > 1) ? prev - 1 : weighted_rand(9);
                break;
            default:
                digits[i] = (prev < 9) ? prev + 1 : weighted_rand(9);
                break;
        }
    }

    std::string result;
    for (size_t i = 1; i < digits.size(); ++i) {
        result += std::to_string(digits[i]);
    }
    return result;
}

std::string number_code() {
    std::string repeat_digit = std::to_string(weighted_rand(9, 0));
    std::string delim = pick_one("- - - - - - - - . . . , / \\ :");

    std::string code;
    while (true) {
        std::string x = std::to_string(weighted_rand(9, 0));

        while (true) {
            code += x;

            if (chance(30)) {
                code += repeat_digit;
            } else if (chance(40)) {
                code += delim;
            }

            if (code.size() > 2) break;
            if (!chance(30)) break;
        }

        if (static_cast<int64_t>(code.size()) > weighted_rand(4, 3)) break;

        if (chance(10)) {
            code = bracket_word(code);
        }

        if (chance(15) && code.size() > 2) break;
    }

    if (!code.empty() && !std::isdigit(static_cast<unsigned char>(code.back()))) {
        code.pop_back();
    }
    return code;
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

BuiltinDispatch::BuiltinDispatch(const Collaborators& collaborators)
    : collaborators_(collaborators) {
    register_builtins();
}

std::string BuiltinDispatch::lookup_word(const std::string& list_name) const {
    if (collaborators_.words == nullptr) {
        throw WordlistNotFound("No word source configured for list: " + list_name);
    }
    return collaborators_.words->lookup_word(list_name);
}

bool BuiltinDispatch::is_builtin(const std::string& name) const {
    return table_.count(to_lower(trim(name))) > 0;
}

ResolveResult BuiltinDispatch::resolve(const std::string& name,
                                       const std::vector<std::string>& params) const {
    std::string key = to_lower(trim(name));

    auto it = table_.find(key);
    if (it != table_.end()) {
        try {
            return ResolveResult::success(it->second(params));
        } catch (const WordlistNotFound& e) {
            return ResolveResult::failure(ResolveError::WORDLIST_NOT_FOUND, e.what());
        }
    }

    // Unrecognized: maybe a word list, otherwise literal text
    try {
        return ResolveResult::success(lookup_word(key));
    } catch (const WordlistNotFound&) {
        return ResolveResult::success(name);
    }
}

void BuiltinDispatch::register_builtins() {
    auto pick_from = [](std::string_view chars) {
        return [chars](const std::vector<std::string>&) { return pick_character(chars); };
    };
    auto one_of = [](std::string_view items) {
        return [items](const std::vector<std::string>&) { return pick_one(items); };
    };

    table_["word"] = [this](const std::vector<std::string>& params) {
        WordParams p = WordParams::from_params(params);
        std::string list = p.list;
        if (list.find('|') != std::string::npos) {
            list = pick_one(split(list, '|'));
        }
        return lookup_word(list);
    };

    table_["number"] = [](const std::vector<std::string>& params) {
        NumberParams p = NumberParams::from_params(params);
        if (p.decimals > 0) {
            double value = weighted_rand_decimal(static_cast<double>(p.max),
                                                 static_cast<double>(p.min),
                                                 p.weight, p.decimals);
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(p.decimals) << value;
            return trim_decimal_zeros(ss.str());
        }
        return std::to_string(weighted_rand(p.max, p.min, p.weight));
    };

    table_["letter"] = [](const std::vector<std::string>& params) {
        // A negative count means its magnitude, under the same cap
        int64_t count = parse_int_or(param_at(params, 0), 1);
        if (count < 0) {
            count = (count == std::numeric_limits<int64_t>::min()) ? MAX_GENERATED_LENGTH : -count;
        }
        return repeat_picks(charsets::LETTERS, clamp_length(count));
    };
    table_["vowel"] = [](const std::vector<std::string>& params) {
        return repeat_picks(charsets::VOWELS, CountParams::from_params(params).count);
    };
    table_["consonant"] = [](const std::vector<std::string>& params) {
        return repeat_picks(charsets::CONSONANTS, CountParams::from_params(params).count);
    };

    table_["sp"] = [](const std::vector<std::string>&) { return std::string(" "); };
    table_["space"] = table_["sp"];

    table_["symbol"] = one_of(charsets::SYMBOLS);
    table_["smiley"] = one_of(charsets::SMILEYS);
    table_["endpunctuation"] = one_of(charsets::END_PUNCTUATION);
    table_["sentencepunctuation"] = pick_from(charsets::SENTENCE_PUNCTUATION);

    table_["keyboard"] = pick_from(charsets::KEYBOARD);
    table_["numrow"] = pick_from(charsets::NUMROW);
    table_["numrowfull"] = pick_from(charsets::NUMROW_FULL);
    table_["row1"] = pick_from(charsets::ROW1);
    table_["row1full"] = pick_from(charsets::ROW1_FULL);
    table_["row2"] = pick_from(charsets::ROW2);
    table_["row2full"] = pick_from(charsets::ROW2_FULL);
    table_["row3"] = pick_from(charsets::ROW3);
    table_["row3full"] = pick_from(charsets::ROW3_FULL);
    table_["lefthand"] = pick_from(charsets::LEFT_HAND);
    table_["righthand"] = pick_from(charsets::RIGHT_HAND);

    table_["sequence"] = [](const std::vector<std::string>& params) {
        return get_sequence(LengthParams::from_params(params).length);
    };
    table_["numberpattern"] = [](const std::vector<std::string>& params) {
        return get_number_pattern(LengthParams::from_params(params).length);
    };
    table_["numbercode"] = [](const std::vector<std::string>&) { return number_code(); };

    table_["ordinal"] = [](const std::vector<std::string>& params) {
        OrdinalParams p = OrdinalParams::from_params(params);
        int64_t n = p.n ? *p.n : weighted_rand(99, 1);
        return get_ordinal(std::to_string(n));
    };

    table_["phonetic"] = [](const std::vector<std::string>& params) {
        PhoneticParams p = PhoneticParams::from_params(params);
        std::string word = p.word.empty() ? pick_character(charsets::LETTERS) : p.word;
        return get_phonetic(word, p.style);
    };

    table_["pronounceable"] = [this](const std::vector<std::string>&) {
        return collaborators_.pronounceable_word ? collaborators_.pronounceable_word() : std::string();
    };

    table_["asc"] = [](const std::vector<std::string>& params) {
        std::string text = unescape(param_at(params, 0));
        if (!text.empty()) {
            return std::to_string(static_cast<unsigned char>(text[0]));
        }
        return std::to_string(weighted_rand(255, 32));
    };

    table_["chr"] = [](const std::vector<std::string>& params) {
        auto code = parse_int(param_at(params, 0));
        if (code && *code >= 32 && *code <= 126) {
            return std::string(1, static_cast<char>(*code));
        }
        return std::string();
    };

    table_["longmonth"] = one_of(charsets::LONG_MONTHS);
    table_["shortmonth"] = one_of(charsets::SHORT_MONTHS);
    table_["longday"] = one_of(charsets::LONG_DAYS);
    table_["shortday"] = one_of(charsets::SHORT_DAYS);
}

}  // namespace mnemo
