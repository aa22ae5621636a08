/**
 * Mnemo Modifier Pipeline Implementation
 */

#include "modifiers.hpp"
#include "../core/charsets.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace mnemo {

namespace {

constexpr int64_t MAX_REPEAT = 100;
constexpr int64_t MAX_SCRAMBLE = 1000;
constexpr int64_t MAX_ROMAN = 3999;

std::string param_at(const std::vector<std::string>& params, size_t i) {
    return i < params.size() ? params[i] : std::string();
}

char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

bool in_set(char c, std::string_view set) {
    return set.find(lower(c)) != std::string_view::npos;
}

std::string join(const std::vector<std::string>& words, char delimiter) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) result += delimiter;
        result += words[i];
    }
    return result;
}

// Substitution rules for obscure(), applied at most once per pick
const std::vector<std::pair<std::string_view, std::string_view>>& obscure_rules() {
    static const std::vector<std::pair<std::string_view, std::string_view>> rules = {
        {"ate", "8"}, {"for", "4"}, {"e", "3"}, {"l", "1"}, {"s", "z"},
        {"o", "0"}, {"a", "@"}, {"s", "$"}, {"l", "|"}, {"ait", "8"},
        {"a", ""}, {"e", ""}, {"ou", "u"}, {"cc", "x"}, {"oo", "ew"},
        {"and", "&"}, {"are", "r"}, {"ks", "x"}, {"f", "ph"}, {"ph", "f"},
        {"won", "1"}, {"l", "r"}, {"ee", "eee"}, {"000", "k"}, {"er", "r"},
        {"ex", "x"}, {"ecs", "x"}, {"m", "mm"}, {"cke", "x0"}, {"qu", "kw"},
        {"a", "'"}, {"u", "'"}, {"ei", "ee"}, {"one", "own"}, {"oi", "oy"},
        {"om", "um"}, {"a", "aa"}, {"ew", "u"}, {"us", "is"}, {"y", "ee"},
        {"sh", "ch"}, {"to", "2"}, {"s", "th"}, {"ck", "q"}, {"ci", "si"},
        {"ie", "iye"}, {"tion", "shun"}, {"r", "w"}, {"come", "cum"},
        {"cks", "x"}, {"ight", "ite"}, {"ing", "'n"}, {"th", "f"},
        {"too", "2"}, {"why", "y"}, {"your", "yor"}, {"sc", "sh"},
        {"sh", "th"}, {"ly", "lee"}, {"er", "uh"}, {"er", "a"},
        {"the", "da"}, {"it is", "'tis"}, {"you", "ya"}, {"l", "w"},
        {"th", "d"}, {"a", "u"}, {"th", "'"}, {"your", "yer"},
        {"ned", "nt"}, {"e", "_"}, {"t", "+"}, {"e", "="}, {"can", "kin"},
        {"t", "'"}, {"ng", "n'"}, {"red", "hed"}, {"he", "eh"}, {"h", ""},
        {"f", "v"}, {"ha", "o"}, {"v", "f"}, {"v", "b"}, {"N", "|\\|"},
        {"ll", "dd"}, {"ll", "tt"}, {"dd", "tt"}, {"h", "'"}, {"o", "a"},
        {"e", "a"}, {"a", "uh"}, {"a", "u"}, {"oo", "u"}, {"i", "ih"},
        {"a ", "ah"}, {"s", "ss"}, {"t", "tt"}, {"d", "dd"}, {"at", "@"},
        {" ", ""}, {"with", "w/"}, {"t", "d"}, {"t", "dd"}, {"d", "t"},
        {"d", "tt"}, {"cks", "x"}, {"er", "ah"},
    };
    return rules;
}

}  // namespace

// -----------------------------------------------------------------------------
// Parameters
// -----------------------------------------------------------------------------

ReplaceParams ReplaceParams::from_params(const std::vector<std::string>& params) {
    return ReplaceParams{.from = param_at(params, 0), .to = param_at(params, 1)};
}

SubstringParams SubstringParams::from_params(const std::vector<std::string>& params) {
    return SubstringParams{.length = parse_int(param_at(params, 0))};
}

MidParams MidParams::from_params(const std::vector<std::string>& params) {
    MidParams p;
    p.start = std::max<int64_t>(1, parse_int_or(param_at(params, 0), p.start));
    p.length = std::max<int64_t>(0, parse_int_or(param_at(params, 1), p.length));
    return p;
}

TimesParams TimesParams::from_params(const std::vector<std::string>& params, int64_t limit) {
    TimesParams p;
    p.times = std::clamp<int64_t>(parse_int_or(param_at(params, 0), p.times), 0, limit);
    return p;
}

BracketParams BracketParams::from_params(const std::vector<std::string>& params) {
    return BracketParams{.pairs = param_at(params, 0)};
}

FormatParams FormatParams::from_params(const std::vector<std::string>& params) {
    FormatParams p;
    std::string format = param_at(params, 0);
    if (!format.empty()) p.format = format;
    return p;
}

// -----------------------------------------------------------------------------
// Transforms
// -----------------------------------------------------------------------------

std::string bracket_word(std::string_view word, std::string_view pairs) {
    if (pairs.empty()) pairs = charsets::DEFAULT_BRACKETS;

    auto brackets = split(pairs, ' ');
    if (brackets.size() < 2) return std::string(word);

    size_t x = random_index(brackets.size() / 2) * 2;
    return brackets[x] + std::string(word) + brackets[x + 1];
}

std::string obscure(std::string_view word) {
    const auto& rules = obscure_rules();
    std::string result(word);

    int64_t max_attempts = weighted_rand(20, 2, 2);
    for (int64_t i = 0; i < max_attempts; ++i) {
        const auto& [from, to] = rules[random_index(rules.size())];

        if (result.find(from) != std::string::npos) {
            result = replace_first(result, from, to);
        }

        if (i >= 2 && result != word && chance(75)) {
            break;
        }
    }
    return result;
}

std::string random_case(std::string_view word) {
    std::string result(word);
    if (result.empty()) return result;
    size_t len = result.size();

    switch (weighted_rand(14, 0)) {
        case 0:
            break;

        case 1:
            result = to_upper(result);
            break;

        case 2:
            result = to_lower(result);
            break;

        case 3:
            result = title_case(result);
            break;

        // Every occurrence of one letter
        case 4: {
            char letter = result[random_index(len)];
            for (char& c : result) {
                if (c == letter) c = upper(c);
            }
            break;
        }

        case 5:
            for (char& c : result) {
                if (weighted_rand(1) == 1) c = upper(c);
            }
            break;

        case 6:
        case 7: {
            size_t i = random_index(len);
            result[i] = upper(result[i]);
            break;
        }

        case 8:
            for (char& c : result) {
                if (in_set(c, charsets::VOWELS)) c = upper(c);
            }
            break;

        case 9:
            for (char& c : result) {
                if (in_set(c, charsets::CONSONANTS)) c = upper(c);
            }
            break;

        // Two neighbouring letters
        case 10: {
            size_t i = random_index(len - 1);
            for (size_t j = i; j < i + 2 && j < len; ++j) {
                result[j] = upper(result[j]);
            }
            break;
        }

        case 11:
            result.back() = upper(result.back());
            break;

        case 12:
            result.front() = upper(result.front());
            result.back() = upper(result.back());
            break;

        // First x letters
        case 13: {
            auto x = static_cast<size_t>(weighted_rand(static_cast<int64_t>(len), 1, 2));
            for (size_t j = 0; j < x && j < len; ++j) {
                result[j] = upper(result[j]);
            }
            break;
        }

        default:
            for (size_t j = 0; j < len; j += 2) {
                result[j] = upper(result[j]);
            }
            break;
    }
    return result;
}

std::string scramble_word(std::string_view word, int64_t times) {
    std::string chars(word);
    if (chars.size() < 2) return chars;

    for (int64_t i = 0; i < times; ++i) {
        size_t x1 = random_index(chars.size());
        size_t x2 = random_index(chars.size());
        std::swap(chars[x1], chars[x2]);
    }
    return chars;
}

std::string pig_latin(std::string_view text) {
    auto words = split(text, ' ');

    for (auto& word : words) {
        if (word.empty()) continue;

        std::string converted;
        if (in_set(word[0], charsets::VOWELS)) {
            converted = word + "yay";
        } else {
            converted = word.substr(1) + word[0] + "ay";
        }

        if (std::isupper(static_cast<unsigned char>(word[0]))) {
            converted = to_lower(converted);
            converted[0] = upper(converted[0]);
        }
        word = std::move(converted);
    }
    return join(words, ' ');
}

std::string swap_initials(std::string_view text) {
    auto words = split(text, ' ');
    if (words.size() < 2) return std::string(text);

    if (!words[0].empty() && !words[1].empty()) {
        std::swap(words[0][0], words[1][0]);
    }
    return join(words, ' ');
}

std::string stutter(std::string_view word) {
    std::string_view syllable_marker = (weighted_rand(100) > 20) ? "aeiou" : "hywrtnaeiou";

    for (size_t i = 0; i < word.size(); ++i) {
        if (!in_set(word[i], syllable_marker)) continue;

        std::string first_part(word.substr(0, i + 1));
        if (weighted_rand(100) < 5) first_part += "...";
        if (weighted_rand(100) < 10) first_part += " ";

        std::string stuttered(word);
        int64_t repeats = weighted_rand(4, 1, -2);
        for (int64_t r = 0; r < repeats; ++r) {
            stuttered = first_part + stuttered;
        }
        return stuttered;
    }
    return std::string(word);
}

std::string format_number(std::string_view word, std::string_view format) {
    size_t width = static_cast<size_t>(std::count(format.begin(), format.end(), '0'));
    if (width == 0 || word.size() >= width) return std::string(word);

    std::string sign;
    std::string_view digits = word;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        sign = std::string(1, digits[0]);
        digits.remove_prefix(1);
    }
    return sign + std::string(width - word.size(), '0') + std::string(digits);
}

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------

ModifierPipeline::ModifierPipeline(const Collaborators& collaborators)
    : collaborators_(collaborators) {
    register_modifiers();
}

bool ModifierPipeline::has_modifier(const std::string& name) const {
    return table_.count(to_lower(trim(name))) > 0;
}

ResolveResult ModifierPipeline::apply(const std::string& word, const std::string& name,
                                      const std::vector<std::string>& params) const {
    std::string key = to_lower(trim(name));

    auto it = table_.find(key);
    if (it == table_.end()) {
        return ResolveResult::failure(ResolveError::UNKNOWN_MODIFIER, "Unknown modifier: " + key);
    }

    if (word.empty()) {
        return ResolveResult::success(word);
    }
    return ResolveResult::success(it->second(word, params));
}

void ModifierPipeline::register_modifiers() {
    using Params = std::vector<std::string>;

    table_["a"] = [](const std::string& word, const Params&) {
        return (in_set(word[0], charsets::VOWELS) ? "an " : "a ") + word;
    };

    table_["bracket"] = [](const std::string& word, const Params& params) {
        return bracket_word(word, BracketParams::from_params(params).pairs);
    };

    table_["num2words"] = [this](const std::string& word, const Params&) {
        if (!collaborators_.number_to_words) return word;
        return sentence_case(collaborators_.number_to_words(word));
    };
    table_["num2word"] = table_["num2words"];

    table_["fakeword"] = [this](const std::string& word, const Params&) {
        return collaborators_.fake_word ? collaborators_.fake_word(word) : word;
    };

    table_["reverse"] = [](const std::string& word, const Params&) {
        return std::string(word.rbegin(), word.rend());
    };

    table_["uppercase"] = [](const std::string& word, const Params&) { return to_upper(word); };
    table_["ucase"] = table_["uppercase"];
    table_["lowercase"] = [](const std::string& word, const Params&) { return to_lower(word); };
    table_["lcase"] = table_["lowercase"];
    table_["propercase"] = [](const std::string& word, const Params&) { return title_case(word); };
    table_["sentencecase"] = [](const std::string& word, const Params&) { return sentence_case(word); };
    table_["trim"] = [](const std::string& word, const Params&) { return trim(word); };

    table_["obscure"] = [](const std::string& word, const Params&) { return obscure(word); };
    table_["randomcase"] = [](const std::string& word, const Params&) { return random_case(word); };
    table_["piglatin"] = [](const std::string& word, const Params&) { return pig_latin(word); };
    table_["swap"] = [](const std::string& word, const Params&) { return swap_initials(word); };
    table_["stutter"] = [](const std::string& word, const Params&) { return stutter(word); };

    table_["replace"] = [](const std::string& word, const Params& params) {
        ReplaceParams p = ReplaceParams::from_params(params);
        return replace_all(word, p.from, p.to);
    };

    table_["scramble"] = [](const std::string& word, const Params& params) {
        return scramble_word(word, TimesParams::from_params(params, MAX_SCRAMBLE).times);
    };

    table_["repeat"] = [](const std::string& word, const Params& params) {
        int64_t times = TimesParams::from_params(params, MAX_REPEAT).times;
        std::string result;
        for (int64_t i = 0; i <= times; ++i) result += word;
        return result;
    };

    table_["left"] = [](const std::string& word, const Params& params) {
        int64_t n = SubstringParams::from_params(params).length.value_or(static_cast<int64_t>(word.size()));
        n = std::clamp<int64_t>(n, 0, static_cast<int64_t>(word.size()));
        return word.substr(0, static_cast<size_t>(n));
    };

    table_["right"] = [](const std::string& word, const Params& params) {
        int64_t n = SubstringParams::from_params(params).length.value_or(static_cast<int64_t>(word.size()));
        n = std::clamp<int64_t>(n, 0, static_cast<int64_t>(word.size()));
        return word.substr(word.size() - static_cast<size_t>(n));
    };

    table_["mid"] = [](const std::string& word, const Params& params) {
        MidParams p = MidParams::from_params(params);
        auto start = static_cast<size_t>(p.start - 1);
        if (start >= word.size()) return std::string();
        return word.substr(start, static_cast<size_t>(p.length));
    };

    table_["format"] = [](const std::string& word, const Params& params) {
        return format_number(word, FormatParams::from_params(params).format);
    };

    table_["romannumeral"] = [](const std::string& word, const Params&) {
        auto number = parse_int(word);
        if (!number || *number > MAX_ROMAN) return word;
        return to_roman(*number);
    };

    table_["hide"] = [](const std::string&, const Params&) { return std::string(); };

    table_["quote"] = [](const std::string& word, const Params&) {
        return "\"" + word + "\"";
    };

    table_["random"] = [this](const std::string& word, const Params& params) {
        std::string name = pick_one("bracket num2words randomcase reverse obscure piglatin scramble swap");
        return table_.at(name)(word, params);
    };
}

}  // namespace mnemo
