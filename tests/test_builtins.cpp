/**
 * Builtin Value Tests
 *
 * Tests for builtin placeholder dispatch and the generators behind it.
 */

#include "../src/pattern/builtins.hpp"
#include "../src/core/charsets.hpp"
#include "../src/core/text_utils.hpp"
#include "test_sources.hpp"
#include <iostream>
#include <cassert>
#include <cctype>
#include <limits>
#include <set>
#include <type_traits>

using namespace mnemo;
using mnemo::testing::StubWordSource;

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool only_from(const std::string& s, std::string_view allowed) {
    for (char c : s) {
        if (allowed.find(c) == std::string_view::npos) return false;
    }
    return true;
}

std::set<std::string> tokens(std::string_view table) {
    std::set<std::string> result;
    for (auto& t : split(table, ' ')) result.insert(t);
    return result;
}

std::string resolve(const BuiltinDispatch& b, const std::string& name,
                    const std::vector<std::string>& params = {}) {
    ResolveResult r = b.resolve(name, params);
    assert(r.ok());
    return r.value;
}

}  // namespace

void test_number() {
    Collaborators c;
    BuiltinDispatch b(c);

    for (int i = 0; i < 300; ++i) {
        int64_t v = std::stoll(resolve(b, "number", {"99"}));
        assert(v >= 0 && v <= 99);

        int64_t w = std::stoll(resolve(b, "number", {"10", "5"}));
        assert(w >= 5 && w <= 10);

        // Non-numeric parameters fall back to the defaults
        int64_t d = std::stoll(resolve(b, "number", {"abc"}));
        assert(d >= 0 && d <= 9);

        int64_t fixed = std::stoll(resolve(b, "NUMBER", {"42", "42"}));
        assert(fixed == 42);
    }

    for (int i = 0; i < 100; ++i) {
        std::string dec = resolve(b, "number", {"1", "0", "1", "2"});
        size_t point = dec.find('.');
        assert(point != std::string::npos);
        size_t places = dec.size() - point - 1;
        assert(places >= 1 && places <= 2);
        assert(places == 1 || dec.back() != '0');
        double d = std::stod(dec);
        assert(d >= 0.0 && d <= 1.0);
    }

    // Trailing zeros are dropped down to one decimal digit
    assert(resolve(b, "number", {"1", "1", "1", "2"}) == "1.0");
    assert(resolve(b, "number", {"3", "3", "1", "3"}) == "3.0");

    std::cout << "[PASS] Number\n";
}

void test_number_extreme_bounds() {
    Collaborators c;
    BuiltinDispatch b(c);

    const int64_t top = std::numeric_limits<int64_t>::max();
    for (int i = 0; i < 300; ++i) {
        int64_t v = std::stoll(resolve(b, "number", {"9223372036854775807", "9223372036854775000"}));
        assert(v >= 9223372036854775000LL && v <= top);

        int64_t w = std::stoll(resolve(b, "number", {"-9223372036854775000", "-9223372036854775808"}));
        assert(w <= -9223372036854775000LL);

        int64_t x = std::stoll(resolve(b, "number", {"9223372036854775807", "-9223372036854775808"}));
        (void)x;
    }

    std::cout << "[PASS] Number extreme bounds\n";
}

void test_letters() {
    Collaborators c;
    BuiltinDispatch b(c);

    for (int i = 0; i < 100; ++i) {
        std::string l = resolve(b, "letter", {"5"});
        assert(l.size() == 5);
        assert(only_from(l, charsets::LETTERS));

        std::string v = resolve(b, "vowel", {"3"});
        assert(v.size() == 3);
        assert(only_from(v, charsets::VOWELS));

        std::string k = resolve(b, "consonant");
        assert(k.size() == 1);
        assert(only_from(k, charsets::CONSONANTS));
    }

    assert(resolve(b, "letter", {"0"}).empty());

    // Negative counts use the magnitude, under the same cap
    assert(resolve(b, "letter", {"-4"}).size() == 4);
    assert(static_cast<int64_t>(resolve(b, "letter", {"2000"}).size()) == MAX_GENERATED_LENGTH);
    assert(static_cast<int64_t>(resolve(b, "letter", {"-2000"}).size()) == MAX_GENERATED_LENGTH);
    assert(static_cast<int64_t>(resolve(b, "letter", {"-9223372036854775807"}).size()) == MAX_GENERATED_LENGTH);
    assert(static_cast<int64_t>(resolve(b, "letter", {"-9223372036854775808"}).size()) == MAX_GENERATED_LENGTH);
    assert(resolve(b, "vowel", {"-3"}).empty());

    std::cout << "[PASS] Letters\n";
}

void test_symbols_and_tables() {
    Collaborators c;
    BuiltinDispatch b(c);

    auto symbols = tokens(charsets::SYMBOLS);
    auto smileys = tokens(charsets::SMILEYS);
    auto months = tokens(charsets::LONG_MONTHS);
    auto days = tokens(charsets::SHORT_DAYS);

    for (int i = 0; i < 200; ++i) {
        assert(symbols.count(resolve(b, "symbol")));
        assert(smileys.count(resolve(b, "smiley")));
        assert(months.count(resolve(b, "longmonth")));
        assert(days.count(resolve(b, "shortday")));

        std::string p = resolve(b, "sentencepunctuation");
        assert(p.size() == 1 && only_from(p, charsets::SENTENCE_PUNCTUATION));

        std::string n = resolve(b, "numrow");
        assert(n.size() == 1 && only_from(n, charsets::NUMROW));

        std::string h = resolve(b, "lefthand");
        assert(h.size() == 1 && only_from(h, charsets::LEFT_HAND));
    }

    assert(resolve(b, "sp") == " ");
    assert(resolve(b, "space") == " ");

    std::cout << "[PASS] Symbols and tables\n";
}

void test_sequences() {
    for (int64_t len = 1; len <= 24; ++len) {
        for (int i = 0; i < 50; ++i) {
            assert(static_cast<int64_t>(get_sequence(len).size()) == len);
        }
    }
    assert(get_sequence(0).size() == 3);
    assert(get_sequence(-4).size() == 3);

    Collaborators c;
    BuiltinDispatch b(c);
    assert(resolve(b, "sequence").size() == 3);
    assert(resolve(b, "sequence", {"6"}).size() == 6);
    assert(resolve(b, "sequence", {"junk"}).size() == 3);
    assert(static_cast<int64_t>(resolve(b, "sequence", {"100000"}).size()) == MAX_GENERATED_LENGTH);

    std::cout << "[PASS] Sequences\n";
}

void test_number_patterns() {
    for (int i = 0; i < 200; ++i) {
        std::string p = get_number_pattern(5);
        assert(p.size() == 5);
        assert(all_digits(p));
    }
    assert(get_number_pattern(0).size() == 3);

    for (int i = 0; i < 200; ++i) {
        std::string code = number_code();
        assert(code.size() >= 2);
    }

    std::cout << "[PASS] Number patterns and codes\n";
}

void test_ordinal_and_phonetic() {
    Collaborators c;
    BuiltinDispatch b(c);

    assert(resolve(b, "ordinal", {"21"}) == "21st");
    assert(resolve(b, "ordinal", {"22"}) == "22nd");
    assert(resolve(b, "ordinal", {"3"}) == "3rd");
    assert(resolve(b, "ordinal", {"12"}) == "12th");
    assert(resolve(b, "ordinal", {"111"}) == "111th");

    for (int i = 0; i < 100; ++i) {
        std::string o = resolve(b, "ordinal");
        std::string suffix = o.substr(o.size() - 2);
        assert(suffix == "st" || suffix == "nd" || suffix == "rd" || suffix == "th");
        assert(all_digits(o.substr(0, o.size() - 2)));
    }

    assert(resolve(b, "phonetic", {"abc"}) == "Alpha Bravo Charlie");
    assert(resolve(b, "phonetic", {"ab", "2"}) == "Adam Baker");
    assert(resolve(b, "phonetic", {"a1b"}) == "Alpha Bravo");
    assert(!resolve(b, "phonetic").empty());

    std::cout << "[PASS] Ordinal and phonetic\n";
}

void test_ascii() {
    Collaborators c;
    BuiltinDispatch b(c);

    assert(resolve(b, "asc", {"A"}) == "65");
    assert(resolve(b, "asc", {"#pls#"}) == "43");
    assert(resolve(b, "chr", {"65"}) == "A");
    assert(resolve(b, "chr", {"5"}).empty());
    assert(resolve(b, "chr", {"abc"}).empty());

    for (int i = 0; i < 100; ++i) {
        int64_t code = std::stoll(resolve(b, "asc"));
        assert(code >= 32 && code <= 255);
    }

    std::cout << "[PASS] ASCII conversions\n";
}

void test_word_lookup() {
    StubWordSource words;
    words.lists["animal"] = {"cat", "dog"};
    words.lists["4-letter"] = {"bone"};
    words.lists["color"] = {"red"};

    Collaborators c;
    c.words = &words;
    BuiltinDispatch b(c);

    for (int i = 0; i < 50; ++i) {
        std::string a = resolve(b, "word", {"animal"});
        assert(a == "cat" || a == "dog");

        std::string either = resolve(b, "word", {"animal|color"});
        assert(either == "cat" || either == "dog" || either == "red");
    }
    assert(resolve(b, "word") == "bone");

    ResolveResult missing = b.resolve("word", {"nosuchlist"});
    assert(!missing.ok());
    assert(missing.error == ResolveError::WORDLIST_NOT_FOUND);

    std::cout << "[PASS] Word lookup\n";
}

void test_unknown_names() {
    StubWordSource words;
    words.lists["color"] = {"teal"};

    Collaborators c;
    c.words = &words;
    BuiltinDispatch b(c);

    // A list name on its own, then the literal name
    assert(resolve(b, "color") == "teal");
    assert(resolve(b, "Color") == "teal");
    assert(resolve(b, "Zzyzx") == "Zzyzx");

    assert(b.is_builtin("number"));
    assert(b.is_builtin("Number"));
    assert(!b.is_builtin("color"));

    std::cout << "[PASS] Unknown names\n";
}

void test_missing_collaborators() {
    Collaborators c;
    BuiltinDispatch b(c);

    assert(b.resolve("word", {"animal"}).error == ResolveError::WORDLIST_NOT_FOUND);
    assert(resolve(b, "plainliteral") == "plainliteral");
    assert(resolve(b, "pronounceable").empty());

    Collaborators with_pron;
    with_pron.pronounceable_word = [] { return std::string("blorvat"); };
    BuiltinDispatch b2(with_pron);
    assert(resolve(b2, "pronounceable") == "blorvat");

    std::cout << "[PASS] Missing collaborators\n";
}

void test_dispatch_not_copyable() {
    static_assert(!std::is_copy_constructible_v<BuiltinDispatch>);
    static_assert(!std::is_copy_assignable_v<BuiltinDispatch>);

    std::cout << "[PASS] Builtin table is not copyable\n";
}

int main() {
    std::cout << "=== Builtin Value Tests ===\n\n";

    test_number();
    test_number_extreme_bounds();
    test_letters();
    test_symbols_and_tables();
    test_sequences();
    test_number_patterns();
    test_ordinal_and_phonetic();
    test_ascii();
    test_word_lookup();
    test_unknown_names();
    test_missing_collaborators();
    test_dispatch_not_copyable();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
