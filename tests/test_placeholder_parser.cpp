/**
 * Placeholder Parser Tests
 *
 * Tests for escaping, placeholder content parsing, pattern validation
 * and the backreference store.
 */

#include "../src/pattern/escaper.hpp"
#include "../src/pattern/placeholder_parser.hpp"
#include "../src/pattern/backref_store.hpp"
#include <iostream>
#include <cassert>

using namespace mnemo;

void test_escape_pattern() {
    assert(escape_pattern("a\\{b") == "a#lbr#b");
    assert(escape_pattern("\\}\\[\\]") == "#rbr##lba##rba#");
    assert(escape_pattern("\\(\\)\\+\\|") == "#lpa##rpa##pls##pip#");

    // An escaped backslash leaves the following brace structural
    assert(escape_pattern("\\\\{") == "#sla#{");

    // Backslash before an ordinary character is kept
    assert(escape_pattern("\\x") == "\\x");
    assert(escape_pattern("plain text") == "plain text");

    std::cout << "[PASS] Escape pattern\n";
}

void test_escape_value_and_unescape() {
    assert(escape_value("a+b|c") == "a#pls#b#pip#c");
    assert(escape_value("{x}") == "#lbr#x#rbr#");
    assert(unescape(escape_value("(a)[b]\\")) == "(a)[b]\\");

    assert(unescape(escape_pattern("\\{\\}\\[\\]\\(\\)\\+\\|\\\\")) == "{}[]()+|\\");

    // Text without tokens survives untouched
    assert(unescape("#notatoken# and #") == "#notatoken# and #");

    std::cout << "[PASS] Escape value and unescape\n";
}

void test_literal_round_trip() {
    const char* samples[] = {
        "hello world",
        "Password 123 !@$%^&*",
        "tabs\tand.dots,commas;colons:",
        "# hash # marks #",
        "",
    };
    for (const char* s : samples) {
        assert(unescape(escape_pattern(s)) == s);
        assert(unescape(escape_value(s)) == s);
    }

    std::cout << "[PASS] Literal round trip\n";
}

void test_split_top_level() {
    auto parts = split_top_level("a|b|c", '|');
    assert(parts.size() == 3);
    assert(parts[0] == "a" && parts[1] == "b" && parts[2] == "c");

    parts = split_top_level("a(b|c)|d", '|');
    assert(parts.size() == 2);
    assert(parts[0] == "a(b|c)");
    assert(parts[1] == "d");

    parts = split_top_level("", '|');
    assert(parts.size() == 1 && parts[0].empty());

    parts = split_top_level("a|", '|');
    assert(parts.size() == 1 && parts[0] == "a");

    std::cout << "[PASS] Split top level\n";
}

void test_parse_base() {
    PlaceholderContent p = parse_placeholder_content("word");
    assert(!p.is_alternatives());
    assert(p.name == "word");
    assert(p.params.empty());
    assert(!p.qualifier);
    assert(p.modifiers.empty());

    p = parse_placeholder_content("number( 99 , \"10\" )");
    assert(p.name == "number");
    assert(p.params.size() == 2);
    assert(p.params[0] == "99");
    assert(p.params[1] == "10");

    p = parse_placeholder_content("symbol[25]");
    assert(p.name == "symbol");
    assert(p.qualifier && *p.qualifier == 25);

    p = parse_placeholder_content("word(animal)[50]");
    assert(p.name == "word");
    assert(p.params.size() == 1 && p.params[0] == "animal");
    assert(p.qualifier && *p.qualifier == 50);

    std::cout << "[PASS] Parse base placeholder\n";
}

void test_parse_modifiers() {
    PlaceholderContent p = parse_placeholder_content("word(animal)[50]+uppercase+replace(a,b)[25]");
    assert(p.name == "word");
    assert(p.qualifier && *p.qualifier == 50);
    assert(p.modifiers.size() == 2);

    assert(p.modifiers[0].name == "uppercase");
    assert(p.modifiers[0].params.empty());
    assert(!p.modifiers[0].qualifier);

    assert(p.modifiers[1].name == "replace");
    assert(p.modifiers[1].params.size() == 2);
    assert(p.modifiers[1].params[0] == "a");
    assert(p.modifiers[1].params[1] == "b");
    assert(p.modifiers[1].qualifier && *p.modifiers[1].qualifier == 25);

    // '+' inside parentheses belongs to the parameter
    p = parse_placeholder_content("word+replace(+,-)");
    assert(p.modifiers.size() == 1);
    assert(p.modifiers[0].params.size() == 2);
    assert(p.modifiers[0].params[0] == "+");

    std::cout << "[PASS] Parse modifiers\n";
}

void test_parse_alternatives() {
    PlaceholderContent p = parse_placeholder_content("red|green|blue");
    assert(p.is_alternatives());
    assert(p.alternatives->size() == 3);
    assert((*p.alternatives)[1] == "green");
    assert(p.name.empty());
    assert(p.modifiers.empty());

    p = parse_placeholder_content("replace(a|b)");
    assert(!p.is_alternatives());

    std::cout << "[PASS] Parse alternatives\n";
}

void test_parse_modifier_spec() {
    ModifierSpec spec = parse_modifier_spec("left(3)");
    assert(spec.name == "left");
    assert(spec.params.size() == 1 && spec.params[0] == "3");

    // Unresolved placeholders stay whole
    spec = parse_modifier_spec("replace({word(x)},y)[10]");
    assert(spec.name == "replace");
    assert(spec.params.size() == 2);
    assert(spec.params[0] == "{word(x)}");
    assert(spec.params[1] == "y");
    assert(spec.qualifier && *spec.qualifier == 10);

    spec = parse_modifier_spec("bracket({number[50]})");
    assert(spec.name == "bracket");
    assert(!spec.qualifier);
    assert(spec.params.size() == 1 && spec.params[0] == "{number[50]}");

    spec = parse_modifier_spec("reverse[abc]");
    assert(spec.name == "reverse");
    assert(!spec.qualifier);

    std::cout << "[PASS] Parse modifier spec\n";
}

void test_check_pattern() {
    assert(check_pattern("") == std::optional<std::string>("Error: Empty pattern"));
    assert(check_pattern("{word") == std::optional<std::string>("Error: Unmatched braces in pattern"));
    assert(check_pattern("{word[50}") == std::optional<std::string>("Error: Unmatched brackets in pattern"));
    assert(check_pattern("{word(}") == std::optional<std::string>("Error: Unmatched parentheses in pattern"));

    auto mismatched = check_pattern("}{");
    assert(mismatched);
    assert(mismatched->find("Mismatched braces") != std::string::npos);

    assert(!check_pattern("{word}.{number(99)}"));
    assert(!check_pattern("\\{word"));
    assert(!check_pattern("{red|green}+uppercase"));
    assert(!check_pattern("{{word}}"));

    std::cout << "[PASS] Check pattern\n";
}

void test_backreference_store() {
    BackreferenceStore store;
    assert(store.size() == 0);

    assert(store.record("first") == 1);
    assert(store.record("") == 2);
    assert(store.record("third") == 3);

    assert(store.lookup(1) == "first");
    assert(store.lookup(2).empty());
    assert(store.contains(2));
    assert(store.lookup(3) == "third");
    assert(store.lookup(9).empty());
    assert(!store.contains(9));
    assert(store.lookup(0).empty());
    assert(store.size() == 3);

    std::cout << "[PASS] Backreference store\n";
}

int main() {
    std::cout << "=== Placeholder Parser Tests ===\n\n";

    test_escape_pattern();
    test_escape_value_and_unescape();
    test_literal_round_trip();
    test_split_top_level();
    test_parse_base();
    test_parse_modifiers();
    test_parse_alternatives();
    test_parse_modifier_spec();
    test_check_pattern();
    test_backreference_store();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
