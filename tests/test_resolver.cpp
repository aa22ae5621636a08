/**
 * Resolver Tests
 *
 * Tests for recursive placeholder resolution, qualifiers, modifier chains
 * and backreferences.
 */

#include "../src/pattern/resolver.hpp"
#include "../src/pattern/escaper.hpp"
#include "../src/core/charsets.hpp"
#include "../src/core/text_utils.hpp"
#include "test_sources.hpp"
#include <iostream>
#include <cassert>
#include <set>

using namespace mnemo;
using mnemo::testing::StubWordSource;

namespace {

// Escape, resolve and unescape one pattern with a fresh store
struct Harness {
    StubWordSource words;
    Collaborators collaborators;
    size_t max_depth = DEFAULT_MAX_DEPTH;

    Harness() {
        words.lists["animal"] = {"cat"};
        words.lists["meta"] = {"animal"};
        words.lists["odd"] = {"a+b"};
        collaborators.words = &words;
    }

    ResolveResult run(const std::string& pattern) {
        BuiltinDispatch builtins(collaborators);
        ModifierPipeline modifiers(collaborators);
        BackreferenceStore store;
        Resolver resolver(builtins, modifiers, store, max_depth);

        ResolveResult r = resolver.process(escape_pattern(pattern));
        if (r.ok()) r.value = unescape(r.value);
        return r;
    }

    std::string value(const std::string& pattern) {
        ResolveResult r = run(pattern);
        assert(r.ok());
        return r.value;
    }
};

}  // namespace

void test_literals() {
    Harness h;
    assert(h.value("hello world") == "hello world");
    assert(h.value("") == "");
    assert(h.value("a{b") == "a{b");
    assert(h.value("\\{x\\}") == "{x}");
    assert(h.value("1\\+1") == "1+1");

    std::cout << "[PASS] Literal text\n";
}

void test_qualifiers() {
    Harness h;
    std::set<std::string> symbols;
    for (auto& s : split(charsets::SYMBOLS, ' ')) symbols.insert(s);

    for (int i = 0; i < 100; ++i) {
        assert(h.value("A{symbol[0]}B") == "AB");
        assert(h.value("A{symbol}[0]B") == "AB");

        std::string kept = h.value("{symbol[100]}");
        assert(symbols.count(kept));
    }

    std::cout << "[PASS] Qualifiers\n";
}

void test_backreferences() {
    Harness h;
    h.words.lists["animal"] = {"cat", "dog", "eel"};

    for (int i = 0; i < 50; ++i) {
        std::string v = h.value("{word(animal)}-{$W1}");
        size_t dash = v.find('-');
        assert(dash != std::string::npos);
        assert(v.substr(0, dash) == v.substr(dash + 1));
    }

    // Inner spans are numbered before the span that contains them
    h.words.lists["animal"] = {"cat"};
    assert(h.value("{word({word(meta)})}{$W1}{$W2}") == "catanimalcat");

    assert(h.value("x{$W9}y") == "xy");
    assert(h.value("{$W1}") == "");

    // A reference is not itself recorded
    assert(h.value("{word(animal)}{$W1}{$W2}") == "catcat");

    // A span dropped by its qualifier still takes a number
    assert(h.value("{word(animal)}[0]{$W1}x") == "x");

    std::cout << "[PASS] Backreferences\n";
}

void test_alternatives() {
    Harness h;
    std::set<std::string> seen;
    for (int i = 0; i < 300; ++i) {
        std::string v = h.value("{red|green|blue}");
        assert(v == "red" || v == "green" || v == "blue");
        seen.insert(v);
    }
    assert(seen.size() == 3);

    for (int i = 0; i < 50; ++i) {
        std::string v = h.value("{a|b}+uppercase");
        assert(v == "A" || v == "B");

        std::string nested = h.value("{{word(animal)}|{word(animal)}}");
        assert(nested == "cat");
    }

    std::cout << "[PASS] Alternatives\n";
}

void test_modifier_chains() {
    Harness h;

    assert(h.value("{word(animal)+uppercase+reverse}") == "TAC");
    assert(h.value("{word(animal)}+uppercase+reverse") == "TAC");
    assert(h.value("{word(animal)}+uppercase.x") == "CAT.x");
    assert(h.value("{word(animal)}+uppercase {word(animal)}") == "CAT cat");

    // A modifier that fails its qualifier is skipped; the chain continues
    assert(h.value("{word(animal)}+reverse[0]+uppercase") == "CAT");
    assert(h.value("{word(animal)+reverse[0]+uppercase}") == "CAT");
    assert(h.value("{word(animal)}+reverse[100]") == "tac");

    // Placeholders inside parameters resolve first
    assert(h.value("{word(animal)}+replace(a,{number(5,5)})") == "c5t");
    assert(h.value("{number({number(3,3)},{number(3,3)})}") == "3");

    std::cout << "[PASS] Modifier chains\n";
}

void test_special_characters_in_values() {
    Harness h;

    assert(h.value("{word(odd)}") == "a+b");
    assert(h.value("{word(odd)}+uppercase") == "A+B");
    assert(h.value("{word(odd)+uppercase}") == "A+B");
    assert(h.value("{word(odd)}{$W1}") == "a+ba+b");

    std::cout << "[PASS] Special characters in values\n";
}

void test_grouping() {
    Harness h;

    assert(h.value("x{ cat}") == "x cat");
    assert(h.value("a{ x[0]}b") == "ab");
    assert(h.value("a{ x[100]}b") == "a xb");
    assert(h.value("{ {word(animal)}}") == " cat");

    std::cout << "[PASS] Grouping\n";
}

void test_errors() {
    Harness h;

    ResolveResult unknown = h.run("{word(animal)}+nosuch");
    assert(!unknown.ok());
    assert(unknown.error == ResolveError::UNKNOWN_MODIFIER);

    ResolveResult inline_unknown = h.run("{word(animal)+nosuch}");
    assert(inline_unknown.error == ResolveError::UNKNOWN_MODIFIER);

    ResolveResult missing = h.run("{word(nosuchlist)}");
    assert(missing.error == ResolveError::WORDLIST_NOT_FOUND);

    // An error inside a parameter fails the whole pattern
    ResolveResult in_param = h.run("{word(animal)}+replace(a,{word(nosuchlist)})");
    assert(in_param.error == ResolveError::WORDLIST_NOT_FOUND);

    std::cout << "[PASS] Errors\n";
}

void test_depth_limit() {
    Harness h;
    assert(h.value("{{{{{sp}}}}}") == " ");

    h.max_depth = 3;
    ResolveResult r = h.run("{{{{{sp}}}}}");
    assert(!r.ok());
    assert(r.error == ResolveError::TOO_DEEPLY_NESTED);

    assert(h.value("{{sp}}") == " ");

    std::cout << "[PASS] Depth limit\n";
}

int main() {
    std::cout << "=== Resolver Tests ===\n\n";

    test_literals();
    test_qualifiers();
    test_backreferences();
    test_alternatives();
    test_modifier_chains();
    test_special_characters_in_values();
    test_grouping();
    test_errors();
    test_depth_limit();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
