/**
 * Number Words and Pronounceable Word Tests
 */

#include "../src/generators/number_text.hpp"
#include "../src/generators/pronounceable.hpp"
#include <iostream>
#include <cassert>
#include <cctype>

using namespace mnemo;

void test_small_numbers() {
    assert(number_to_words("0") == "Zero");
    assert(number_to_words("7") == "Seven");
    assert(number_to_words("13") == "Thirteen");
    assert(number_to_words("20") == "Twenty");
    assert(number_to_words("42") == "Forty Two");
    assert(number_to_words("100") == "One Hundred");
    assert(number_to_words("123") == "One Hundred and Twenty Three");
    assert(number_to_words(" 99 ") == "Ninety Nine");

    std::cout << "[PASS] Small numbers\n";
}

void test_large_numbers() {
    assert(number_to_words("1005") == "One Thousand and Five");
    assert(number_to_words("1,234") == "One Thousand Two Hundred and Thirty Four");
    assert(number_to_words("2500000") == "Two Million Five Hundred Thousand");
    assert(number_to_words("1000000000") == "One Billion");
    assert(number_to_words("2000000001") == "Two Billion and One");

    std::string max = number_to_words("999999999999999999");
    assert(max.rfind("Nine Hundred Ninety Nine Quadrillion", 0) == 0);

    std::cout << "[PASS] Large numbers\n";
}

void test_signs_and_decimals() {
    assert(number_to_words("-42") == "Minus Forty Two");
    assert(number_to_words("+5") == "Plus Five");
    assert(number_to_words("3.14") == "Three Point One Four");
    assert(number_to_words(".5") == "Zero Point Five");
    assert(number_to_words("7.") == "Seven");

    std::cout << "[PASS] Signs and decimals\n";
}

void test_errors() {
    const std::string bad = "Error - Number improperly formed";
    assert(number_to_words("") == bad);
    assert(number_to_words("abc") == bad);
    assert(number_to_words("-") == bad);
    assert(number_to_words("1.2.3") == bad);
    assert(number_to_words("12a") == bad);
    assert(number_to_words("1.2,3") == bad);

    assert(number_to_words("1234567890123456789") == "Error - Number too large");

    std::cout << "[PASS] Errors\n";
}

void test_pronounceable_words() {
    for (int i = 0; i < 500; ++i) {
        std::string word = pronounceable_word();
        assert(!word.empty());
        for (char c : word) {
            assert(std::islower(static_cast<unsigned char>(c)));
        }
        assert(word.find("cie") == std::string::npos);
    }

    std::cout << "[PASS] Pronounceable words\n";
}

void test_fake_words() {
    for (int i = 0; i < 200; ++i) {
        std::string word = fake_word("tree");
        assert(word.find("tree") != std::string::npos);
        assert(word.size() > 4);
    }

    std::cout << "[PASS] Fake words\n";
}

int main() {
    std::cout << "=== Number Words Tests ===\n\n";

    test_small_numbers();
    test_large_numbers();
    test_signs_and_decimals();
    test_errors();
    test_pronounceable_words();
    test_fake_words();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
