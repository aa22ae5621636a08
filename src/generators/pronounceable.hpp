/**
 * Mnemo Pronounceable Words
 *
 * Made-up words built from alternating vowel and consonant clusters, and
 * fake words formed by gluing affixes onto a real one.
 */

#pragma once

#include <string>
#include <string_view>

namespace mnemo {

/**
 * Four or five alternating clusters, possibly cut short by a common
 * ending ("-ing", "-tion", ...), then tidied so it reads naturally.
 */
std::string pronounceable_word();

/**
 * base with a prefix, a suffix, or both: "astro" + base + "ology".
 */
std::string fake_word(std::string_view base);

}  // namespace mnemo
