/**
 * Mnemo Character Sets
 *
 * Fixed tables consumed by the builtins, the modifiers and the failsafe.
 * Space-separated tables are meant for pick_one(); repetition inside a
 * table is how entries are weighted. Letter tables are ordered by English
 * frequency so weighted pick_character() leans toward common letters.
 */

#pragma once

#include <string_view>

namespace mnemo {
namespace charsets {

inline constexpr std::string_view VOWELS = "eaoiu";
inline constexpr std::string_view CONSONANTS = "tnshrdlcmfgypwbvkxjqz";
inline constexpr std::string_view LETTERS = "etaoinshrdlucmfgypwbvkxjqz";

inline constexpr std::string_view SYMBOLS =
    "! @ # % $ ^ & * ( ) { } : ' / ` ~ * - < > + = _ | \\ \\ . . , , ; ; ? ? [ ]";

inline constexpr std::string_view SENTENCE_PUNCTUATION = "!;:?.,";

inline constexpr std::string_view END_PUNCTUATION =
    "! ! ! ! . . . . . . . . . . . . . . . ... ... ? ? ? ? ? ? ?";

inline constexpr std::string_view SMILEYS =
    ":) :( :-) :-( :D :0 ;-) ;) :/ 8-) 8-( :-D :-0 :-p :^)";

// Vowel and consonant clusters for pronounceable words and the failsafe
inline constexpr std::string_view VOWELS2 =
    "a a a a a a a a a e e e e e e e e e e e i i i u u o o "
    "ay ea ee ia io oa oi oo er on re he ha in es io ou";
inline constexpr std::string_view CONSONANTS2 =
    "b b c d d d f g j k m m m n n p p qu r r r s s s s t t t t v w x z z "
    "th st sh ph ch th sh for has tis men";
// Clusters that may not start a word
inline constexpr std::string_view CONSONANTS3 =
    "nd rt dd zz rg ng tt ss mm nn pp nt nc nl ft";

inline constexpr std::string_view KEYBOARD =
    "1234567890`~!@#$%^&*()-_=+]}[{\\|'\";:/?.>,<"
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

// Keyboard rows and hands
inline constexpr std::string_view NUMROW = "1234567890";
inline constexpr std::string_view NUMROW_FULL = "1234567890`~!@#$%^&*()_-+=";
inline constexpr std::string_view ROW1 = "QWERTYUIOP";
inline constexpr std::string_view ROW1_FULL = "QWERTYUIOP{[}]|\\";
inline constexpr std::string_view ROW2 = "ASDFGHJKL";
inline constexpr std::string_view ROW2_FULL = "ASDFGHJKL;:'\"";
inline constexpr std::string_view ROW3 = "ZXCVBNM";
inline constexpr std::string_view ROW3_FULL = "ZXCVBNM,<.>/?";
inline constexpr std::string_view LEFT_HAND = "qwertasdfgzxcvb";
inline constexpr std::string_view RIGHT_HAND = "yuiophjknm";

inline constexpr std::string_view THREE_LETTER_WORDS =
    "the and for are but not you all any can had her was one our out day get has "
    "him his how man new now old see two way who boy did its let put say she too use";

inline constexpr std::string_view LONG_MONTHS =
    "January February March April May June July August September October November December";
inline constexpr std::string_view SHORT_MONTHS = "Jan Feb Mar Apr May Jun Jul Aug Sep Oct Nov Dec";
inline constexpr std::string_view LONG_DAYS =
    "Monday Tuesday Wednesday Thursday Friday Saturday Sunday";
inline constexpr std::string_view SHORT_DAYS = "Mon Tue Wed Thu Fri Sat Sun";

inline constexpr std::string_view DEFAULT_BRACKETS =
    "[ ] < > ( ) ( ) ( ) ( ) ( ) ( ) ( ) ( ) [ ] [ ] | | \\ / * * [ ] { } "
    "/ / \\ / / \\ \\ \\ <- -> -> <-";

// Symbols mixed into the failsafe alphabet
inline constexpr std::string_view FAILSAFE_SYMBOLS =
    "! @ # % $ ^ & * : ' / ` ~ * - < > + = . . , , ; ; ? ?";

}  // namespace charsets
}  // namespace mnemo
