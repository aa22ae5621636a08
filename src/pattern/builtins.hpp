/**
 * Mnemo Builtin Values
 *
 * Maps a placeholder name plus parameters to a generated value. Lookup
 * is case-insensitive. Names missing from the table are treated as word
 * list names and, failing that, returned literally.
 *
 *   word(list)                  entry from a word list ("4-letter"), list may be "a|b"
 *   number(max,min,weight,dec)  weighted number, defaults 9,0,1,0
 *   letter/vowel/consonant(n)   n frequency-weighted characters
 *   symbol smiley endpunctuation sentencepunctuation
 *   sequence(len)               keyboard or alphabet run, default 3
 *   numberpattern(len)          digits with copy/step rules, default 3
 *   numbercode                  short digit code with delimiters
 *   ordinal(n)                  "21st"; n defaults to 1-99
 *   phonetic(word,style)        "Alpha Bravo"
 *   pronounceable               fake but pronounceable word
 *   asc(char) chr(code)         ASCII conversions
 *   keyboard numrow numrowfull row1..row3[full] lefthand righthand
 *   longmonth shortmonth longday shortday
 *   sp space                    a single space
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mnemo {

// Upper bound on counts and lengths taken from pattern parameters
inline constexpr int64_t MAX_GENERATED_LENGTH = 1024;

// -----------------------------------------------------------------------------
// Builtin Parameters
// -----------------------------------------------------------------------------

struct WordParams {
    std::string list = "4-letter";
    static WordParams from_params(const std::vector<std::string>& params);
};

struct NumberParams {
    int64_t max = 9;
    int64_t min = 0;
    int weight = 1;
    int decimals = 0;
    static NumberParams from_params(const std::vector<std::string>& params);
};

struct CountParams {
    int64_t count = 1;
    static CountParams from_params(const std::vector<std::string>& params);
};

struct LengthParams {
    int64_t length = 3;
    static LengthParams from_params(const std::vector<std::string>& params);
};

struct OrdinalParams {
    std::optional<int64_t> n;   // Random 1-99 when absent
    static OrdinalParams from_params(const std::vector<std::string>& params);
};

struct PhoneticParams {
    std::string word;           // Random letter when empty
    int style = 1;
    static PhoneticParams from_params(const std::vector<std::string>& params);
};

// -----------------------------------------------------------------------------
// Generators
// -----------------------------------------------------------------------------

/**
 * One of twenty keyboard, alphabet or digit runs, exactly length long.
 */
std::string get_sequence(int64_t length = 3);

/**
 * Digit string of the given length where each digit after the first is
 * fresh, a copy of an earlier digit, or one below/above its predecessor.
 */
std::string get_number_pattern(int64_t length = 3);

/**
 * Short code of digits with a repeated digit or delimiter mixed in,
 * sometimes bracketed. Never ends in a delimiter.
 */
std::string number_code();

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

class BuiltinDispatch {
public:
    explicit BuiltinDispatch(const Collaborators& collaborators);

    // Table handlers capture this
    BuiltinDispatch(const BuiltinDispatch&) = delete;
    BuiltinDispatch& operator=(const BuiltinDispatch&) = delete;

    /**
     * Resolve name(params) to a raw (unescaped) value.
     *
     * Fails only when word() names a list that does not exist.
     */
    ResolveResult resolve(const std::string& name, const std::vector<std::string>& params) const;

    bool is_builtin(const std::string& name) const;

private:
    using Handler = std::function<std::string(const std::vector<std::string>&)>;

    const Collaborators& collaborators_;
    std::unordered_map<std::string, Handler> table_;

    void register_builtins();
    std::string lookup_word(const std::string& list_name) const;
};

}  // namespace mnemo
