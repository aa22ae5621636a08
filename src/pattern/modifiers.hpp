/**
 * Mnemo Modifier Pipeline
 *
 * Named text transforms chained onto a placeholder with +name(...).
 * Lookup is case-insensitive; an unknown name fails the attempt with
 * ResolveError::UNKNOWN_MODIFIER. Empty input passes through every
 * known modifier unchanged.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mnemo {

// -----------------------------------------------------------------------------
// Modifier Parameters
// -----------------------------------------------------------------------------

struct ReplaceParams {
    std::string from;
    std::string to;
    static ReplaceParams from_params(const std::vector<std::string>& params);
};

struct SubstringParams {
    std::optional<int64_t> length;   // Whole word when absent
    static SubstringParams from_params(const std::vector<std::string>& params);
};

struct MidParams {
    int64_t start = 1;               // 1-indexed
    int64_t length = 1;
    static MidParams from_params(const std::vector<std::string>& params);
};

struct TimesParams {
    int64_t times = 1;
    static TimesParams from_params(const std::vector<std::string>& params, int64_t limit);
};

struct BracketParams {
    std::string pairs;               // Space-separated open/close list; default table when empty
    static BracketParams from_params(const std::vector<std::string>& params);
};

struct FormatParams {
    std::string format = "0";
    static FormatParams from_params(const std::vector<std::string>& params);
};

// -----------------------------------------------------------------------------
// Transforms
// -----------------------------------------------------------------------------

/**
 * Wrap word in one randomly chosen open/close pair.
 */
std::string bracket_word(std::string_view word, std::string_view pairs = "");

/**
 * Leet-speak: 2-20 single substitutions from a fixed rule table.
 */
std::string obscure(std::string_view word);

/**
 * One of fifteen capitalization strategies, chosen uniformly.
 */
std::string random_case(std::string_view word);

/**
 * times random index swaps; length and character multiset are preserved.
 */
std::string scramble_word(std::string_view word, int64_t times = 1);

/**
 * "apple" -> "appleyay", "Hello" -> "Ellohay"; applied per space-separated word.
 */
std::string pig_latin(std::string_view text);

/**
 * Swap the first letters of the first two space-separated words.
 */
std::string swap_initials(std::string_view text);

/**
 * "table" -> "ta-ta-table" style repetition of the first syllable.
 */
std::string stutter(std::string_view word);

/**
 * Zero-pad to the count of '0' characters in format, after any sign.
 */
std::string format_number(std::string_view word, std::string_view format);

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------

class ModifierPipeline {
public:
    explicit ModifierPipeline(const Collaborators& collaborators);

    // Table handlers capture this
    ModifierPipeline(const ModifierPipeline&) = delete;
    ModifierPipeline& operator=(const ModifierPipeline&) = delete;

    /**
     * Apply one modifier to raw (unescaped) text.
     */
    ResolveResult apply(const std::string& word, const std::string& name,
                        const std::vector<std::string>& params) const;

    bool has_modifier(const std::string& name) const;

private:
    using Handler = std::function<std::string(const std::string&, const std::vector<std::string>&)>;

    const Collaborators& collaborators_;
    std::unordered_map<std::string, Handler> table_;

    void register_modifiers();
};

}  // namespace mnemo
