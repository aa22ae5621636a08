/**
 * Mnemo Core Types
 *
 * Common type definitions shared by the pattern engine, the generators
 * and the word-list collaborators.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <stdexcept>
#include <functional>

namespace mnemo {

// -----------------------------------------------------------------------------
// Resolution Results
// -----------------------------------------------------------------------------

/**
 * Reasons a generation attempt can fail.
 */
enum class ResolveError : uint8_t {
    NONE = 0,
    UNKNOWN_MODIFIER = 1,     // Modifier name not in the pipeline table
    TOO_DEEPLY_NESTED = 2,    // Placeholder nesting exceeded the depth bound
    WORDLIST_NOT_FOUND = 3,   // {word(...)} named a list that does not exist
};

inline const char* resolve_error_name(ResolveError error) {
    switch (error) {
        case ResolveError::NONE:               return "none";
        case ResolveError::UNKNOWN_MODIFIER:   return "unknown modifier";
        case ResolveError::TOO_DEEPLY_NESTED:  return "too deeply nested";
        case ResolveError::WORDLIST_NOT_FOUND: return "wordlist not found";
        default: return "?";
    }
}

/**
 * Value-or-error produced by every resolution step.
 *
 * An error fails the current generation attempt only; the session
 * retries with a fresh backreference store.
 */
struct ResolveResult {
    std::string value;
    ResolveError error = ResolveError::NONE;
    std::string detail;

    bool ok() const { return error == ResolveError::NONE; }

    static ResolveResult success(std::string v) {
        return ResolveResult{.value = std::move(v), .error = ResolveError::NONE, .detail = {}};
    }

    static ResolveResult failure(ResolveError e, std::string what) {
        return ResolveResult{.value = {}, .error = e, .detail = std::move(what)};
    }
};

// -----------------------------------------------------------------------------
// Parsed Placeholder Types
// -----------------------------------------------------------------------------

/**
 * One link of a modifier chain: name(params)[qualifier].
 */
struct ModifierSpec {
    std::string name;
    std::vector<std::string> params;
    std::optional<int> qualifier;   // 0-100, gates whether the modifier runs
};

/**
 * Parsed form of the text between one matched pair of braces.
 *
 * When alternatives is set, every other field is left empty.
 */
struct PlaceholderContent {
    std::string name;                  // Empty means literal grouping
    std::vector<std::string> params;   // Trimmed, quote-stripped
    std::optional<int> qualifier;      // 0-100
    std::vector<ModifierSpec> modifiers;
    std::optional<std::vector<std::string>> alternatives;

    bool is_alternatives() const { return alternatives.has_value(); }
};

// -----------------------------------------------------------------------------
// Collaborator Interfaces
// -----------------------------------------------------------------------------

class WordlistNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NoPatternsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Source of random entries from named word lists.
 */
class WordSource {
public:
    virtual ~WordSource() = default;

    /**
     * Pick one entry from a word list.
     * @throws WordlistNotFound if the list does not exist
     */
    virtual std::string lookup_word(const std::string& list_name) = 0;
};

/**
 * Source of whole patterns when the caller does not supply one.
 */
class PatternSource {
public:
    virtual ~PatternSource() = default;

    /**
     * @throws NoPatternsError if none are configured
     */
    virtual std::string random_pattern() = 0;
};

using NumberToWordsFn = std::function<std::string(const std::string&)>;
using PronounceableFn = std::function<std::string()>;
using FakeWordFn = std::function<std::string(const std::string&)>;

/**
 * Everything the pattern engine consumes from outside itself.
 * Sources are borrowed; the caller keeps them alive.
 */
struct Collaborators {
    WordSource* words = nullptr;
    PatternSource* patterns = nullptr;
    NumberToWordsFn number_to_words;
    PronounceableFn pronounceable_word;
    FakeWordFn fake_word;
};

}  // namespace mnemo
