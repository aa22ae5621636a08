/**
 * Mnemo Password Generator
 *
 * Generation session: turns a pattern (or a random one from the pattern
 * source) into a password. Each attempt gets a fresh backreference store;
 * a failed attempt is logged and retried, and when every attempt fails a
 * failsafe password is returned instead. generate() never throws for a
 * pattern problem.
 */

#pragma once

#include "../core/types.hpp"
#include "../pattern/builtins.hpp"
#include "../pattern/modifiers.hpp"
#include "../pattern/resolver.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace mnemo {

struct GeneratorOptions {
    int max_attempts = 10;
    size_t max_depth = DEFAULT_MAX_DEPTH;
};

class PasswordGenerator {
public:
    static constexpr int FAILSAFE_PICKS = 7;

    /**
     * Missing number_to_words, pronounceable_word and fake_word
     * collaborators are filled with the in-tree implementations.
     */
    explicit PasswordGenerator(Collaborators collaborators, GeneratorOptions options = {});

    // Builtins and modifiers hold a reference to collaborators_
    PasswordGenerator(const PasswordGenerator&) = delete;
    PasswordGenerator& operator=(const PasswordGenerator&) = delete;

    /**
     * Generate one password. An empty or absent pattern draws a fresh
     * random pattern for every attempt.
     */
    std::string generate(const std::optional<std::string>& pattern = std::nullopt);

    /**
     * One attempt: escape, resolve, unescape, collapse double spaces, trim.
     */
    ResolveResult generate_once(const std::string& pattern);

    /**
     * Seven picks over vowel clusters, symbols, consonant clusters,
     * three-letter words and digits.
     */
    static std::string failsafe();

    const std::string& last_pattern() const { return last_pattern_; }
    const std::string& last_password() const { return last_password_; }
    int last_attempts() const { return last_attempts_; }
    bool last_was_failsafe() const { return last_was_failsafe_; }

    const GeneratorOptions& options() const { return options_; }

private:
    Collaborators collaborators_;
    GeneratorOptions options_;
    BuiltinDispatch builtins_;
    ModifierPipeline modifiers_;

    std::string last_pattern_;
    std::string last_password_;
    int last_attempts_ = 0;
    bool last_was_failsafe_ = false;

    static Collaborators with_defaults(Collaborators collaborators);
};

}  // namespace mnemo
