/**
 * Mnemo Password Generator Implementation
 */

#include "password_generator.hpp"
#include "number_text.hpp"
#include "pronounceable.hpp"
#include "../core/charsets.hpp"
#include "../core/logger.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"
#include "../pattern/backref_store.hpp"
#include "../pattern/escaper.hpp"

#include <exception>

namespace mnemo {

Collaborators PasswordGenerator::with_defaults(Collaborators collaborators) {
    if (!collaborators.number_to_words) {
        collaborators.number_to_words = [](const std::string& text) { return number_to_words(text); };
    }
    if (!collaborators.pronounceable_word) {
        collaborators.pronounceable_word = [] { return pronounceable_word(); };
    }
    if (!collaborators.fake_word) {
        collaborators.fake_word = [](const std::string& base) { return fake_word(base); };
    }
    return collaborators;
}

PasswordGenerator::PasswordGenerator(Collaborators collaborators, GeneratorOptions options)
    : collaborators_(with_defaults(std::move(collaborators))),
      options_(options),
      builtins_(collaborators_),
      modifiers_(collaborators_) {
    if (options_.max_attempts < 1) {
        options_.max_attempts = 1;
    }
}

ResolveResult PasswordGenerator::generate_once(const std::string& pattern) {
    BackreferenceStore backrefs;
    Resolver resolver(builtins_, modifiers_, backrefs, options_.max_depth);

    ResolveResult resolved = resolver.process(escape_pattern(pattern));
    if (!resolved.ok()) return resolved;

    std::string result = unescape(resolved.value);
    while (result.find("  ") != std::string::npos) {
        result = replace_all(result, "  ", " ");
    }
    return ResolveResult::success(trim(result));
}

std::string PasswordGenerator::generate(const std::optional<std::string>& pattern) {
    bool use_random = !pattern || pattern->empty();
    last_was_failsafe_ = false;

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        last_attempts_ = attempt;
        std::string current = use_random ? std::string() : *pattern;

        try {
            if (use_random) {
                if (collaborators_.patterns == nullptr) {
                    throw NoPatternsError("No pattern source configured");
                }
                current = collaborators_.patterns->random_pattern();
            }
            last_pattern_ = current;

            ResolveResult result = generate_once(current);
            if (result.ok()) {
                last_password_ = result.value;
                return last_password_;
            }

            Logger::instance().log_attempt_failed(
                attempt, current,
                std::string(resolve_error_name(result.error)) + ": " + result.detail);
        } catch (const std::exception& e) {
            Logger::instance().log_attempt_failed(attempt, current, e.what());
        }
    }

    Logger::instance().log_failsafe(options_.max_attempts, last_pattern_);
    last_was_failsafe_ = true;
    last_password_ = failsafe();
    return last_password_;
}

std::string PasswordGenerator::failsafe() {
    std::string alphabet;
    alphabet += charsets::VOWELS2;
    alphabet += ' ';
    alphabet += charsets::FAILSAFE_SYMBOLS;
    alphabet += ' ';
    alphabet += charsets::CONSONANTS2;
    alphabet += ' ';
    alphabet += charsets::THREE_LETTER_WORDS;
    alphabet += " 1 2 3 4 5 6 7 8 9 0";

    std::string result;
    for (int i = 0; i < FAILSAFE_PICKS; ++i) {
        result += pick_one(alphabet);
    }
    return result;
}

}  // namespace mnemo
