/**
 * Mnemo Recursive Resolver
 *
 * Walks an escaped pattern left to right. Each brace-matched span is
 * resolved inside-out: nested placeholders first, then the span itself,
 * then an optional "}[N]" qualifier and any "}+modifier" chain. Literal
 * text is copied through. Every resolved span except a {$W<n>} reference
 * is recorded in the backreference store.
 *
 * A resolver borrows its store for one pass and keeps nothing after it.
 */

#pragma once

#include "../core/types.hpp"
#include "backref_store.hpp"
#include "builtins.hpp"
#include "modifiers.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo {

inline constexpr size_t DEFAULT_MAX_DEPTH = 32;

class Resolver {
public:
    Resolver(const BuiltinDispatch& builtins,
             const ModifierPipeline& modifiers,
             BackreferenceStore& backrefs,
             size_t max_depth = DEFAULT_MAX_DEPTH)
        : builtins_(builtins),
          modifiers_(modifiers),
          backrefs_(backrefs),
          max_depth_(max_depth) {}

    /**
     * Resolve every placeholder in an escaped pattern.
     *
     * The result is still escaped; unmatched '{' is kept as literal text.
     */
    ResolveResult process(std::string_view pattern, size_t depth = 0);

    /**
     * Resolve the already-processed text between one pair of braces.
     */
    ResolveResult resolve_content(const std::string& content, size_t depth = 0);

private:
    const BuiltinDispatch& builtins_;
    const ModifierPipeline& modifiers_;
    BackreferenceStore& backrefs_;
    size_t max_depth_;

    // Resolve placeholders inside parameters, then unescape them for the modifier
    ResolveResult resolve_params(const std::vector<std::string>& params, size_t depth,
                                 std::vector<std::string>& out);

    static bool qualifier_passes(int qualifier);
};

}  // namespace mnemo
