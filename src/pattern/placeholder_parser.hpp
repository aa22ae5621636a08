/**
 * Mnemo Placeholder Parser
 *
 * Splits the text between one matched pair of braces into its parts:
 *
 *   content      := alternatives | base ('+' modifier)*
 *   alternatives := part ('|' part)+
 *   base         := name ('(' paramlist ')')? ('[' INT ']')?
 *   modifier     := name ('(' paramlist ')')? ('[' INT ']')?
 *
 * Separators nested inside parentheses are not split on. Only the first
 * [..] and the first (..) of a modifier link are honored.
 */

#pragma once

#include "../core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo {

/**
 * Split on separator where it is not nested inside parentheses.
 * Empty input yields a single empty part.
 */
std::vector<std::string> split_top_level(std::string_view content, char separator);

/**
 * Parse one "name(params)[N]" spec, used for both modifier links and
 * the post-brace "}+name(...)" chain. Brackets, parentheses and commas
 * nested inside braces are skipped, so unresolved placeholders survive
 * as whole parameters.
 */
ModifierSpec parse_modifier_spec(std::string_view spec);

/**
 * Parse resolved placeholder content.
 */
PlaceholderContent parse_placeholder_content(std::string_view content);

/**
 * Structural validation used by callers before accepting a pattern.
 * @return an error message, or nullopt when the pattern is well formed
 */
std::optional<std::string> check_pattern(std::string_view pattern);

}  // namespace mnemo
