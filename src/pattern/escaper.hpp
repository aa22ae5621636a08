/**
 * Mnemo Escaper
 *
 * Maps reserved pattern characters to sentinel tokens so structural
 * parsing never sees them, and maps the tokens back once resolution is
 * done.
 *
 *   \\ -> #sla#   \+ -> #pls#   \{ -> #lbr#   \} -> #rbr#   \[ -> #lba#
 *   \] -> #rba#   \( -> #lpa#   \) -> #rpa#   \| -> #pip#
 */

#pragma once

#include <string>
#include <string_view>

namespace mnemo {

/**
 * Replace backslash escapes in a raw pattern with sentinel tokens.
 * Scans left to right, so "\\\\{" keeps its brace structural.
 * A backslash before any other character is left alone.
 */
std::string escape_pattern(std::string_view pattern);

/**
 * Replace bare reserved characters in a freshly resolved value with
 * sentinel tokens, so a generated "+" is never read as a modifier.
 */
std::string escape_value(std::string_view value);

/**
 * Replace every sentinel token with its literal character.
 */
std::string unescape(std::string_view text);

}  // namespace mnemo
