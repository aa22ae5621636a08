/**
 * Mnemo Placeholder Parser Implementation
 */

#include "placeholder_parser.hpp"
#include "escaper.hpp"
#include "../core/text_utils.hpp"

namespace mnemo {

namespace {

// First occurrence of c at or after start that is not nested inside braces
size_t find_outside_braces(std::string_view s, char c, size_t start = 0) {
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char ch = s[i];
        if (ch == '{') {
            depth++;
        } else if (ch == '}') {
            if (depth > 0) depth--;
        } else if (ch == c && depth == 0 && i >= start) {
            return i;
        }
    }
    return std::string_view::npos;
}

std::string strip_quotes(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && s[start] == '"') start++;
    size_t end = s.size();
    while (end > start && s[end - 1] == '"') end--;
    return std::string(s.substr(start, end - start));
}

std::vector<std::string> split_params(std::string_view param_str) {
    std::vector<std::string> params;
    std::string current;
    int depth = 0;

    for (char c : param_str) {
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (depth > 0) depth--;
        } else if (c == ',' && depth == 0) {
            params.push_back(strip_quotes(trim(current)));
            current.clear();
            continue;
        }
        current += c;
    }
    params.push_back(strip_quotes(trim(current)));
    return params;
}

struct CallParts {
    std::string name;
    std::vector<std::string> params;
    std::optional<int> qualifier;
};

// name(params)[N] in either order; qualifier is removed before params are read
CallParts parse_call(std::string_view spec) {
    CallParts parts;
    std::string text(spec);

    size_t qual_start = find_outside_braces(text, '[');
    if (qual_start != std::string::npos) {
        size_t qual_end = find_outside_braces(text, ']', qual_start);
        if (qual_end != std::string::npos) {
            auto value = parse_int(std::string_view(text).substr(qual_start + 1, qual_end - qual_start - 1));
            if (value) parts.qualifier = static_cast<int>(*value);
            text = text.substr(0, qual_start) + text.substr(qual_end + 1);
        }
    }

    parts.name = text;
    size_t param_start = find_outside_braces(text, '(');
    if (param_start != std::string::npos) {
        size_t param_end = find_outside_braces(text, ')', param_start);
        if (param_end != std::string::npos) {
            parts.name = text.substr(0, param_start);
            parts.params = split_params(std::string_view(text).substr(param_start + 1, param_end - param_start - 1));
        }
    }
    parts.name = trim(parts.name);
    return parts;
}

}  // namespace

std::vector<std::string> split_top_level(std::string_view content, char separator) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;

    for (char c : content) {
        if (c == '(') {
            depth++;
        } else if (c == ')') {
            depth--;
        } else if (c == separator && depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }

    // A trailing separator does not open an empty final part
    if (!current.empty()) parts.push_back(current);
    if (parts.empty()) parts.emplace_back(content);
    return parts;
}

ModifierSpec parse_modifier_spec(std::string_view spec) {
    CallParts parts = parse_call(spec);
    return ModifierSpec{
        .name = std::move(parts.name),
        .params = std::move(parts.params),
        .qualifier = parts.qualifier
    };
}

PlaceholderContent parse_placeholder_content(std::string_view content) {
    PlaceholderContent result;

    auto alternatives = split_top_level(content, '|');
    if (alternatives.size() > 1) {
        result.alternatives = std::move(alternatives);
        return result;
    }

    auto parts = split_top_level(content, '+');
    for (size_t i = 1; i < parts.size(); ++i) {
        result.modifiers.push_back(parse_modifier_spec(parts[i]));
    }

    CallParts base = parse_call(parts[0]);
    result.name = std::move(base.name);
    result.params = std::move(base.params);
    result.qualifier = base.qualifier;
    return result;
}

std::optional<std::string> check_pattern(std::string_view pattern) {
    if (pattern.empty()) {
        return "Error: Empty pattern";
    }

    std::string escaped = escape_pattern(pattern);

    int braces = 0, brackets = 0, parens = 0;
    for (char c : escaped) {
        switch (c) {
            case '{': braces++; break;
            case '}': braces--; break;
            case '[': brackets++; break;
            case ']': brackets--; break;
            case '(': parens++; break;
            case ')': parens--; break;
            default: break;
        }
    }

    if (braces != 0) return "Error: Unmatched braces in pattern";
    if (brackets != 0) return "Error: Unmatched brackets in pattern";
    if (parens != 0) return "Error: Unmatched parentheses in pattern";

    // Counts balance; a closing brace must still never precede its opener
    int depth = 0;
    for (char c : escaped) {
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (depth == 0) {
                return "Error: Mismatched braces in pattern: " + std::string(pattern);
            }
            depth--;
        }
    }

    return std::nullopt;
}

}  // namespace mnemo
