/**
 * Mnemo Recursive Resolver Implementation
 */

#include "resolver.hpp"
#include "escaper.hpp"
#include "placeholder_parser.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"

#include <regex>

namespace mnemo {

namespace {

// Index one past the '}' matching the '{' at open, or npos when unmatched
size_t find_matching_brace(std::string_view pattern, size_t open) {
    int depth = 1;
    size_t j = open + 1;
    while (j < pattern.size() && depth > 0) {
        if (pattern[j] == '{') {
            depth++;
        } else if (pattern[j] == '}') {
            depth--;
        }
        j++;
    }
    return depth == 0 ? j : std::string_view::npos;
}

// End of a "+modifier" link: next +, {, whitespace or '.' outside parentheses
size_t find_modifier_end(std::string_view pattern, size_t start) {
    int paren_depth = 0;
    size_t end = start;
    while (end < pattern.size()) {
        char c = pattern[end];
        if (c == '(') {
            paren_depth++;
        } else if (c == ')') {
            paren_depth--;
        } else if (paren_depth == 0 &&
                   (c == '+' || c == '{' || c == ' ' || c == '\t' || c == '.')) {
            break;
        }
        end++;
    }
    return end;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}  // namespace

bool Resolver::qualifier_passes(int qualifier) {
    return weighted_rand(99, 0) < qualifier;
}

ResolveResult Resolver::resolve_params(const std::vector<std::string>& params, size_t depth,
                                       std::vector<std::string>& out) {
    out.clear();
    out.reserve(params.size());

    for (const auto& param : params) {
        if (param.find('{') == std::string::npos) {
            out.push_back(unescape(param));
            continue;
        }
        ResolveResult r = process(param, depth + 1);
        if (!r.ok()) return r;
        out.push_back(unescape(r.value));
    }
    return ResolveResult::success("");
}

ResolveResult Resolver::process(std::string_view pattern, size_t depth) {
    if (depth > max_depth_) {
        return ResolveResult::failure(ResolveError::TOO_DEEPLY_NESTED,
                                      "Placeholders nested deeper than " + std::to_string(max_depth_));
    }

    std::string result;
    size_t i = 0;

    while (i < pattern.size()) {
        if (pattern[i] != '{') {
            result += pattern[i];
            i++;
            continue;
        }

        size_t j = find_matching_brace(pattern, i);
        if (j == std::string_view::npos) {
            result += pattern[i];
            i++;
            continue;
        }

        // Inner placeholders resolve before the one that contains them
        std::string_view content = pattern.substr(i + 1, j - i - 2);
        ResolveResult inner = process(content, depth + 1);
        if (!inner.ok()) return inner;

        std::string value;
        bool is_backref = starts_with(inner.value, "$W");
        if (is_backref) {
            auto key = parse_int(std::string_view(inner.value).substr(2));
            value = key ? backrefs_.lookup(static_cast<int>(*key)) : std::string();
        } else {
            ResolveResult resolved = resolve_content(inner.value, depth);
            if (!resolved.ok()) return resolved;
            value = std::move(resolved.value);
        }

        // }[N] keeps the value with N percent probability
        if (j < pattern.size() && pattern[j] == '[') {
            size_t qual_end = pattern.find(']', j);
            if (qual_end != std::string_view::npos) {
                auto qualifier = parse_int(pattern.substr(j + 1, qual_end - j - 1));
                if (qualifier && !qualifier_passes(static_cast<int>(*qualifier))) {
                    value.clear();
                }
                j = qual_end + 1;
            }
        }

        // }+modifier(...)[N] chain
        while (j < pattern.size() && pattern[j] == '+') {
            size_t mod_end = find_modifier_end(pattern, j + 1);
            std::string_view mod_str = pattern.substr(j + 1, mod_end - j - 1);
            j = mod_end;
            if (mod_str.empty()) continue;

            ModifierSpec spec = parse_modifier_spec(mod_str);

            std::vector<std::string> params;
            ResolveResult p = resolve_params(spec.params, depth, params);
            if (!p.ok()) return p;

            if (spec.qualifier && !qualifier_passes(*spec.qualifier)) continue;

            ResolveResult modified = modifiers_.apply(unescape(value), spec.name, params);
            if (!modified.ok()) return modified;
            value = escape_value(modified.value);
        }

        if (!is_backref) {
            backrefs_.record(value);
        }
        result += value;
        i = j;
    }

    return ResolveResult::success(std::move(result));
}

ResolveResult Resolver::resolve_content(const std::string& content, size_t depth) {
    PlaceholderContent parsed = parse_placeholder_content(content);

    if (parsed.is_alternatives()) {
        std::string choice = pick_one(*parsed.alternatives);
        if (choice.find('{') != std::string::npos) {
            return process(choice, depth + 1);
        }
        return ResolveResult::success(std::move(choice));
    }

    if (parsed.qualifier && !qualifier_passes(*parsed.qualifier)) {
        return ResolveResult::success("");
    }

    // Literal grouping such as "{ {word}}": the content is the value
    if (parsed.name.empty() || content[0] == ' ' || content[0] == '\t') {
        if (parsed.qualifier) {
            static const std::regex qualifier_re(R"(\[\d+\])");
            return ResolveResult::success(std::regex_replace(content, qualifier_re, ""));
        }
        return ResolveResult::success(content);
    }

    ResolveResult base = builtins_.resolve(parsed.name, parsed.params);
    if (!base.ok()) return base;
    std::string value = std::move(base.value);

    for (const auto& mod : parsed.modifiers) {
        if (mod.qualifier && !qualifier_passes(*mod.qualifier)) continue;

        std::vector<std::string> params;
        ResolveResult p = resolve_params(mod.params, depth, params);
        if (!p.ok()) return p;

        ResolveResult modified = modifiers_.apply(value, mod.name, params);
        if (!modified.ok()) return modified;
        value = std::move(modified.value);
    }

    return ResolveResult::success(escape_value(value));
}

}  // namespace mnemo
