/**
 * yaml_config.hpp - Simple YAML configuration loader for mnemo
 *
 * Parses a subset of YAML (key: value pairs with sections) without external dependencies.
 * Command-line arguments override config file settings.
 */

#pragma once

#include <string>
#include <fstream>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace mnemo {

/**
 * Application configuration loaded from mnemo.yml
 */
struct AppConfig {
    // Generator configuration
    int count = 12;
    int max_attempts = 10;
    int max_depth = 32;
    std::string pattern;             // Empty means a random pattern per password

    // Word lists
    std::string wordlist_dir;        // Empty means the bundled data directory

    // Output
    bool show_pattern = false;
    bool quiet = false;

    // Settings
    bool debug = false;
    std::string log_dir;             // Empty means ~/.mnemo

    // Path of the file that was loaded, empty if none
    std::string loaded_path;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./mnemo.yml");
        paths.push_back("./mnemo.yaml");

        // 2. User home directory
        std::string home;
#ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        home = userprofile ? userprofile : "";
#else
        const char* home_env = std::getenv("HOME");
        home = home_env ? home_env : "";
#endif
        if (!home.empty()) {
            paths.push_back(home + "/.mnemo/config.yml");
            paths.push_back(home + "/.mnemo/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from YAML file.
     * Returns true if a config file was found and loaded.
     */
    bool load(const std::string& explicit_path = "") {
        std::string config_path;
        std::error_code ec;

        // Use explicit path if provided
        if (!explicit_path.empty()) {
            if (std::filesystem::exists(explicit_path, ec)) {
                config_path = explicit_path;
            } else {
                std::cerr << "[!] Config file not found: " << explicit_path << "\n";
                return false;
            }
        } else {
            // Search default paths
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::exists(path, ec)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[!] Failed to open config file: " << config_path << "\n";
            return false;
        }

        std::string line;
        int line_number = 0;
        while (std::getline(file, line)) {
            line_number++;
            parse_line(line, line_number);
        }

        loaded_path = config_path;
        return true;
    }

    /**
     * Parse configuration text directly (used by load and by tests).
     */
    void load_from_string(const std::string& text) {
        size_t start = 0;
        int line_number = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            line_number++;
            parse_line(text.substr(start, end - start), line_number);
            start = end + 1;
        }
    }

private:
    std::string current_section_;

    void parse_line(const std::string& line, int line_number) {
        // Trim leading whitespace and count indent
        size_t indent = 0;
        while (indent < line.length() && (line[indent] == ' ' || line[indent] == '\t')) {
            indent++;
        }
        std::string trimmed = line.substr(indent);

        // Skip empty lines and comments
        if (trimmed.empty() || trimmed[0] == '#' || trimmed.substr(0, 3) == "---") {
            return;
        }

        trimmed = strip_trailing_comment(trimmed);

        // Trim trailing whitespace
        while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }

        if (trimmed.empty()) return;

        // Parse key: value
        size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) return;

        std::string key = trimmed.substr(0, colon_pos);
        std::string value = (colon_pos + 1 < trimmed.length()) ? trimmed.substr(colon_pos + 1) : "";

        // Trim key and value
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

        // Section header (no value, or just whitespace after colon)
        if (value.empty() && indent == 0) {
            current_section_ = key;
            return;
        }

        // Remove quotes from string values
        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        // Parse value based on section and key
        try {
            parse_value(current_section_, key, value);
        } catch (const std::exception& e) {
            std::cerr << "[!] Config parse error at line " << line_number << ": " << e.what() << "\n";
        }
    }

    // Patterns may contain '#', so only " #" outside quotes starts a comment
    static std::string strip_trailing_comment(const std::string& text) {
        char quote = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && i > 0 && (text[i - 1] == ' ' || text[i - 1] == '\t')) {
                return text.substr(0, i);
            }
        }
        return text;
    }

    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "generator") {
            if (key == "count") count = std::stoi(value);
            else if (key == "max_attempts") max_attempts = std::stoi(value);
            else if (key == "max_depth") max_depth = std::stoi(value);
            else if (key == "pattern") pattern = value;
        }
        else if (section == "wordlists") {
            if (key == "dir") wordlist_dir = value;
        }
        else if (section == "output") {
            if (key == "show_pattern") show_pattern = parse_bool(value);
            else if (key == "quiet") quiet = parse_bool(value);
        }
        else if (section == "settings") {
            if (key == "debug") debug = parse_bool(value);
            else if (key == "log_dir") log_dir = value;
        }
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
    }
};

/**
 * Apply config file settings to Arguments struct.
 * Only applies settings where command-line wasn't explicitly set.
 */
template<typename Arguments>
void apply_config_to_args(Arguments& args, const AppConfig& config,
                          bool cli_has_count, bool cli_has_pattern, bool cli_has_wordlists) {
    if (!cli_has_count && config.count > 0) {
        args.count = static_cast<size_t>(config.count);
    }
    if (!cli_has_pattern && !config.pattern.empty()) {
        args.pattern = config.pattern;
    }
    if (!cli_has_wordlists && !config.wordlist_dir.empty()) {
        args.wordlist_dir = config.wordlist_dir;
    }

    if (config.max_attempts > 0) args.max_attempts = config.max_attempts;
    if (config.max_depth > 0) args.max_depth = static_cast<size_t>(config.max_depth);

    // Flags can only be switched on from the file
    if (config.show_pattern) args.show_pattern = true;
    if (config.quiet) args.quiet = true;
    if (config.debug) args.debug = true;

    if (args.log_dir.empty() && !config.log_dir.empty()) {
        args.log_dir = config.log_dir;
    }
}

}  // namespace mnemo
