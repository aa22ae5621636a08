/**
 * Mnemo Word-List Store
 *
 * File-backed WordSource and PatternSource over a directory of plain
 * text lists (one entry per line, "<name>.txt") and a patterns.cfg of
 * "name: pattern" lines. Small lists are cached whole; large lists are
 * sampled by random seeking so they never have to be read in full.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mnemo {

struct NamedPattern {
    std::string name;      // Empty for bare lines
    std::string pattern;
};

class WordlistStore : public WordSource, public PatternSource {
public:
    static constexpr uintmax_t SMALL_FILE_LIMIT = 100000;
    static constexpr size_t SEEK_BUFFER_SIZE = 128;
    static constexpr int SEEK_RETRIES = 5;
    static constexpr const char* PATTERNS_FILE = "patterns.cfg";

    explicit WordlistStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    /**
     * Random entry from <directory>/<name>.txt; "" when the list is empty.
     * @throws WordlistNotFound if the list does not exist
     */
    std::string lookup_word(const std::string& list_name) override;

    /**
     * Random pattern from patterns.cfg.
     * @throws NoPatternsError if the file is missing or has no patterns
     */
    std::string random_pattern() override;

    /**
     * Parsed patterns.cfg, comments and blank lines skipped.
     * @throws NoPatternsError if the file is missing
     */
    std::vector<NamedPattern> load_patterns() const;

    /**
     * Whole list, trimmed, blank lines dropped. Cached by lower-cased name.
     * @throws WordlistNotFound if the list does not exist
     */
    std::vector<std::string> load_wordlist(const std::string& list_name);

    size_t count_words(const std::string& list_name);

    bool has_wordlist(const std::string& list_name) const;

    void clear_cache();

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    std::unordered_map<std::string, std::vector<std::string>> cache_;
    mutable std::mutex mutex_;

    // Lower-cased name with ".txt"; empty when the name could escape the directory
    static std::string file_name_for(const std::string& list_name);

    std::filesystem::path path_for(const std::string& list_name) const;
    // mutex_ must be held
    const std::vector<std::string>& load_locked(const std::string& list_name);
    std::string seek_random_line(const std::filesystem::path& path, uintmax_t size) const;
};

}  // namespace mnemo
