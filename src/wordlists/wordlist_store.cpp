/**
 * Mnemo Word-List Store Implementation
 */

#include "wordlist_store.hpp"
#include "../core/logger.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"

#include <fstream>
#include <system_error>

namespace mnemo {

namespace fs = std::filesystem;

std::string WordlistStore::file_name_for(const std::string& list_name) {
    std::string name = to_lower(trim(list_name));
    if (name.empty() ||
        name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos ||
        name.find("..") != std::string::npos) {
        return "";
    }

    if (name.size() < 4 || name.compare(name.size() - 4, 4, ".txt") != 0) {
        name += ".txt";
    }
    return name;
}

fs::path WordlistStore::path_for(const std::string& list_name) const {
    std::string file = file_name_for(list_name);
    if (file.empty()) {
        throw WordlistNotFound("Invalid wordlist name: " + list_name);
    }

    fs::path path = directory_ / file;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw WordlistNotFound("Wordlist file not found: " + path.string());
    }
    return path;
}

bool WordlistStore::has_wordlist(const std::string& list_name) const {
    std::string file = file_name_for(list_name);
    if (file.empty()) return false;

    std::error_code ec;
    return fs::is_regular_file(directory_ / file, ec);
}

const std::vector<std::string>& WordlistStore::load_locked(const std::string& list_name) {
    std::string key = to_lower(trim(list_name));

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    fs::path path = path_for(list_name);
    std::ifstream file(path);
    if (!file) {
        throw WordlistNotFound("Cannot open wordlist: " + path.string());
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        std::string word = trim(line);
        if (!word.empty()) {
            words.push_back(std::move(word));
        }
    }

    Logger::instance().log_wordlist_loaded(key, words.size());
    return cache_.emplace(key, std::move(words)).first->second;
}

std::vector<std::string> WordlistStore::load_wordlist(const std::string& list_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(list_name);
}

size_t WordlistStore::count_words(const std::string& list_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(list_name).size();
}

void WordlistStore::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

// Second line of a 128-byte window; the first is usually partial
std::string WordlistStore::seek_random_line(const fs::path& path, uintmax_t size) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) return "";

    std::string buffer(SEEK_BUFFER_SIZE, '\0');

    for (int attempt = 0; attempt < SEEK_RETRIES; ++attempt) {
        auto pos = weighted_rand(static_cast<int64_t>(size - SEEK_BUFFER_SIZE), 1);

        file.clear();
        file.seekg(pos);
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

        auto lines = split(std::string_view(buffer.data(), static_cast<size_t>(file.gcount())), '\n');
        if (lines.size() >= 3) {
            std::string word = trim(lines[1]);
            if (!word.empty()) return word;
        }
    }
    return "";
}

std::string WordlistStore::lookup_word(const std::string& list_name) {
    fs::path path = path_for(list_name);

    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);

    if (!ec && size >= SMALL_FILE_LIMIT) {
        std::string word = seek_random_line(path, size);
        if (!word.empty()) return word;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& words = load_locked(list_name);
    if (words.empty()) return "";
    return words[random_index(words.size())];
}

std::vector<NamedPattern> WordlistStore::load_patterns() const {
    fs::path path = directory_ / PATTERNS_FILE;

    std::ifstream file(path);
    if (!file) {
        throw NoPatternsError("Patterns file not found: " + path.string());
    }

    std::vector<NamedPattern> patterns;
    std::string raw;
    while (std::getline(file, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            patterns.push_back(NamedPattern{
                .name = trim(std::string_view(line).substr(0, colon)),
                .pattern = trim(std::string_view(line).substr(colon + 1))
            });
        } else {
            patterns.push_back(NamedPattern{.name = "", .pattern = line});
        }
    }
    return patterns;
}

std::string WordlistStore::random_pattern() {
    auto patterns = load_patterns();
    if (patterns.empty()) {
        throw NoPatternsError("No patterns found in " + (directory_ / PATTERNS_FILE).string());
    }
    return patterns[random_index(patterns.size())].pattern;
}

}  // namespace mnemo
