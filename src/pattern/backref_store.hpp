/**
 * Mnemo Backreference Store
 *
 * Numbered record of every placeholder value resolved during one
 * generation attempt, consulted by {$W<n>}. Keys start at 1 and follow
 * depth-first, left-to-right resolution order. A store lives for exactly
 * one attempt; the session replaces it rather than clearing it.
 */

#pragma once

#include <map>
#include <string>

namespace mnemo {

class BackreferenceStore {
public:
    BackreferenceStore() = default;

    BackreferenceStore(const BackreferenceStore&) = delete;
    BackreferenceStore& operator=(const BackreferenceStore&) = delete;

    /**
     * Record a value under the next key.
     * @return the key assigned
     */
    int record(std::string value) {
        int key = ++counter_;
        values_[key] = std::move(value);
        return key;
    }

    /**
     * Stored value for key, or empty string when absent.
     */
    std::string lookup(int key) const {
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : std::string();
    }

    bool contains(int key) const { return values_.count(key) > 0; }
    size_t size() const { return values_.size(); }

private:
    int counter_ = 0;
    std::map<int, std::string> values_;
};

}  // namespace mnemo
