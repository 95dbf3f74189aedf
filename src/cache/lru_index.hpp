#pragma once
#include "entry.hpp"
#include <cstdint>
#include <functional>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>

namespace middleman {

// Size-bounded least-recently-used index of KeyEntry records.
// Hash map for lookup, list for recency (front = most recent).
//
// set() evicts from the back until the total size fits max_bytes again and
// reports each victim through the evict callback, after the victims have
// already left the index. An entry that alone exceeds max_bytes is not kept
// and is reported as evicted without disturbing the others.
// erase() is silent.
class LruIndex {
public:
    using EvictCallback = std::function<void(const KeyEntry&)>;

    // max_bytes == 0 means unbounded.
    LruIndex(uint64_t max_bytes, EvictCallback on_evict);

    LruIndex(const LruIndex&) = delete;
    LruIndex& operator=(const LruIndex&) = delete;

    // Insert or replace, marking the key most recent.
    void set(KeyEntry entry);

    // Mark most recent. Returns false if the key is not indexed.
    bool touch(const std::string& key);

    // Lookup without changing recency.
    const KeyEntry* peek(const std::string& key) const;
    bool has(const std::string& key) const;

    bool erase(const std::string& key);

    // Most recent first.
    std::vector<std::string> keys() const;

    size_t count() const { return map_.size(); }
    uint64_t total_bytes() const { return total_bytes_; }
    uint64_t max_bytes() const { return max_bytes_; }

private:
    using List = std::list<KeyEntry>;

    uint64_t max_bytes_;
    EvictCallback on_evict_;
    List order_;
    std::unordered_map<std::string, List::iterator> map_;
    uint64_t total_bytes_ = 0;
};

} // namespace middleman
