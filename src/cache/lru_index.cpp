#include "lru_index.hpp"

namespace middleman {

LruIndex::LruIndex(uint64_t max_bytes, EvictCallback on_evict)
    : max_bytes_(max_bytes), on_evict_(std::move(on_evict)) {}

void LruIndex::set(KeyEntry entry) {
    erase(entry.key);

    std::vector<KeyEntry> victims;
    if (max_bytes_ > 0 && entry.size > max_bytes_) {
        victims.push_back(std::move(entry));
    } else {
        total_bytes_ += entry.size;
        order_.push_front(std::move(entry));
        map_[order_.front().key] = order_.begin();

        while (max_bytes_ > 0 && total_bytes_ > max_bytes_ && !order_.empty()) {
            KeyEntry& last = order_.back();
            total_bytes_ -= last.size;
            map_.erase(last.key);
            victims.push_back(std::move(last));
            order_.pop_back();
        }
    }

    // Callbacks run once the index is consistent again.
    if (on_evict_) {
        for (const auto& victim : victims) on_evict_(victim);
    }
}

bool LruIndex::touch(const std::string& key) {
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    order_.splice(order_.begin(), order_, it->second);
    return true;
}

const KeyEntry* LruIndex::peek(const std::string& key) const {
    auto it = map_.find(key);
    if (it == map_.end()) return nullptr;
    return &*it->second;
}

bool LruIndex::has(const std::string& key) const {
    return map_.count(key) > 0;
}

bool LruIndex::erase(const std::string& key) {
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    total_bytes_ -= it->second->size;
    order_.erase(it->second);
    map_.erase(it);
    return true;
}

std::vector<std::string> LruIndex::keys() const {
    std::vector<std::string> out;
    out.reserve(order_.size());
    for (const auto& e : order_) out.push_back(e.key);
    return out;
}

} // namespace middleman
