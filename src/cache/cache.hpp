#pragma once
#include "entry.hpp"
#include "lru_index.hpp"
#include "store.hpp"
#include "../async.hpp"
#include "../event_bus.hpp"
#include "../event_loop.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace middleman {

enum class LookupStatus { Hit, Miss, Stale };

// Outcome of Cache::get. Miss: the store has no record. Stale: it had one,
// but it was older than max age. Only a Hit carries an entry.
struct CacheLookup {
    LookupStatus status = LookupStatus::Miss;
    CacheEntry entry;

    explicit operator bool() const { return status == LookupStatus::Hit; }
};

struct CacheOptions {
    std::optional<uint64_t> max_age_ms;      // unset or 0: entries never go stale
    std::optional<uint64_t> max_size_bytes;  // unset or 0: no size bound
    bool lru = true;                         // false: plain key list, no eviction
    std::unique_ptr<Store> store;            // default: MemoryStore
    std::function<uint64_t()> clock;         // default: epoch_millis
};

// Cache engine: mediates reads, writes and deletes against a Store and keeps
// an in-memory index of known keys. With lru on, the index is bounded by
// max_size_bytes and least-recently-used keys are evicted from the store.
//
// All completions arrive through the event loop. A key with a store delete
// in flight is protected: eviction skips it, and a del or clear arriving
// meanwhile joins the pending store call, so a key never has two store
// deletes in flight.
//
// The cache must outlive its pending operations.
class Cache {
public:
    explicit Cache(EventLoop& loop, CacheOptions options = {});

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    void get(const std::string& key, Callback<CacheLookup> done);
    void set(const std::string& key, nlohmann::json value, Callback<CacheEntry> done);
    void del(const std::string& key, Callback<void> done);

    // Delete every indexed key. Keys deleted before a failure stay deleted;
    // the failing key stays indexed and unprotected.
    void clear(Callback<void> done);

    // CacheDeleteEvent and CacheErrorEvent are published here.
    EventBus& events() { return events_; }
    Store& store() { return *store_; }

    bool lru() const { return lru_ != nullptr; }
    bool is_indexed(const std::string& key) const;
    // Always true when lru is off: nothing is ever evicted.
    bool is_protected(const std::string& key) const;
    std::optional<KeyEntry> key_entry(const std::string& key) const;
    std::vector<std::string> indexed_keys() const;
    size_t indexed_count() const;
    uint64_t indexed_bytes() const;
    std::optional<uint64_t> max_size() const { return max_size_; }
    std::optional<uint64_t> max_age() const { return max_age_; }

private:
    bool is_fresh(const CacheEntry& entry) const;
    void index_key(const std::string& key, uint64_t size, uint64_t created);
    void drop_key(const std::string& key);

    void protect(const std::string& key);
    void unprotect(const std::string& key);

    // Issue store_->del, or join the one already pending for key.
    void store_del(const std::string& key, Callback<bool> done);

    // Background removal of a key that left the index (eviction or expiry).
    // notify: publish CacheDeleteEvent on success.
    void on_evict(const std::string& key);
    void remove_from_store(const std::string& key, bool notify);
    void publish_error(const std::string& key, std::exception_ptr error);

    EventLoop& loop_;
    std::unique_ptr<Store> store_;
    std::function<uint64_t()> clock_;
    std::optional<uint64_t> max_age_;
    std::optional<uint64_t> max_size_;

    std::unique_ptr<LruIndex> lru_;
    std::vector<std::string> keys_;   // lru off: insertion order
    std::unordered_map<std::string, int> protected_;
    std::unordered_map<std::string, std::vector<Callback<bool>>> deleting_;
    EventBus events_;
};

} // namespace middleman
