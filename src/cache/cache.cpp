#include "cache.hpp"
#include "../errors.hpp"
#include "../stores/memory_store.hpp"
#include "../util.hpp"
#include <algorithm>

namespace middleman {

namespace {

template <typename T>
void settle(const Callback<T>& done, Result<T> result) {
    if (done) done(std::move(result));
}

struct ClearState {
    size_t remaining = 0;
    bool failed = false;
    Callback<void> done;
};

} // namespace

Cache::Cache(EventLoop& loop, CacheOptions options)
    : loop_(loop),
      store_(std::move(options.store)),
      clock_(std::move(options.clock)) {
    if (!store_) store_ = std::make_unique<MemoryStore>(loop_);
    if (!clock_) clock_ = epoch_millis;
    if (options.max_age_ms && *options.max_age_ms > 0) max_age_ = options.max_age_ms;
    if (options.max_size_bytes && *options.max_size_bytes > 0) max_size_ = options.max_size_bytes;

    if (options.lru) {
        lru_ = std::make_unique<LruIndex>(max_size_.value_or(0),
            [this](const KeyEntry& victim) { on_evict(victim.key); });
    }
}

// ── Public operations ──────────────────────────────────────────

void Cache::get(const std::string& key, Callback<CacheLookup> done) {
    store_->get(key, [this, key, done = std::move(done)](
                         Result<std::optional<nlohmann::json>> result) {
        if (!result.ok()) {
            settle(done, Result<CacheLookup>::failure(result.error()));
            return;
        }

        const auto& stored = result.value();
        if (!stored || stored->is_null()) {
            drop_key(key);
            settle(done, Result<CacheLookup>(CacheLookup{}));
            return;
        }

        auto entry = entry_from_json(*stored);
        if (!entry) {
            auto error = std::make_exception_ptr(StoreProtocolError(
                "expected store to resolve a cache entry for key '" + key + "'"));
            publish_error(key, error);
            drop_key(key);
            settle(done, Result<CacheLookup>::failure(error));
            return;
        }

        if (!is_fresh(*entry)) {
            drop_key(key);
            // An explicit delete already in flight will take care of the record.
            // Without lru this is a purge, not an eviction: no delete event.
            if (protected_.count(key) == 0) remove_from_store(key, lru_ != nullptr);
            CacheLookup lookup;
            lookup.status = LookupStatus::Stale;
            settle(done, Result<CacheLookup>(std::move(lookup)));
            return;
        }

        if (!lru_ || !lru_->touch(key)) {
            // Seen for the first time (e.g. store seeded out-of-band).
            index_key(key, entry->size(), entry->created);
        }
        CacheLookup lookup;
        lookup.status = LookupStatus::Hit;
        lookup.entry = std::move(*entry);
        settle(done, Result<CacheLookup>(std::move(lookup)));
    });
}

void Cache::set(const std::string& key, nlohmann::json value, Callback<CacheEntry> done) {
    CacheEntry entry;
    entry.key = key;
    entry.value = std::move(value);
    entry.created = clock_();

    // Re-setting must not count the old size twice.
    drop_key(key);

    nlohmann::json wire = entry_to_json(entry);
    store_->set(key, wire, [this, entry = std::move(entry), done = std::move(done)](
                               Result<nlohmann::json> result) {
        if (!result.ok()) {
            settle(done, Result<CacheEntry>::failure(result.error()));
            return;
        }
        index_key(entry.key, entry.size(), entry.created);
        settle(done, Result<CacheEntry>(entry));
    });
}

void Cache::del(const std::string& key, Callback<void> done) {
    protect(key);
    store_del(key, [this, key, done = std::move(done)](Result<bool> result) {
        if (!result.ok()) {
            // Store state unknown: keep the index entry.
            unprotect(key);
            settle(done, Result<void>::failure(result.error()));
            return;
        }
        drop_key(key);
        unprotect(key);
        settle(done, Result<void>());
    });
}

void Cache::clear(Callback<void> done) {
    std::vector<std::string> keys = indexed_keys();
    if (keys.empty()) {
        loop_.post([done = std::move(done)]() { settle(done, Result<void>()); });
        return;
    }

    for (const auto& key : keys) protect(key);

    auto state = std::make_shared<ClearState>();
    state->remaining = keys.size();
    state->done = std::move(done);

    for (const auto& key : keys) {
        store_del(key, [this, key, state](Result<bool> result) {
            --state->remaining;
            if (result.ok()) {
                drop_key(key);
                unprotect(key);
            } else {
                unprotect(key);
                if (!state->failed) {
                    state->failed = true;
                    settle(state->done, Result<void>::failure(result.error()));
                }
            }
            if (state->remaining == 0 && !state->failed) {
                settle(state->done, Result<void>());
            }
        });
    }
}

// ── Introspection ──────────────────────────────────────────────

bool Cache::is_indexed(const std::string& key) const {
    if (lru_) return lru_->has(key);
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

bool Cache::is_protected(const std::string& key) const {
    if (!lru_) return true;
    return protected_.count(key) > 0;
}

std::optional<KeyEntry> Cache::key_entry(const std::string& key) const {
    if (!lru_) return std::nullopt;
    const KeyEntry* entry = lru_->peek(key);
    if (!entry) return std::nullopt;
    return *entry;
}

std::vector<std::string> Cache::indexed_keys() const {
    if (lru_) return lru_->keys();
    return keys_;
}

size_t Cache::indexed_count() const {
    return lru_ ? lru_->count() : keys_.size();
}

uint64_t Cache::indexed_bytes() const {
    return lru_ ? lru_->total_bytes() : 0;
}

// ── Index bookkeeping ──────────────────────────────────────────

bool Cache::is_fresh(const CacheEntry& entry) const {
    if (!max_age_) return true;
    uint64_t now = clock_();
    uint64_t age = now > entry.created ? now - entry.created : 0;
    return age < *max_age_;
}

void Cache::index_key(const std::string& key, uint64_t size, uint64_t created) {
    if (lru_) {
        lru_->set(KeyEntry(key, size, created));
        return;
    }
    if (std::find(keys_.begin(), keys_.end(), key) == keys_.end()) {
        keys_.push_back(key);
    }
}

void Cache::drop_key(const std::string& key) {
    if (lru_) {
        lru_->erase(key);
        return;
    }
    keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
}

void Cache::protect(const std::string& key) {
    ++protected_[key];
}

void Cache::unprotect(const std::string& key) {
    auto it = protected_.find(key);
    if (it == protected_.end()) return;
    if (--it->second <= 0) protected_.erase(it);
}

// ── Background removal ─────────────────────────────────────────

void Cache::store_del(const std::string& key, Callback<bool> done) {
    auto pending = deleting_.find(key);
    if (pending != deleting_.end()) {
        pending->second.push_back(std::move(done));
        return;
    }
    deleting_[key].push_back(std::move(done));
    store_->del(key, [this, key](Result<bool> result) {
        auto it = deleting_.find(key);
        if (it == deleting_.end()) return;
        // Waiters may start a fresh delete for the same key.
        std::vector<Callback<bool>> waiters = std::move(it->second);
        deleting_.erase(it);
        for (auto& waiter : waiters) settle(waiter, result);
    });
}

void Cache::on_evict(const std::string& key) {
    if (is_protected(key)) return;
    remove_from_store(key, true);
}

void Cache::remove_from_store(const std::string& key, bool notify) {
    protect(key);
    store_del(key, [this, key, notify](Result<bool> result) {
        unprotect(key);
        if (result.ok()) {
            if (!notify) return;
            CacheDeleteEvent ev;
            ev.key = key;
            events_.publish(ev);
        } else {
            publish_error(key, result.error());
        }
    });
}

void Cache::publish_error(const std::string& key, std::exception_ptr error) {
    CacheErrorEvent ev;
    ev.key = key;
    ev.message = error_message(error);
    ev.error = std::move(error);
    events_.publish(ev);
}

} // namespace middleman
