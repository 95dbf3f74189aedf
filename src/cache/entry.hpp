#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace middleman {

// Index record: lives only in the engine's in-memory index, never persisted.
struct KeyEntry {
    std::string key;
    uint64_t size = 0;
    uint64_t created = 0;

    KeyEntry() = default;
    KeyEntry(std::string k, uint64_t sz, uint64_t ts = 0)
        : key(std::move(k)), size(sz), created(ts) {}
};

// Value record: what the engine hands to the store.
struct CacheEntry {
    std::string key;
    nlohmann::json value;
    uint64_t created = 0;

    // Approximate footprint of the value in bytes (see estimate_size).
    uint64_t size() const;
};

// Byte estimate for an arbitrary JSON value: strings and binary by length,
// numbers 8, booleans 4, null 0, containers the sum of their members
// (object keys counted by length). A tagged Buffer object counts as the
// bytes it holds, so a value sizes the same before and after a text store.
uint64_t estimate_size(const nlohmann::json& value);

// {"key": ..., "value": ..., "created": ...}
nlohmann::json entry_to_json(const CacheEntry& entry);

// Copy of value with every binary value rewritten into the tagged
// {"type":"Buffer","data":[...]} form, so the result survives a text store.
nlohmann::json to_portable_json(const nlohmann::json& value);

// Rebuild a CacheEntry from a stored value. Accepts the object form and a
// string holding its JSON text. nullopt when the shape does not match.
std::optional<CacheEntry> entry_from_json(const nlohmann::json& stored);

} // namespace middleman
