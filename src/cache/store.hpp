#pragma once
#include "../async.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace middleman {

// Abstract key-value backend the cache engine sits on. The store is the source
// of truth for values; the engine only keeps an advisory index.
//
// Every operation completes through its callback, delivered later through the
// event loop the store was built with; none of them throws synchronously.
// Failures arrive as Result::failure (normally a StoreIOError).
class Store {
public:
    virtual ~Store() = default;

    virtual std::string backend_name() const = 0;

    // nullopt (or a JSON null) when the key has no record. Missing keys are
    // not errors.
    virtual void get(const std::string& key,
                     Callback<std::optional<nlohmann::json>> done) = 0;

    // Persist value under key; completes with the value stored.
    virtual void set(const std::string& key, const nlohmann::json& value,
                     Callback<nlohmann::json> done) = 0;

    // Remove key. Completes with true whether or not the key existed.
    virtual void del(const std::string& key, Callback<bool> done) = 0;
};

} // namespace middleman
