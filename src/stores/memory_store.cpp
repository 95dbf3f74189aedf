#include "memory_store.hpp"
#include "../plugin.hpp"

static middleman::StoreRegistrar reg_memory("memory",
    [](const middleman::Config&, middleman::EventLoop& loop) {
        return std::make_unique<middleman::MemoryStore>(loop);
    });

namespace middleman {

void MemoryStore::get(const std::string& key,
                      Callback<std::optional<nlohmann::json>> done) {
    std::optional<nlohmann::json> value;
    auto it = values_.find(key);
    if (it != values_.end()) value = it->second;

    loop_.post([done = std::move(done), value = std::move(value)]() {
        if (done) done(Result<std::optional<nlohmann::json>>(value));
    });
}

void MemoryStore::set(const std::string& key, const nlohmann::json& value,
                      Callback<nlohmann::json> done) {
    values_[key] = value;
    loop_.post([done = std::move(done), value]() {
        if (done) done(Result<nlohmann::json>(value));
    });
}

void MemoryStore::del(const std::string& key, Callback<bool> done) {
    values_.erase(key);
    loop_.post([done = std::move(done)]() {
        if (done) done(Result<bool>(true));
    });
}

} // namespace middleman
