#pragma once
#include "../cache/store.hpp"
#include "../event_loop.hpp"
#include <string>
#include <unordered_map>

namespace middleman {

// In-process store: a hash map of JSON values. The operation takes effect
// immediately; its completion is posted to the loop.
class MemoryStore : public Store {
public:
    explicit MemoryStore(EventLoop& loop) : loop_(loop) {}

    std::string backend_name() const override { return "memory"; }

    void get(const std::string& key,
             Callback<std::optional<nlohmann::json>> done) override;
    void set(const std::string& key, const nlohmann::json& value,
             Callback<nlohmann::json> done) override;
    void del(const std::string& key, Callback<bool> done) override;

    size_t size() const { return values_.size(); }

private:
    EventLoop& loop_;
    std::unordered_map<std::string, nlohmann::json> values_;
};

} // namespace middleman
