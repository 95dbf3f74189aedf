#pragma once
#include "config.hpp"
#include "event_loop.hpp"
#include "cache/store.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace middleman {

using StoreFactory = std::function<std::unique_ptr<Store>(
    const Config& config, EventLoop& loop)>;

// Central registry for self-registering store backends.
// All methods are thread-safe.
class StoreRegistry {
public:
    static StoreRegistry& instance();

    void register_store(const std::string& name, StoreFactory factory);

    // Throws std::invalid_argument for an unknown name.
    std::unique_ptr<Store> create_store(const std::string& name,
                                        const Config& config,
                                        EventLoop& loop) const;

    std::vector<std::string> store_names() const;
    bool has_store(const std::string& name) const;

    // Testing support
    void clear();

private:
    StoreRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

// ── Self-registrar helper (used at file scope in each store .cpp) ──

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        StoreRegistry::instance().register_store(name, std::move(factory));
    }
};

// Build the backend named by config.cache.store.
std::unique_ptr<Store> create_store(const Config& config, EventLoop& loop);

} // namespace middleman
