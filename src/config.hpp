#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace middleman {

struct ProxyConfig {
    std::string target;                    // backend base URL, required to serve
    std::string listen = "127.0.0.1:8080";
    uint64_t max_body = 1048576;           // inbound request body limit (bytes)
    uint32_t timeout = 30;                 // backend timeout (seconds)
    std::vector<std::string> cache_methods = {"any"};
    std::map<std::string, std::string> set_headers;
};

struct CacheConfig {
    uint64_t max_age = 0;                  // milliseconds, 0 = never stale
    uint64_t max_size = 0;                 // bytes, 0 = unbounded
    bool lru = true;
    std::string store = "memory";
    std::string store_path;                // sqlite file, empty = ~/.middleman/cache.db
};

struct Config {
    ProxyConfig proxy;
    CacheConfig cache;

    // Load from ~/.middleman/config.json + env vars
    static Config load();

    // Same as load() for an explicit file path
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document. Throws UsageError for values
    // that cannot be used (e.g. an unparseable cache.max_size).
    static Config from_json(const nlohmann::json& j);
};

} // namespace middleman
