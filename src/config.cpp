#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace middleman {

nlohmann::json Config::defaults_json() {
    return {
        {"proxy", {
            {"target", ""},
            {"listen", "127.0.0.1:8080"},
            {"max_body", 1048576},
            {"timeout", 30},
            {"cache_methods", "any"},
            {"set_headers", nlohmann::json::object()}
        }},
        {"cache", {
            {"max_age", 0},
            {"max_size", ""},
            {"lru", true},
            {"store", "memory"},
            {"store_path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static uint64_t parse_size_setting(const std::string& name, const nlohmann::json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() >= 0)
        return static_cast<uint64_t>(v.get<int64_t>());
    if (v.is_string()) {
        std::string text = trim(v.get<std::string>());
        if (text.empty()) return 0;
        auto bytes = parse_bytes(text);
        if (!bytes) throw UsageError(name + ": invalid size '" + text + "'");
        return *bytes;
    }
    throw UsageError(name + ": expected a byte count or size string");
}

static uint64_t parse_millis_setting(const std::string& name, const std::string& text) {
    std::string t = trim(text);
    char* end = nullptr;
    unsigned long long v = std::strtoull(t.c_str(), &end, 10);
    if (t.empty() || t[0] == '-' || end == nullptr || *end != '\0')
        throw UsageError(name + ": expected milliseconds, got '" + text + "'");
    return static_cast<uint64_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("proxy") && j["proxy"].is_object()) {
        auto& p = j["proxy"];
        if (p.contains("target") && p["target"].is_string())
            cfg.proxy.target = p["target"].get<std::string>();
        if (p.contains("listen") && p["listen"].is_string())
            cfg.proxy.listen = p["listen"].get<std::string>();
        if (p.contains("max_body"))
            cfg.proxy.max_body = parse_size_setting("proxy.max_body", p["max_body"]);
        if (p.contains("timeout") && p["timeout"].is_number_unsigned())
            cfg.proxy.timeout = p["timeout"].get<uint32_t>();

        if (p.contains("cache_methods")) {
            auto& m = p["cache_methods"];
            if (m.is_string()) {
                cfg.proxy.cache_methods = {m.get<std::string>()};
            } else if (m.is_array()) {
                cfg.proxy.cache_methods.clear();
                for (const auto& item : m) {
                    if (!item.is_string())
                        throw UsageError("proxy.cache_methods: entries must be strings");
                    cfg.proxy.cache_methods.push_back(item.get<std::string>());
                }
            } else {
                throw UsageError("proxy.cache_methods must be a string or an array");
            }
        }

        if (p.contains("set_headers") && p["set_headers"].is_object()) {
            for (auto& [name, value] : p["set_headers"].items()) {
                if (value.is_string())
                    cfg.proxy.set_headers[name] = value.get<std::string>();
            }
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("max_age") && c["max_age"].is_number_unsigned())
            cfg.cache.max_age = c["max_age"].get<uint64_t>();
        if (c.contains("max_size"))
            cfg.cache.max_size = parse_size_setting("cache.max_size", c["max_size"]);
        if (c.contains("lru") && c["lru"].is_boolean())
            cfg.cache.lru = c["lru"].get<bool>();
        if (c.contains("store") && c["store"].is_string())
            cfg.cache.store = c["store"].get<std::string>();
        if (c.contains("store_path") && c["store_path"].is_string())
            cfg.cache.store_path = c["store_path"].get<std::string>();
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.middleman/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception&) {
            // Malformed file: fall back to defaults
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("MIDDLEMAN_TARGET"))
        cfg.proxy.target = v;
    if (const char* v = std::getenv("MIDDLEMAN_LISTEN"))
        cfg.proxy.listen = v;
    if (const char* v = std::getenv("MIDDLEMAN_MAX_AGE"))
        cfg.cache.max_age = parse_millis_setting("MIDDLEMAN_MAX_AGE", v);
    if (const char* v = std::getenv("MIDDLEMAN_MAX_SIZE"))
        cfg.cache.max_size = parse_size_setting("MIDDLEMAN_MAX_SIZE", nlohmann::json(v));
    if (const char* v = std::getenv("MIDDLEMAN_STORE"))
        cfg.cache.store = v;
    if (const char* v = std::getenv("MIDDLEMAN_STORE_PATH"))
        cfg.cache.store_path = v;

    return cfg;
}

} // namespace middleman
