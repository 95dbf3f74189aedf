#include <catch2/catch.hpp>
#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace middleman;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.proxy.target.empty());
    REQUIRE(cfg.proxy.listen == "127.0.0.1:8080");
    REQUIRE(cfg.proxy.max_body == 1048576);
    REQUIRE(cfg.proxy.timeout == 30);
    REQUIRE(cfg.proxy.cache_methods == std::vector<std::string>{"any"});
    REQUIRE(cfg.proxy.set_headers.empty());
}

TEST_CASE("CacheConfig: default values", "[config]") {
    CacheConfig cc;
    REQUIRE(cc.max_age == 0);
    REQUIRE(cc.max_size == 0);
    REQUIRE(cc.lru);
    REQUIRE(cc.store == "memory");
    REQUIRE(cc.store_path.empty());
}

TEST_CASE("Config::from_json: defaults document matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.proxy.listen == plain.proxy.listen);
    REQUIRE(cfg.proxy.max_body == plain.proxy.max_body);
    REQUIRE(cfg.proxy.cache_methods == plain.proxy.cache_methods);
    REQUIRE(cfg.cache.max_size == 0);
    REQUIRE(cfg.cache.store == "memory");
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "proxy": {
            "target": "http://api.internal:9000",
            "listen": "0.0.0.0:3000",
            "max_body": "2mb",
            "timeout": 5,
            "cache_methods": ["GET", "HEAD"],
            "set_headers": {"X-Api-Key": "secret", "X-Ignored": 5}
        },
        "cache": {
            "max_age": 60000,
            "max_size": "1.5kb",
            "lru": false,
            "store": "sqlite",
            "store_path": "/tmp/mm.db"
        }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.proxy.target == "http://api.internal:9000");
    REQUIRE(cfg.proxy.listen == "0.0.0.0:3000");
    REQUIRE(cfg.proxy.max_body == 2u * 1024 * 1024);
    REQUIRE(cfg.proxy.timeout == 5);
    REQUIRE(cfg.proxy.cache_methods == std::vector<std::string>{"GET", "HEAD"});
    REQUIRE(cfg.proxy.set_headers.size() == 1);
    REQUIRE(cfg.proxy.set_headers.at("X-Api-Key") == "secret");

    REQUIRE(cfg.cache.max_age == 60000);
    REQUIRE(cfg.cache.max_size == 1536);
    REQUIRE_FALSE(cfg.cache.lru);
    REQUIRE(cfg.cache.store == "sqlite");
    REQUIRE(cfg.cache.store_path == "/tmp/mm.db");
}

TEST_CASE("Config::from_json: sizes accept plain numbers", "[config]") {
    auto j = nlohmann::json{{"cache", {{"max_size", 4096}}}};
    REQUIRE(Config::from_json(j).cache.max_size == 4096);
}

TEST_CASE("Config::from_json: cache_methods as a single string", "[config]") {
    auto j = nlohmann::json{{"proxy", {{"cache_methods", "GET|HEAD"}}}};
    REQUIRE(Config::from_json(j).proxy.cache_methods == std::vector<std::string>{"GET|HEAD"});
}

TEST_CASE("Config::from_json: unusable values throw UsageError", "[config]") {
    REQUIRE_THROWS_AS(Config::from_json({{"cache", {{"max_size", "lots"}}}}), UsageError);
    REQUIRE_THROWS_AS(Config::from_json({{"cache", {{"max_size", "99999999999pb"}}}}), UsageError);
    REQUIRE_THROWS_AS(Config::from_json({{"cache", {{"max_size", -5}}}}), UsageError);
    REQUIRE_THROWS_AS(Config::from_json({{"cache", {{"max_size", true}}}}), UsageError);
    REQUIRE_THROWS_AS(Config::from_json({{"proxy", {{"max_body", "12xb"}}}}), UsageError);
    REQUIRE_THROWS_AS(Config::from_json({{"proxy", {{"cache_methods", 3}}}}), UsageError);
    REQUIRE_THROWS_AS(
        Config::from_json({{"proxy", {{"cache_methods", nlohmann::json::array({"GET", 1})}}}}),
        UsageError);
}

TEST_CASE("Config::from_json: missing sections keep defaults", "[config]") {
    Config cfg = Config::from_json(nlohmann::json::object());
    REQUIRE(cfg.proxy.listen == "127.0.0.1:8080");
    REQUIRE(cfg.cache.store == "memory");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "middleman_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    static void clear_env() {
        for (const char* name : {"MIDDLEMAN_TARGET", "MIDDLEMAN_LISTEN", "MIDDLEMAN_MAX_AGE",
                                 "MIDDLEMAN_MAX_SIZE", "MIDDLEMAN_STORE",
                                 "MIDDLEMAN_STORE_PATH"}) {
            unsetenv(name);
        }
    }

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        clear_env();
    }

    ~ConfigTestGuard() {
        clear_env();
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.middleman/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.middleman");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "proxy": { "target": "http://backend:8000", "cache_methods": "GET" },
        "cache": { "max_age": 1000, "max_size": "10mb" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target == "http://backend:8000");
    REQUIRE(cfg.proxy.cache_methods == std::vector<std::string>{"GET"});
    REQUIRE(cfg.cache.max_age == 1000);
    REQUIRE(cfg.cache.max_size == 10u * 1024 * 1024);
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"proxy": {"target": "http://elsewhere"}})";
    }

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.proxy.target == "http://elsewhere");
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"proxy": {"target": "http://from-file"}})");
    setenv("MIDDLEMAN_TARGET", "http://from-env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target == "http://from-env");
}

TEST_CASE("Config::load: all env var overrides", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("MIDDLEMAN_TARGET", "http://env", 1);
    setenv("MIDDLEMAN_LISTEN", "127.0.0.1:0", 1);
    setenv("MIDDLEMAN_MAX_AGE", "250", 1);
    setenv("MIDDLEMAN_MAX_SIZE", "2kb", 1);
    setenv("MIDDLEMAN_STORE", "sqlite", 1);
    setenv("MIDDLEMAN_STORE_PATH", "/tmp/env.db", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target == "http://env");
    REQUIRE(cfg.proxy.listen == "127.0.0.1:0");
    REQUIRE(cfg.cache.max_age == 250);
    REQUIRE(cfg.cache.max_size == 2048);
    REQUIRE(cfg.cache.store == "sqlite");
    REQUIRE(cfg.cache.store_path == "/tmp/env.db");
}

TEST_CASE("Config::load: invalid env values throw UsageError", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("MIDDLEMAN_MAX_AGE", "soon", 1);
    REQUIRE_THROWS_AS(Config::load(), UsageError);
    unsetenv("MIDDLEMAN_MAX_AGE");

    setenv("MIDDLEMAN_MAX_SIZE", "big", 1);
    REQUIRE_THROWS_AS(Config::load(), UsageError);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target.empty());
    REQUIRE(cfg.cache.store == "memory");
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    nlohmann::json j = nlohmann::json::parse(g.read_config());

    REQUIRE(j.contains("proxy"));
    REQUIRE(j["proxy"]["listen"] == "127.0.0.1:8080");
    REQUIRE(j["proxy"]["cache_methods"] == "any");
    REQUIRE(j.contains("cache"));
    REQUIRE(j["cache"]["store"] == "memory");
    REQUIRE(j["cache"]["lru"] == true);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"proxy": {"target": "http://kept"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target == "http://kept");

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["proxy"]["target"] == "http://kept");
    REQUIRE(j["proxy"].contains("listen"));
    REQUIRE(j.contains("cache"));
    REQUIRE(j["cache"]["store"] == "memory");
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    // Start from actual defaults, override a few values to prove they survive
    nlohmann::json full = Config::defaults_json();
    full["proxy"]["target"] = "http://backend";
    full["cache"]["max_size"] = "64mb";

    g.write_config(full.dump(4) + "\n");
    std::string before = g.read_config();

    Config cfg = Config::load();
    REQUIRE(cfg.proxy.target == "http://backend");
    REQUIRE(cfg.cache.max_size == 64u * 1024 * 1024);

    // File should be unchanged: no unnecessary rewrite
    REQUIRE(before == g.read_config());
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();

    Config::load();
    REQUIRE(first == g.read_config());
}
