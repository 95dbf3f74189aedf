#include <catch2/catch.hpp>
#include "plugin.hpp"
#include "stores/memory_store.hpp"
#include "stores/sqlite_store.hpp"

using namespace middleman;

// Tests use unique prefixed names to avoid colliding with real registrations.
// We never call clear() on the global singleton since it would destroy
// the static registrations from the store .cpp files.

// ── Built-in static registrations ───────────────────────────────

TEST_CASE("StoreRegistry: built-in stores are registered", "[plugin]") {
    auto& reg = StoreRegistry::instance();
    REQUIRE(reg.has_store("memory"));
    REQUIRE(reg.has_store("sqlite"));
}

TEST_CASE("StoreRegistry: store_names returns sorted list", "[plugin]") {
    auto names = StoreRegistry::instance().store_names();
    REQUIRE(names.size() >= 2);
    for (size_t i = 1; i < names.size(); i++) {
        REQUIRE(names[i - 1] <= names[i]);
    }
}

// ── Creation ────────────────────────────────────────────────────

TEST_CASE("StoreRegistry: create memory store", "[plugin]") {
    Config cfg;
    EventLoop loop;
    auto store = StoreRegistry::instance().create_store("memory", cfg, loop);
    REQUIRE(store != nullptr);
    REQUIRE(store->backend_name() == "memory");
}

TEST_CASE("StoreRegistry: create sqlite store at configured path", "[plugin]") {
    Config cfg;
    cfg.cache.store = "sqlite";
    cfg.cache.store_path = ":memory:";
    EventLoop loop;

    auto store = create_store(cfg, loop);
    REQUIRE(store != nullptr);
    REQUIRE(store->backend_name() == "sqlite");
}

TEST_CASE("StoreRegistry: create unknown store throws", "[plugin]") {
    Config cfg;
    EventLoop loop;
    REQUIRE_THROWS_AS(
        StoreRegistry::instance().create_store("_nonexistent_store", cfg, loop),
        std::invalid_argument);

    cfg.cache.store = "_nonexistent_store";
    REQUIRE_THROWS_AS(create_store(cfg, loop), std::invalid_argument);
}

// ── Custom registration ─────────────────────────────────────────

TEST_CASE("StoreRegistry: register and create custom store", "[plugin]") {
    auto& reg = StoreRegistry::instance();
    int created = 0;

    reg.register_store("_test_store", [&created](const Config&, EventLoop& loop) {
        created++;
        return std::make_unique<MemoryStore>(loop);
    });
    REQUIRE(reg.has_store("_test_store"));

    Config cfg;
    EventLoop loop;
    auto store = reg.create_store("_test_store", cfg, loop);
    REQUIRE(store != nullptr);
    REQUIRE(created == 1);
}

TEST_CASE("StoreRegistry: re-registering replaces the factory", "[plugin]") {
    auto& reg = StoreRegistry::instance();
    std::string which;

    reg.register_store("_test_replace", [&which](const Config&, EventLoop& loop) {
        which = "first";
        return std::make_unique<MemoryStore>(loop);
    });
    reg.register_store("_test_replace", [&which](const Config&, EventLoop& loop) {
        which = "second";
        return std::make_unique<MemoryStore>(loop);
    });

    Config cfg;
    EventLoop loop;
    reg.create_store("_test_replace", cfg, loop);
    REQUIRE(which == "second");
}
