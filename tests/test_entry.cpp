#include <catch2/catch.hpp>
#include "cache/entry.hpp"

using namespace middleman;
using json = nlohmann::json;

// ── estimate_size ────────────────────────────────────────────────

TEST_CASE("estimate_size: scalars", "[entry]") {
    REQUIRE(estimate_size(json(nullptr)) == 0);
    REQUIRE(estimate_size(json(true)) == 4);
    REQUIRE(estimate_size(json(42)) == 8);
    REQUIRE(estimate_size(json(-1)) == 8);
    REQUIRE(estimate_size(json(3.5)) == 8);
    REQUIRE(estimate_size(json("hello")) == 5);
}

TEST_CASE("estimate_size: containers sum their members", "[entry]") {
    REQUIRE(estimate_size(json::array({"ab", 1, true})) == 2 + 8 + 4);
    REQUIRE(estimate_size(json{{"k", "vvv"}, {"n", 1}}) == (1 + 3) + (1 + 8));
    REQUIRE(estimate_size(json::binary({1, 2, 3})) == 3);
    REQUIRE(estimate_size(json::object()) == 0);
}

TEST_CASE("estimate_size: tagged Buffer counts its bytes", "[entry]") {
    json tagged = {{"type", "Buffer"}, {"data", json::array({1, 2, 3})}};
    REQUIRE(estimate_size(tagged) == 3);

    json native = {{"status", 200}, {"body", json::binary({1, 2, 3, 4, 5})}};
    REQUIRE(estimate_size(to_portable_json(native)) == estimate_size(native));

    // Extra members make it an ordinary object.
    json other = {{"type", "Buffer"}, {"data", json::array({1})}, {"x", 1}};
    REQUIRE(estimate_size(other) == (4 + 6) + (4 + 8) + (1 + 8));
}

TEST_CASE("CacheEntry: size follows the value", "[entry]") {
    CacheEntry e;
    e.key = "a-much-longer-key-that-does-not-count";
    e.value = "12345";
    REQUIRE(e.size() == 5);
}

// ── entry_to_json / entry_from_json ──────────────────────────────

TEST_CASE("entry_to_json: wire shape", "[entry]") {
    CacheEntry e;
    e.key = "GET:/a";
    e.value = json{{"x", 1}};
    e.created = 1700000000000ull;

    json j = entry_to_json(e);
    REQUIRE(j["key"] == "GET:/a");
    REQUIRE(j["value"]["x"] == 1);
    REQUIRE(j["created"] == 1700000000000ull);
}

TEST_CASE("entry_from_json: accepts the object form", "[entry]") {
    auto e = entry_from_json(json{{"key", "k"}, {"value", "v"}, {"created", 10}});
    REQUIRE(e.has_value());
    REQUIRE(e->key == "k");
    REQUIRE(e->value == "v");
    REQUIRE(e->created == 10);
}

TEST_CASE("entry_from_json: accepts JSON text", "[entry]") {
    auto e = entry_from_json(json(R"({"key":"k","value":[1,2],"created":5})"));
    REQUIRE(e.has_value());
    REQUIRE(e->value == json::array({1, 2}));
    REQUIRE(e->created == 5);
}

TEST_CASE("entry_from_json: null value is still an entry", "[entry]") {
    auto e = entry_from_json(json{{"key", "k"}, {"value", nullptr}, {"created", 0}});
    REQUIRE(e.has_value());
    REQUIRE(e->value.is_null());
}

TEST_CASE("entry_from_json: rejects wrong shapes", "[entry]") {
    REQUIRE_FALSE(entry_from_json(json("plain text")).has_value());
    REQUIRE_FALSE(entry_from_json(json(12)).has_value());
    REQUIRE_FALSE(entry_from_json(json::array()).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"value", 1}, {"created", 1}}).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"key", 1}, {"value", 1}, {"created", 1}}).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"key", "k"}, {"created", 1}}).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"key", "k"}, {"value", 1}}).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"key", "k"}, {"value", 1}, {"created", "x"}}).has_value());
    REQUIRE_FALSE(entry_from_json(json{{"key", "k"}, {"value", 1}, {"created", -3}}).has_value());
}

TEST_CASE("entry_from_json: created must fit in 64 bits", "[entry]") {
    auto ok = entry_from_json(json{{"key", "k"}, {"value", 1}, {"created", 1.7e12}});
    REQUIRE(ok.has_value());
    REQUIRE(ok->created == 1700000000000ull);

    REQUIRE_FALSE(entry_from_json(json{{"key", "k"}, {"value", 1}, {"created", 1e30}}).has_value());
    REQUIRE_FALSE(entry_from_json(json(R"({"key":"k","value":1,"created":1.8446744073709552e19})")).has_value());
}

// ── to_portable_json ─────────────────────────────────────────────

TEST_CASE("to_portable_json: binary becomes a tagged Buffer", "[entry]") {
    json v = json{{"status", 200}, {"body", json::binary({104, 105})}};
    json p = to_portable_json(v);

    REQUIRE(p["status"] == 200);
    REQUIRE(p["body"]["type"] == "Buffer");
    REQUIRE(p["body"]["data"] == json::array({104, 105}));
    REQUIRE_NOTHROW(p.dump());
}

TEST_CASE("to_portable_json: nested arrays are rewritten too", "[entry]") {
    json v = json::array({json::binary({1}), "s"});
    json p = to_portable_json(v);
    REQUIRE(p[0]["type"] == "Buffer");
    REQUIRE(p[1] == "s");
}
