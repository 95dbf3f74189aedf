#include <catch2/catch.hpp>
#include "cached_response.hpp"
#include "errors.hpp"

using namespace middleman;
using json = nlohmann::json;

namespace {

std::string body_text(const CachedResponse& r) {
    return std::string(r.body.begin(), r.body.end());
}

} // namespace

// ── parse ────────────────────────────────────────────────────────

TEST_CASE("CachedResponse: parse byte array body", "[cached_response]") {
    auto r = CachedResponse::parse(
        json{{"status", 200}, {"headers", json::object()}, {"body", {116, 101, 115, 116}}});
    REQUIRE(r.status == 200);
    REQUIRE(r.headers.empty());
    REQUIRE(body_text(r) == "test");
}

TEST_CASE("CachedResponse: parse tagged Buffer body", "[cached_response]") {
    auto r = CachedResponse::parse(json{
        {"status", 404},
        {"headers", {{"content-type", "text/plain"}}},
        {"body", {{"type", "Buffer"}, {"data", {110, 111}}}}});
    REQUIRE(r.status == 404);
    REQUIRE(r.headers.at("content-type") == "text/plain");
    REQUIRE(body_text(r) == "no");
}

TEST_CASE("CachedResponse: parse binary body", "[cached_response]") {
    auto r = CachedResponse::parse(
        json{{"status", 200}, {"headers", json::object()}, {"body", json::binary({0, 1, 2})}});
    REQUIRE(r.body == Bytes{0, 1, 2});
}

TEST_CASE("CachedResponse: header arrays are joined", "[cached_response]") {
    auto r = CachedResponse::parse(json{
        {"status", 200},
        {"headers", {{"set-cookie", json::array({"a=1", "b=2"})}}},
        {"body", json::array()}});
    REQUIRE(r.headers.at("set-cookie") == "a=1, b=2");
}

TEST_CASE("CachedResponse: parse rejects invalid shapes", "[cached_response]") {
    REQUIRE_THROWS_AS(CachedResponse::parse(json("text")), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(json::object()), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(
        json{{"status", "200"}, {"headers", json::object()}, {"body", json::array()}}),
        DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(
        json{{"status", 200}, {"headers", json::array()}, {"body", json::array()}}),
        DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(
        json{{"status", 200}, {"headers", json::object()}}),
        DecodeError);
}

TEST_CASE("CachedResponse: parse rejects invalid bodies", "[cached_response]") {
    auto with_body = [](json body) {
        return json{{"status", 200}, {"headers", json::object()}, {"body", std::move(body)}};
    };
    REQUIRE_THROWS_AS(CachedResponse::parse(with_body(json::object())), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(with_body("test")), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(with_body({1, 256})), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(with_body({1, -1})), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(with_body({"a"})), DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(
        with_body({{"type", "Blob"}, {"data", {1}}})), DecodeError);
}

TEST_CASE("CachedResponse: parse rejects non-string header values", "[cached_response]") {
    REQUIRE_THROWS_AS(CachedResponse::parse(json{
        {"status", 200}, {"headers", {{"x-count", 3}}}, {"body", json::array()}}),
        DecodeError);
    REQUIRE_THROWS_AS(CachedResponse::parse(json{
        {"status", 200}, {"headers", {{"x-list", json::array({"a", 1})}}}, {"body", json::array()}}),
        DecodeError);
}

// ── parse_json / decode ──────────────────────────────────────────

TEST_CASE("CachedResponse: parse_json", "[cached_response]") {
    auto r = CachedResponse::parse_json(
        R"({"status":201,"headers":{"x":"y"},"body":[104,105]})");
    REQUIRE(r.status == 201);
    REQUIRE(r.headers.at("x") == "y");
    REQUIRE(body_text(r) == "hi");

    REQUIRE_THROWS_AS(CachedResponse::parse_json("{not json"), DecodeError);
}

TEST_CASE("CachedResponse: decode accepts objects and JSON text", "[cached_response]") {
    CachedResponse original(200, {{"content-type", "text/html"}}, Bytes{'o', 'k'});

    REQUIRE(CachedResponse::decode(original.to_json()) == original);
    REQUIRE(CachedResponse::decode(json(original.to_portable_json().dump())) == original);
}

// ── serialization ────────────────────────────────────────────────

TEST_CASE("CachedResponse: to_json carries a binary body", "[cached_response]") {
    CachedResponse r(200, {{"a", "b"}}, Bytes{1, 2});
    json j = r.to_json();
    REQUIRE(j["status"] == 200);
    REQUIRE(j["headers"]["a"] == "b");
    REQUIRE(j["body"].is_binary());
}

TEST_CASE("CachedResponse: portable form tags the body", "[cached_response]") {
    CachedResponse r(200, {}, Bytes{116, 101, 115, 116});
    json j = r.to_portable_json();
    REQUIRE(j["body"]["type"] == "Buffer");
    REQUIRE(j["body"]["data"] == json::array({116, 101, 115, 116}));
    REQUIRE_NOTHROW(j.dump());
}

TEST_CASE("CachedResponse: size counts status, headers and body", "[cached_response]") {
    CachedResponse r(200, {{"ab", "cde"}}, Bytes{1, 2, 3, 4});
    REQUIRE(r.size() == 8 + 2 + 3 + 4);
    REQUIRE(CachedResponse().size() == 8);
}

TEST_CASE("CachedResponse: defaults", "[cached_response]") {
    CachedResponse r;
    REQUIRE(r.status == 200);
    REQUIRE(r.headers.empty());
    REQUIRE(r.body.empty());
}
