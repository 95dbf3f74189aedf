#pragma once
#include "http.hpp"
#include "write_buffer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace middleman {

// A captured backend response: what the proxy stores and replays.
struct CachedResponse {
    int status = 200;
    HeaderMap headers;
    Bytes body;

    CachedResponse() = default;
    CachedResponse(int s, HeaderMap h, Bytes b)
        : status(s), headers(std::move(h)), body(std::move(b)) {}

    // Bytes for status, header names and values, and the body.
    uint64_t size() const;

    // {"status": n, "headers": {...}, "body": <binary>}
    nlohmann::json to_json() const;

    // Same with the body as {"type":"Buffer","data":[...]} for text stores.
    nlohmann::json to_portable_json() const;

    // Rebuild from a CachedResponse-like object. body may be binary, an
    // array of byte values, or the tagged Buffer object; header values may
    // be strings or arrays of strings. Throws DecodeError for anything else.
    static CachedResponse parse(const nlohmann::json& obj);

    // parse(JSON text). Throws DecodeError on malformed text.
    static CachedResponse parse_json(const std::string& text);

    // parse_json for strings, parse otherwise.
    static CachedResponse decode(const nlohmann::json& value);
};

bool operator==(const CachedResponse& a, const CachedResponse& b);

} // namespace middleman
