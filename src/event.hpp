#pragma once
#include "http.hpp"
#include <exception>
#include <memory>
#include <string>

namespace middleman {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CacheDelete  = "CacheDelete";
    constexpr const char* CacheError   = "CacheError";
    constexpr const char* Request      = "Request";
    constexpr const char* ProxyRequest = "ProxyRequest";
    constexpr const char* CacheRequest = "CacheRequest";
    constexpr const char* ProxyError   = "ProxyError";
} // namespace event_tags

// ── Cache engine events ─────────────────────────────────────────

// A key was evicted and its store record removed.
struct CacheDeleteEvent : Event {
    static constexpr const char* TAG = event_tags::CacheDelete;
    std::string key;

    CacheDeleteEvent() { type_tag = TAG; }
};

// A store operation without a caller failed, or the store returned
// something that is not a cache entry.
struct CacheErrorEvent : Event {
    static constexpr const char* TAG = event_tags::CacheError;
    std::string key;
    std::string message;
    std::exception_ptr error;

    CacheErrorEvent() { type_tag = TAG; }
};

// ── Coordinator events ──────────────────────────────────────────

struct RequestEvent : Event {
    static constexpr const char* TAG = event_tags::Request;
    std::shared_ptr<const HttpRequest> request;
    std::shared_ptr<ResponseWriter> response;

    RequestEvent() { type_tag = TAG; }
};

// Request is being forwarded to the backend.
struct ProxyRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ProxyRequest;
    std::shared_ptr<const HttpRequest> request;
    std::shared_ptr<ResponseWriter> response;

    ProxyRequestEvent() { type_tag = TAG; }
};

// Request is being answered from the cache.
struct CacheRequestEvent : Event {
    static constexpr const char* TAG = event_tags::CacheRequest;
    std::shared_ptr<const HttpRequest> request;
    std::shared_ptr<ResponseWriter> response;

    CacheRequestEvent() { type_tag = TAG; }
};

struct ProxyErrorEvent : Event {
    static constexpr const char* TAG = event_tags::ProxyError;
    std::string message;
    std::exception_ptr error;

    ProxyErrorEvent() { type_tag = TAG; }
};

} // namespace middleman
