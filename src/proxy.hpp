#pragma once
#include "cache/cache.hpp"
#include "cached_response.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "server.hpp"
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace middleman {

// Cache key for a request. Default: "METHOD:url" (url keeps the query string).
using KeyFunction = std::function<std::string(const HttpRequest& request)>;

// Decides from the backend's status and headers that a response must not be
// cached. Default: never bypass.
using BypassFunction = std::function<bool(long status, const HeaderMap& headers)>;

// Sends the response for a failed request. Default: 500 text/plain.
using ErrorResponder = std::function<void(const HttpRequest& request,
                                          ResponseWriter& response)>;

struct MiddlemanOptions {
    std::string target;                               // required
    HeaderMap set_headers;                            // sent with every proxied request
    std::vector<std::string> cache_methods = {"any"}; // "any" or method names
    long timeout_seconds = 30;
    KeyFunction create_key;
    BypassFunction bypass;
    ErrorResponder http_error;
};

// Reverse-proxy coordinator. For a cacheable request it looks the key up in
// the cache; a hit is replayed, anything else is forwarded to the target while
// the body is streamed to the client and captured. Once the backend response
// completes (and the bypass predicate did not fire) the capture is stored.
//
// Events published on events(): RequestEvent for every request,
// ProxyRequestEvent / CacheRequestEvent for the path taken, ProxyErrorEvent
// for failures, including ones the cache reports in the background.
class Middleman {
public:
    // Throws std::invalid_argument without a target and UsageError for a
    // cache method pattern that is not a valid regular expression.
    Middleman(EventLoop& loop, HttpClient& http, MiddlemanOptions options,
              CacheOptions cache_options = {});
    ~Middleman();

    Middleman(const Middleman&) = delete;
    Middleman& operator=(const Middleman&) = delete;

    // Request entry point. Completes asynchronously on the event loop.
    void handle(std::shared_ptr<const HttpRequest> request,
                std::shared_ptr<ResponseWriter> response);

    // handle() bound to this instance.
    ProxyServer::Handler handler();

    // Start an owned listener. Returns false and populates error on failure.
    bool listen(const std::string& addr, std::string& error,
                uint64_t max_body = 1048576);
    void close();
    ProxyServer* server() { return server_.get(); }

    // Chainable setters; an empty function throws UsageError.
    Middleman& create_key(KeyFunction fn);
    Middleman& bypass(BypassFunction fn);
    Middleman& http_error(ErrorResponder fn);

    bool is_cacheable(const std::string& method) const;
    std::string key_for(const HttpRequest& request) const;
    std::string backend_url(const HttpRequest& request) const;

    Cache& cache() { return *cache_; }
    EventBus& events() { return events_; }

private:
    void forward(const std::shared_ptr<const HttpRequest>& request,
                 const std::shared_ptr<ResponseWriter>& response,
                 bool capture, const std::string& key);
    void send_cached(const CacheEntry& entry,
                     const std::shared_ptr<const HttpRequest>& request,
                     const std::shared_ptr<ResponseWriter>& response);
    void error_response(const HttpRequest& request, ResponseWriter& response);
    void publish_error(const std::string& message, std::exception_ptr error);

    EventLoop& loop_;
    HttpClient& http_;
    std::string target_;
    HeaderMap set_headers_;
    std::vector<std::regex> cache_methods_;
    long timeout_seconds_;
    KeyFunction create_key_;
    BypassFunction bypass_;
    ErrorResponder http_error_;

    EventBus events_;
    std::unique_ptr<Cache> cache_;
    ScopedSubscription cache_errors_;
    std::unique_ptr<ProxyServer> server_;
};

} // namespace middleman
