#include "proxy.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <stdexcept>

namespace middleman {

static std::regex compile_method(const std::string& method) {
    try {
        if (method == "any") return std::regex("\\w+");
        return std::regex(method, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw UsageError("invalid cache method '" + method + "': " + e.what());
    }
}

static bool is_protocol_error(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const StoreProtocolError&) {
        return true;
    } catch (...) {
        return false;
    }
}

Middleman::Middleman(EventLoop& loop, HttpClient& http, MiddlemanOptions options,
                     CacheOptions cache_options)
    : loop_(loop),
      http_(http),
      target_(std::move(options.target)),
      set_headers_(std::move(options.set_headers)),
      timeout_seconds_(options.timeout_seconds),
      create_key_(std::move(options.create_key)),
      bypass_(std::move(options.bypass)),
      http_error_(std::move(options.http_error)) {
    if (target_.empty()) {
        throw std::invalid_argument("Middleman requires a target");
    }
    for (const auto& method : options.cache_methods) {
        cache_methods_.push_back(compile_method(method));
    }
    if (!create_key_) {
        create_key_ = [](const HttpRequest& req) { return req.method + ":" + req.url; };
    }
    if (!bypass_) {
        bypass_ = [](long, const HeaderMap&) { return false; };
    }

    HeaderMap lowered;
    for (const auto& [name, value] : set_headers_) lowered[to_lower(name)] = value;
    set_headers_ = std::move(lowered);

    cache_ = std::make_unique<Cache>(loop_, std::move(cache_options));
    cache_errors_ = ScopedSubscription(cache_->events(),
        subscribe<CacheErrorEvent>(cache_->events(), [this](const CacheErrorEvent& ev) {
            publish_error("cache: " + ev.message, ev.error);
        }));
}

Middleman::~Middleman() {
    close();
}

// ── Configuration ──────────────────────────────────────────────

Middleman& Middleman::create_key(KeyFunction fn) {
    if (!fn) throw UsageError("create_key requires a function");
    create_key_ = std::move(fn);
    return *this;
}

Middleman& Middleman::bypass(BypassFunction fn) {
    if (!fn) throw UsageError("bypass requires a function");
    bypass_ = std::move(fn);
    return *this;
}

Middleman& Middleman::http_error(ErrorResponder fn) {
    if (!fn) throw UsageError("http_error requires a function");
    http_error_ = std::move(fn);
    return *this;
}

bool Middleman::is_cacheable(const std::string& method) const {
    for (const auto& pattern : cache_methods_) {
        if (std::regex_match(method, pattern)) return true;
    }
    return false;
}

std::string Middleman::key_for(const HttpRequest& request) const {
    return create_key_(request);
}

std::string Middleman::backend_url(const HttpRequest& request) const {
    return url_join(target_, request.url);
}

// ── Serving ────────────────────────────────────────────────────

ProxyServer::Handler Middleman::handler() {
    return [this](std::shared_ptr<const HttpRequest> request,
                  std::shared_ptr<ResponseWriter> response) {
        handle(std::move(request), std::move(response));
    };
}

bool Middleman::listen(const std::string& addr, std::string& error, uint64_t max_body) {
    close();
    server_ = std::make_unique<ProxyServer>(addr, max_body, loop_, handler());
    if (!server_->start(error)) {
        server_.reset();
        return false;
    }
    return true;
}

void Middleman::close() {
    if (server_) {
        server_->stop();
        server_.reset();
    }
}

void Middleman::handle(std::shared_ptr<const HttpRequest> request,
                       std::shared_ptr<ResponseWriter> response) {
    RequestEvent received;
    received.request = request;
    received.response = response;
    events_.publish(received);

    if (!is_cacheable(request->method)) {
        ProxyRequestEvent ev;
        ev.request = request;
        ev.response = response;
        events_.publish(ev);
        forward(request, response, false, "");
        return;
    }

    std::string key = key_for(*request);
    cache_->get(key, [this, request, response, key](Result<CacheLookup> result) {
        if (!result.ok()) {
            // Protocol violations were already reported by the cache.
            if (!is_protocol_error(result.error())) {
                publish_error("cache lookup failed for " + key, result.error());
            }
            error_response(*request, *response);
            return;
        }

        const CacheLookup& lookup = result.value();
        if (!lookup) {
            ProxyRequestEvent ev;
            ev.request = request;
            ev.response = response;
            events_.publish(ev);
            forward(request, response, true, key);
            return;
        }

        CacheRequestEvent ev;
        ev.request = request;
        ev.response = response;
        events_.publish(ev);
        send_cached(lookup.entry, request, response);
    });
}

void Middleman::forward(const std::shared_ptr<const HttpRequest>& request,
                        const std::shared_ptr<ResponseWriter>& response,
                        bool capture, const std::string& key) {
    std::vector<Header> headers;
    for (const auto& [name, value] : request->headers) {
        if (name == "host" || name == "connection") continue;
        if (set_headers_.count(name)) continue;
        headers.emplace_back(name, value);
    }
    for (const auto& [name, value] : set_headers_) {
        headers.emplace_back(name, value);
    }

    const std::string url = backend_url(*request);
    WriteBuffer body;
    bool cacheable = capture;
    long status = 0;
    HeaderMap response_headers;

    HttpResponse result = http_.stream(
        request->method, url, request->body, headers,
        [&](long s, const HeaderMap& h) {
            status = s;
            response_headers = h;
            if (cacheable && bypass_(s, h)) cacheable = false;
            response->write_head(static_cast<int>(s), h);
        },
        [&](const char* data, size_t len) {
            if (cacheable) body.write(data, len);
            return response->write(data, len);
        },
        timeout_seconds_);

    if (result.status_code == 0) {
        body.close();
        publish_error("proxy request failed: " + request->method + " " + url,
                      std::make_exception_ptr(std::runtime_error(
                          "backend request to " + url + " did not complete")));
        if (!response->head_sent()) {
            error_response(*request, *response);
        } else {
            response->end();
        }
        return;
    }

    response->end();

    if (!cacheable) {
        body.close();
        return;
    }

    CachedResponse cached(static_cast<int>(status), std::move(response_headers),
                          body.to_bytes());
    body.close();
    cache_->set(key, cached.to_json(), [this, key](Result<CacheEntry> stored) {
        if (!stored.ok()) {
            publish_error("cache set failed for " + key, stored.error());
        }
    });
}

void Middleman::send_cached(const CacheEntry& entry,
                            const std::shared_ptr<const HttpRequest>& request,
                            const std::shared_ptr<ResponseWriter>& response) {
    CachedResponse cached;
    try {
        cached = CachedResponse::decode(entry.value);
    } catch (const DecodeError&) {
        publish_error("Invalid cache value", std::current_exception());
        error_response(*request, *response);
        return;
    }
    response->write_head(cached.status, cached.headers);
    response->end(std::string(cached.body.begin(), cached.body.end()));
}

void Middleman::error_response(const HttpRequest& request, ResponseWriter& response) {
    if (http_error_) {
        http_error_(request, response);
        return;
    }
    response.write_head(500, {{"content-type", "text/plain"}});
    response.end("Internal Server Error");
}

void Middleman::publish_error(const std::string& message, std::exception_ptr error) {
    ProxyErrorEvent ev;
    ev.message = message;
    ev.error = std::move(error);
    events_.publish(ev);
}

} // namespace middleman
