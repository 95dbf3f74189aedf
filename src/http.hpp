#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <utility>
#include <atomic>

namespace middleman {

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

// Header names are lowercased on the way in.
using HeaderMap = std::map<std::string, std::string>;

// ── Inbound side (listener → coordinator) ───────────────────────

struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string url;      // path + query exactly as received, e.g. "/a?b=1"
    std::string path;     // url without the query string
    HeaderMap   headers;
    std::string body;
};

// Sink for the response to an inbound request. Implemented over a socket by
// the listener and by recording doubles in tests.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void write_head(int status, const HeaderMap& headers) = 0;

    // Append body bytes; sends a 200 head first if none went out yet.
    // Returns false once the client is gone.
    virtual bool write(const char* data, size_t len) = 0;

    // Finish the response, optionally appending a last piece of body.
    virtual void end(const std::string& body = "") = 0;

    virtual bool head_sent() const = 0;
    virtual bool finished() const = 0;
};

// ── Outbound side (coordinator → backend) ───────────────────────

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure
    HeaderMap headers;
};

// Called once with the backend's status and headers, before any body chunk.
using HeadCallback = std::function<void(long status, const HeaderMap& headers)>;

// Raw-chunk streaming callback: receives decoded body bytes.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

using Header = std::pair<std::string, std::string>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse stream(const std::string& method,
                                const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                HeadCallback on_head,
                                RawChunkCallback on_chunk,
                                long timeout_seconds = 30) = 0;
};

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse stream(const std::string& method,
                        const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        HeadCallback on_head,
                        RawChunkCallback on_chunk,
                        long timeout_seconds = 30) override;
};

} // namespace middleman
