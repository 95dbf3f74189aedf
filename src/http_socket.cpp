// Backend HTTP/HTTPS client using POSIX sockets + OpenSSL.
// One connection per request ("Connection: close"); the body is streamed to
// the caller as it arrives, dechunked when the backend uses chunked framing.
#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS has no such flag.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace middleman {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http_socket: invalid URL: " + url);

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("http_socket: unsupported scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("http_socket: missing host: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return false;
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return false;
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) return false;
        }

        // 1-second slices for body I/O so the abort flag is polled.
        set_socket_timeout(1);
        deadline_slices_ = timeout_secs;
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or timeout.
    // Each expired 1-second slice counts against the request timeout.
    ssize_t read_some(char* buf, size_t len) {
        long idle = 0;
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed))
                return -1;
            if (deadline_slices_ > 0 && idle >= deadline_slices_)
                return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    ++idle;
                    continue;
                }
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    ++idle;
                    continue;
                }
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    ++idle;
                    continue;
                }
                if (errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    long deadline_slices_ = 0;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";

    bool has_host = false;
    bool has_content_length = false;
    for (const auto& h : headers) {
        std::string name = to_lower(h.first);
        // Framing is ours: one request per connection, body sized here.
        if (name == "connection" || name == "transfer-encoding" ||
            name == "keep-alive" || name == "content-length")
            continue;
        if (name == "host") has_host = true;
        req += h.first + ": " + h.second + "\r\n";
    }
    if (!has_host) {
        bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
        req += "Host: " + url.host + (default_port ? "" : ":" + url.port) + "\r\n";
    }
    if (!body.empty() && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// ok is cleared when the connection ends before a full line arrived.
static std::string read_line(Connection& conn, std::string& leftover, bool& ok) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            std::string line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) { ok = false; return ""; }
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    HeaderMap headers;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers. Skips interim 1xx responses.
static bool parse_response_head(Connection& conn, std::string& leftover, ResponseHead& head) {
    bool ok = true;
    while (true) {
        head = ResponseHead{};
        std::string status_line = read_line(conn, leftover, ok);
        if (!ok || status_line.empty()) return false;

        // "HTTP/1.1 200 OK": extract the three-digit code
        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos || sp1 + 4 > status_line.size()) return false;
        std::string code = status_line.substr(sp1 + 1, 3);
        if (!std::all_of(code.begin(), code.end(),
                         [](char c) { return c >= '0' && c <= '9'; }))
            return false;
        head.status = std::stol(code);

        while (true) {
            std::string line = read_line(conn, leftover, ok);
            if (!ok) return false;
            if (line.empty()) break; // blank line → end of headers

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = to_lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            if (name == "transfer-encoding") {
                head.is_chunked = (to_lower(value).find("chunked") != std::string::npos);
            } else if (name == "content-length") {
                char* end = nullptr;
                unsigned long long len = std::strtoull(value.c_str(), &end, 10);
                if (end != value.c_str()) {
                    head.has_length = true;
                    head.content_length = static_cast<size_t>(len);
                }
            }

            auto it = head.headers.find(name);
            if (it == head.headers.end()) head.headers[name] = value;
            else it->second += ", " + value;
        }

        if (head.status >= 100 && head.status < 200 && head.status != 101)
            continue; // interim response, the real one follows
        return true;
    }
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Feed up to `remaining` bytes (or everything until EOF when !bounded) to the callback.
// Returns false on transport failure or when the callback aborted.
static bool pump(Connection& conn, std::string& leftover, bool bounded,
                 size_t remaining, RawChunkCallback& callback) {
    while (!bounded || remaining > 0) {
        if (!leftover.empty()) {
            size_t take = bounded ? std::min(remaining, leftover.size()) : leftover.size();
            if (!callback(leftover.data(), take)) return false;
            leftover.erase(0, take);
            if (bounded) remaining -= take;
            continue;
        }
        char buf[4096];
        size_t want = bounded ? std::min(remaining, sizeof(buf)) : sizeof(buf);
        ssize_t n = conn.read_some(buf, want);
        if (n == 0) return !bounded;     // EOF ends a close-delimited body
        if (n < 0) return false;
        if (!callback(buf, static_cast<size_t>(n))) return false;
        if (bounded) remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Stream body to a RawChunkCallback; dechunks if needed.
static bool stream_body(Connection& conn, std::string& leftover,
                        const ResponseHead& head, RawChunkCallback& callback) {
    if (head.is_chunked) {
        bool ok = true;
        for (;;) {
            std::string size_line = read_line(conn, leftover, ok);
            if (!ok) return false;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) {
                // Trailers until the blank line
                while (ok && !read_line(conn, leftover, ok).empty()) {}
                return true;
            }
            if (!pump(conn, leftover, true, chunk_size, callback)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false;
        }
    }
    if (head.has_length) {
        return pump(conn, leftover, true, head.content_length, callback);
    }
    return pump(conn, leftover, false, 0, callback);
}

static bool bodiless(const std::string& method, long status) {
    return method == "HEAD" || status == 204 || status == 304 ||
           (status >= 100 && status < 200);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::stream(const std::string& method,
                                      const std::string& url,
                                      const std::string& body,
                                      const std::vector<Header>& headers,
                                      HeadCallback on_head,
                                      RawChunkCallback on_chunk,
                                      long timeout_seconds) {
    ParsedUrl parsed_url;
    try {
        parsed_url = parse_url(url);
    } catch (const std::runtime_error&) {
        return {};
    }

    Connection conn;
    if (!conn.connect(parsed_url, timeout_seconds)) return {};

    std::string request = build_request(method, parsed_url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) return {};

    if (on_head) on_head(head.status, head.headers);

    HttpResponse resp;
    resp.headers = head.headers;
    if (!bodiless(method, head.status)) {
        RawChunkCallback sink = on_chunk
            ? std::move(on_chunk)
            : RawChunkCallback([](const char*, size_t) { return true; });
        if (!stream_body(conn, leftover, head, sink)) return resp; // status 0: incomplete
    }
    resp.status_code = head.status;
    return resp;
}

} // namespace middleman
