#include "server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace middleman {

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;

    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    long p = std::strtol(digits.c_str(), nullptr, 10);
    if (p < 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── SocketResponseWriter ──────────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

static bool is_hop_by_hop(const std::string& name) {
    return name == "connection" || name == "keep-alive" ||
           name == "proxy-connection" || name == "transfer-encoding" ||
           name == "te" || name == "trailer" || name == "upgrade";
}

bool SocketResponseWriter::send_all(const char* data, size_t len) {
    while (len > 0) {
        if (fd_ < 0) return false;
        ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void SocketResponseWriter::write_head(int status, const HeaderMap& headers) {
    if (head_started_ || finished_) return;
    status_ = status;
    for (const auto& [name, value] : headers) {
        headers_[to_lower(name)] = value;
    }
    head_started_ = true;
}

bool SocketResponseWriter::flush_head(const std::string* final_body) {
    head_flushed_ = true;

    std::string head = "HTTP/1.1 " + std::to_string(status_) + " " +
                       reason_phrase(status_) + "\r\n";
    for (const auto& [name, value] : headers_) {
        if (is_hop_by_hop(name)) continue;
        head += name + ": " + value + "\r\n";
    }
    if (final_body && headers_.find("content-length") == headers_.end()) {
        head += "content-length: " + std::to_string(final_body->size()) + "\r\n";
    }
    head += "connection: close\r\n\r\n";
    return send_all(head.data(), head.size());
}

bool SocketResponseWriter::write(const char* data, size_t len) {
    if (finished_) return false;
    if (!head_started_) write_head(200, {});
    if (!head_flushed_ && !flush_head(nullptr)) return false;
    return send_all(data, len);
}

void SocketResponseWriter::end(const std::string& body) {
    if (finished_) return;
    if (!head_started_) write_head(200, {});
    if (!head_flushed_) flush_head(&body);
    if (!body.empty()) send_all(body.data(), body.size());
    finished_ = true;
}

// ── ProxyServer ───────────────────────────────────────────────────────────────

ProxyServer::ProxyServer(std::string listen_addr,
                         uint64_t max_body,
                         EventLoop& loop,
                         Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , loop_(loop)
    , handler_(std::move(handler))
{}

ProxyServer::~ProxyServer() {
    stop();
}

bool ProxyServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [this, &error](const std::string& message) {
        error = message;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1)
        return fail("Invalid bind address: " + host);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0)
        return fail(std::string("bind failed: ") + std::strerror(errno));

    if (::listen(server_fd_, 16) != 0)
        return fail("listen failed");

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) != 0)
        return fail("getsockname failed");
    port_ = ntohs(bound.sin_port);

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void ProxyServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;  // the interrupt below wakes a busy loop either way
    }
    loop_.interrupt();
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void ProxyServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd >= 0) {
            struct timeval tv{10, 0};  // 10s recv timeout
            ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            handle_connection(cfd);
            ::close(cfd);
        }
    }
}

// ── Request handling ──────────────────────────────────────────────────────────

static void send_plain(int fd, int status, const std::string& body) {
    SocketResponseWriter writer(fd);
    writer.write_head(status, {{"content-type", "text/plain"}});
    writer.end(body);
}

void ProxyServer::handle_connection(int fd) {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_plain(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string ver;
        if (!(ss >> req.method >> req.url >> ver)) {
            send_plain(fd, 400, "Bad Request");
            return;
        }
        auto q = req.url.find('?');
        req.path = (q == std::string::npos) ? req.url : req.url.substr(0, q);
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body for any method that declares one.
    auto cl = req.headers.find("content-length");
    if (cl != req.headers.end()) {
        char* end = nullptr;
        unsigned long long content_len = std::strtoull(cl->second.c_str(), &end, 10);
        if (end == cl->second.c_str()) {
            send_plain(fd, 400, "Bad Content-Length");
            return;
        }
        if (content_len > max_body_) {
            send_plain(fd, 413, "Payload too large");
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) break;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(static_cast<size_t>(content_len));
    }

    auto request = std::make_shared<const HttpRequest>(std::move(req));
    auto writer = std::make_shared<SocketResponseWriter>(fd);

    try {
        loop_.post([this, request, writer]() { handler_(request, writer); });
        loop_.run_until([this, &writer]() { return writer->finished() || !running_.load(); });
        // Out-of-band work (cache population) settles before the next request.
        if (running_.load()) loop_.run();
    } catch (const std::exception& e) {
        std::cerr << "[server] " << request->method << " " << request->url
                  << " failed: " << e.what() << "\n";
        if (!writer->head_sent()) {
            writer->write_head(500, {{"content-type", "text/plain"}});
            writer->end("Internal Server Error");
        } else {
            writer->end();
        }
    }
    writer->detach();
}

} // namespace middleman
