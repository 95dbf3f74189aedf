#pragma once
#include "event_loop.hpp"
#include "http.hpp"
#include <string>
#include <functional>
#include <memory>
#include <atomic>
#include <thread>
#include <cstdint>

namespace middleman {

// ResponseWriter over an accepted client socket. The head is held back until
// the first body byte or end(), so end(body) can add Content-Length.
// Hop-by-hop headers are dropped and every response closes the connection.
class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    void write_head(int status, const HeaderMap& headers) override;
    bool write(const char* data, size_t len) override;
    void end(const std::string& body = "") override;

    bool head_sent() const override { return head_started_; }
    bool finished() const override { return finished_; }

    // Socket is about to be closed; later writes are no-ops.
    void detach() { fd_ = -1; }

private:
    bool send_all(const char* data, size_t len);
    bool flush_head(const std::string* final_body);

    int fd_;
    int status_ = 200;
    HeaderMap headers_;
    bool head_started_ = false;
    bool head_flushed_ = false;
    bool finished_ = false;
};

// Single-threaded TCP HTTP listener in front of the coordinator. Handles one
// connection at a time on a background accept thread. Each request is handed
// to the handler as a task on the event loop, and the loop is driven until
// the response is finished.
class ProxyServer {
public:
    using Handler = std::function<void(std::shared_ptr<const HttpRequest>,
                                       std::shared_ptr<ResponseWriter>)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8080"; port 0 picks a free port
    // max_body:    maximum request body size in bytes; larger bodies get 413
    ProxyServer(std::string listen_addr, uint64_t max_body,
                EventLoop& loop, Handler handler);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it.
    void stop();

    // Bound port (valid after a successful start).
    uint16_t port() const { return port_; }
    bool running() const { return running_.load(); }

private:
    void accept_loop();
    void handle_connection(int client_fd);

    std::string listen_addr_;
    uint64_t    max_body_;
    EventLoop&  loop_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t port_         = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range (0 is accepted).
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace middleman
