#include "config.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "proxy.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: middleman [options]\n"
              << "\n"
              << "Options:\n"
              << "  --target URL         Backend to proxy for (overrides proxy.target)\n"
              << "  --listen HOST:PORT   Listen address (default: 127.0.0.1:8080)\n"
              << "  --config PATH        Config file (default: ~/.middleman/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MIDDLEMAN_TARGET     Backend URL\n"
              << "  MIDDLEMAN_LISTEN     Listen address\n"
              << "  MIDDLEMAN_MAX_AGE    Max cache entry age in milliseconds (0 = no limit)\n"
              << "  MIDDLEMAN_MAX_SIZE   Max cache size, e.g. 512kb, 64MB (empty = no limit)\n"
              << "  MIDDLEMAN_STORE      Cache store backend (memory, sqlite)\n"
              << "  MIDDLEMAN_STORE_PATH SQLite database path\n";
}

static void attach_logging(middleman::Middleman& proxy) {
    using namespace middleman;

    subscribe<RequestEvent>(proxy.events(),
        [](const RequestEvent& ev) {
            std::cerr << "[proxy] " << ev.request->method << " " << ev.request->url << "\n";
        });
    subscribe<ProxyRequestEvent>(proxy.events(),
        [](const ProxyRequestEvent& ev) {
            std::cerr << "[proxy] forward " << ev.request->url << "\n";
        });
    subscribe<CacheRequestEvent>(proxy.events(),
        [](const CacheRequestEvent& ev) {
            std::cerr << "[cache] hit " << ev.request->url << "\n";
        });
    subscribe<ProxyErrorEvent>(proxy.events(),
        [](const ProxyErrorEvent& ev) {
            std::cerr << "[proxy] error: " << ev.message;
            std::string detail = error_message(ev.error);
            if (!detail.empty() && detail != ev.message) std::cerr << " (" << detail << ")";
            std::cerr << "\n";
        });
    subscribe<CacheDeleteEvent>(proxy.cache().events(),
        [](const CacheDeleteEvent& ev) {
            std::cerr << "[cache] evicted " << ev.key << "\n";
        });
}

int main(int argc, char* argv[]) try {
    std::string target;
    std::string listen;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--target") == 0 && i + 1 < argc) {
            target = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty()
        ? middleman::Config::load()
        : middleman::Config::load_from(config_path);

    // Override config with CLI args
    if (!target.empty()) config.proxy.target = target;
    if (!listen.empty()) config.proxy.listen = listen;

    if (config.proxy.target.empty()) {
        std::cerr << "Error: no target configured (use --target or MIDDLEMAN_TARGET)\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    middleman::http_set_abort_flag(&g_shutdown);

    middleman::EventLoop loop;
    middleman::SocketHttpClient http_client;

    middleman::CacheOptions cache_options;
    cache_options.max_age_ms = config.cache.max_age;
    cache_options.max_size_bytes = config.cache.max_size;
    cache_options.lru = config.cache.lru;
    try {
        cache_options.store = middleman::create_store(config, loop);
    } catch (const std::exception& e) {
        std::cerr << "Error creating store '" << config.cache.store << "': " << e.what() << "\n";
        return 1;
    }

    middleman::MiddlemanOptions options;
    options.target = config.proxy.target;
    options.cache_methods = config.proxy.cache_methods;
    options.timeout_seconds = static_cast<long>(config.proxy.timeout);
    for (const auto& [name, value] : config.proxy.set_headers) {
        options.set_headers[name] = value;
    }

    middleman::Middleman proxy(loop, http_client, std::move(options), std::move(cache_options));
    attach_logging(proxy);

    std::string error;
    if (!proxy.listen(config.proxy.listen, error, config.proxy.max_body)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::cerr << "[server] Proxying " << config.proxy.target << " on "
              << config.proxy.listen << " (store: " << proxy.cache().store().backend_name()
              << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down\n";
    proxy.close();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
