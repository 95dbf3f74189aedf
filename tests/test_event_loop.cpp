#include <catch2/catch.hpp>
#include "async.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace middleman;

// ── EventLoop ────────────────────────────────────────────────────

TEST_CASE("EventLoop: runs tasks in FIFO order", "[event_loop]") {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() { order.push_back(1); });
    loop.post([&]() { order.push_back(2); });
    loop.post([&]() { order.push_back(3); });

    REQUIRE(loop.pending() == 3);
    REQUIRE(loop.run() == 3);
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(loop.pending() == 0);
}

TEST_CASE("EventLoop: tasks posted while draining run after queued ones", "[event_loop]") {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() {
        order.push_back(1);
        loop.post([&]() { order.push_back(3); });
    });
    loop.post([&]() { order.push_back(2); });

    loop.run();
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("EventLoop: run_one on empty queue", "[event_loop]") {
    EventLoop loop;
    REQUIRE_FALSE(loop.run_one());
}

TEST_CASE("EventLoop: run_until stops when the predicate holds", "[event_loop]") {
    EventLoop loop;
    int count = 0;
    for (int i = 0; i < 5; i++) loop.post([&]() { count++; });

    loop.run_until([&]() { return count == 2; });
    REQUIRE(count == 2);
    REQUIRE(loop.pending() == 3);
}

TEST_CASE("EventLoop: run_until waits for work posted from another thread", "[event_loop]") {
    EventLoop loop;
    bool done = false;
    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        loop.post([&]() { done = true; });
    });

    loop.run_until([&]() { return done; });
    producer.join();
    REQUIRE(done);
}

TEST_CASE("EventLoop: interrupt releases an idle run_until", "[event_loop]") {
    EventLoop loop;
    std::thread stopper([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        loop.interrupt();
    });

    loop.run_until([]() { return false; });
    stopper.join();
    SUCCEED();
}

TEST_CASE("EventLoop: task exceptions propagate to the driver", "[event_loop]") {
    EventLoop loop;
    loop.post([]() { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(loop.run(), std::runtime_error);
}

// ── Result ───────────────────────────────────────────────────────

TEST_CASE("Result: carries a value", "[async]") {
    Result<int> r(42);
    REQUIRE(r.ok());
    REQUIRE(r.value() == 42);
    REQUIRE_FALSE(r.error());
}

TEST_CASE("Result: value() rethrows the carried error", "[async]") {
    auto r = Result<int>::failure(std::make_exception_ptr(StoreIOError("disk gone")));
    REQUIRE_FALSE(r.ok());
    REQUIRE_THROWS_AS(r.value(), StoreIOError);
    REQUIRE(error_message(r.error()) == "disk gone");
}

TEST_CASE("Result<void>: success and failure", "[async]") {
    Result<void> ok;
    REQUIRE(ok.ok());
    REQUIRE_NOTHROW(ok.value());

    auto bad = Result<void>::failure(std::make_exception_ptr(UsageError("misuse")));
    REQUIRE_FALSE(bad.ok());
    REQUIRE_THROWS_AS(bad.value(), UsageError);
}

TEST_CASE("error_message: null pointer is empty", "[errors]") {
    REQUIRE(error_message(nullptr).empty());
    REQUIRE(error_message(std::make_exception_ptr(42)) == "unknown error");
}
