#include "test_common.hpp"
#include "thread_utils.hpp"

#include <atomic>

using namespace melt;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken copies share state") {
    CancellationToken a;
    CancellationToken b = a;
    REQUIRE_FALSE(b.is_cancelled());
    a.cancel();
    REQUIRE(b.is_cancelled());
}

TEST_CASE("Semaphore permits are returned on destruction") {
    Semaphore sem(2);
    CancellationToken cancel;
    {
        auto p1 = sem.acquire(cancel);
        auto p2 = sem.acquire(cancel);
        REQUIRE(p1);
        REQUIRE(p2);
        REQUIRE(sem.available() == 0);
        auto moved = std::move(*p1);
        REQUIRE(sem.available() == 0);
    }
    REQUIRE(sem.available() == 2);
    REQUIRE(sem.capacity() == 2);
}

TEST_CASE("Semaphore wait ends on cancellation") {
    Semaphore sem(1);
    CancellationToken cancel;
    auto held = sem.acquire(cancel);
    REQUIRE(held);
    std::thread t([cancel] {
        std::this_thread::sleep_for(30ms);
        cancel.cancel();
    });
    auto waited = sem.acquire(cancel);
    t.join();
    REQUIRE_FALSE(waited);
}

TEST_CASE("TaskQueue is FIFO") {
    TaskQueue<int> q;
    REQUIRE(q.empty());
    q.push(1);
    q.push(2);
    REQUIRE(q.try_pop() == std::optional<int>(1));
    REQUIRE(q.try_pop() == std::optional<int>(2));
    REQUIRE_FALSE(q.try_pop());
}

TEST_CASE("WorkerPool runs every queued job before joining") {
    std::atomic<int> done{0};
    {
        WorkerPool pool(3);
        for (int i = 0; i < 20; ++i)
            pool.submit([&done] {
                std::this_thread::sleep_for(1ms);
                ++done;
            });
    }
    REQUIRE(done == 20);
}

TEST_CASE("run_with_timeout returns the result") {
    Error err;
    auto r = run_with_timeout<int>([](Error*) -> std::optional<int> { return 42; }, 1s,
                                   CancellationToken{}, &err, "answer");
    REQUIRE(r == std::optional<int>(42));
}

TEST_CASE("run_with_timeout propagates the callee error") {
    Error err;
    auto r = run_with_timeout<int>(
        [](Error* e) -> std::optional<int> {
            set_error(e, ErrorKind::NotFound, "missing");
            return std::nullopt;
        },
        1s, CancellationToken{}, &err, "lookup");
    REQUIRE_FALSE(r);
    REQUIRE(err.kind == ErrorKind::NotFound);
    REQUIRE(err.message == "missing");
}

TEST_CASE("run_with_timeout gives up after the deadline") {
    Error err;
    auto start = std::chrono::steady_clock::now();
    auto r = run_with_timeout<int>(
        [](Error*) -> std::optional<int> {
            std::this_thread::sleep_for(500ms);
            return 1;
        },
        50ms, CancellationToken{}, &err, "slow call");
    REQUIRE_FALSE(r);
    REQUIRE(err.kind == ErrorKind::Timeout);
    REQUIRE(err.message == "slow call");
    REQUIRE(std::chrono::steady_clock::now() - start < 400ms);
}

TEST_CASE("Abandoned blocking calls are counted until they return") {
    REQUIRE(wait_for_blocking_calls(2s));
    Error err;
    auto r = run_with_timeout<int>(
        [](Error*) -> std::optional<int> {
            std::this_thread::sleep_for(200ms);
            return 1;
        },
        10ms, CancellationToken{}, &err, "slow clone");
    REQUIRE_FALSE(r);
    REQUIRE(blocking_calls_in_flight() == 1);
    REQUIRE_FALSE(wait_for_blocking_calls(10ms));
    REQUIRE(wait_for_blocking_calls(2s));
    REQUIRE(blocking_calls_in_flight() == 0);
}

TEST_CASE("run_with_timeout honours cancellation") {
    CancellationToken cancel;
    cancel.cancel();
    Error err;
    auto r = run_with_timeout<int>([](Error*) -> std::optional<int> { return 1; }, 1s, cancel,
                                   &err, "never");
    REQUIRE_FALSE(r);
    REQUIRE(err.kind == ErrorKind::Cancelled);
}
