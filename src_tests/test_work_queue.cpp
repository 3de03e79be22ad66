/**
 * @file test_work_queue.cpp
 * @brief Tests for the bounded hand-off queue and the cancellation token.
 */

#include <catch2/catch_test_macros.hpp>

#include "calregress/cancellation.hpp"
#include "calregress/work_queue.hpp"

#include <atomic>
#include <chrono>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace calregress;
using namespace std::chrono_literals;

TEST_CASE("BoundedQueue hands items over in FIFO order", "[queue]")
{
    BoundedQueue<int> queue(4);
    CHECK(queue.push(1));
    CHECK(queue.push(2));
    CHECK(queue.size() == 2);
    CHECK(queue.pop() == 1);
    CHECK(queue.pop() == 2);
    CHECK(queue.size() == 0);

    CHECK_THROWS_AS(BoundedQueue<int>(0), std::invalid_argument);
}

TEST_CASE("Closing drains remaining items, then reports end", "[queue][close]")
{
    BoundedQueue<int> queue(4);
    REQUIRE(queue.push(7));
    queue.close();
    CHECK(queue.closed());
    CHECK_FALSE(queue.push(8));
    CHECK(queue.pop() == 7);
    CHECK_FALSE(queue.pop().has_value());
}

TEST_CASE("Close wakes blocked producers and consumers", "[queue][close]")
{
    BoundedQueue<int> queue(1);
    REQUIRE(queue.push(1));

    std::atomic<bool> producer_result{true};
    std::thread producer([&] { producer_result = queue.push(2); });

    BoundedQueue<int> empty(1);
    std::atomic<bool> consumer_got{true};
    std::thread consumer([&] { consumer_got = empty.pop().has_value(); });

    std::this_thread::sleep_for(50ms);
    queue.close();
    empty.close();
    producer.join();
    consumer.join();

    CHECK_FALSE(producer_result.load());
    CHECK_FALSE(consumer_got.load());
}

TEST_CASE("Every item is delivered exactly once across threads", "[queue][concurrency]")
{
    constexpr int kItems = 2000;
    constexpr int kConsumers = 4;
    BoundedQueue<int> queue(8);
    std::vector<std::vector<int>> received(kConsumers);

    std::vector<std::thread> consumers;
    for (int c = 0; c < kConsumers; ++c) {
        consumers.emplace_back([&, c] {
            while (auto item = queue.pop()) {
                received[c].push_back(*item);
            }
        });
    }
    for (int i = 0; i < kItems; ++i) {
        REQUIRE(queue.push(i));
    }
    queue.close();
    for (auto& t : consumers) {
        t.join();
    }

    std::vector<int> seen(kItems, 0);
    std::size_t total = 0;
    for (const auto& part : received) {
        total += part.size();
        for (int item : part) {
            ++seen[item];
        }
    }
    CHECK(total == kItems);
    CHECK(std::all_of(seen.begin(), seen.end(), [](int n) { return n == 1; }));
}

TEST_CASE("CancellationToken wakes waiters", "[cancellation]")
{
    CancellationToken token;
    CHECK_FALSE(token.cancelled());
    CHECK_FALSE(token.wait_for(1ms));

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    CHECK(token.wait_for(10s));
    CHECK(std::chrono::steady_clock::now() - start < 5s);
    canceller.join();

    CHECK(token.cancelled());
    token.cancel();
    CHECK(token.cancelled());
}
