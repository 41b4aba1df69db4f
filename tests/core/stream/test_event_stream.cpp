/*
===============================================================================
 stream::EventStream - Unit Tests
===============================================================================

Scope:
------
Fan-out, backpressure and end-of-stream semantics.

Covered Contracts:
------------------
1. Every subscriber receives every event, in publish order
2. A full subscriber blocks the producer until it consumes (nothing dropped)
3. close() unblocks producers; subscribers drain, then observe the end
4. A raised cancel flag releases a blocked producer
5. Subscription is move-only and unregisters itself on destruction

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "shardgate/core/stream/event_stream.hpp"
#include "common/test_check.hpp"

using namespace shardgate::core::stream;
using namespace std::chrono_literals;


static DispatchEvent make_event(std::int64_t seq, std::uint32_t shard = 0) {
    DispatchEvent ev;
    ev.shard_index = shard;
    ev.sequence = seq;
    ev.name = "MESSAGE_CREATE";
    ev.data = "{}";
    return ev;
}


void test_fan_out() {
    std::cout << "[TEST] EventStream: fan-out to every subscriber\n";
    EventStream stream(16);
    auto a = stream.subscribe();
    auto b = stream.subscribe();
    TEST_CHECK(stream.subscriber_count() == 2);

    for (int i = 1; i <= 5; ++i) {
        TEST_CHECK(stream.publish(make_event(i)));
    }
    TEST_CHECK(a.queued() == 5);
    TEST_CHECK(b.queued() == 5);

    DispatchEvent ev;
    for (int i = 1; i <= 5; ++i) {
        TEST_CHECK(a.try_next(ev));
        TEST_CHECK(ev.sequence.value() == i);
        TEST_CHECK(b.try_next(ev));
        TEST_CHECK(ev.sequence.value() == i);
    }
    TEST_CHECK(!a.try_next(ev));
    TEST_CHECK(stream.published() == 5);

    // A late subscriber only sees what comes after it
    TEST_CHECK(stream.publish(make_event(6)));
    auto c = stream.subscribe();
    TEST_CHECK(c.queued() == 0);
    TEST_CHECK(a.queued() == 1);

    std::cout << "[TEST] OK\n";
}

void test_backpressure() {
    std::cout << "[TEST] EventStream: slow subscriber blocks the producer\n";
    EventStream stream(2);
    auto fast = stream.subscribe();
    auto slow = stream.subscribe();

    std::atomic<int> produced{0};
    std::thread producer([&] {
        for (int i = 1; i <= 6; ++i) {
            TEST_CHECK(stream.publish(make_event(i)));
            produced = i;
        }
    });

    DispatchEvent ev;
    // Drain the fast one: the producer is still gated by the slow queue
    std::this_thread::sleep_for(50ms);
    while (fast.try_next(ev)) {}
    std::this_thread::sleep_for(50ms);
    TEST_CHECK(produced == 2);
    TEST_CHECK(slow.queued() == 2);
    TEST_CHECK(stream.blocked_publishes() > 0);

    // Consuming from the slow one releases the producer step by step
    for (int i = 1; i <= 6; ++i) {
        TEST_CHECK(slow.next_for(ev, 1000ms));
        TEST_CHECK(ev.sequence.value() == i);
        while (fast.try_next(ev)) {}
    }
    producer.join();
    TEST_CHECK(produced == 6);
    TEST_CHECK(stream.published() == 6);

    std::cout << "[TEST] OK\n";
}

void test_close() {
    std::cout << "[TEST] EventStream: close() drains then ends\n";
    EventStream stream(1);
    auto sub = stream.subscribe();

    TEST_CHECK(stream.publish(make_event(1)));

    std::atomic<bool> returned{false};
    std::atomic<bool> result{true};
    std::thread producer([&] {
        result = stream.publish(make_event(2)); // blocks: queue full
        returned = true;
    });
    std::this_thread::sleep_for(50ms);
    TEST_CHECK(!returned);

    stream.close();
    producer.join();
    TEST_CHECK(!result);
    TEST_CHECK(stream.closed());
    TEST_CHECK(!stream.publish(make_event(3)));

    DispatchEvent ev;
    TEST_CHECK(!sub.finished());
    TEST_CHECK(sub.next(ev));
    TEST_CHECK(ev.sequence.value() == 1);
    TEST_CHECK(!sub.next(ev));
    TEST_CHECK(sub.finished());

    std::cout << "[TEST] OK\n";
}

void test_blocked_consumer_wakes_on_close() {
    std::cout << "[TEST] EventStream: waiting consumer observes the end\n";
    EventStream stream(4);
    auto sub = stream.subscribe();

    std::atomic<bool> result{true};
    std::thread consumer([&] {
        DispatchEvent ev;
        result = sub.next(ev);
    });
    std::this_thread::sleep_for(30ms);
    stream.close();
    consumer.join();
    TEST_CHECK(!result);

    std::cout << "[TEST] OK\n";
}

void test_cancel_flag() {
    std::cout << "[TEST] EventStream: cancel releases a blocked producer\n";
    EventStream stream(1);
    auto sub = stream.subscribe();
    std::atomic<bool> cancel{false};

    TEST_CHECK(stream.publish(make_event(1), &cancel));

    std::atomic<bool> result{true};
    std::thread producer([&] {
        result = stream.publish(make_event(2), &cancel);
    });
    std::this_thread::sleep_for(30ms);
    cancel = true;
    stream.wake_producers();
    producer.join();

    TEST_CHECK(!result);
    TEST_CHECK(sub.queued() == 1);
    TEST_CHECK(!stream.closed());

    std::cout << "[TEST] OK\n";
}

void test_subscription_lifetime() {
    std::cout << "[TEST] Subscription: move and unregister\n";
    EventStream stream(1);

    Subscription empty;
    TEST_CHECK(!empty.valid());
    TEST_CHECK(empty.finished());

    {
        auto sub = stream.subscribe();
        TEST_CHECK(stream.publish(make_event(1)));

        Subscription moved(std::move(sub));
        TEST_CHECK(moved.valid());
        TEST_CHECK(!sub.valid());
        TEST_CHECK(moved.queued() == 1);
        TEST_CHECK(stream.subscriber_count() == 1);

        Subscription assigned;
        assigned = std::move(moved);
        TEST_CHECK(assigned.valid());
        TEST_CHECK(stream.subscriber_count() == 1);
    }

    // The full queue went away with its subscriber: publishing proceeds
    TEST_CHECK(stream.subscriber_count() == 0);
    TEST_CHECK(stream.publish(make_event(2)));

    // A subscription may outlive its stream
    Subscription orphan;
    {
        EventStream inner(4);
        orphan = inner.subscribe();
        TEST_CHECK(inner.publish(make_event(7)));
    }
    DispatchEvent ev;
    TEST_CHECK(orphan.next(ev));
    TEST_CHECK(ev.sequence.value() == 7);
    TEST_CHECK(!orphan.next(ev));

    std::cout << "[TEST] OK\n";
}

void test_multi_producer_order() {
    std::cout << "[TEST] EventStream: per-producer order across shards\n";
    constexpr int PER_SHARD = 200;
    EventStream stream(8);
    auto sub = stream.subscribe();

    std::vector<std::thread> producers;
    for (std::uint32_t shard = 0; shard < 4; ++shard) {
        producers.emplace_back([&, shard] {
            for (int i = 1; i <= PER_SHARD; ++i) {
                TEST_CHECK(stream.publish(make_event(i, shard)));
            }
        });
    }

    std::int64_t last[4] = {0, 0, 0, 0};
    DispatchEvent ev;
    for (int n = 0; n < 4 * PER_SHARD; ++n) {
        TEST_CHECK(sub.next_for(ev, 2000ms));
        TEST_CHECK(ev.sequence.value() == last[ev.shard_index] + 1);
        last[ev.shard_index] = ev.sequence.value();
    }
    for (auto& t : producers) {
        t.join();
    }
    for (auto seq : last) {
        TEST_CHECK(seq == PER_SHARD);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_fan_out();
    test_backpressure();
    test_close();
    test_blocked_consumer_wakes_on_close();
    test_cancel_flag();
    test_subscription_lifetime();
    test_multi_producer_order();

    std::cout << "\n[EVENT STREAM TESTS PASSED]\n";
    return 0;
}
