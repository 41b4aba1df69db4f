/*
===============================================================================
 gateway::ShardConnection - Group E Unit Tests
===============================================================================

Scope:
------
These tests validate ConnectionId bookkeeping, stale-frame isolation and
the reconnection schedule.

Covered Contracts:
------------------
E1. ConnectionId
    - +1 per transport attempt
    - +1 on transition to Stopped, never again afterwards

E2. Frames tagged with a previous ConnectionId are dropped
    - no state change, no sequence change, nothing forwarded
    - a stale heartbeat ack does not satisfy the current heartbeat

E3. disconnect()
    - closes with 1000 from any state (including mid-backoff)
    - terminal: connect() afterwards is refused with a warning
    - request_stop() is honored by the next poll()

E4. Failed transport attempts back off and retry

E5. A missing Hello is a resumable connection loss

E6. The attempt counter resets after a stable READY period

E7. Only wss:// endpoints are used
    - a plain ws:// gateway URL stops the shard (one critical log, no attempt)
    - a plain ws:// resume URL falls back to the gateway URL

E8. request_stop() aborts a transport handshake in flight

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "common/harness/shard.hpp"

using namespace shardgate::core::gateway::test;


// -----------------------------------------------------------------------------
// E1. ConnectionId progression
// -----------------------------------------------------------------------------
void test_connection_id_progression() {
    std::cout << "[TEST] Group E1: ConnectionId advances per attempt and on stop\n";
    ShardHarness h;

    h.establish(1);
    TEST_CHECK(h.shard->connection_id() == 1);

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    TEST_CHECK(h.shard->connection_id() == 1); // loss alone does not advance it
    h.reconnect_now();
    TEST_CHECK(h.shard->connection_id() == 2);
    TEST_CHECK(h.ws().connection_id() == 2);

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    h.reconnect_now();
    TEST_CHECK(h.shard->connection_id() == 3);

    h.shard->disconnect();
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);
    TEST_CHECK(h.shard->connection_id() == 4);

    h.shard->disconnect();
    TEST_CHECK(h.shard->connection_id() == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E2. Stale frames
// -----------------------------------------------------------------------------
void test_stale_frames_dropped() {
    std::cout << "[TEST] Group E2: frames from a previous connection are dropped\n";
    ShardHarness h;
    h.establish(1);
    h.dispatch_range(2, 3);

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    h.reconnect_now();
    h.hello();
    h.ws().emit_text(json::gateway::resumed());
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);
    (void)h.drain_events();

    // Late frames of connection 1, including an op 9 that would discard the session
    h.ws().emit_text_as(1, json::gateway::dispatch("MESSAGE_CREATE", 99));
    h.ws().emit_text_as(1, json::gateway::invalid_session(false));
    h.poll();

    TEST_CHECK(h.shard->dropped_frames() == 2);
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);
    TEST_CHECK(h.shard->session().last_sequence.value() == 3);
    TEST_CHECK(h.shard->session().valid());
    TEST_CHECK(h.drain_events().empty());

    std::cout << "[TEST] OK\n";
}

void test_stale_heartbeat_ack_dropped() {
    std::cout << "[TEST] Group E2b: an ack from a previous connection is not an ack\n";
    ShardHarness h;
    h.establish(1);

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    h.reconnect_now();
    h.hello();
    h.ws().emit_text(json::gateway::resumed());
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);
    TEST_CHECK(h.shard->connection_id() == 2);

    // Heartbeat on connection 2, ack arrives tagged with connection 1
    h.shard->force_heartbeat_due();
    h.poll();
    TEST_CHECK(h.ws().count_sent(1) == 1);
    TEST_CHECK(!h.shard->heartbeat().ack_received());

    h.ws().emit_text_as(1, json::gateway::heartbeat_ack());
    h.poll();
    TEST_CHECK(h.shard->dropped_frames() == 1);
    TEST_CHECK(!h.shard->heartbeat().ack_received());

    // Next tick: still unacknowledged, so the connection is a zombie
    WebSocketUnderTest* ws = &h.ws();
    h.shard->force_heartbeat_due();
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);
    TEST_CHECK(ws->local_close_code() == close_code::CLIENT_RESUME);
    TEST_CHECK(h.shard->session().valid());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E3. disconnect()
// -----------------------------------------------------------------------------
void test_disconnect_from_ready() {
    std::cout << "[TEST] Group E3a: disconnect() closes with 1000 and is terminal\n";
    ShardHarness h;
    h.establish(1);
    TEST_CHECK(h.shard->enqueue_command(R"({"op":3,"d":{}})"));
    TEST_CHECK(h.shard->pending_commands() == 1);

    WebSocketUnderTest* ws = &h.ws();
    h.shard->disconnect();

    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);
    TEST_CHECK(ws->local_close_code() == close_code::NORMAL);
    TEST_CHECK(!h.shard->session().valid());
    TEST_CHECK(h.shard->pending_commands() == 0);

    const auto warns = h.log_count(lcr::log::Level::Warn);
    TEST_CHECK(!h.shard->connect());
    TEST_CHECK(h.log_count(lcr::log::Level::Warn) == warns + 1);
    TEST_CHECK(!h.shard->enqueue_command(R"({"op":3,"d":{}})"));
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

void test_disconnect_during_backoff() {
    std::cout << "[TEST] Group E3b: disconnect() during backoff stops without reconnecting\n";
    ShardHarness h;
    h.establish(1);
    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);

    h.shard->disconnect();
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);

    h.shard->force_backoff_elapsed();
    h.poll(3);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

void test_request_stop_honored_by_poll() {
    std::cout << "[TEST] Group E3c: request_stop() takes effect on the next poll\n";
    ShardHarness h;
    h.establish(1);

    h.shard->request_stop();
    TEST_CHECK(h.shard->stop_requested());
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);

    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);
    TEST_CHECK(h.log_count(lcr::log::Level::Critical) == 0);

    std::cout << "[TEST] OK\n";
}

void test_destructor_closes_transport() {
    std::cout << "[TEST] Group E3d: destroying a live shard closes its transport\n";
    ShardHarness h;
    h.establish(1);

    h.destroy_shard();
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.log_sink.str().find("stopped") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E4. Connect failures back off
// -----------------------------------------------------------------------------
void test_connect_failure_retries() {
    std::cout << "[TEST] Group E4: failed attempts are retried after a backoff\n";
    ShardHarness h;
    WebSocketUnderTest::push_connect_result(transport::Error::ConnectionFailed);
    WebSocketUnderTest::push_connect_result(transport::Error::HandshakeFailed);

    TEST_CHECK(h.shard->connect());
    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);
    TEST_CHECK(h.shard->reconnect_attempts() == 1);
    TEST_CHECK(h.shard->connection_id() == 1);

    // The backoff has not elapsed: nothing happens
    h.poll(3);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    h.reconnect_now();
    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);
    TEST_CHECK(h.shard->reconnect_attempts() == 2);
    TEST_CHECK(h.shard->connection_id() == 2);

    h.reconnect_now();
    TEST_CHECK(h.shard->state() == ConnectionState::Connecting);
    TEST_CHECK(h.shard->connection_id() == 3);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);

    h.hello();
    TEST_CHECK(h.shard->state() == ConnectionState::Identifying);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E5. Hello timeout
// -----------------------------------------------------------------------------
void test_hello_timeout() {
    std::cout << "[TEST] Group E5: no Hello within the deadline reconnects\n";
    ShardHarness h;
    TEST_CHECK(h.shard->connect());

    WebSocketUnderTest* ws = &h.ws();
    h.shard->force_hello_deadline();
    h.poll();

    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);
    TEST_CHECK(ws->local_close_code() == close_code::CLIENT_RESUME);

    h.reconnect_now();
    h.hello();
    TEST_CHECK(h.shard->state() == ConnectionState::Identifying);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E6. Backoff reset after a stable session
// -----------------------------------------------------------------------------
void test_backoff_reset_after_stable_ready() {
    std::cout << "[TEST] Group E6: stable READY resets the attempt counter\n";
    ShardHarness h;
    WebSocketUnderTest::push_connect_result(transport::Error::ConnectionFailed);
    WebSocketUnderTest::push_connect_result(transport::Error::ConnectionFailed);

    TEST_CHECK(h.shard->connect());
    h.reconnect_now();
    h.reconnect_now();
    TEST_CHECK(h.shard->state() == ConnectionState::Connecting);
    TEST_CHECK(h.shard->reconnect_attempts() == 2);

    h.hello();
    h.ws().emit_text(json::gateway::ready(1, "session-abc"));
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);

    // A fresh READY is not yet stable
    h.poll();
    TEST_CHECK(h.shard->reconnect_attempts() == 2);

    h.shard->force_ready_since(std::chrono::steady_clock::now() - std::chrono::hours(1));
    h.poll();
    TEST_CHECK(h.shard->reconnect_attempts() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E7. Plain ws:// endpoints
// -----------------------------------------------------------------------------
void test_plain_gateway_url_is_fatal() {
    std::cout << "[TEST] Group E7a: a ws:// gateway URL stops the shard\n";
    ShardHarness h;
    h.shard->set_gateway_url("ws://gateway.example.com");

    TEST_CHECK(h.shard->connect());
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);
    TEST_CHECK(h.log_count(lcr::log::Level::Critical) == 1);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);

    h.shard->force_backoff_elapsed();
    h.poll(3);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_plain_resume_url_falls_back() {
    std::cout << "[TEST] Group E7b: a ws:// resume URL falls back to the gateway URL\n";
    ShardHarness h;
    h.establish(5, "session-abc", "ws://resume.example.com");

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    h.reconnect_now();
    TEST_CHECK(h.shard->state() == ConnectionState::Connecting);
    TEST_CHECK(WebSocketUnderTest::last_host() == "gateway.example.com");
    TEST_CHECK(h.shard->session().resume_url.empty());

    // The session itself survives: Hello leads to a Resume
    h.hello();
    TEST_CHECK(h.shard->state() == ConnectionState::Resuming);
    TEST_CHECK(h.ws().count_sent(6) == 1);
    TEST_CHECK(h.log_count(lcr::log::Level::Critical) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E8. Aborting a stalled handshake
// -----------------------------------------------------------------------------
void test_request_stop_aborts_connect() {
    std::cout << "[TEST] Group E8a: request_stop() releases a blocked connect\n";
    ShardHarness h;
    WebSocketUnderTest::set_connect_blocks(true);

    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        h.shard->request_stop();
    });
    const auto start = std::chrono::steady_clock::now();
    TEST_CHECK(h.shard->connect());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    TEST_CHECK(elapsed < std::chrono::seconds(2));
    TEST_CHECK(WebSocketUnderTest::aborted_connects() == 1);
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);
    TEST_CHECK(h.shard->connection_id() == 2);
    TEST_CHECK(h.log_count(lcr::log::Level::Critical) == 0);

    std::cout << "[TEST] OK\n";
}

void test_stop_requested_before_connect() {
    std::cout << "[TEST] Group E8b: a stop requested before the transport exists still aborts it\n";
    ShardHarness h;
    WebSocketUnderTest::set_connect_blocks(true);

    h.shard->request_stop();
    TEST_CHECK(h.shard->connect());
    TEST_CHECK(WebSocketUnderTest::aborted_connects() == 1);
    TEST_CHECK(h.shard->state() == ConnectionState::Stopped);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_connection_id_progression();
    test_stale_frames_dropped();
    test_stale_heartbeat_ack_dropped();
    test_disconnect_from_ready();
    test_disconnect_during_backoff();
    test_request_stop_honored_by_poll();
    test_destructor_closes_transport();
    test_connect_failure_retries();
    test_hello_timeout();
    test_backoff_reset_after_stable_ready();
    test_plain_gateway_url_is_fatal();
    test_plain_resume_url_falls_back();
    test_request_stop_aborts_connect();
    test_stop_requested_before_connect();

    std::cout << "\n[GROUP E - CONNECTION IDENTITY & RECONNECTION TESTS PASSED]\n";
    return 0;
}
