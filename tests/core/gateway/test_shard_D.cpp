/*
===============================================================================
 gateway::ShardConnection - Group D Unit Tests
===============================================================================

Scope:
------
These tests validate op 9 (Invalid Session) handling on a live transport.

Covered Contracts:
------------------
D1. InvalidSession(false) discards the session
    - Identifying, session and sequence cleared
    - a fresh Identify goes out on the same connection (limiter permitting)

D2. InvalidSession(true) with a session resends Resume

D3. InvalidSession(true) without a session re-identifies

D4. A pending identify slot waits for the limiter
    - no Identify while another shard holds the front of the bucket

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/shard.hpp"

using namespace shardgate::core::gateway::test;


// -----------------------------------------------------------------------------
// D1. Non-resumable invalid session
// -----------------------------------------------------------------------------
void test_invalid_session_not_resumable() {
    std::cout << "[TEST] Group D1: InvalidSession(false) re-identifies\n";
    ShardHarness h;
    h.establish(1);
    h.dispatch_range(2, 3);

    h.ws().emit_text(json::gateway::invalid_session(false));
    h.poll();

    TEST_CHECK(h.shard->state() == ConnectionState::Identifying);
    TEST_CHECK(!h.shard->session().valid());
    TEST_CHECK(!h.shard->session().last_sequence.has());
    TEST_CHECK(h.shard->connection_id() == 1);
    TEST_CHECK(h.ws().count_sent(2) == 2);
    TEST_CHECK(h.limiter.history().size() == 2);

    h.ws().emit_text(json::gateway::ready(1, "session-new"));
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Ready);
    TEST_CHECK(h.shard->session().session_id == "session-new");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D2. Resumable invalid session while resuming
// -----------------------------------------------------------------------------
void test_invalid_session_resumable() {
    std::cout << "[TEST] Group D2: InvalidSession(true) resends Resume\n";
    ShardHarness h;
    h.establish(1);
    h.dispatch_range(2, 8);

    h.ws().emit_close(close_code::SESSION_TIMED_OUT);
    h.poll();
    h.reconnect_now();
    h.hello();
    TEST_CHECK(h.shard->state() == ConnectionState::Resuming);
    TEST_CHECK(h.ws().count_sent(6) == 1);

    h.ws().emit_text(json::gateway::invalid_session(true));
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Resuming);
    TEST_CHECK(h.ws().count_sent(6) == 2);
    TEST_CHECK(h.ws().last_sent_op(6).find("\"seq\":8") != std::string::npos);
    TEST_CHECK(h.shard->session().valid());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D3. Resumable flag without a session
// -----------------------------------------------------------------------------
void test_invalid_session_resumable_without_session() {
    std::cout << "[TEST] Group D3: InvalidSession(true) before READY re-identifies\n";
    ShardHarness h;
    TEST_CHECK(h.shard->connect());
    h.hello();
    TEST_CHECK(h.ws().count_sent(2) == 1);

    h.ws().emit_text(json::gateway::invalid_session(true));
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Identifying);
    TEST_CHECK(h.ws().count_sent(6) == 0);
    TEST_CHECK(h.ws().count_sent(2) == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4. Identify waits for its turn
// -----------------------------------------------------------------------------
void test_identify_waits_for_limiter() {
    std::cout << "[TEST] Group D4: identify is deferred until the limiter grants it\n";
    ShardHarness h{ShardHarness::default_config(), ShardDescriptor{1, 2}};

    // Shard 0 sits in front of the only bucket
    h.limiter.enqueue(0);

    TEST_CHECK(h.shard->connect());
    h.hello();
    TEST_CHECK(h.shard->state() == ConnectionState::Identifying);
    TEST_CHECK(h.ws().count_sent(2) == 0);
    h.poll(3);
    TEST_CHECK(h.ws().count_sent(2) == 0);

    // Shard 0 identifies, shard 1 is next
    TEST_CHECK(h.limiter.try_acquire(0));
    h.poll();
    TEST_CHECK(h.ws().count_sent(2) == 1);

    auto grants = h.limiter.history();
    TEST_CHECK(grants.size() == 2);
    TEST_CHECK(grants[0].shard == 0);
    TEST_CHECK(grants[1].shard == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4b. A lost connection withdraws the pending request
// -----------------------------------------------------------------------------
void test_pending_identify_cancelled_on_loss() {
    std::cout << "[TEST] Group D4b: connection loss withdraws the identify request\n";
    ShardHarness h{ShardHarness::default_config(), ShardDescriptor{1, 2}};
    h.limiter.enqueue(0);

    TEST_CHECK(h.shard->connect());
    h.hello();
    TEST_CHECK(h.limiter.pending(0) == 2);

    h.ws().emit_close(close_code::UNKNOWN_ERROR);
    h.poll();
    TEST_CHECK(h.shard->state() == ConnectionState::Reconnecting);
    TEST_CHECK(h.limiter.pending(0) == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_invalid_session_not_resumable();
    test_invalid_session_resumable();
    test_invalid_session_resumable_without_session();
    test_identify_waits_for_limiter();
    test_pending_identify_cancelled_on_loss();

    std::cout << "\n[GROUP D - INVALID SESSION & IDENTIFY ORDERING TESTS PASSED]\n";
    return 0;
}
