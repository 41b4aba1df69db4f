/*
===============================================================================
 gateway::codec::Inflater - Unit Tests
===============================================================================

Scope:
------
zlib-stream decoding: one deflate context per connection, messages
delimited by the sync-flush marker.

Covered Contracts:
------------------
1. A complete message decodes in one feed
2. A message split across frames yields NeedMore until the marker arrives
3. Consecutive messages share the context
4. reset() starts a new stream
5. Corrupt input and oversized output are reported

===============================================================================
*/

#include <iostream>
#include <string>

#include "shardgate/core/gateway/codec/inflater.hpp"
#include "common/test_check.hpp"
#include "common/zlib_stream.hpp"

using namespace shardgate::core::gateway::codec;


void test_single_message() {
    std::cout << "[TEST] Inflater: one message per frame\n";
    Inflater inflater;
    ::test::zlib::DeflateStream z;
    std::string out;

    const std::string msg = R"({"op":10,"d":{"heartbeat_interval":41250}})";
    TEST_CHECK(inflater.feed(z.message(msg), out) == Status::Ok);
    TEST_CHECK(out == msg);
    TEST_CHECK(inflater.pending_bytes() == 0);
    TEST_CHECK(inflater.total_out() == msg.size());

    std::cout << "[TEST] OK\n";
}

void test_split_message() {
    std::cout << "[TEST] Inflater: message split across frames\n";
    Inflater inflater;
    ::test::zlib::DeflateStream z;
    std::string out;

    std::string msg = R"({"op":0,"t":"GUILD_CREATE","d":{"members":[)";
    for (int i = 0; i < 200; ++i) {
        msg += (i ? "," : "");
        msg += R"({"id":")" + std::to_string(1000 + i) + R"("})";
    }
    msg += "]}}";
    const std::string compressed = z.message(msg);
    TEST_CHECK(compressed.size() > 12);

    const std::size_t third = compressed.size() / 3;
    TEST_CHECK(inflater.feed(compressed.substr(0, third), out) == Status::NeedMore);
    TEST_CHECK(inflater.feed(compressed.substr(third, third), out) == Status::NeedMore);
    TEST_CHECK(inflater.pending_bytes() == 2 * third);
    TEST_CHECK(inflater.feed(compressed.substr(2 * third), out) == Status::Ok);
    TEST_CHECK(out == msg);

    std::cout << "[TEST] OK\n";
}

void test_shared_context() {
    std::cout << "[TEST] Inflater: consecutive messages share one stream\n";
    Inflater inflater;
    ::test::zlib::DeflateStream z;
    std::string out;

    for (int i = 0; i < 20; ++i) {
        const std::string msg = R"({"op":0,"s":)" + std::to_string(i) + R"(,"t":"MESSAGE_CREATE","d":{"content":"same text"}})";
        TEST_CHECK(inflater.feed(z.message(msg), out) == Status::Ok);
        TEST_CHECK(out == msg);
    }

    std::cout << "[TEST] OK\n";
}

void test_reset_starts_new_stream() {
    std::cout << "[TEST] Inflater: reset() for a new connection\n";
    Inflater inflater;
    std::string out;

    {
        ::test::zlib::DeflateStream z;
        TEST_CHECK(inflater.feed(z.message("first connection"), out) == Status::Ok);
    }

    // A new sender stream starts with a zlib header the old context rejects
    ::test::zlib::DeflateStream z2;
    const std::string fresh = z2.message("second connection");
    inflater.reset();
    TEST_CHECK(inflater.feed(fresh, out) == Status::Ok);
    TEST_CHECK(out == "second connection");

    std::cout << "[TEST] OK\n";
}

void test_corrupt_input() {
    std::cout << "[TEST] Inflater: corrupt input\n";
    Inflater inflater;
    std::string out;

    TEST_CHECK(inflater.feed(std::string("\x01\x02\x03garbage\x00\x00\xff\xff", 14), out) == Status::Corrupt);

    inflater.reset();
    ::test::zlib::DeflateStream z;
    TEST_CHECK(inflater.feed(z.message("recovered"), out) == Status::Ok);
    TEST_CHECK(out == "recovered");

    std::cout << "[TEST] OK\n";
}

void test_size_limit() {
    std::cout << "[TEST] Inflater: output bound\n";
    Inflater inflater(1024);
    ::test::zlib::DeflateStream z;
    std::string out;

    // Highly compressible: small input, large output
    TEST_CHECK(inflater.feed(z.message(std::string(64 * 1024, 'a')), out) == Status::TooLarge);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_single_message();
    test_split_message();
    test_shared_context();
    test_reset_starts_new_stream();
    test_corrupt_input();
    test_size_limit();

    std::cout << "\n[ZLIB-STREAM CODEC TESTS PASSED]\n";
    return 0;
}
