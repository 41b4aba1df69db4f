/*
===============================================================================
 gateway::parser - Unit Tests
===============================================================================

Scope:
------
Router envelope dispatch and payload parsers.

Covered Contracts:
------------------
1. Every inbound opcode maps onto its typed message
2. READY and RESUMED are recognized by event name; other dispatches keep
   their raw payload
3. Malformed envelopes and payloads are rejected with the matching Result
4. Unknown opcodes are Ignored
5. GET /gateway/bot body decoding

===============================================================================
*/

#include <iostream>
#include <string>
#include <variant>

#include "shardgate/core/gateway/parser/bot_gateway.hpp"
#include "shardgate/core/gateway/parser/router.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace shardgate::core::gateway;
using namespace shardgate::core::gateway::parser;


void test_control_messages() {
    std::cout << "[TEST] Router: control opcodes\n";
    Router router;
    Message msg;

    TEST_CHECK(router.parse(json::gateway::hello(41250), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::Hello>(msg));
    TEST_CHECK(std::get<schema::Hello>(msg).heartbeat_interval == std::chrono::milliseconds(41250));

    TEST_CHECK(router.parse(json::gateway::heartbeat_request(), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::HeartbeatRequest>(msg));

    TEST_CHECK(router.parse(json::gateway::heartbeat_ack(), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::HeartbeatAck>(msg));

    TEST_CHECK(router.parse(json::gateway::reconnect(), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::Reconnect>(msg));

    TEST_CHECK(router.parse(json::gateway::invalid_session(true), msg) == Result::Parsed);
    TEST_CHECK(std::get<schema::InvalidSession>(msg).resumable);

    TEST_CHECK(router.parse(json::gateway::invalid_session(false), msg) == Result::Parsed);
    TEST_CHECK(!std::get<schema::InvalidSession>(msg).resumable);

    TEST_CHECK(router.parse(R"({"op":9,"d":null})", msg) == Result::Parsed);
    TEST_CHECK(!std::get<schema::InvalidSession>(msg).resumable);

    std::cout << "[TEST] OK\n";
}

void test_dispatch_messages() {
    std::cout << "[TEST] Router: dispatches\n";
    Router router;
    Message msg;

    TEST_CHECK(router.parse(json::gateway::ready(1, "session-abc", "wss://resume.example.com", 2, 4), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::Ready>(msg));
    const auto& ready = std::get<schema::Ready>(msg);
    TEST_CHECK(ready.version == 10);
    TEST_CHECK(ready.session_id == "session-abc");
    TEST_CHECK(ready.resume_gateway_url == "wss://resume.example.com");
    TEST_CHECK(ready.user_id == 80351110224678912ULL);
    TEST_CHECK(ready.username == "shardbot");
    TEST_CHECK(ready.shard_index == 2);
    TEST_CHECK(ready.shard_count == 4);
    TEST_CHECK(ready.guild_count == 1);
    TEST_CHECK(ready.dispatch.name == "READY");
    TEST_CHECK(ready.dispatch.sequence.value() == 1);

    TEST_CHECK(router.parse(json::gateway::resumed(12), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::Resumed>(msg));
    TEST_CHECK(std::get<schema::Resumed>(msg).dispatch.sequence.value() == 12);

    TEST_CHECK(router.parse(json::gateway::dispatch("MESSAGE_CREATE", 42, R"({ "id" : "1", "content" : "hi" })"), msg) == Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::Dispatch>(msg));
    const auto& d = std::get<schema::Dispatch>(msg);
    TEST_CHECK(d.name == "MESSAGE_CREATE");
    TEST_CHECK(d.sequence.value() == 42);
    TEST_CHECK(d.data == R"({"id":"1","content":"hi"})");

    TEST_CHECK(router.parse(R"({"op":0,"s":null,"t":"TYPING_START","d":{}})", msg) == Result::Parsed);
    TEST_CHECK(!std::get<schema::Dispatch>(msg).sequence.has());

    std::cout << "[TEST] OK\n";
}

void test_malformed_messages() {
    std::cout << "[TEST] Router: malformed messages\n";
    Router router;
    Message msg;

    TEST_CHECK(router.parse("not json", msg) == Result::InvalidJson);
    TEST_CHECK(router.parse("[1,2,3]", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"d":null})", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"op":"10","d":null})", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"op":10})", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"op":10,"d":{"heartbeat_interval":0}})", msg) == Result::InvalidValue);
    TEST_CHECK(router.parse(R"({"op":0,"s":1,"t":null,"d":{}})", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"op":0,"s":1,"t":"READY","d":{"v":10}})", msg) == Result::InvalidSchema);
    TEST_CHECK(router.parse(R"({"op":0,"s":1,"t":"READY","d":{"v":10,"session_id":"","user":{"id":"1"}}})", msg) == Result::InvalidValue);
    TEST_CHECK(router.parse(R"({"op":9,"d":"yes"})", msg) == Result::InvalidSchema);
    TEST_CHECK(std::holds_alternative<std::monostate>(msg));

    std::cout << "[TEST] OK\n";
}

void test_unknown_opcode() {
    std::cout << "[TEST] Router: unknown and send-only opcodes are ignored\n";
    Router router;
    Message msg;

    TEST_CHECK(router.parse(R"({"op":42,"d":null})", msg) == Result::Ignored);
    TEST_CHECK(router.parse(R"({"op":2,"d":{}})", msg) == Result::Ignored);
    TEST_CHECK(std::holds_alternative<std::monostate>(msg));

    std::cout << "[TEST] OK\n";
}

void test_bot_gateway() {
    std::cout << "[TEST] parse_bot_gateway\n";
    BotGatewayInfo info;

    const std::string body = R"({"url":"wss://gateway.example.com","shards":9,)"
                             R"("session_start_limit":{"total":1000,"remaining":999,"reset_after":14400000,"max_concurrency":16}})";
    TEST_CHECK(parse_bot_gateway(body, info) == Result::Parsed);
    TEST_CHECK(info.url == "wss://gateway.example.com");
    TEST_CHECK(info.shards == 9);
    TEST_CHECK(info.session_start_limit.total == 1000);
    TEST_CHECK(info.session_start_limit.remaining == 999);
    TEST_CHECK(info.session_start_limit.reset_after == std::chrono::milliseconds(14400000));
    TEST_CHECK(info.session_start_limit.max_concurrency == 16);

    TEST_CHECK(parse_bot_gateway("{", info) == Result::InvalidJson);
    TEST_CHECK(parse_bot_gateway(R"({"shards":1})", info) == Result::InvalidSchema);
    TEST_CHECK(parse_bot_gateway(R"({"url":"wss://x","shards":0,"session_start_limit":{}})", info) == Result::InvalidValue);
    TEST_CHECK(parse_bot_gateway(R"({"url":"wss://x","shards":1,"session_start_limit":{"total":1}})", info) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_control_messages();
    test_dispatch_messages();
    test_malformed_messages();
    test_unknown_opcode();
    test_bot_gateway();

    std::cout << "\n[GATEWAY PARSER TESTS PASSED]\n";
    return 0;
}
