#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "shardgate/core/config/gateway.hpp"
#include "shardgate/core/gateway/backoff.hpp"
#include "shardgate/core/gateway/close_code.hpp"
#include "shardgate/core/gateway/codec/inflater.hpp"
#include "shardgate/core/gateway/config.hpp"
#include "shardgate/core/gateway/heartbeat_timer.hpp"
#include "shardgate/core/gateway/identify_limiter.hpp"
#include "shardgate/core/gateway/parser/router.hpp"
#include "shardgate/core/gateway/schema/heartbeat.hpp"
#include "shardgate/core/gateway/schema/identify.hpp"
#include "shardgate/core/gateway/schema/resume.hpp"
#include "shardgate/core/gateway/send_limiter.hpp"
#include "shardgate/core/gateway/session_info.hpp"
#include "shardgate/core/gateway/state.hpp"
#include "shardgate/core/stream/event_stream.hpp"
#include "shardgate/core/transport/concepts.hpp"
#include "shardgate/core/transport/parse_url.hpp"
#include "shardgate/core/transport/websocket/frame.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway {

/*
===============================================================================
 shardgate::core::gateway::ShardConnection
===============================================================================

One shard of a gateway session, parameterized by a WebSocket transport
conforming to transport::WebSocketConcept.

A ShardConnection owns the session (session id, last sequence, resume URL)
and keeps it alive across transport failures: every connection loss is
classified (Resumable / NonResumable / Fatal) and resolved by resuming,
re-identifying or stopping for good.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

  NoSession --connect--> Connecting
  Connecting --Hello--> Resuming      (preserved session)
  Connecting --Hello--> Identifying   (identify slot from the shared limiter)
  Identifying --READY--> Ready        (fresh session recorded)
  Resuming --RESUMED--> Ready         (session and sequence preserved)
  * --InvalidSession(false)--> Identifying (session cleared)
  * --InvalidSession(true)--> Resuming     (Resume resent, if a session exists)
  * --Reconnect / zombie / Hello timeout--> Reconnecting (session kept)
  * --transport closed--> Reconnecting | Stopped (by close code)
  Reconnecting --backoff elapsed--> Connecting
  * --disconnect--> Stopped (terminal)

-------------------------------------------------------------------------------
 ConnectionId
-------------------------------------------------------------------------------
Incremented on every transport attempt and on every transition to Stopped.
Each transport instance tags its frames with the id it was created for;
poll() drops frames carrying any other id without touching state.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
poll(), connect() and disconnect() belong to the shard runner thread.
request_stop(), enqueue_command(), state() and connection_id() may be called
from any thread. request_stop() also aborts a transport handshake in flight,
so a runner blocked in connect() returns promptly.

No callbacks. No background threads of its own: all progress is poll-driven.
===============================================================================
*/

template <transport::WebSocketConcept WS>
class ShardConnection {
public:
    using clock = std::chrono::steady_clock;

    ShardConnection(ShardDescriptor shard,
                    const ShardConfig& cfg,
                    IdentifyRateLimiter& limiter,
                    stream::EventStream& events,
                    lcr::log::Logger& logger)
        : shard_(shard)
        , cfg_(cfg)
        , limiter_(limiter)
        , events_(events)
        , logger_(logger)
        , frames_(std::make_unique<transport::websocket::FrameRing>())
        , router_(logger)
        , inflater_(cfg.max_message_size, logger)
        , backoff_(cfg.backoff_base, cfg.backoff_cap, cfg.backoff_factor)
        , sends_(cfg.send_limit_per_window, cfg.send_window, cfg.send_reserved_heartbeats)
        , rng_(std::random_device{}())
    {}

    // Reconnection is not attempted after object lifetime ends
    ~ShardConnection() {
        disconnect();
    }

    ShardConnection(const ShardConnection&) = delete;
    ShardConnection& operator=(const ShardConnection&) = delete;

    // Discovered gateway URL (query is replaced on connect)
    inline void set_gateway_url(std::string url) {
        gateway_url_ = std::move(url);
    }

    // Idempotent while not Stopped
    [[nodiscard]]
    inline bool connect() noexcept {
        const auto state = get_state_();
        if (state == ConnectionState::Stopped) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] connect() called on a stopped shard. Ignoring.");
            return false;
        }
        if (state != ConnectionState::NoSession) {
            return true;
        }
        if (gateway_url_.empty()) {
            SG_LOG(logger_, Error, "[SHARD " << shard_.index << "] connect() called without a gateway URL");
            return false;
        }
        transition_(Event::ConnectRequested);
        open_transport_();
        return true;
    }

    // Force-closes the transport and stops the shard for good
    inline void disconnect() noexcept {
        if (get_state_() == ConnectionState::Stopped) {
            return;
        }
        transition_(Event::StopRequested);
    }

    // Thread-safe stop request, honored by the next poll(). Also cancels a
    // pending event-stream publish and an in-flight transport connect.
    inline void request_stop() noexcept {
        stop_requested_.store(true, std::memory_order_release);
        std::lock_guard<std::mutex> lock(transport_mutex_);
        if (ws_) {
            ws_->abort();
        }
    }

    [[nodiscard]]
    inline bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    // Event loop
    inline void poll() noexcept {
        if (stop_requested()) {
            disconnect();
            return;
        }
        if (get_state_() == ConnectionState::Stopped) {
            return;
        }
        // === Drain transport frames ===
        transport::websocket::Frame frame;
        std::size_t processed = 0;
        while (transport_open_ && processed < config::gateway::MAX_FRAMES_PER_POLL && frames_->pop(frame)) {
            ++processed;
            if (frame.connection_id != connection_id()) {
                ++dropped_frames_;
                SG_LOG(logger_, Trace, "[SHARD " << shard_.index << "] dropped stale frame (connection "
                       << frame.connection_id << ", current " << connection_id() << ")");
                continue;
            }
            handle_frame_(frame);
        }
        auto now = clock::now();
        // === Hello deadline ===
        if (awaiting_hello_ && now >= hello_deadline_) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] no Hello within " << cfg_.connect_timeout.count() << " ms");
            transition_(Event::HelloTimeout);
        }
        // === Heartbeat ===
        if (heartbeat_.due(now)) {
            if (!heartbeat_.ack_received()) {
                heartbeat_.on_missed();
                SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] heartbeat not acknowledged within "
                       << heartbeat_.interval().count() << " ms (zombied connection)");
                transition_(Event::HeartbeatAckMissed);
            }
            else {
                send_heartbeat_(now);
            }
        }
        // === Identify slot ===
        if (identify_pending_ && get_state_() == ConnectionState::Identifying) {
            if (limiter_.try_acquire(shard_.index)) {
                identify_pending_ = false;
                send_identify_(now);
            }
        }
        // === Reconnection ===
        if (get_state_() == ConnectionState::Reconnecting && now >= retry_at_) {
            transition_(Event::BackoffElapsed);
            open_transport_();
            now = clock::now();
        }
        // === Stable session ===
        if (get_state_() == ConnectionState::Ready && !stable_) {
            const auto window = heartbeat_.interval() * cfg_.stable_ready_heartbeats;
            if (window.count() > 0 && now - ready_since_ > window) {
                SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] session stable, backoff reset");
                backoff_.reset();
                stable_ = true;
            }
        }
        // === Application commands ===
        if (get_state_() == ConnectionState::Ready) {
            drain_commands_(now);
        }
    }

    // Queues an application command (op 3 / 4 / 8). Sent only while Ready and
    // within the command budget; survives resumes, discarded on stop.
    [[nodiscard]]
    inline bool enqueue_command(std::string payload) {
        if (get_state_() == ConnectionState::Stopped) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] command rejected (shard stopped)");
            return false;
        }
        std::lock_guard<std::mutex> lock(commands_mutex_);
        commands_.push_back(std::move(payload));
        return true;
    }

    // Accessors
    [[nodiscard]]
    inline ConnectionState state() const noexcept {
        return get_state_();
    }

    [[nodiscard]]
    inline std::uint64_t connection_id() const noexcept {
        return connection_id_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline const ShardDescriptor& shard() const noexcept {
        return shard_;
    }

    [[nodiscard]]
    inline const SessionInfo& session() const noexcept {
        return session_;
    }

    [[nodiscard]]
    inline const HeartbeatTimer& heartbeat() const noexcept {
        return heartbeat_;
    }

    [[nodiscard]]
    inline std::uint64_t dropped_frames() const noexcept {
        return dropped_frames_;
    }

    [[nodiscard]]
    inline std::uint64_t forwarded_events() const noexcept {
        return forwarded_events_;
    }

    [[nodiscard]]
    inline std::uint32_t reconnect_attempts() const noexcept {
        return backoff_.attempt();
    }

    [[nodiscard]]
    inline std::size_t pending_commands() const {
        std::lock_guard<std::mutex> lock(commands_mutex_);
        return commands_.size();
    }

    // True when poll() has nothing buffered to process
    [[nodiscard]]
    inline bool is_idle() const noexcept {
        return !transport_open_ || frames_->empty();
    }

#ifdef SG_UNIT_TEST
public:
    inline void force_heartbeat_due() noexcept {
        heartbeat_.force_due();
    }

    inline void force_backoff_elapsed() noexcept {
        retry_at_ = clock::time_point{};
    }

    inline void force_hello_deadline() noexcept {
        hello_deadline_ = clock::time_point{};
    }

    inline void force_ready_since(clock::time_point ts) noexcept {
        ready_since_ = ts;
    }

    WS& ws() {
        return *ws_;
    }
#endif // SG_UNIT_TEST

private:
    ShardDescriptor shard_;
    ShardConfig cfg_;
    IdentifyRateLimiter& limiter_;
    stream::EventStream& events_;
    lcr::log::Logger& logger_;

    std::string gateway_url_;

    // Transport (owned) and its inbound frame ring. ws_ is replaced only
    // under transport_mutex_ so request_stop() can reach it.
    std::unique_ptr<transport::websocket::FrameRing> frames_;
    std::unique_ptr<WS> ws_;
    std::mutex transport_mutex_;
    bool transport_open_{false};

    // Payload codec
    parser::Router router_;
    codec::Inflater inflater_;
    std::string inflated_;

    // Session and liveness
    SessionInfo session_;
    HeartbeatTimer heartbeat_;
    bool awaiting_hello_{false};
    clock::time_point hello_deadline_{};
    bool identify_pending_{false};
    bool invalid_session_resumable_{false};
    clock::time_point ready_since_{};
    bool stable_{false};

    // Reconnection
    Backoff backoff_;
    clock::time_point retry_at_{};
    std::uint16_t last_close_code_{0};
    transport::Error last_error_{transport::Error::None};

    // Outbound
    SendLimiter sends_;
    std::deque<std::string> commands_;
    mutable std::mutex commands_mutex_;

    // Observable facts
    std::atomic<ConnectionState> state_{ConnectionState::NoSession};
    std::atomic<std::uint64_t> connection_id_{0};
    std::atomic<bool> stop_requested_{false};
    std::uint64_t dropped_frames_{0};
    std::uint64_t forwarded_events_{0};

    std::mt19937_64 rng_;

private:
    // State accessor
    inline ConnectionState get_state_() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    // State mutator with logging
    inline void set_state_(ConnectionState new_state) noexcept {
        SG_LOG(logger_, Trace, "[SHARD " << shard_.index << "] State:  " << to_string(get_state_()) << " -> " << to_string(new_state));
        state_.store(new_state, std::memory_order_release);
    }

    // State machine transition function
    inline void transition_(Event event, CloseDisposition disposition = CloseDisposition::Resumable) noexcept {
        const ConnectionState state = get_state_();

        SG_LOG(logger_, Trace, "[FSM] shard " << shard_.index << " (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case ConnectionState::NoSession:
            switch (event) {
            case Event::ConnectRequested:
                set_state_(ConnectionState::Connecting);
                break;

            case Event::StopRequested:
                stop_(close_code::NORMAL);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Connecting:
            switch (event) {
            case Event::HelloReceived:
                if (session_.valid()) {
                    set_state_(ConnectionState::Resuming);
                    send_resume_(clock::now());
                }
                else {
                    set_state_(ConnectionState::Identifying);
                    arm_identify_();
                }
                break;

            case Event::TransportConnectFailed:
                if (disposition == CloseDisposition::Fatal) {
                    fail_(close_code::NORMAL);
                }
                else {
                    lose_connection_(close_code::NORMAL, disposition);
                }
                break;

            case Event::HelloTimeout:
            case Event::HeartbeatAckMissed:
            case Event::ReconnectRequested:
                lose_connection_(close_code::CLIENT_RESUME, CloseDisposition::Resumable);
                break;

            case Event::ProtocolViolation:
                lose_connection_(close_code::NORMAL, CloseDisposition::NonResumable);
                break;

            case Event::TransportClosed:
                on_transport_closed_(disposition);
                break;

            case Event::StopRequested:
                stop_(close_code::NORMAL);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Identifying:
        case ConnectionState::Resuming:
        case ConnectionState::Ready:
            switch (event) {
            case Event::ReadyReceived:
                if (state == ConnectionState::Identifying) {
                    enter_ready_();
                }
                break;

            case Event::ResumedReceived:
                if (state == ConnectionState::Resuming) {
                    enter_ready_();
                }
                break;

            case Event::InvalidSession:
                if (invalid_session_resumable_ && session_.valid()) {
                    set_state_(ConnectionState::Resuming);
                    send_resume_(clock::now());
                }
                else {
                    session_.clear();
                    set_state_(ConnectionState::Identifying);
                    arm_identify_();
                }
                break;

            case Event::HeartbeatAckMissed:
            case Event::ReconnectRequested:
            case Event::HelloTimeout:
                lose_connection_(close_code::CLIENT_RESUME, CloseDisposition::Resumable);
                break;

            case Event::ProtocolViolation:
                lose_connection_(close_code::NORMAL, CloseDisposition::NonResumable);
                break;

            case Event::TransportClosed:
                on_transport_closed_(disposition);
                break;

            case Event::StopRequested:
                stop_(close_code::NORMAL);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Reconnecting:
            switch (event) {
            case Event::BackoffElapsed:
                set_state_(ConnectionState::Connecting);
                break;

            case Event::StopRequested:
                stop_(close_code::NORMAL);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Stopped:
            break;
        }
    }

    inline void on_transport_closed_(CloseDisposition disposition) noexcept {
        switch (disposition) {
            case CloseDisposition::Fatal:
                fail_(close_code::NORMAL);
                break;
            case CloseDisposition::NonResumable:
            case CloseDisposition::Resumable:
                lose_connection_(close_code::NORMAL, disposition);
                break;
        }
    }

    // ---------------------------------------------------------------------
    // Transport lifecycle
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline std::string query_() const {
        std::string q = "v=" + std::to_string(cfg_.api_version) + "&encoding=" + std::string(config::gateway::ENCODING);
        if (cfg_.compress) {
            q += "&compress=";
            q += config::gateway::COMPRESSION;
        }
        return q;
    }

    // Only TLS endpoints are usable: the transport always speaks wss
    [[nodiscard]]
    inline transport::Error parse_endpoint_(const std::string& url, transport::ParsedUrl& parsed) const {
        const auto err = transport::parse_url(transport::with_query(url, query_()), parsed);
        if (err == transport::Error::None && !parsed.secure) {
            SG_LOG(logger_, Error, "[SHARD " << shard_.index << "] '" << url << "' is not a wss:// URL");
            return transport::Error::InvalidUrl;
        }
        return err;
    }

    inline void open_transport_() noexcept {
        // Old transport (already closed) is torn down before the ring is reused
        {
            std::lock_guard<std::mutex> lock(transport_mutex_);
            ws_.reset();
        }
        frames_->clear();
        inflater_.reset();
        sends_.reset();
        heartbeat_.stop();
        transport_open_ = false;
        last_close_code_ = 0;
        last_error_ = transport::Error::None;
        const std::uint64_t id = connection_id_.fetch_add(1, std::memory_order_acq_rel) + 1;

        const bool resuming = session_.valid() && !session_.resume_url.empty();
        transport::ParsedUrl parsed;
        auto err = parse_endpoint_(resuming ? session_.resume_url : gateway_url_, parsed);
        if (err != transport::Error::None && resuming) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] resume URL '" << session_.resume_url << "' unusable, using the gateway URL");
            session_.resume_url.clear();
            err = parse_endpoint_(gateway_url_, parsed);
        }
        if (err != transport::Error::None) {
            last_error_ = err;
            transition_(Event::TransportConnectFailed, CloseDisposition::Fatal);
            return;
        }

        SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] connecting to " << parsed.host << parsed.target()
               << " (connection " << id << ")");
        {
            std::lock_guard<std::mutex> lock(transport_mutex_);
            ws_ = std::make_unique<WS>(*frames_, id, logger_);
        }
        // A stop requested before ws_ existed is not seen by request_stop()
        if (stop_requested()) {
            ws_->abort();
        }
        err = ws_->connect(parsed.host, parsed.port, parsed.target());
        if (err == transport::Error::Cancelled && stop_requested()) {
            SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] connect cancelled by stop request");
            transition_(Event::StopRequested);
            return;
        }
        if (err != transport::Error::None) {
            last_error_ = err;
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] connection failed (" << transport::to_string(err) << ")");
            transition_(Event::TransportConnectFailed, CloseDisposition::Resumable);
            return;
        }
        transport_open_ = true;
        awaiting_hello_ = true;
        hello_deadline_ = clock::now() + cfg_.connect_timeout;
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] connected to " << parsed.host << " (connection " << id << ")");
    }

    // Closes the current transport. Frames still in the ring are discarded
    // when the next transport is opened.
    inline void close_transport_(std::uint16_t code) noexcept {
        heartbeat_.stop();
        awaiting_hello_ = false;
        // Also withdraws the manager's initial registration if this
        // connection never got as far as Hello
        limiter_.cancel(shard_.index);
        identify_pending_ = false;
        if (ws_) {
            ws_->close(code);
        }
        transport_open_ = false;
    }

    // Resumable / NonResumable loss: schedule a new attempt
    inline void lose_connection_(std::uint16_t local_code, CloseDisposition disposition) noexcept {
        close_transport_(local_code);
        if (disposition == CloseDisposition::NonResumable) {
            SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] session discarded");
            session_.clear();
        }
        set_state_(ConnectionState::Reconnecting);
        const auto delay = backoff_.next_delay();
        retry_at_ = clock::now() + delay;
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] " << to_string(disposition)
               << " connection loss, reconnecting in " << delay.count() << " ms (attempt " << backoff_.attempt() << ")");
    }

    // Non-retryable termination: the only place that logs at Critical
    inline void fail_(std::uint16_t local_code) noexcept {
        if (last_close_code_ != 0) {
            SG_LOG(logger_, Critical, "[SHARD " << shard_.index << "] gateway closed the session with code "
                   << last_close_code_ << " (" << describe(last_close_code_) << "). Shard stopped.");
        }
        else {
            SG_LOG(logger_, Critical, "[SHARD " << shard_.index << "] unrecoverable transport error ("
                   << transport::to_string(last_error_) << "). Shard stopped.");
        }
        stop_(local_code);
    }

    inline void stop_(std::uint16_t local_code) noexcept {
        close_transport_(local_code);
        limiter_.cancel(shard_.index);
        session_.clear();
        {
            std::lock_guard<std::mutex> lock(commands_mutex_);
            commands_.clear();
        }
        set_state_(ConnectionState::Stopped);
        connection_id_.fetch_add(1, std::memory_order_acq_rel);
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] stopped");
    }

    inline void arm_identify_() noexcept {
        identify_pending_ = true;
        limiter_.enqueue(shard_.index);
    }

    inline void enter_ready_() noexcept {
        if (identify_pending_) {
            limiter_.cancel(shard_.index);
            identify_pending_ = false;
        }
        set_state_(ConnectionState::Ready);
        ready_since_ = clock::now();
        stable_ = false;
    }

    // ---------------------------------------------------------------------
    // Inbound
    // ---------------------------------------------------------------------

    inline void handle_frame_(transport::websocket::Frame& frame) noexcept {
        switch (frame.kind) {
            case transport::websocket::FrameKind::Text:
                on_message_(frame.payload);
                break;

            case transport::websocket::FrameKind::Binary: {
                if (!cfg_.compress) {
                    on_message_(frame.payload);
                    break;
                }
                const auto status = inflater_.feed(frame.payload, inflated_);
                if (status == codec::Status::NeedMore) {
                    break;
                }
                if (status != codec::Status::Ok) {
                    SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] compressed stream unusable (" << codec::to_string(status) << ")");
                    transition_(Event::ProtocolViolation);
                    break;
                }
                on_message_(inflated_);
                break;
            }

            case transport::websocket::FrameKind::Closed:
                last_close_code_ = frame.close_code;
                SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] closed by gateway: " << frame.close_code
                       << " (" << describe(frame.close_code) << ")");
                transition_(Event::TransportClosed, classify(frame.close_code));
                break;

            case transport::websocket::FrameKind::Error:
                last_error_ = frame.error;
                SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] transport error: " << transport::to_string(frame.error));
                transition_(Event::TransportClosed,
                            frame.error == transport::Error::ProtocolError ? CloseDisposition::NonResumable
                                                                            : CloseDisposition::Resumable);
                break;
        }
    }

    inline void on_message_(std::string_view raw) noexcept {
        if (raw.size() > cfg_.max_message_size) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] message of " << raw.size() << " bytes exceeds the limit");
            transition_(Event::ProtocolViolation);
            return;
        }
        parser::Message msg;
        switch (router_.parse(raw, msg)) {
            case parser::Result::Parsed:
                std::visit([this](auto& m) { on_(m); }, msg);
                break;
            case parser::Result::Ignored:
                break;
            default:
                transition_(Event::ProtocolViolation);
                break;
        }
    }

    inline void on_(std::monostate&) noexcept {}

    inline void on_(schema::Hello& hello) noexcept {
        if (get_state_() != ConnectionState::Connecting) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] unexpected Hello in state " << to_string(get_state_()));
            return;
        }
        awaiting_hello_ = false;
        const auto now = clock::now();
        heartbeat_.start(hello.heartbeat_interval, jitter_(hello.heartbeat_interval), now);
        SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] Hello (heartbeat interval " << hello.heartbeat_interval.count() << " ms)");
        transition_(Event::HelloReceived);
    }

    inline void on_(schema::Ready& ready) noexcept {
        if (get_state_() != ConnectionState::Identifying) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] unexpected READY in state " << to_string(get_state_()));
            return;
        }
        session_.session_id = ready.session_id;
        session_.resume_url = ready.resume_gateway_url;
        session_.last_sequence.reset();
        if (ready.dispatch.sequence.has()) {
            session_.last_sequence = ready.dispatch.sequence.value();
        }
        transition_(Event::ReadyReceived);
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] READY as " << ready.username
               << " (session " << ready.session_id << ", " << ready.guild_count << " guilds)");
        forward_(std::move(ready.dispatch));
    }

    inline void on_(schema::Resumed& resumed) noexcept {
        if (get_state_() != ConnectionState::Resuming) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] unexpected RESUMED in state " << to_string(get_state_()));
            return;
        }
        if (resumed.dispatch.sequence.has()) {
            session_.last_sequence = resumed.dispatch.sequence.value();
        }
        transition_(Event::ResumedReceived);
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] session resumed at seq " << lcr::to_string(session_.last_sequence));
        forward_(std::move(resumed.dispatch));
    }

    inline void on_(schema::Dispatch& dispatch) noexcept {
        const auto state = get_state_();
        if (state != ConnectionState::Ready && state != ConnectionState::Resuming) {
            SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] dispatch " << dispatch.name << " ignored in state " << to_string(state));
            return;
        }
        if (dispatch.sequence.has()) {
            session_.last_sequence = dispatch.sequence.value();
        }
        forward_(std::move(dispatch));
    }

    inline void on_(schema::HeartbeatRequest&) noexcept {
        send_heartbeat_(clock::now());
    }

    inline void on_(schema::HeartbeatAck&) noexcept {
        heartbeat_.on_ack(clock::now());
    }

    inline void on_(schema::Reconnect&) noexcept {
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] gateway requested a reconnect");
        transition_(Event::ReconnectRequested);
    }

    inline void on_(schema::InvalidSession& invalid) noexcept {
        SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] invalid session (resumable: " << (invalid.resumable ? "true" : "false") << ")");
        invalid_session_resumable_ = invalid.resumable;
        transition_(Event::InvalidSession);
    }

    inline void forward_(schema::Dispatch&& dispatch) noexcept {
        stream::DispatchEvent ev;
        ev.shard_index = shard_.index;
        ev.sequence = dispatch.sequence;
        ev.name = std::move(dispatch.name);
        ev.data = std::move(dispatch.data);
        if (events_.publish(ev, &stop_requested_)) {
            ++forwarded_events_;
        }
        else {
            SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] event " << ev.name << " not delivered (stream closed or stopping)");
        }
    }

    // ---------------------------------------------------------------------
    // Outbound
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline bool send_control_(const std::string& payload, clock::time_point now) noexcept {
        if (!transport_open_) {
            return false;
        }
        if (!sends_.try_acquire(SendLimiter::Lane::Control, now)) {
            SG_LOG(logger_, Warn, "[SHARD " << shard_.index << "] outbound budget exhausted, control frame dropped");
            return false;
        }
        if (!ws_->send(payload)) {
            SG_LOG(logger_, Debug, "[SHARD " << shard_.index << "] transport refused control frame");
            return false;
        }
        return true;
    }

    // A failed heartbeat still re-arms the timer: the missing ack then
    // resolves the connection as a zombie.
    inline void send_heartbeat_(clock::time_point now) noexcept {
        schema::Heartbeat hb{session_.last_sequence};
        (void)send_control_(hb.to_json(), now);
        heartbeat_.on_sent(now);
        SG_LOG(logger_, Trace, "[SHARD " << shard_.index << "] heartbeat (seq " << lcr::to_string(session_.last_sequence) << ")");
    }

    inline void send_identify_(clock::time_point now) noexcept {
        schema::Identify identify;
        identify.token = cfg_.token;
        identify.intents = cfg_.intents;
        identify.properties = cfg_.properties;
        identify.shard_index = shard_.index;
        identify.shard_count = shard_.count;
        identify.presence = cfg_.presence;
        identify.compress = false; // payload compression; transport compression is negotiated in the URL
        identify.large_threshold = cfg_.large_threshold;
        if (send_control_(identify.to_json(), now)) {
            SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] identify sent (shard " << shard_.index << "/" << shard_.count << ")");
        }
    }

    inline void send_resume_(clock::time_point now) noexcept {
        schema::Resume resume;
        resume.token = cfg_.token;
        resume.session_id = session_.session_id;
        resume.seq = session_.last_sequence;
        if (send_control_(resume.to_json(), now)) {
            SG_LOG(logger_, Info, "[SHARD " << shard_.index << "] resume sent (session " << session_.session_id
                   << ", seq " << lcr::to_string(session_.last_sequence) << ")");
        }
    }

    inline void drain_commands_(clock::time_point now) noexcept {
        std::unique_lock<std::mutex> lock(commands_mutex_);
        while (!commands_.empty() && transport_open_) {
            if (!sends_.try_acquire(SendLimiter::Lane::Command, now)) {
                break; // stays queued until the window rolls over
            }
            std::string payload = std::move(commands_.front());
            commands_.pop_front();
            lock.unlock();
            const bool sent = ws_->send(payload);
            lock.lock();
            if (!sent) {
                commands_.push_front(std::move(payload));
                break;
            }
        }
    }

    [[nodiscard]]
    inline std::chrono::milliseconds jitter_(std::chrono::milliseconds interval) noexcept {
        if (interval.count() <= 1) {
            return std::chrono::milliseconds(0);
        }
        std::uniform_int_distribution<std::int64_t> dist(0, static_cast<std::int64_t>(interval.count()) - 1);
        return std::chrono::milliseconds(dist(rng_));
    }
};

} // namespace shardgate::core::gateway
