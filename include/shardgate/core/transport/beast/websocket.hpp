#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "shardgate/core/config/gateway.hpp"
#include "shardgate/core/config/transport.hpp"
#include "shardgate/core/transport/concepts.hpp"
#include "shardgate/core/transport/error.hpp"
#include "shardgate/core/transport/websocket/frame.hpp"
#include "lcr/log/logger.hpp"


/*
================================================================================
WebSocket Transport (Boost.Beast over Asio SSL)
================================================================================

Single-connection transport primitive. No retries, no reconnection logic, no
protocol knowledge: recovery lives in ShardConnection.

  • connect() runs resolve -> TCP connect -> TLS handshake (SNI) -> WebSocket
    upgrade on the caller's thread. One deadline (HANDSHAKE_TIMEOUT) covers
    the whole chain
  • abort() may be called from any thread: an in-flight connect() returns
    Cancelled at once. A resolve that is still inside getaddrinfo is
    abandoned, and the destructor waits for it to return
  • On success an IO thread takes over the io_context and runs the read loop
  • Every message is pushed into the shard's FrameRing tagged with the
    ConnectionId this instance was created for
  • The stream ends with exactly one terminal frame (Closed / Error), unless
    the local side closed it, in which case nothing more is pushed
  • send() posts onto the io_context; one async_write in flight at a time
  • close() performs the closing handshake (bounded by CLOSE_TIMEOUT) and joins

Beast / Asio error codes are translated into transport::Error here and never
leave this file.
================================================================================
*/

namespace shardgate::core::transport {
namespace beast {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace bb  = boost::beast;
namespace bws = boost::beast::websocket;

class WebSocket {
    using tcp         = net::ip::tcp;
    using stream_type = bws::stream<bb::ssl_stream<bb::tcp_stream>>;

public:
    WebSocket(websocket::FrameRing& ring, std::uint64_t connection_id, lcr::log::Logger& logger)
        : ring_(ring)
        , connection_id_(connection_id)
        , logger_(logger)
        , ssl_ctx_(ssl::context::tlsv12_client)
        , connect_timer_(ioc_)
        , close_timer_(ioc_)
    {}

    ~WebSocket() {
        shutdown_();
    }

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    inline std::uint64_t connection_id() const noexcept {
        return connection_id_;
    }

    [[nodiscard]]
    inline bool is_open() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

    // Single shot: a WebSocket serves exactly one connection attempt
    [[nodiscard]]
    inline Error connect(const std::string& host, const std::string& port, const std::string& target) noexcept {
        if (attempted_) {
            return Error::InvalidState;
        }
        attempted_ = true;
        try {
            return connect_(host, port, target);
        }
        catch (const std::exception& e) {
            SG_LOG(logger_, Error, "[WS] connect failed: " << e.what());
            ws_.reset();
            return Error::TransportFailure;
        }
    }

    // Thread-safe. Cancels an in-flight connect(); no effect once connected.
    inline void abort() noexcept {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        aborted_ = true;
        if (connecting_) {
            ioc_.stop();
        }
    }

    [[nodiscard]]
    inline bool send(std::string_view msg) noexcept {
        if (!open_.load(std::memory_order_acquire) || stopping_.load(std::memory_order_acquire)) {
            return false;
        }
        try {
            net::post(ioc_, [this, m = std::string(msg)]() mutable {
                write_queue_.push_back(std::move(m));
                if (!writing_) {
                    do_write_();
                }
            });
        }
        catch (const std::exception& e) {
            SG_LOG(logger_, Error, "[WS] send failed: " << e.what());
            return false;
        }
        return true;
    }

    // Idempotent. Nothing is pushed into the ring once close() has started.
    inline void close(std::uint16_t code) noexcept {
        if (stopping_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (!io_thread_.joinable()) {
            return;
        }
        if (open_.load(std::memory_order_acquire)) {
            try {
                net::post(ioc_, [this, code] {
                    close_code_ = code;
                    closing_ = true;
                    if (!writing_) {
                        do_close_();
                    }
                });
            }
            catch (const std::exception& e) {
                SG_LOG(logger_, Warn, "[WS] graceful close unavailable: " << e.what());
                ioc_.stop();
            }
        }
        io_thread_.join();
        open_.store(false, std::memory_order_release);
    }

#ifdef SG_UNIT_TEST
public:
    // Trusts one more CA (PEM) on top of the system store
    inline void add_certificate_authority(std::string_view pem) {
        ssl_ctx_.add_certificate_authority(net::buffer(pem.data(), pem.size()));
    }
#endif // SG_UNIT_TEST

private:
    websocket::FrameRing& ring_;
    std::uint64_t connection_id_;
    lcr::log::Logger& logger_;

    net::io_context ioc_;
    ssl::context ssl_ctx_;
    net::steady_timer connect_timer_;
    net::steady_timer close_timer_;
    std::unique_ptr<stream_type> ws_;
    bb::flat_buffer read_buffer_;

    // Touched only on the io_context thread
    std::deque<std::string> write_queue_;
    bool writing_{false};
    bool closing_{false};
    std::uint16_t close_code_{bws::close_code::normal};

    // Connect attempt (aborted_ / connecting_ guarded by connect_mutex_)
    bool attempted_{false};
    std::mutex connect_mutex_;
    bool aborted_{false};
    bool connecting_{false};

    std::thread io_thread_;
    std::atomic<bool> open_{false};
    std::atomic<bool> stopping_{false};

private:
    [[nodiscard]]
    inline Error connect_(const std::string& host, const std::string& port, const std::string& target) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);

        ws_ = std::make_unique<stream_type>(ioc_, ssl_ctx_);

        // SNI (most TLS front ends refuse the handshake without it)
        if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
            SG_LOG(logger_, Error, "[WS] failed to set SNI host name " << host);
            ws_.reset();
            return Error::HandshakeFailed;
        }
        ws_->next_layer().set_verify_callback(ssl::host_name_verification(host));

        // Handlers below capture locals by reference. They only ever run
        // inside the ioc_.run() call of this function: on success the chain
        // drains completely, on timeout / abort the context is stopped and
        // never run again.
        Error result = Error::None;
        bool done = false;
        auto fail = [&](Error e, const bb::error_code& ec, std::string_view step) {
            if (done) {
                return;
            }
            done = true;
            result = e;
            connect_timer_.cancel();
            SG_LOG(logger_, Warn, "[WS] " << step << " failed: " << ec.message());
        };

        tcp::resolver resolver(ioc_);

        connect_timer_.expires_after(config::transport::HANDSHAKE_TIMEOUT);
        connect_timer_.async_wait([&](const bb::error_code& ec) {
            if (ec == net::error::operation_aborted || done) {
                return;
            }
            done = true;
            result = Error::Timeout;
            SG_LOG(logger_, Warn, "[WS] handshake with " << host << ":" << port << " timed out");
            // A pending resolve cannot be cancelled, so the chain is abandoned
            ioc_.stop();
        });

        resolver.async_resolve(host, port,
            [&](const bb::error_code& ec, tcp::resolver::results_type results) {
            if (done) {
                return;
            }
            if (ec) {
                return fail(Error::ConnectionFailed, ec, "resolve");
            }
            bb::get_lowest_layer(*ws_).async_connect(results,
                [&](const bb::error_code& ec, const tcp::endpoint&) {
                if (done) {
                    return;
                }
                if (ec) {
                    return fail(Error::ConnectionFailed, ec, "tcp connect");
                }
                ws_->next_layer().async_handshake(ssl::stream_base::client,
                    [&](const bb::error_code& ec) {
                    if (done) {
                        return;
                    }
                    if (ec) {
                        return fail(Error::HandshakeFailed, ec, "tls handshake");
                    }
                    // Liveness is the gateway heartbeat's job, the closing
                    // handshake has its own timer
                    bws::stream_base::timeout opt{
                        bws::stream_base::none(),
                        bws::stream_base::none(),
                        false
                    };
                    ws_->set_option(opt);
                    ws_->set_option(bws::stream_base::decorator([](bws::request_type& req) {
                        req.set(boost::beast::http::field::user_agent, std::string(config::transport::USER_AGENT));
                    }));
                    ws_->read_message_max(config::gateway::MAX_MESSAGE_SIZE);
                    ws_->async_handshake(host, target,
                        [&](const bb::error_code& ec) {
                        if (done) {
                            return;
                        }
                        if (ec) {
                            return fail(Error::HandshakeFailed, ec, "websocket upgrade");
                        }
                        done = true;
                        connect_timer_.cancel();
                    });
                });
            });
        });

        {
            std::lock_guard<std::mutex> lock(connect_mutex_);
            if (aborted_) {
                SG_LOG(logger_, Debug, "[WS] connect aborted before it started (connection " << connection_id_ << ")");
                return Error::Cancelled;
            }
            connecting_ = true;
        }

        // Drives the handshake chain on this thread
        ioc_.run();

        {
            std::lock_guard<std::mutex> lock(connect_mutex_);
            connecting_ = false;
            if (aborted_) {
                SG_LOG(logger_, Debug, "[WS] connect aborted (connection " << connection_id_ << ")");
                result = Error::Cancelled;
            }
        }
        if (result != Error::None) {
            return result;
        }
        ioc_.restart();

        ws_->text(true);
        open_.store(true, std::memory_order_release);
        do_read_();
        io_thread_ = std::thread([this] {
            ioc_.run();
            open_.store(false, std::memory_order_release);
        });
        SG_LOG(logger_, Debug, "[WS] connected to " << host << ":" << port << " (connection " << connection_id_ << ")");
        return Error::None;
    }

    inline void do_read_() {
        ws_->async_read(read_buffer_, [this](const bb::error_code& ec, std::size_t) {
            if (ec) {
                on_read_error_(ec);
                return;
            }
            websocket::Frame frame;
            frame.connection_id = connection_id_;
            frame.kind = ws_->got_text() ? websocket::FrameKind::Text : websocket::FrameKind::Binary;
            frame.payload = bb::buffers_to_string(read_buffer_.data());
            read_buffer_.consume(read_buffer_.size());
            if (!push_(std::move(frame))) {
                return;
            }
            do_read_();
        });
    }

    inline void on_read_error_(const bb::error_code& ec) {
        open_.store(false, std::memory_order_release);
        close_timer_.cancel();
        if (stopping_.load(std::memory_order_acquire)) {
            return;
        }
        websocket::Frame frame;
        frame.connection_id = connection_id_;
        if (ec == bws::error::closed) {
            frame.kind = websocket::FrameKind::Closed;
            frame.close_code = static_cast<std::uint16_t>(ws_->reason().code);
            frame.error = Error::RemoteClosed;
            SG_LOG(logger_, Debug, "[WS] remote close " << frame.close_code << " (connection " << connection_id_ << ")");
        }
        else {
            frame.kind = websocket::FrameKind::Error;
            frame.error = map_error_(ec);
            SG_LOG(logger_, Debug, "[WS] read failed: " << ec.message() << " -> " << to_string(frame.error));
        }
        (void)push_(std::move(frame));
    }

    // Spins while the ring is full; gives up once a local close starts
    [[nodiscard]]
    inline bool push_(websocket::Frame&& frame) {
        while (!ring_.push(std::move(frame))) {
            if (stopping_.load(std::memory_order_acquire)) {
                return false;
            }
            std::this_thread::yield();
        }
        return true;
    }

    inline void do_write_() {
        writing_ = true;
        ws_->async_write(net::buffer(write_queue_.front()), [this](const bb::error_code& ec, std::size_t) {
            write_queue_.pop_front();
            if (ec) {
                // The read side reports the failure
                SG_LOG(logger_, Debug, "[WS] write failed: " << ec.message());
                writing_ = false;
                write_queue_.clear();
                if (closing_) {
                    bb::error_code ignored;
                    bb::get_lowest_layer(*ws_).socket().close(ignored);
                }
                return;
            }
            if (!write_queue_.empty() && !closing_) {
                do_write_();
                return;
            }
            writing_ = false;
            if (closing_) {
                do_close_();
            }
        });
    }

    inline void do_close_() {
        close_timer_.expires_after(config::transport::CLOSE_TIMEOUT);
        close_timer_.async_wait([this](const bb::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            bb::error_code ignored;
            bb::get_lowest_layer(*ws_).socket().close(ignored);
        });
        ws_->async_close(bws::close_reason(close_code_), [this](const bb::error_code& ec) {
            if (ec) {
                SG_LOG(logger_, Debug, "[WS] closing handshake failed: " << ec.message());
                bb::error_code ignored;
                bb::get_lowest_layer(*ws_).socket().close(ignored);
            }
            // The pending read completes with `closed` and the loop drains
        });
    }

    inline void shutdown_() noexcept {
        stopping_.store(true, std::memory_order_release);
        if (io_thread_.joinable()) {
            ioc_.stop();
            io_thread_.join();
        }
        open_.store(false, std::memory_order_release);
    }

    [[nodiscard]]
    static inline Error map_error_(const bb::error_code& ec) noexcept {
        if (ec == bb::error::timeout) {
            return Error::Timeout;
        }
        if (ec == bws::error::message_too_big || ec == bws::error::bad_opcode ||
            ec == bws::error::bad_data_frame || ec == bws::error::bad_frame_payload) {
            return Error::ProtocolError;
        }
        if (ec == net::error::operation_aborted) {
            return Error::Cancelled;
        }
        return Error::TransportFailure;
    }
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace shardgate::core::transport
