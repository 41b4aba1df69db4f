#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include <zlib.h>

#include "shardgate/core/config/gateway.hpp"
#include "lcr/log/logger.hpp"


namespace shardgate::core::gateway::codec {

// ===============================================
// CODEC STATUS
// ===============================================
enum class Status : std::uint8_t {
    Ok,             // a complete message was produced
    NeedMore,       // input buffered, message not complete yet
    Corrupt,        // inflate failed, stream is unusable
    TooLarge,       // message or pending input exceeds the size limit
    NotInitialized  // zlib context could not be created
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Ok:             return "Ok";
        case Status::NeedMore:       return "NeedMore";
        case Status::Corrupt:        return "Corrupt";
        case Status::TooLarge:       return "TooLarge";
        case Status::NotInitialized: return "NotInitialized";
        default:                     return "Unknown";
    }
}


/*
===============================================================================
 codec::Inflater
===============================================================================

zlib-stream transport decompression.

The whole connection is ONE deflate stream. Every binary frame is a slice of
it, and a logical message ends where the sender issued a sync flush (the
input ends with 00 00 FF FF). The inflate context therefore persists for the
lifetime of the connection and is only reset when a new connection starts.

  feed(bytes, out)
    - appends bytes to the pending input
    - if the pending input ends with the sync-flush marker, inflates it into
      out (replacing its content) and returns Ok
    - otherwise returns NeedMore

After Corrupt or TooLarge the context must be reset() before reuse.
Single-threaded (shard runner).
===============================================================================
*/
class Inflater {
public:
    explicit Inflater(std::size_t max_output = config::gateway::MAX_MESSAGE_SIZE,
                      lcr::log::Logger& logger = lcr::log::Logger::instance()) noexcept
        : max_output_(max_output)
        , logger_(logger)
    {
        init_();
    }

    ~Inflater() {
        end_();
    }

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    // Start a fresh stream (new connection)
    inline void reset() noexcept {
        end_();
        pending_.clear();
        init_();
    }

    [[nodiscard]]
    inline Status feed(std::string_view bytes, std::string& out) {
        if (!initialized_) {
            return Status::NotInitialized;
        }
        if (pending_.size() + bytes.size() > max_output_) {
            SG_LOG(logger_, Warn, "[CODEC] pending compressed input exceeds " << max_output_ << " bytes");
            return Status::TooLarge;
        }
        pending_.append(bytes.data(), bytes.size());
        if (!ends_with_sync_flush_()) {
            return Status::NeedMore;
        }
        out.clear();
        Status status = inflate_(out);
        pending_.clear();
        return status;
    }

    [[nodiscard]]
    inline std::size_t pending_bytes() const noexcept {
        return pending_.size();
    }

    // Total decompressed bytes since the last reset
    [[nodiscard]]
    inline std::uint64_t total_out() const noexcept {
        return initialized_ ? static_cast<std::uint64_t>(stream_.total_out) : 0;
    }

private:
    static constexpr unsigned char SYNC_FLUSH_SUFFIX[4] = {0x00, 0x00, 0xFF, 0xFF};
    static constexpr std::size_t CHUNK_SIZE = 16 * 1024;

    z_stream stream_{};
    bool initialized_{false};
    std::size_t max_output_;
    lcr::log::Logger& logger_;
    std::string pending_;

private:
    inline void init_() noexcept {
        std::memset(&stream_, 0, sizeof(stream_));
        initialized_ = (inflateInit(&stream_) == Z_OK);
        if (!initialized_) {
            SG_LOG(logger_, Error, "[CODEC] inflateInit failed");
        }
    }

    inline void end_() noexcept {
        if (initialized_) {
            inflateEnd(&stream_);
            initialized_ = false;
        }
    }

    [[nodiscard]]
    inline bool ends_with_sync_flush_() const noexcept {
        if (pending_.size() < sizeof(SYNC_FLUSH_SUFFIX)) {
            return false;
        }
        return std::memcmp(pending_.data() + pending_.size() - sizeof(SYNC_FLUSH_SUFFIX),
                           SYNC_FLUSH_SUFFIX, sizeof(SYNC_FLUSH_SUFFIX)) == 0;
    }

    [[nodiscard]]
    inline Status inflate_(std::string& out) {
        unsigned char chunk[CHUNK_SIZE];
        stream_.next_in  = reinterpret_cast<Bytef*>(pending_.data());
        stream_.avail_in = static_cast<uInt>(pending_.size());
        do {
            stream_.next_out  = chunk;
            stream_.avail_out = static_cast<uInt>(sizeof(chunk));
            const int rc = ::inflate(&stream_, Z_SYNC_FLUSH);
            if (rc != Z_OK && rc != Z_BUF_ERROR && rc != Z_STREAM_END) {
                SG_LOG(logger_, Warn, "[CODEC] inflate failed (rc=" << rc << (stream_.msg ? ", " : "") << (stream_.msg ? stream_.msg : "") << ")");
                return Status::Corrupt;
            }
            const std::size_t produced = sizeof(chunk) - stream_.avail_out;
            if (out.size() + produced > max_output_) {
                SG_LOG(logger_, Warn, "[CODEC] decompressed message exceeds " << max_output_ << " bytes");
                return Status::TooLarge;
            }
            out.append(reinterpret_cast<const char*>(chunk), produced);
            if (rc == Z_BUF_ERROR && produced == 0) {
                break; // no progress possible, all input consumed
            }
            if (rc == Z_STREAM_END) {
                break;
            }
        } while (stream_.avail_in > 0 || stream_.avail_out == 0);
        return Status::Ok;
    }
};

} // namespace shardgate::core::gateway::codec
