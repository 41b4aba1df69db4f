#pragma once

#include <mutex>
#include <atomic>
#include <array>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
// Critical is reserved for fatal, non-retryable termination.
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

inline constexpr std::size_t LEVEL_COUNT = 6;

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace:    return "TRACE";
        case Level::Debug:    return "DEBUG";
        case Level::Info:     return "INFO";
        case Level::Warn:     return "WARN";
        case Level::Error:    return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "?????";
}

// Accepts "trace" | "debug" | "info" | "warn" | "error" | "critical".
// Unknown names map to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace")    return Level::Trace;
    if (name == "debug")    return Level::Debug;
    if (name == "warn")     return Level::Warn;
    if (name == "error")    return Level::Error;
    if (name == "critical") return Level::Critical;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe logger
// ---------------------------------------------------------
// A process-wide instance backs the SG_* macros. Components that
// need an explicit sink (gateway manager, shards) take a Logger&.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(false)
    {}

    explicit Logger(std::ostream& os, Level lvl = Level::Info)
        : out_(&os)
        , level_(lvl)
        , color_enabled_(false)
    {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl >= level();
    }

    // Number of messages accepted at the given level (filtered ones are not counted)
    [[nodiscard]]
    std::uint64_t count(Level lvl) const noexcept {
        return counters_[static_cast<std::size_t>(lvl)].load(std::memory_order_relaxed);
    }

    void reset_counters() noexcept {
        for (auto& c : counters_) {
            c.store(0, std::memory_order_relaxed);
        }
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        counters_[static_cast<std::size_t>(lvl)].fetch_add(1, std::memory_order_relaxed);
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << std::endl;
    }

private:
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace:    return "\033[37m";
            case Level::Debug:    return "\033[36m";
            case Level::Info:     return "\033[32m";
            case Level::Warn:     return "\033[33m";
            case Level::Error:    return "\033[31m";
            case Level::Critical: return "\033[1;31m";
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::array<std::atomic<std::uint64_t>, LEVEL_COUNT> counters_{};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    LogStream(Logger& logger, Level lvl) : logger_(logger), lvl_(lvl) {}

    explicit LogStream(Level lvl) : logger_(Logger::instance()), lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        logger_.log(lvl_, ss_.str());
    }

private:
    Logger& logger_;
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros
// ---------------------------------------------------------
// The level check happens before the message is formatted.
#define SG_LOG(logger, lvl, msg)                                              \
    do {                                                                      \
        if ((logger).enabled(::lcr::log::Level::lvl)) {                       \
            ::lcr::log::LogStream((logger), ::lcr::log::Level::lvl) << msg;   \
        }                                                                     \
    } while (0)

#define SG_TRACE(msg)     SG_LOG(::lcr::log::Logger::instance(), Trace, msg)
#define SG_DEBUG(msg)     SG_LOG(::lcr::log::Logger::instance(), Debug, msg)
#define SG_INFO(msg)      SG_LOG(::lcr::log::Logger::instance(), Info, msg)
#define SG_WARN(msg)      SG_LOG(::lcr::log::Logger::instance(), Warn, msg)
#define SG_ERROR(msg)     SG_LOG(::lcr::log::Logger::instance(), Error, msg)
#define SG_CRITICAL(msg)  SG_LOG(::lcr::log::Logger::instance(), Critical, msg)
