#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace lcr {
namespace log {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// "trace" .. "fatal", "off" ("warning" is accepted for warn).
// Unknown names leave `out` untouched.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    struct Entry { std::string_view name; Level level; };
    static constexpr Entry table[] = {
        {"trace", Level::Trace}, {"debug", Level::Debug}, {"info", Level::Info},
        {"warn", Level::Warn},   {"warning", Level::Warn}, {"error", Level::Error},
        {"fatal", Level::Fatal}, {"off", Level::Off},
    };
    for (const Entry& e : table) {
        if (e.name == name) {
            out = e.level;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------
// Process-wide logger
//
// The reactor and a websocket backend thread log concurrently: the level is
// atomic, the sink is guarded by a mutex and each record is written whole.
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        const Level threshold = level();
        return threshold != Level::Off && lvl >= threshold;
    }

    void enable_color(bool on) noexcept { color_.store(on, std::memory_order_relaxed); }

    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::clog;
    }

    void write(Level lvl, std::string_view msg) {
        if (!enabled(lvl)) {
            return;
        }
        const std::string stamp = timestamp_();
        const bool color = color_.load(std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& os = *out_;
        if (color) {
            os << ansi_(lvl);
        }
        os << stamp << ' ' << tag_(lvl) << ' ' << msg;
        if (color) {
            os << "\033[0m";
        }
        os << '\n';
        if (lvl >= Level::Warn) {
            os.flush();
        }
    }

private:
    Logger() = default;

    static std::string_view tag_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "[TRACE]";
            case Level::Debug: return "[DEBUG]";
            case Level::Info:  return "[INFO ]";
            case Level::Warn:  return "[WARN ]";
            case Level::Error: return "[ERROR]";
            case Level::Fatal: return "[FATAL]";
            case Level::Off:   break;
        }
        return "[?????]";
    }

    static std::string_view ansi_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[90m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // Local wall time, "YYYY-MM-DD HH:MM:SS.mmm"
    static std::string timestamp_() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const int millis = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &secs);
#else
        localtime_r(&secs, &local);
#endif
        char buf[32];
        const std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
        std::snprintf(buf + len, sizeof(buf) - len, ".%03d", millis);
        return std::string(buf);
    }

    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_{true};
    std::mutex mutex_;
    std::ostream* out_{&std::clog};
};

// Collects one record through operator<< and writes it on destruction
class Record {
public:
    explicit Record(Level lvl) : level_(lvl) {}
    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;

    ~Record() { Logger::instance().write(level_, buffer_.str()); }

    template<typename T>
    Record& operator<<(const T& v) {
        buffer_ << v;
        return *this;
    }

private:
    Level level_;
    std::ostringstream buffer_;
};

} // namespace log
} // namespace lcr


// Messages are only formatted when the level is enabled
#define BL_LOG_LEVEL(lvl)                                                     \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {}                    \
    else ::lcr::log::Record((lvl))

#define BL_TRACE(msg)  BL_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define BL_DEBUG(msg)  BL_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define BL_INFO(msg)   BL_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define BL_WARN(msg)   BL_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define BL_ERROR(msg)  BL_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define BL_FATAL(msg)  BL_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
