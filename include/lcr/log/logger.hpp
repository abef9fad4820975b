#pragma once

#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// ---------------------------------------------------------
// Parse a level name (trace | debug | info | warn | error | fatal | off)
// ---------------------------------------------------------
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if (name == "trace")      { out = Level::Trace; return true; }
    else if (name == "debug") { out = Level::Debug; return true; }
    else if (name == "info")  { out = Level::Info;  return true; }
    else if (name == "warn")  { out = Level::Warn;  return true; }
    else if (name == "error") { out = Level::Error; return true; }
    else if (name == "fatal") { out = Level::Fatal; return true; }
    else if (name == "off")   { out = Level::Off;   return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// Library code logs through the UMADB_* macros below. The sink is
// std::clog so that applications keep stdout for their own output.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    // Applies the level named by an environment variable, if set and valid.
    // Returns true when the level was changed.
    bool set_level_from_env(const char* var = "UMADB_LOG_LEVEL") noexcept {
        const char* value = std::getenv(var);
        if (value == nullptr) {
            return false;
        }
        Level lvl;
        if (!parse_level(value, lvl)) {
            return false;
        }
        set_level(lvl);
        return true;
    }

    // Enable or disable ANSI colored output
    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = (os != nullptr) ? os : &std::clog;
    }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return lvl >= level_ && level_ != Level::Off;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl < level_ || level_ == Level::Off) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::clog)
        , level_(Level::Info)
        , color_enabled_(false)
    {
        set_level_from_env();
    }

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default:           break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            default:           break;
        }
        return "\033[0m";
    }

    // Local wall-clock time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Logging macros
// ---------------------------------------------------------
// The message expression is only evaluated when the level is enabled.
#define UMADB_LOG_LEVEL(lvl, msg)                                            \
    do {                                                                     \
        if (::lcr::log::Logger::instance().enabled((lvl))) {                 \
            ::lcr::log::LogStream((lvl)) << msg;                             \
        }                                                                    \
    } while (0)

#define UMADB_TRACE(msg)  UMADB_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define UMADB_DEBUG(msg)  UMADB_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define UMADB_INFO(msg)   UMADB_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define UMADB_WARN(msg)   UMADB_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define UMADB_ERROR(msg)  UMADB_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define UMADB_FATAL(msg)  UMADB_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
