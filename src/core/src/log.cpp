#include "core/log.hpp"
#include <mutex>
#include <iostream>
#include <atomic>
#include <chrono>
#include <sstream>
#include <iomanip>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vcam::log {

static SinkFn g_sink;
static std::mutex g_mutex;
static std::atomic<bool> g_json{false};
static std::atomic<int> g_level{static_cast<int>(Level::Info)};

// stdout may carry frame data (raw sink / pattern producer), so everything goes to stderr.
static std::shared_ptr<spdlog::logger> stderr_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto l = spdlog::stderr_color_mt("vcam");
        l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        l->set_level(spdlog::level::trace);
        return l;
    }();
    return logger;
}

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) noexcept {
    if(name == "trace") return Level::Trace;
    if(name == "debug") return Level::Debug;
    if(name == "info") return Level::Info;
    if(name == "warn" || name == "warning") return Level::Warn;
    if(name == "error") return Level::Error;
    if(name == "critical") return Level::Critical;
    return std::nullopt;
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

void set_level(Level lvl) noexcept { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }
Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

std::string json_escape(const std::string& text) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(text.size());
    for(char ch: text) {
        const auto c = static_cast<unsigned char>(ch);
        switch(c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20) {
                    out += "\\u00";
                    out += hex[c >> 4];
                    out += hex[c & 0xF];
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

static void default_emit(Level lvl, const std::string& msg) {
    if(json_mode()) {
        // Minimal JSON line: {"ts":"ISO8601","level":"info","msg":"..."}
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream ts;
        ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        ts << '.' << std::setw(3) << std::setfill('0') << ms.count();
        std::clog << '{' << "\"ts\":\"" << ts.str() << "\",\"level\":\"" << level_name(lvl)
                  << "\",\"msg\":\"" << json_escape(msg) << "\"}" << '\n';
    } else {
        auto logger = stderr_logger();
        switch(lvl){
            case Level::Trace: logger->trace(msg); break;
            case Level::Debug: logger->debug(msg); break;
            case Level::Info: logger->info(msg); break;
            case Level::Warn: logger->warn(msg); break;
            case Level::Error: logger->error(msg); break;
            case Level::Critical: logger->critical(msg); break;
        }
    }
}

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::scoped_lock lock(g_mutex);
    try {
        if(g_sink) { g_sink(lvl, msg); return; }
        default_emit(lvl, msg);
    } catch(const std::exception& e) {
        std::cerr << "vcam::log: sink failed: " << e.what() << '\n';
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

} // namespace vcam::log
