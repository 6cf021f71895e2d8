#pragma once
#include <string>
#include <functional>
#include <optional>

namespace vcam::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replace the default spdlog output (tests capture log lines this way). Pass an empty
// function to restore the default.
void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

// Thin wrapper over spdlog with a JSON-lines mode for piping into log collectors.
void set_json_mode(bool enabled) noexcept;
bool json_mode() noexcept;
// Escapes a message for a JSON string body; control characters become \n, \t or \u00XX.
std::string json_escape(const std::string& text);

// Messages below the level are dropped before reaching any sink.
void set_level(Level lvl) noexcept;
Level level() noexcept;
std::optional<Level> parse_level(const std::string& name) noexcept;
const char* level_name(Level lvl) noexcept;

void trace(const std::string& msg) noexcept;
void debug(const std::string& msg) noexcept;
void info(const std::string& msg) noexcept;
void warn(const std::string& msg) noexcept;
void error(const std::string& msg) noexcept;
void critical(const std::string& msg) noexcept;

} // namespace vcam::log
