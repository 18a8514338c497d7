#pragma once
/**
 * @file log.hpp
 * @brief Minimal leveled logger with a replaceable sink.
 *
 * Lines follow the CLI's key=value convention:
 *   level=warn frame dropped reason="Invalid checksum (expected 0x5F)."
 *
 * The default sink writes to std::cerr. Tests install their own sink to
 * capture output. Logging never affects control flow.
 */

#include <functional>
#include <string>

namespace xbeelink::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level level);
Level level();

/// Replace the sink; an empty function restores the stderr sink.
void set_sink(Sink sink);

/// Reads XBEELINK_LOG_LEVEL (debug|info|warn|error|off) if set.
void init_from_env();

/// "debug" / "info" / ...; false for an unknown name.
bool level_from_string(const std::string& name, Level& out);
const char* to_string(Level level);

void write(Level level, const std::string& message);

inline void debug(const std::string& m) { write(Level::Debug, m); }
inline void info(const std::string& m)  { write(Level::Info, m); }
inline void warn(const std::string& m)  { write(Level::Warn, m); }
inline void error(const std::string& m) { write(Level::Error, m); }

} // namespace xbeelink::log
