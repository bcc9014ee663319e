#pragma once
/**
 * @file log.hpp
 * @brief One-line key=value diagnostics on stderr.
 *
 * Every line starts with the level, followed by whatever key=value fields the
 * caller supplies:
 *
 *     level=warn event=channel_gap channel=3 cycle=12
 *     level=error status=error reason=open_failed dev=/dev/ttyUSB0
 *
 * Lines are grep- and awk-friendly, matching the status= lines the CLI prints.
 * The stream can be redirected (tests capture it in a std::ostringstream).
 */

#include <cstdint>
#include <ostream>
#include <string>

namespace lmreadout::log {

enum class Level : uint8_t { Error=0, Warn=1, Info=2, Debug=3 };

void  set_level(Level lvl);
Level level();

/// Redirect output; nullptr restores std::cerr.
void set_stream(std::ostream* os);

bool enabled(Level lvl);
void write(Level lvl, const std::string& fields);

inline void error(const std::string& f) { write(Level::Error, f); }
inline void warn (const std::string& f) { write(Level::Warn,  f); }
inline void info (const std::string& f) { write(Level::Info,  f); }
inline void debug(const std::string& f) { write(Level::Debug, f); }

const char* to_string(Level lvl);

} // namespace lmreadout::log
