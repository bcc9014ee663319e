#include "lmreadout/log.hpp"

#include <iostream>

namespace lmreadout::log {

// Single-threaded process; plain statics are enough.
static Level         g_level  = Level::Info;
static std::ostream* g_stream = nullptr;

void  set_level(Level lvl) { g_level = lvl; }
Level level()              { return g_level; }

void set_stream(std::ostream* os) { g_stream = os; }

bool enabled(Level lvl) {
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(g_level);
}

void write(Level lvl, const std::string& fields) {
    if (!enabled(lvl)) return;
    std::ostream& os = g_stream ? *g_stream : std::cerr;
    os << "level=" << to_string(lvl);
    if (!fields.empty()) os << ' ' << fields;
    os << '\n';
    os.flush();
}

const char* to_string(Level lvl) {
    switch (lvl) {
        case Level::Error: return "error";
        case Level::Warn:  return "warn";
        case Level::Info:  return "info";
        case Level::Debug: return "debug";
    }
    return "unknown";
}

} // namespace lmreadout::log
