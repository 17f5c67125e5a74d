// -----------------------------------------------------------------------------
// log.cpp: implementation for log.hpp
//
// Threshold is an atomic so the hot path (a skipped debug line) takes no lock.
// The sink is guarded by one mutex; lines from different threads never mix.
// -----------------------------------------------------------------------------
#include "floodnet/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace floodnet::log {

namespace {
std::atomic<Level> g_level{Level::Info};
std::mutex         g_mutex;
std::ostream*      g_sink = &std::cerr;
}

void set_level(Level lvl) { g_level.store(lvl); }

Level level() { return g_level.load(); }

bool parse_level(const std::string& text, Level& out) {
    if (text == "debug") { out = Level::Debug; return true; }
    if (text == "info")  { out = Level::Info;  return true; }
    if (text == "warn")  { out = Level::Warn;  return true; }
    if (text == "error") { out = Level::Error; return true; }
    if (text == "off")   { out = Level::Off;   return true; }
    return false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "unknown";
}

void set_sink(std::ostream& os) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = &os;
}

void write(Level lvl, const std::string& event, const std::string& fields) {
    if (lvl == Level::Off || lvl < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_mutex);
    *g_sink << "level=" << level_name(lvl) << " event=" << event;
    if (!fields.empty()) *g_sink << ' ' << fields;
    *g_sink << '\n';
    g_sink->flush();
}

} // namespace floodnet::log
