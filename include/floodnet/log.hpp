#pragma once
/**
 * @file log.hpp
 * @brief Leveled key=value diagnostics for the node.
 *
 * One line per event on stderr, machine-greppable and readable by eye:
 *
 *     level=info event=new_peer addr=127.0.0.1:40312
 *     level=warn event=read_failed addr=10.0.0.7:9000 reason=Connection reset by peer
 *
 * stdout is reserved for delivered messages, so diagnostics never interleave
 * with program output. Lines below the process-wide threshold are skipped.
 * Calls are safe from any thread (accept and stdin threads log too).
 */

#include <cstdint>
#include <ostream>
#include <string>

namespace floodnet::log {

enum class Level : uint8_t { Debug=0, Info=1, Warn=2, Error=3, Off=4 };

void  set_level(Level lvl);
Level level();

/// "debug" | "info" | "warn" | "error" | "off"
bool        parse_level(const std::string& text, Level& out);
const char* level_name(Level lvl);

/// Redirect output (tests capture into a std::ostringstream). Default: std::cerr.
void set_sink(std::ostream& os);

/// Emit "level=<lvl> event=<event> <fields>" if `lvl` passes the threshold.
void write(Level lvl, const std::string& event, const std::string& fields);

inline void debug(const std::string& event, const std::string& fields = "") { write(Level::Debug, event, fields); }
inline void info (const std::string& event, const std::string& fields = "") { write(Level::Info,  event, fields); }
inline void warn (const std::string& event, const std::string& fields = "") { write(Level::Warn,  event, fields); }
inline void error(const std::string& event, const std::string& fields = "") { write(Level::Error, event, fields); }

} // namespace floodnet::log
