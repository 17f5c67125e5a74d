#pragma once
/**
 * @file command.hpp
 * @brief Operator instructions and the line parser that produces them.
 *
 * One command per line of operator input:
 *
 *     connect 127.0.0.1:9001     dial a peer
 *     broadcast hello mesh       originate a message ("hello mesh")
 *     disconnect                 shut down every peer link
 *
 * Leading and trailing whitespace is ignored. For `broadcast` the text is
 * everything after the first run of spaces, inner spacing kept as typed.
 * Verbs are case-sensitive. `disconnect` ignores any trailing words.
 *
 * Parsing reports failure the same way the rest of the node does: `false`
 * plus a stable reason string suitable for `status=error reason=<err>`.
 *
 *   empty_line        nothing but whitespace
 *   unknown_command   verb is not one of the three above
 *   missing_argument  connect/broadcast with nothing after the verb
 *   bad_address       connect target is not "ip:port" / "[v6]:port"
 */

#include <cstdint>
#include <string>
#include <utility>

namespace floodnet {

struct Command {
  enum class Kind : uint8_t { Connect=0, Broadcast=1, Disconnect=2 };

  Kind        kind{Kind::Disconnect};
  std::string argument;   ///< address for Connect, text for Broadcast, empty otherwise

  static Command connect(std::string address) { return Command{Kind::Connect, std::move(address)}; }
  static Command broadcast(std::string text)  { return Command{Kind::Broadcast, std::move(text)}; }
  static Command disconnect()                 { return Command{Kind::Disconnect, {}}; }

  bool operator==(const Command& o) const { return kind == o.kind && argument == o.argument; }
};

/// Parse one operator line. On failure `out` is untouched and `err` set.
bool parse_command(const std::string& line, Command& out, std::string& err);

} // namespace floodnet
