#pragma once
/**
 * @file command_source.hpp
 * @brief Background reader turning operator lines into Commands.
 *
 * Reads a file descriptor (stdin for the node, a pipe in tests) on its own
 * thread, splits it into lines, parses each with parse_command() and pushes
 * the result into a Channel<Command>. Bad lines are logged and skipped.
 *
 * End of input or a read error closes the channel, which the event loop sees
 * as CommandsDisconnected. The reader waits in poll(2) with a short timeout
 * so stop() can end it without needing the fd to close.
 */

#include <atomic>
#include <string>
#include <thread>

#include "channel.hpp"
#include "command.hpp"

namespace floodnet {

using CommandChannel = Channel<Command>;

class CommandSource {
public:
  static constexpr int POLL_SLICE_MS = 100;   ///< how often the reader checks for stop()
  static constexpr size_t MAX_LINE_BYTES = 4096;  ///< longer lines are rejected whole

  CommandSource(int fd, CommandChannel& out);
  ~CommandSource();

  CommandSource(const CommandSource&) = delete;
  CommandSource& operator=(const CommandSource&) = delete;

  void start();

  /// Ask the reader to exit and join it. Does not close the channel.
  void stop();

  /// Lines rejected by the parser so far.
  uint32_t rejected() const { return rejected_.load(); }

private:
  void run();
  void handle_line(const std::string& line);

  int                   fd_;
  CommandChannel&       out_;
  std::thread           thread_;
  std::atomic<bool>     stopping_{false};
  std::atomic<uint32_t> rejected_{0};
};

} // namespace floodnet
