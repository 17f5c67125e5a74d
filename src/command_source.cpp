// ============================================================================
// command_source.cpp: implementation for command_source.hpp
// ============================================================================

#include "floodnet/command_source.hpp"
#include "floodnet/log.hpp"

#include <poll.h>          // poll(2) for the stop-aware wait
#include <unistd.h>        // ::read
#include <cerrno>
#include <cstring>         // strerror

namespace floodnet {

CommandSource::CommandSource(int fd, CommandChannel& out)
: fd_(fd), out_(out) {}

CommandSource::~CommandSource() {
  stop();
}

void CommandSource::start() {
  stopping_.store(false);
  thread_ = std::thread([this] { run(); });
}

void CommandSource::stop() {
  stopping_.store(true);
  if (thread_.joinable()) thread_.join();
}

// ---------------------------------------------------------------------------
// run()
// -----
// Read loop. Bytes are collected into `pending` and cut at '\n'.
//
// POLICY:
//   - A final line without '\n' still counts when input ends.
//   - Lines longer than MAX_LINE_BYTES are dropped whole (rejected, not truncated).
//   - EOF or a hard read error closes the channel: producer death.
// ---------------------------------------------------------------------------
void CommandSource::run() {
  std::string pending;
  bool        skipping = false;     // inside an over-long line, waiting for '\n'
  char        buf[512];
  pollfd      pfd{fd_, POLLIN, 0};

  while (!stopping_.load()) {
    const int pr = ::poll(&pfd, 1, POLL_SLICE_MS);
    if (pr == 0) continue;                          // timeout: re-check stop flag
    if (pr < 0) {
      if (errno == EINTR) continue;
      log::error("command_input_failed", std::string("reason=") + std::strerror(errno));
      out_.close();
      return;
    }

    const ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      log::error("command_input_failed", std::string("reason=") + std::strerror(errno));
      out_.close();
      return;
    }

    if (n == 0) {                                   // end of input
      if (!skipping && !pending.empty()) handle_line(pending);
      log::info("command_input_closed");
      out_.close();
      return;
    }

    for (ssize_t i = 0; i < n; ++i) {
      const char c = buf[i];
      if (c == '\n') {
        if (!skipping) handle_line(pending);
        pending.clear();
        skipping = false;
        continue;
      }
      if (skipping) continue;
      pending += c;
      if (pending.size() > MAX_LINE_BYTES) {
        log::warn("command_rejected", "reason=line_too_long");
        ++rejected_;
        pending.clear();
        skipping = true;
      }
    }
  }
}

void CommandSource::handle_line(const std::string& line) {
  Command cmd;
  std::string err;
  if (!parse_command(line, cmd, err)) {
    if (err == "empty_line") return;                // blank lines are not mistakes
    ++rejected_;
    log::warn("command_rejected", "status=error reason=" + err);
    return;
  }
  if (!out_.push(std::move(cmd))) {
    log::debug("command_dropped", "reason=channel_closed");
  }
}

} // namespace floodnet
