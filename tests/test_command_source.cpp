#include <doctest/doctest.h>
#include <climits>   // defines LINE_MAX; the header below must not collide with it
#include "floodnet/command_source.hpp"

#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace floodnet;

namespace {

// Write `text` into a pipe, close it, and run a CommandSource over the read end
// until it reports end of input. Returns everything it produced.
std::vector<Command> run_source(const std::string& text, uint32_t& rejected) {
  int fds[2] = {-1, -1};
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(::write(fds[1], text.data(), text.size()) == static_cast<ssize_t>(text.size()));
  ::close(fds[1]);

  CommandChannel ch;
  CommandSource source(fds[0], ch);
  source.start();

  std::vector<Command> out;
  Command cmd;
  for (int tries = 0; tries < 300; ++tries) {
    pollfd p{ch.wake_handle(), POLLIN, 0};
    ::poll(&p, 1, 10);
    PopResult r;
    while ((r = ch.try_pop(cmd)) == PopResult::Item) out.push_back(cmd);
    if (r == PopResult::Disconnected) break;
  }
  CHECK(ch.closed());

  source.stop();
  rejected = source.rejected();
  ::close(fds[0]);
  return out;
}

} // namespace

TEST_CASE("Every valid line becomes a command, in order") {
  uint32_t rejected = 0;
  const std::vector<Command> cmds =
      run_source("connect 127.0.0.1:9001\nbroadcast hello mesh\ndisconnect\n", rejected);

  REQUIRE(cmds.size() == 3);
  CHECK(cmds[0] == Command::connect("127.0.0.1:9001"));
  CHECK(cmds[1] == Command::broadcast("hello mesh"));
  CHECK(cmds[2] == Command::disconnect());
  CHECK(rejected == 0);
}

TEST_CASE("Bad lines are skipped, blank lines are ignored quietly") {
  uint32_t rejected = 0;
  const std::vector<Command> cmds =
      run_source("\nshout hi\n   \nconnect nowhere\nbroadcast ok\r\n", rejected);

  REQUIRE(cmds.size() == 1);
  CHECK(cmds[0] == Command::broadcast("ok"));
  CHECK(rejected == 2);
}

TEST_CASE("A last line without a newline still counts") {
  uint32_t rejected = 0;
  const std::vector<Command> cmds = run_source("broadcast tail", rejected);
  REQUIRE(cmds.size() == 1);
  CHECK(cmds[0] == Command::broadcast("tail"));
}

TEST_CASE("The line limit is a plain class constant") {
  CHECK(CommandSource::MAX_LINE_BYTES == 4096);
#ifdef LINE_MAX
  CHECK(LINE_MAX > 0);                      // libc macro still usable alongside it
#endif
}

TEST_CASE("An over-long line is rejected whole and the next line still parses") {
  uint32_t rejected = 0;
  const std::string longline = "broadcast " + std::string(CommandSource::MAX_LINE_BYTES + 10, 'x') + "\n";
  const std::vector<Command> cmds = run_source(longline + "broadcast after\n", rejected);

  REQUIRE(cmds.size() == 1);
  CHECK(cmds[0] == Command::broadcast("after"));
  CHECK(rejected == 1);
}

TEST_CASE("Empty input closes the channel straight away") {
  uint32_t rejected = 0;
  CHECK(run_source("", rejected).empty());
}
