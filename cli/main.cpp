/**
 * @file main.cpp
 * @brief floodnet-node: one flooding node on a TCP port, driven from stdin.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11), layer them over an optional JSON config file.
 *  - Bind the listening socket and start the accept thread.
 *  - Start the stdin command reader (connect / broadcast / disconnect).
 *  - Dial bootstrap peers, then run the event loop until stopped.
 *  - Print every newly delivered message on stdout as "<addr>: <text>".
 *
 * Exit codes:
 *  0  stopped by SIGINT/SIGTERM
 *  1  start-up failure (bind, listen)
 *  2  usage or config error
 *  3  accept thread died
 *  4  command input closed or failed
 *
 * Notes:
 *  - Diagnostics go to stderr as key=value lines (see floodnet/log.hpp).
 *  - Example: `floodnet-node 127.0.0.1:9000 --peer 127.0.0.1:9001`
 */

#include <csignal>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h> // STDIN_FILENO

#include "CLI/CLI11.hpp"

#include "floodnet/acceptor.hpp"
#include "floodnet/command_source.hpp"
#include "floodnet/config.hpp"
#include "floodnet/event_loop.hpp"
#include "floodnet/log.hpp"

using namespace floodnet;

// ---------- signal plumbing ----------

static EventLoop* g_loop = nullptr;

extern "C" void on_stop_signal(int) {
  if (g_loop) g_loop->request_stop();
}

static int exit_code_for(LoopStatus st) {
  switch (st) {
    case LoopStatus::Stopped:              return 0;
    case LoopStatus::AcceptorDisconnected: return 3;
    case LoopStatus::CommandsDisconnected: return 4;
    case LoopStatus::Running:              return 0;
  }
  return 1;
}

// ---------- node runtime ----------

// Channels throw std::system_error if the kernel refuses an eventfd; main()
// turns that into a start-up failure.
static int run_node(const NodeConfig& cfg) {
  std::string err;

  ConnectionChannel accepts;
  CommandChannel    commands;

  Acceptor acceptor(accepts);
  if (!acceptor.listen(cfg.listen, err)) {
    std::cerr << "status=error reason=" << err << " addr=" << cfg.listen << "\n";
    return 1;
  }
  log::info("starting", "addr=" + acceptor.local_address());

  EventLoop loop(accepts, commands, dial_tcp,
                 [](const std::string& origin, const Message& msg) {
                   std::cout << origin << ": " << msg.display_text() << std::endl;
                 });
  loop.set_poll_timeout_ms(cfg.poll_timeout_ms);

  size_t bootstrapped = 0;
  for (const auto& peer : cfg.peers) {
    if (loop.connect(peer)) ++bootstrapped;        // failures are logged and counted
  }
  if (!cfg.peers.empty()) {
    log::info("bootstrap", "connected=" + std::to_string(bootstrapped) +
                           " requested=" + std::to_string(cfg.peers.size()));
  }

  CommandSource input(STDIN_FILENO, commands);

  g_loop = &loop;
  std::signal(SIGINT,  on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);

  acceptor.start();
  input.start();

  const LoopStatus st = loop.run();

  g_loop = nullptr;
  input.stop();
  acceptor.stop();

  const LoopStats& s = loop.stats();
  log::info("summary", "iterations=" + std::to_string(s.iterations) +
                       " delivered=" + std::to_string(s.delivered) +
                       " duplicates=" + std::to_string(s.duplicates) +
                       " rejected_frames=" + std::to_string(s.rejected_frames) +
                       " peers_dropped=" + std::to_string(s.peers_dropped));

  return exit_code_for(st);
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string              opt_listen;
  std::string              opt_config;
  std::vector<std::string> opt_peers;
  int                      opt_poll_ms = -1;     // -1 => not given
  std::string              opt_log_level;

  CLI::App app{"floodnet node: flood text messages between TCP peers"};

  app.add_option("listen", opt_listen, "Address to listen on, ip:port");
  app.add_option("--config", opt_config, "JSON config file")->check(CLI::ExistingFile);
  app.add_option("--peer", opt_peers, "Peer to dial at start-up (repeatable)");
  app.add_option("--poll-timeout", opt_poll_ms, "Idle wait per loop iteration in ms")
     ->check(CLI::Range(0, 60000));
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e) == 0 ? 0 : 2;               // --help is not a usage error
  }

  // Defaults <- config file <- command line
  NodeConfig cfg;
  std::string err;
  if (!opt_config.empty() && !load_config(opt_config, cfg, err)) {
    std::cerr << "status=error reason=" << err << " file=" << opt_config << "\n";
    return 2;
  }
  if (!opt_listen.empty())    cfg.listen = opt_listen;
  for (const auto& p : opt_peers) cfg.peers.push_back(p);
  if (opt_poll_ms >= 0)       cfg.poll_timeout_ms = opt_poll_ms;
  if (!opt_log_level.empty() && !log::parse_level(opt_log_level, cfg.log_level)) {
    std::cerr << "status=error reason=bad_value:log_level\n";
    return 2;
  }

  if (cfg.listen.empty()) {
    std::cerr << "status=error reason=missing_listen_address\n";
    return 2;
  }

  log::set_level(cfg.log_level);

  try {
    return run_node(cfg);
  } catch (const std::system_error& e) {
    std::cerr << "status=error reason=" << e.what() << "\n";
    return 1;
  }
}
