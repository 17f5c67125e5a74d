#pragma once
/**
 * @file config.hpp
 * @brief Node settings: defaults, JSON config file, command-line overrides.
 *
 * Precedence, lowest to highest:
 *   1. built-in defaults below
 *   2. JSON file given with --config
 *   3. command-line options
 *
 * JSON shape (every key optional, unknown keys ignored):
 * @code
 * {
 *   "listen": "127.0.0.1:9000",
 *   "peers": ["127.0.0.1:9001", "[::1]:9002"],
 *   "poll_timeout_ms": 100,
 *   "log_level": "info"
 * }
 * @endcode
 *
 * Loading never throws. Failures come back as `false` plus a reason:
 *   config_unreadable, config_parse_error:<detail>, config_not_object,
 *   bad_type:<key>, bad_value:<key>
 */

#include <string>
#include <vector>

#include "log.hpp"

namespace floodnet {

struct NodeConfig {
  std::string              listen;                   ///< "ip:port" to bind
  std::vector<std::string> peers;                    ///< dialed once at start-up
  int                      poll_timeout_ms{100};
  log::Level               log_level{log::Level::Info};
};

/// Apply the keys of a JSON document (text) on top of `cfg`.
bool config_from_json(const std::string& text, NodeConfig& cfg, std::string& err);

/// Read `path` and apply it on top of `cfg`.
bool load_config(const std::string& path, NodeConfig& cfg, std::string& err);

} // namespace floodnet
