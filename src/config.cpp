// -----------------------------------------------------------------------------
// config.cpp: implementation for config.hpp
//
// nlohmann::json does the parsing. Its exceptions stop here: every failure
// leaves as "false" plus a reason string, like the rest of the node.
// -----------------------------------------------------------------------------
#include "floodnet/config.hpp"
#include "floodnet/net_address.hpp"

#include <fstream>
#include <sstream>

#include <sys/socket.h>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace floodnet {

static bool valid_address(const std::string& text) {
  sockaddr_storage ss{};
  socklen_t len = 0;
  std::string ignored;
  return net::parse_address(text, ss, len, ignored);
}

// ---------------------------------------------------------------------------
// apply_json()
// Key by key; the first bad key wins. `cfg` is only updated once every key
// has been checked, so a half-valid file changes nothing.
// ---------------------------------------------------------------------------
static bool apply_json(const json& j, NodeConfig& cfg, std::string& err) {
  if (!j.is_object()) { err = "config_not_object"; return false; }

  NodeConfig next = cfg;

  if (j.contains("listen")) {
    const json& v = j["listen"];
    if (!v.is_string()) { err = "bad_type:listen"; return false; }
    next.listen = v.get<std::string>();
    if (!valid_address(next.listen)) { err = "bad_value:listen"; return false; }
  }

  if (j.contains("peers")) {
    const json& v = j["peers"];
    if (!v.is_array()) { err = "bad_type:peers"; return false; }
    next.peers.clear();
    for (const auto& p : v) {
      if (!p.is_string()) { err = "bad_type:peers"; return false; }
      const std::string addr = p.get<std::string>();
      if (!valid_address(addr)) { err = "bad_value:peers"; return false; }
      next.peers.push_back(addr);
    }
  }

  if (j.contains("poll_timeout_ms")) {
    const json& v = j["poll_timeout_ms"];
    if (!v.is_number_integer()) { err = "bad_type:poll_timeout_ms"; return false; }
    const long long ms = v.get<long long>();
    if (ms < 0 || ms > 60000) { err = "bad_value:poll_timeout_ms"; return false; }
    next.poll_timeout_ms = static_cast<int>(ms);
  }

  if (j.contains("log_level")) {
    const json& v = j["log_level"];
    if (!v.is_string()) { err = "bad_type:log_level"; return false; }
    if (!log::parse_level(v.get<std::string>(), next.log_level)) {
      err = "bad_value:log_level";
      return false;
    }
  }

  cfg = next;
  return true;
}

bool config_from_json(const std::string& text, NodeConfig& cfg, std::string& err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    err = std::string("config_parse_error:") + e.what();
    return false;
  }
  return apply_json(j, cfg, err);
}

bool load_config(const std::string& path, NodeConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "config_unreadable";
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return config_from_json(ss.str(), cfg, err);
}

} // namespace floodnet
