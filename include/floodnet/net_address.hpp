#pragma once
/**
 * @file net_address.hpp
 * @brief "ip:port" text <-> sockaddr helpers shared by the dialer and acceptor.
 *
 * Accepted forms:
 *   - `127.0.0.1:9000`      IPv4 literal
 *   - `[::1]:9000`          IPv6 literal in brackets
 *
 * Hostnames are not resolved; peers are addressed by literal IP only.
 * All helpers report failure as `false` plus a stable reason in `err`
 * (`bad_address`, `bad_port`, `socket_error:<strerror>`).
 */

#include <string>

#include <sys/socket.h>

namespace floodnet::net {

/// Parse `text` into a socket address. `out_len` is set to the family's size.
bool parse_address(const std::string& text, sockaddr_storage& out, socklen_t& out_len,
                   std::string& err);

/// Render a socket address as "ip:port" (IPv6 bracketed). Unknown families give "?".
std::string format_address(const sockaddr* sa, socklen_t len);

/// Remote endpoint of a connected socket.
bool peer_address(int fd, std::string& out, std::string& err);

/// Local endpoint of a bound socket (useful after binding port 0).
bool local_address(int fd, std::string& out, std::string& err);

/// Switch `fd` to O_NONBLOCK.
bool set_nonblocking(int fd, std::string& err);

} // namespace floodnet::net
