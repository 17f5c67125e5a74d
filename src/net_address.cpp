// ============================================================================
// net_address.cpp: implementation for net_address.hpp
// ============================================================================

#include "floodnet/net_address.hpp"

#include <arpa/inet.h>     // inet_pton / inet_ntop
#include <netinet/in.h>    // sockaddr_in, sockaddr_in6
#include <fcntl.h>         // fcntl, O_NONBLOCK
#include <cerrno>
#include <cstdint>
#include <cstdlib>        // strtoul
#include <cstring>         // memset, strerror

namespace floodnet::net {

// ---------------------------------------------------------------------------
// parse_port()
// Decimal 0..65535, digits only. Port 0 is allowed so a listener can ask the
// kernel for any free port.
// ---------------------------------------------------------------------------
static bool parse_port(const std::string& s, uint16_t& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
    if (v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

static std::string errno_reason(const char* prefix) {
    return std::string(prefix) + ":" + std::strerror(errno);
}

bool parse_address(const std::string& text, sockaddr_storage& out, socklen_t& out_len,
                   std::string& err) {
    std::string host;
    std::string port_text;

    if (!text.empty() && text.front() == '[') {
        // "[v6]:port"
        const size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            err = "bad_address";
            return false;
        }
        host      = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
    } else {
        // "v4:port": the last ':' splits host from port
        const size_t colon = text.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            err = "bad_address";
            return false;
        }
        host      = text.substr(0, colon);
        port_text = text.substr(colon + 1);
        if (host.find(':') != std::string::npos) {   // bare IPv6 without brackets
            err = "bad_address";
            return false;
        }
    }

    uint16_t port = 0;
    if (!parse_port(port_text, port)) {
        err = "bad_port";
        return false;
    }

    std::memset(&out, 0, sizeof(out));

    sockaddr_in v4{};
    if (::inet_pton(AF_INET, host.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        v4.sin_port   = htons(port);
        std::memcpy(&out, &v4, sizeof(v4));
        out_len = sizeof(v4);
        return true;
    }

    sockaddr_in6 v6{};
    if (::inet_pton(AF_INET6, host.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        v6.sin6_port   = htons(port);
        std::memcpy(&out, &v6, sizeof(v6));
        out_len = sizeof(v6);
        return true;
    }

    err = "bad_address";
    return false;
}

std::string format_address(const sockaddr* sa, socklen_t len) {
    char buf[INET6_ADDRSTRLEN] = {0};

    if (sa->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(sa);
        if (!::inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf))) return "?";
        return std::string(buf) + ":" + std::to_string(ntohs(v4->sin_port));
    }
    if (sa->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(sa);
        if (!::inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf))) return "?";
        return "[" + std::string(buf) + "]:" + std::to_string(ntohs(v6->sin6_port));
    }
    return "?";
}

bool peer_address(int fd, std::string& out, std::string& err) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        err = errno_reason("socket_error");
        return false;
    }
    out = format_address(reinterpret_cast<const sockaddr*>(&ss), len);
    return true;
}

bool local_address(int fd, std::string& out, std::string& err) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        err = errno_reason("socket_error");
        return false;
    }
    out = format_address(reinterpret_cast<const sockaddr*>(&ss), len);
    return true;
}

bool set_nonblocking(int fd, std::string& err) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        err = errno_reason("socket_error");
        return false;
    }
    return true;
}

} // namespace floodnet::net
