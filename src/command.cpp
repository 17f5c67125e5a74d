// -----------------------------------------------------------------------------
// Implementation for command.hpp
//
// Operator line -> Command. No exceptions; failure is "false" plus a stable
// reason string the caller logs as `status=error reason=<err>`.
// -----------------------------------------------------------------------------

#include "floodnet/command.hpp"
#include "floodnet/net_address.hpp"

#include <sys/socket.h>    // sockaddr_storage for address validation

namespace floodnet {

// ---------- whitespace helpers ----------
// Space, tab and the CR left behind by "\r\n" line endings.
static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b]))     ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool parse_command(const std::string& line, Command& out, std::string& err) {
    const std::string text = trim(line);
    if (text.empty()) {
        err = "empty_line";
        return false;
    }

    // Split "verb<ws>rest"; rest keeps its inner spacing
    size_t verb_end = 0;
    while (verb_end < text.size() && !is_space(text[verb_end])) ++verb_end;
    const std::string verb = text.substr(0, verb_end);

    size_t rest_begin = verb_end;
    while (rest_begin < text.size() && is_space(text[rest_begin])) ++rest_begin;
    const std::string rest = text.substr(rest_begin);

    if (verb == "disconnect") {
        out = Command::disconnect();            // trailing words ignored
        return true;
    }

    if (verb == "broadcast") {
        if (rest.empty()) { err = "missing_argument"; return false; }
        out = Command::broadcast(rest);
        return true;
    }

    if (verb == "connect") {
        if (rest.empty()) { err = "missing_argument"; return false; }

        // Validate now so a typo is reported at the prompt, not at dial time
        sockaddr_storage ss{};
        socklen_t len = 0;
        std::string addr_err;
        if (!net::parse_address(rest, ss, len, addr_err)) {
            err = "bad_address";
            return false;
        }
        out = Command::connect(rest);
        return true;
    }

    err = "unknown_command";
    return false;
}

} // namespace floodnet
