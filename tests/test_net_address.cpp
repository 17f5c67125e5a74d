#include <doctest/doctest.h>
#include "floodnet/net_address.hpp"

#include <string>

#include <netinet/in.h>

using namespace floodnet;

static bool parses(const std::string& text, std::string& err) {
    sockaddr_storage ss{};
    socklen_t len = 0;
    return net::parse_address(text, ss, len, err);
}

TEST_CASE("parse_address accepts IPv4 and bracketed IPv6 literals") {
    sockaddr_storage ss{};
    socklen_t len = 0;
    std::string err;

    REQUIRE(net::parse_address("127.0.0.1:9000", ss, len, err));
    CHECK(ss.ss_family == AF_INET);
    CHECK(len == sizeof(sockaddr_in));
    CHECK(net::format_address(reinterpret_cast<const sockaddr*>(&ss), len) == "127.0.0.1:9000");

    REQUIRE(net::parse_address("[::1]:9001", ss, len, err));
    CHECK(ss.ss_family == AF_INET6);
    CHECK(len == sizeof(sockaddr_in6));
    CHECK(net::format_address(reinterpret_cast<const sockaddr*>(&ss), len) == "[::1]:9001");
}

TEST_CASE("Port zero is allowed for listeners") {
    std::string err;
    CHECK(parses("0.0.0.0:0", err));
}

TEST_CASE("parse_address rejects malformed text") {
    std::string err;

    CHECK_FALSE(parses("127.0.0.1", err));
    CHECK(err == "bad_address");

    CHECK_FALSE(parses("localhost:80", err));
    CHECK(err == "bad_address");

    CHECK_FALSE(parses("::1:80", err));
    CHECK(err == "bad_address");

    CHECK_FALSE(parses("127.0.0.1:65536", err));
    CHECK(err == "bad_port");

    CHECK_FALSE(parses("127.0.0.1:80a", err));
    CHECK(err == "bad_port");

    CHECK_FALSE(parses("[::1]9000", err));
    CHECK(err == "bad_address");
}
