#include <doctest/doctest.h>
#include "floodnet/channel.hpp"

#include <memory>
#include <string>
#include <thread>

#include <poll.h>

using namespace floodnet;

static bool readable(int fd) {
    pollfd p{fd, POLLIN, 0};
    return ::poll(&p, 1, 0) == 1 && (p.revents & POLLIN);
}

TEST_CASE("Channel delivers items in push order") {
    Channel<int> ch;
    CHECK(ch.push(1));
    CHECK(ch.push(2));
    CHECK(ch.size() == 2);

    int v = 0;
    CHECK(ch.try_pop(v) == PopResult::Item);
    CHECK(v == 1);
    CHECK(ch.try_pop(v) == PopResult::Item);
    CHECK(v == 2);
    CHECK(ch.try_pop(v) == PopResult::Empty);
}

TEST_CASE("Closed channel drains queued items before reporting Disconnected") {
    Channel<std::string> ch;
    ch.push("last words");
    ch.close();
    CHECK(ch.closed());
    CHECK_FALSE(ch.push("too late"));

    std::string s;
    CHECK(ch.try_pop(s) == PopResult::Item);
    CHECK(s == "last words");
    CHECK(ch.try_pop(s) == PopResult::Disconnected);
    CHECK(ch.try_pop(s) == PopResult::Disconnected);
}

TEST_CASE("Wake fd follows the queue state") {
    Channel<int> ch;
    CHECK_FALSE(readable(ch.wake_handle()));

    ch.push(7);
    CHECK(readable(ch.wake_handle()));

    int v = 0;
    REQUIRE(ch.try_pop(v) == PopResult::Item);
    CHECK_FALSE(readable(ch.wake_handle()));

    ch.close();
    CHECK(readable(ch.wake_handle()));
}

TEST_CASE("Channel moves move-only items") {
    Channel<std::unique_ptr<int>> ch;
    ch.push(std::unique_ptr<int>(new int(42)));

    std::unique_ptr<int> out;
    REQUIRE(ch.try_pop(out) == PopResult::Item);
    REQUIRE(out);
    CHECK(*out == 42);
}

TEST_CASE("Items pushed from another thread arrive") {
    Channel<int> ch;
    std::thread producer([&ch] {
        for (int i = 0; i < 100; ++i) ch.push(i);
        ch.close();
    });
    producer.join();

    int expected = 0;
    int v = -1;
    PopResult r;
    while ((r = ch.try_pop(v)) == PopResult::Item) {
        CHECK(v == expected);
        ++expected;
    }
    CHECK(expected == 100);
    CHECK(r == PopResult::Disconnected);
}
