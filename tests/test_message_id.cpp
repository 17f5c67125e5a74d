#include <doctest/doctest.h>
#include "floodnet/message_id.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace floodnet;

TEST_CASE("MessageID default is nil") {
    MessageID id;
    CHECK(id.is_nil());
    CHECK(id == MessageID());
}

TEST_CASE("MessageID generate sets version 4 and RFC 4122 variant") {
    for (int i = 0; i < 32; ++i) {
        MessageID id = MessageID::generate();
        CHECK_FALSE(id.is_nil());
        CHECK((id.bytes[6] & 0xF0) == 0x40);
        CHECK((id.bytes[8] & 0xC0) == 0x80);
    }
}

TEST_CASE("MessageID generate does not repeat") {
    MessageID a = MessageID::generate();
    MessageID b = MessageID::generate();
    CHECK(a != b);
}

TEST_CASE("MessageID pack/unpack preserves bytes") {
    MessageID a = MessageID::generate();
    uint8_t buf[MessageID::SIZE]{};
    a.pack(buf);

    MessageID b;
    b.unpack(buf, sizeof(buf));
    CHECK(a == b);

    MessageID c(buf, sizeof(buf));
    CHECK(a == c);
}

TEST_CASE("MessageID unpack from a short buffer yields nil") {
    uint8_t buf[MessageID::SIZE];
    for (size_t i = 0; i < sizeof(buf); ++i) buf[i] = 0xAB;

    MessageID id(buf, MessageID::SIZE - 1);
    CHECK(id.is_nil());
}

TEST_CASE("MessageID to_hex_string is canonical 8-4-4-4-12 lowercase") {
    uint8_t buf[MessageID::SIZE] = {
        0x3f, 0x1c, 0x2a, 0x9e, 0x07, 0xd4, 0x4b, 0x6a,
        0x9c, 0x11, 0x5e, 0x0d, 0x2f, 0x7a, 0x8b, 0x34,
    };
    MessageID id(buf, sizeof(buf));
    auto hex = id.to_hex_string();
    CHECK(hex.size() == 36);
    CHECK(std::string(hex.c_str()) == "3f1c2a9e-07d4-4b6a-9c11-5e0d2f7a8b34");
}

TEST_CASE("MessageID streams on separate threads do not overlap") {
    // every thread seeds its own engine; first draws must all differ
    constexpr int THREADS = 32;
    constexpr int PER_THREAD = 64;
    std::vector<std::vector<MessageID>> drawn(THREADS);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&drawn, t] {
            for (int i = 0; i < PER_THREAD; ++i) drawn[t].push_back(MessageID::generate());
        });
    }
    for (auto& w : workers) w.join();

    std::vector<std::string> all;
    for (const auto& ids : drawn) {
        for (const auto& id : ids) all.emplace_back(id.to_hex_string().c_str());
    }
    std::sort(all.begin(), all.end());
    CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
    CHECK(all.size() == static_cast<size_t>(THREADS * PER_THREAD));
}
