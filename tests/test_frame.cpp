#include <doctest/doctest.h>
#include "floodnet/frame.hpp"

#include <string>

using namespace floodnet;
using frame::Frame;
using frame::FrameStatus;

static MessageID fixed_id() {
    uint8_t buf[MessageID::SIZE];
    for (size_t i = 0; i < MessageID::SIZE; ++i) buf[i] = static_cast<uint8_t>(0xA0 + i);
    return MessageID(buf, sizeof(buf));
}

TEST_CASE("encode lays out content, separator, id and zero padding") {
    Message msg;
    REQUIRE(Message::create("hello", fixed_id(), msg) == MessageStatus::Ok);

    Frame f;
    f.fill(0xEE);                                   // make sure padding is rewritten
    REQUIRE(frame::encode(msg, f) == FrameStatus::Ok);

    CHECK(f.size() == 128);
    CHECK(std::string(reinterpret_cast<const char*>(f.data()), 5) == "hello");
    CHECK(f[5] == 0x00);
    for (size_t i = 0; i < MessageID::SIZE; ++i) {
        CHECK(f[6 + i] == static_cast<uint8_t>(0xA0 + i));
    }
    for (size_t i = 22; i < 128; ++i) {
        CHECK(f[i] == 0x00);
    }
}

TEST_CASE("decode(encode(m)) == m across the length range") {
    for (size_t len : {size_t(0), size_t(1), size_t(64), size_t(110), size_t(111)}) {
        Message in;
        REQUIRE(Message::create(std::string(len, 'q'), in) == MessageStatus::Ok);

        Frame f;
        REQUIRE(frame::encode(in, f) == FrameStatus::Ok);

        Message out;
        CHECK(frame::decode(f, out) == FrameStatus::Ok);
        CHECK(out == in);
    }
}

TEST_CASE("A 111-byte message fills the frame exactly") {
    Message msg;
    REQUIRE(Message::create(std::string(111, 'z'), fixed_id(), msg) == MessageStatus::Ok);

    Frame f;
    REQUIRE(frame::encode(msg, f) == FrameStatus::Ok);
    CHECK(f[111] == 0x00);
    CHECK(f[127] == static_cast<uint8_t>(0xA0 + 15));
}

TEST_CASE("decode keeps non-UTF-8 content byte-exact") {
    Message in;
    REQUIRE(Message::create("\xFF\xFE raw", fixed_id(), in) == MessageStatus::Ok);

    Frame f;
    REQUIRE(frame::encode(in, f) == FrameStatus::Ok);

    Message out;
    REQUIRE(frame::decode(f, out) == FrameStatus::Ok);
    CHECK(out == in);

    Frame again;
    REQUIRE(frame::encode(out, again) == FrameStatus::Ok);
    CHECK(again == f);
}

TEST_CASE("decode reports MissingSeparator when the block has no zero byte") {
    Frame f;
    f.fill('x');
    Message out;
    CHECK(frame::decode(f, out) == FrameStatus::MissingSeparator);
}

TEST_CASE("decode reports CorruptId when the id would run past the block") {
    Frame f;
    f.fill('x');
    f[120] = 0x00;                                  // only 7 bytes left for the id
    Message out;
    CHECK(frame::decode(f, out) == FrameStatus::CorruptId);
}

TEST_CASE("A message with the nil id round-trips") {
    Message in;
    REQUIRE(Message::create("a", MessageID(), in) == MessageStatus::Ok);

    Frame f;
    REQUIRE(frame::encode(in, f) == FrameStatus::Ok);
    CHECK(f[0] == 'a');
    for (size_t i = 1; i < frame::CAPACITY; ++i) CHECK(f[i] == 0x00);

    Message out;
    REQUIRE(frame::decode(f, out) == FrameStatus::Ok);
    CHECK(out == in);
    CHECK(out.id().is_nil());
}

TEST_CASE("An all-zero block decodes as empty content with the nil id") {
    Frame zeros;
    zeros.fill(0);
    Message out;
    REQUIRE(frame::decode(zeros, out) == FrameStatus::Ok);
    CHECK(out.content().empty());
    CHECK(out.id().is_nil());
}

TEST_CASE("decode leaves the output untouched on failure") {
    Message out;
    REQUIRE(Message::create("before", fixed_id(), out) == MessageStatus::Ok);
    const Message before = out;

    Frame f;
    f.fill('x');
    REQUIRE(frame::decode(f, out) == FrameStatus::MissingSeparator);
    CHECK(out == before);
}

TEST_CASE("assembler collects a frame across partial writes") {
    Message msg;
    REQUIRE(Message::create("split", fixed_id(), msg) == MessageStatus::Ok);
    Frame f;
    REQUIRE(frame::encode(msg, f) == FrameStatus::Ok);

    frame::assembler rx;
    CHECK(rx.missing() == 128);

    // 50 bytes, then 78
    for (size_t i = 0; i < 50; ++i) rx.write_ptr()[i] = f[i];
    rx.commit(50);
    CHECK_FALSE(rx.complete());
    CHECK(rx.buffered() == 50);
    CHECK(rx.missing() == 78);

    for (size_t i = 0; i < 78; ++i) rx.write_ptr()[i] = f[50 + i];
    rx.commit(78);
    REQUIRE(rx.complete());

    Message out;
    CHECK(frame::decode(rx.frame(), out) == FrameStatus::Ok);
    CHECK(out == msg);

    rx.reset();
    CHECK(rx.buffered() == 0);
}

TEST_CASE("status_name covers every FrameStatus") {
    CHECK(std::string(frame::status_name(FrameStatus::Ok)) == "ok");
    CHECK(std::string(frame::status_name(FrameStatus::MessageTooLarge)) == "message_too_large");
    CHECK(std::string(frame::status_name(FrameStatus::MissingSeparator)) == "missing_separator");
    CHECK(std::string(frame::status_name(FrameStatus::CorruptId)) == "corrupt_id");
}
