#include <gtest/gtest.h>
#include "core/Message.hpp"

using namespace core;
using Bytes = std::vector<uint8_t>;

TEST(FramerTest, ShortMessagesPassUnchanged) {
    for (const Bytes& b : {Bytes{0x90, 0x3C, 0x7F}, Bytes{0xC0, 0x05}, Bytes{0xF8}}) {
        auto r = frame(b);
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(r.value().bytes(), b);
        EXPECT_FALSE(r.value().is_sysex());
    }
}

TEST(FramerTest, CompleteSysExIsAccepted) {
    Bytes id{0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7};
    auto r = frame(id);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().is_sysex());
    EXPECT_EQ(r.value().size(), 6u);
}

TEST(FramerTest, TruncatedSysExIsRejected) {
    auto r = frame({0xF0, 0x7D, 0x01});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), FramingError::Unterminated);
}

TEST(FramerTest, StatusByteInsideSysExIsRejected) {
    auto r = frame({0xF0, 0x7D, 0x01, 0x01, 0x7F, 0x80, 0xF7});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), FramingError::StrayStatusByte);
}

TEST(FramerTest, MalformedShortMessages) {
    EXPECT_EQ(frame({}).error(), FramingError::Empty);
    EXPECT_EQ(frame({0x3C, 0x7F}).error(), FramingError::MissingStatus);
    EXPECT_EQ(frame({0x90, 0x3C, 0x7F, 0x00}).error(), FramingError::TooLong);
    EXPECT_EQ(frame({0x90, 0x90, 0x7F}).error(), FramingError::StrayStatusByte);
}

TEST(FramerTest, DirectionHelpers) {
    EXPECT_STREQ(to_string(Direction::ClientToDevice), "ClientToDevice");
    EXPECT_STREQ(to_string(Direction::DeviceToClient), "DeviceToClient");
    EXPECT_EQ(opposite(Direction::ClientToDevice), Direction::DeviceToClient);
    EXPECT_EQ(opposite(Direction::DeviceToClient), Direction::ClientToDevice);
}

TEST(FramerTest, HexAndShortDescriptions) {
    EXPECT_EQ(to_hex({0xF0, 0x7E, 0x0A, 0xF7}), "F0 7E 0A F7");
    EXPECT_EQ(to_hex({}), "");

    EXPECT_EQ(describe_short(RawMessage{{0x90, 0x3C, 0x7F}}), "NoteOn ch=1 note=60 vel=127");
    EXPECT_EQ(describe_short(RawMessage{{0x81, 0x3C, 0x00}}), "NoteOff ch=2 note=60 vel=0");
    EXPECT_EQ(describe_short(RawMessage{{0xB0, 0x07, 0x7F}}), "ControlChange ch=1 cc=7 value=127");
    EXPECT_EQ(describe_short(RawMessage{{0xE0, 0x00, 0x40}}), "PitchBend ch=1 value=8192");
    EXPECT_EQ(describe_short(RawMessage{{0xF8}}), "Clock");
    EXPECT_EQ(describe_short(RawMessage{{0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7}}), "");
}
