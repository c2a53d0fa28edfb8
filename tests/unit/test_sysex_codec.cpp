#include <gtest/gtest.h>
#include <stdexcept>
#include "core/SysEx.hpp"

using namespace core;
using Bytes = std::vector<uint8_t>;

namespace {
RawMessage raw(Bytes b) { return RawMessage{std::move(b)}; }
}

TEST(SysExCodecTest, DecodesIdentityRequest) {
    auto r = decode(raw({0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7}));
    ASSERT_TRUE(r.ok());
    const SysExCommand& c = r.value();
    EXPECT_EQ(c.manufacturer_id, 0x7E);
    EXPECT_EQ(c.device_id, 0x7F);
    EXPECT_EQ(c.sub_id, 0x06);
    EXPECT_EQ(c.command_id, 0x01);
    EXPECT_TRUE(c.payload.empty());
    EXPECT_EQ(classify(c), CommandKind::IdentityRequest);
}

TEST(SysExCodecTest, DecodesManufacturerCommand) {
    auto r = decode(raw({0xF0, 0x7D, 0x01, 0x01, 0x02, 0x40, 0xF7}));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), make_set_parameter(0x01, 0x02, 0x40));
    EXPECT_EQ(classify(r.value()), CommandKind::SetParameter);
}

TEST(SysExCodecTest, EncodeRebuildsWireBytes) {
    const Bytes wire{0xF0, 0x7D, 0x01, 0x03, 0x01, 0xF7};
    auto r = decode(raw(wire));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(encode(r.value()).bytes(), wire);

    EXPECT_EQ(encode(make_identity_request()).bytes(), (Bytes{0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7}));
    EXPECT_EQ(encode(make_get_parameter(0x01, 0x02)).bytes(), (Bytes{0xF0, 0x7D, 0x01, 0x02, 0x02, 0xF7}));
}

TEST(SysExCodecTest, DecodeOfEncodeIsIdentity) {
    for (const SysExCommand& c : {make_identity_request(), make_identity_reply(),
                                  make_get_parameter_reply(0x01, 0x7F, 0x7F),
                                  make_error_report(0x01, ErrorCode::ActionFailed, 0x03)}) {
        auto r = decode(encode(c));
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(r.value(), c);
    }
}

TEST(SysExCodecTest, RoundTripAcrossCommandSpace) {
    const std::size_t lengths[] = {1, 2, 5, 32};
    for (int cmd = 0; cmd <= 0x7F; ++cmd) {
        for (uint8_t dev : {uint8_t{0x00}, uint8_t{0x01}, uint8_t{0x7F}}) {
            for (std::size_t len : lengths) {
                SysExCommand c;
                c.manufacturer_id = sysex::MANUFACTURER_ID;
                c.device_id = dev;
                c.command_id = static_cast<uint8_t>(cmd);
                for (std::size_t i = 0; i < len; ++i)
                    c.payload.push_back(static_cast<uint8_t>((cmd + i * 31) & 0x7F));

                const RawMessage wire = encode(c);
                ASSERT_EQ(wire.size(), len + 5);
                auto r = decode(wire);
                ASSERT_TRUE(r.ok()) << "cmd=" << cmd << " len=" << len;
                EXPECT_EQ(r.value(), c) << "cmd=" << cmd << " len=" << len;
            }
        }
    }
}

TEST(SysExCodecTest, RoundTripAcrossUniversalSubIds) {
    for (int sub = 0; sub <= 0x7F; ++sub) {
        for (int cmd : {0x00, 0x01, 0x02, 0x7F}) {
            for (std::size_t len : {std::size_t{0}, std::size_t{3}}) {
                SysExCommand c;
                c.manufacturer_id = sysex::UNIVERSAL_NON_REALTIME;
                c.device_id = sysex::ALL_CALL;
                c.sub_id = static_cast<uint8_t>(sub);
                c.command_id = static_cast<uint8_t>(cmd);
                c.payload.assign(len, static_cast<uint8_t>(sub));

                auto r = decode(encode(c));
                ASSERT_TRUE(r.ok()) << "sub=" << sub << " cmd=" << cmd;
                EXPECT_EQ(r.value(), c) << "sub=" << sub << " cmd=" << cmd;
            }
        }
    }
}

TEST(SysExCodecTest, IdentityReplyLayout) {
    const Bytes expected{0xF0, 0x7E, 0x7F, 0x06, 0x02, 0x7D,
                         0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0xF7};
    EXPECT_EQ(encode(make_identity_reply()).bytes(), expected);
    EXPECT_EQ(classify(make_identity_reply()), CommandKind::IdentityReply);
}

TEST(SysExCodecTest, DecodeErrors) {
    EXPECT_EQ(decode(raw({0x90, 0x3C, 0x7F})).error(), DecodeError::NotSysEx);
    EXPECT_EQ(decode(raw({0xF0, 0x7D, 0x01, 0xF7})).error(), DecodeError::TooShort);
    EXPECT_EQ(decode(raw({0xF0, 0x7D, 0x01, 0x01, 0x02, 0x40})).error(), DecodeError::BadTerminator);
    EXPECT_EQ(decode(raw({0xF0, 0x7D, 0x01, 0x01, 0x82, 0x40, 0xF7})).error(), DecodeError::InvalidDataByte);
    EXPECT_EQ(decode(raw({0xF0, 0x41, 0x10, 0x42, 0x12, 0xF7})).error(), DecodeError::UnknownManufacturer);
}

TEST(SysExCodecTest, ClassifyUnknownCommands) {
    SysExCommand c = make_set_parameter(0x01, 0x00, 0x00);
    c.command_id = 0x55;
    EXPECT_EQ(classify(c), CommandKind::Unrecognized);

    SysExCommand u = make_identity_request();
    u.sub_id = 0x09;
    EXPECT_EQ(classify(u), CommandKind::Unrecognized);

    EXPECT_EQ(classify(make_error_report(0x01, ErrorCode::UnknownCommand, 0x55)), CommandKind::ErrorReport);
}

TEST(SysExCodecTest, EncodeRejectsUnencodableCommands) {
    EXPECT_THROW(encode(make_set_parameter(0x01, 0x02, 0x80)), std::invalid_argument);
    EXPECT_THROW(encode(make_set_parameter(0x90, 0x02, 0x10)), std::invalid_argument);

    SysExCommand empty = make_trigger_action(0x01, 0x01);
    empty.payload.clear();
    EXPECT_THROW(encode(empty), std::invalid_argument);

    SysExCommand foreign = make_trigger_action(0x01, 0x01);
    foreign.manufacturer_id = 0x41;
    EXPECT_THROW(encode(foreign), std::invalid_argument);
}

TEST(SysExCodecTest, ErrorReportMasksOriginalCommand) {
    SysExCommand e = make_error_report(0x01, ErrorCode::InvalidParameter, 0x81);
    EXPECT_EQ(e.payload, (Bytes{0x02, 0x01}));
}

TEST(SysExCodecTest, Summaries) {
    EXPECT_EQ(summarize(make_set_parameter(0x01, 0x02, 0x40)), "SetParameter device=01 param=02 value=40");
    EXPECT_EQ(summarize(make_trigger_action(0x01, 0x01)), "TriggerAction device=01 action=01");
    EXPECT_EQ(summarize(make_identity_request()), "IdentityRequest target=7F");
    EXPECT_EQ(summarize(make_error_report(0x01, ErrorCode::UnknownCommand, 0x55)),
              "ErrorReport device=01 code=UnknownCommand command=55");
    EXPECT_EQ(summarize(make_identity_reply()),
              "IdentityReply manufacturer=7D family=01 01 model=01 01 version=01 01 01 01");
}
