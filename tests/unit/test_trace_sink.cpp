#include <gtest/gtest.h>
#include <sstream>
#include "core/Trace.hpp"
#include "TestHelper.hpp"

using namespace core;
using test::Bytes;

TEST(TraceSinkTest, FormatsDecodedSysEx) {
    TraceRecord rec{Direction::ClientToDevice, 0, Bytes{0xF0, 0x7D, 0x01, 0x01, 0x02, 0x40, 0xF7}, std::nullopt};
    EXPECT_EQ(TraceSink::format(rec),
              "[ClientToDevice] F0 7D 01 01 02 40 F7 (SetParameter device=01 param=02 value=40)");
}

TEST(TraceSinkTest, FormatsShortMessage) {
    TraceRecord rec{Direction::DeviceToClient, 5, Bytes{0x90, 0x3C, 0x7F}, std::nullopt};
    EXPECT_EQ(TraceSink::format(rec), "[DeviceToClient] 90 3C 7F (NoteOn ch=1 note=60 vel=127)");
}

TEST(TraceSinkTest, UndecodableBytesHaveNoSummary) {
    TraceRecord rec{Direction::ClientToDevice, 0, Bytes{0xF0, 0x41, 0x10, 0x42, 0x12, 0xF7}, std::nullopt};
    EXPECT_EQ(TraceSink::format(rec), "[ClientToDevice] F0 41 10 42 12 F7");
    EXPECT_FALSE(TraceSink::summarize({0xF0, 0x7D, 0x01}).has_value());
    EXPECT_FALSE(TraceSink::summarize({}).has_value());
}

TEST(TraceSinkTest, ExplicitSummaryWins) {
    TraceRecord rec{Direction::ClientToDevice, 0, Bytes{0xF0, 0x7D, 0x01}, std::string("FramingError: Unterminated")};
    EXPECT_EQ(TraceSink::format(rec), "[ClientToDevice] F0 7D 01 (FramingError: Unterminated)");
}

TEST(TraceSinkTest, EmitWritesOneLinePerRecord) {
    test::RecordingOutput out;
    TraceSink sink(out);
    EXPECT_TRUE(sink.emit({Direction::ClientToDevice, 0, Bytes{0xF8}, std::nullopt}));
    EXPECT_TRUE(sink.emit({Direction::DeviceToClient, 1, Bytes{0xFA}, std::nullopt}));

    auto lines = out.lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[ClientToDevice] F8 (Clock)");
    EXPECT_EQ(lines[1], "[DeviceToClient] FA (Start)");
    EXPECT_EQ(sink.warnings(), 0u);
}

TEST(TraceSinkTest, UnavailableOutputIsAWarning) {
    test::RecordingOutput out;
    TraceSink sink(out);
    out.set_failing(true);
    EXPECT_FALSE(sink.emit({Direction::ClientToDevice, 0, Bytes{0xF8}, std::nullopt}));
    EXPECT_EQ(sink.warnings(), 1u);

    out.set_failing(false);
    EXPECT_TRUE(sink.emit({Direction::ClientToDevice, 0, Bytes{0xF8}, std::nullopt}));
    EXPECT_EQ(sink.warnings(), 1u);
}

TEST(TraceSinkTest, StreamOutputReportsBrokenStream) {
    std::ostringstream os;
    StreamTraceOutput good(os);
    good.write("[ClientToDevice] F8");
    EXPECT_EQ(os.str(), "[ClientToDevice] F8\n");

    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    StreamTraceOutput bad(broken);
    TraceSink sink(bad);
    EXPECT_FALSE(sink.emit({Direction::ClientToDevice, 0, Bytes{0xF8}, std::nullopt}));
    EXPECT_EQ(sink.warnings(), 1u);
}
