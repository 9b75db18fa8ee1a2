#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "hypoforge/gateway/event_stream_decoder.hpp"

using namespace hypoforge;

namespace {
std::string frame(const std::string& content) {
    return "data: {\"choices\":[{\"delta\":{\"content\":\"" + content + "\"}}]}\n\n";
}
}

class EventStreamDecoderTest : public ::testing::Test {
protected:
    std::vector<std::string> updates;
    EventStreamDecoder decoder{[this](const std::string& total) {
        updates.push_back(total);
        return true;
    }};
};

TEST_F(EventStreamDecoderTest, AccumulatesRunningTotal) {
    decoder.feed(frame("Hel") + frame("lo") + "data: [DONE]\n\n");
    EXPECT_TRUE(decoder.done());
    EXPECT_EQ(decoder.content(), "Hello");
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0], "Hel");
    EXPECT_EQ(updates[1], "Hello");
}

TEST_F(EventStreamDecoderTest, FramesSplitAcrossChunks) {
    const std::string stream = frame("a") + frame("b") + frame("c") + "data: [DONE]\n\n";
    for (char c : stream) decoder.feed(&c, 1);
    EXPECT_EQ(decoder.content(), "abc");
    EXPECT_EQ(decoder.frames(), 3u);
    EXPECT_TRUE(decoder.done());
}

TEST_F(EventStreamDecoderTest, CarriageReturnsAndNoSpaceAfterColon) {
    decoder.feed("data:{\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\r\n\r\n");
    EXPECT_EQ(decoder.content(), "x");
}

TEST_F(EventStreamDecoderTest, NothingAfterDone) {
    EXPECT_FALSE(decoder.feed("data: [DONE]\n" + frame("late")));
    EXPECT_FALSE(decoder.feed(frame("later")));
    EXPECT_EQ(decoder.content(), "");
    EXPECT_TRUE(updates.empty());
}

TEST_F(EventStreamDecoderTest, SkipsMalformedAndEmptyFrames) {
    decoder.feed(": keep-alive comment\n");
    decoder.feed("event: ping\n");
    decoder.feed("data: {not json\n");
    decoder.feed("data: {\"choices\":[]}\n");                                 // usage frame
    decoder.feed("data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n");
    decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":null}}]}\n");
    decoder.feed(frame("ok"));
    EXPECT_EQ(decoder.content(), "ok");
    EXPECT_EQ(decoder.skipped(), 1u);
    EXPECT_EQ(updates.size(), 1u);
}

TEST_F(EventStreamDecoderTest, FinishFlushesTrailingLine) {
    decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":\"tail\"}}]}");
    EXPECT_EQ(decoder.content(), "");
    decoder.finish();
    EXPECT_EQ(decoder.content(), "tail");
}

TEST(EventStreamDecoderStopTest, CallbackCanStop) {
    int calls = 0;
    EventStreamDecoder decoder([&](const std::string&) { return ++calls < 2; });
    EXPECT_FALSE(decoder.feed(frame("1") + frame("2") + frame("3")));
    EXPECT_TRUE(decoder.stopped());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(decoder.content(), "12");
}
