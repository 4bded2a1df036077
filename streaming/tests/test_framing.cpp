#include <gtest/gtest.h>

#include <switchboard/streaming/framing.hpp>

#pragma GCC diagnostic ignored "-Wunused-result"

using namespace switchboard;

// ============================================================================
// SSE
// ============================================================================

TEST(SseFramerTest, SplitsEventsOnBlankLines) {
  SseFramer framer;
  auto frames = framer.feed("data: one\n\ndata: two\n\n");
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].data, "one");
  EXPECT_EQ(frames[1].data, "two");
  EXPECT_EQ(framer.buffered(), 0u);
}

TEST(SseFramerTest, CarriesIncompleteEventAcrossReads) {
  SseFramer framer;
  EXPECT_TRUE(framer.feed("data: {\"a\":").empty());
  EXPECT_GT(framer.buffered(), 0u);
  EXPECT_TRUE(framer.feed("1}\n").empty());

  auto frames = framer.feed("\n");
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].data, "{\"a\":1}");
}

TEST(SseFramerTest, HandlesCrlfEventNamesAndComments) {
  SseFramer framer;
  auto frames = framer.feed(": keep-alive\r\n\r\nevent: message_stop\r\ndata: {}\r\n\r\n");
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].event, "message_stop");
  EXPECT_EQ(frames[0].data, "{}");
}

TEST(SseFramerTest, JoinsMultiLineData) {
  SseFramer framer;
  auto frames = framer.feed("data: first\ndata: second\n\n");
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].data, "first\nsecond");
}

TEST(SseFramerTest, FinishFlushesUnterminatedEvent) {
  SseFramer framer;
  EXPECT_TRUE(framer.feed("data: [DONE]").empty());
  auto frames = framer.finish();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].data, "[DONE]");
  EXPECT_TRUE(framer.finish().empty());
}

TEST(SseFramerTest, ByteAtATimeMatchesWholeFeed) {
  const std::string wire = "event: a\ndata: x\n\ndata: y\n\n";
  SseFramer framer;
  std::vector<Frame> frames;
  for (char c : wire) {
    for (auto& f : framer.feed(std::string_view(&c, 1))) frames.push_back(std::move(f));
  }
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].event, "a");
  EXPECT_EQ(frames[1].data, "y");
}

// ============================================================================
// NDJSON
// ============================================================================

TEST(NdjsonFramerTest, SplitsLinesAndSkipsBlanks) {
  NdjsonFramer framer;
  auto frames = framer.feed("{\"a\":1}\n\n{\"b\":2}\r\n{\"c\"");
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].data, "{\"b\":2}");

  auto rest = framer.feed(":3}\n");
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0].data, "{\"c\":3}");
}

TEST(NdjsonFramerTest, FinishFlushesLastLine) {
  NdjsonFramer framer;
  EXPECT_TRUE(framer.feed("{\"done\":true}").empty());
  auto frames = framer.finish();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].data, "{\"done\":true}");
}

TEST(FramerFactoryTest, OllamaUsesNdjson) {
  auto ndjson = make_framer(Provider::Ollama);
  EXPECT_EQ(ndjson->feed("{}\n").size(), 1u);

  auto sse = make_framer(Provider::Anthropic);
  EXPECT_TRUE(sse->feed("{}\n").empty());
}
