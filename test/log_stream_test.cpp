#include <random>
#include <gtest/gtest.h>

#include "log_stream.h"

namespace {

std::string Frame(uint8_t stream, const std::string& payload) {
  uint32_t len = payload.size();
  std::string ret = {(char)stream, 0, 0, 0,
      (char)(len >> 24), (char)(len >> 16 & 0xff), (char)(len >> 8 & 0xff), (char)(len & 0xff)};
  return ret + payload;
}

} // namespace

TEST(DemuxLogStream, Empty) {
  auto logs = DemuxLogStream("");
  EXPECT_EQ(logs.stdout_text, "");
  EXPECT_EQ(logs.stderr_text, "");
}

TEST(DemuxLogStream, Interleaved) {
  std::string raw = Frame(1, "hello ") + Frame(2, "oops\n") + Frame(1, "world\n") + Frame(2, "again");
  auto logs = DemuxLogStream(raw);
  EXPECT_EQ(logs.stdout_text, "hello world\n");
  EXPECT_EQ(logs.stderr_text, "oops\nagain");
}

TEST(DemuxLogStream, EmptyPayloads) {
  auto logs = DemuxLogStream(Frame(1, "") + Frame(2, "") + Frame(1, "x"));
  EXPECT_EQ(logs.stdout_text, "x");
  EXPECT_EQ(logs.stderr_text, "");
}

TEST(DemuxLogStream, OtherStreamTypesSkipped) {
  auto logs = DemuxLogStream(Frame(0, "stdin echo") + Frame(3, "system") + Frame(1, "out"));
  EXPECT_EQ(logs.stdout_text, "out");
  EXPECT_EQ(logs.stderr_text, "");
}

TEST(DemuxLogStream, BinaryPayload) {
  std::string payload("a\0b\xff\r\n", 6);
  auto logs = DemuxLogStream(Frame(2, payload));
  EXPECT_EQ(logs.stderr_text, payload);
}

TEST(DemuxLogStream, LargeFrameLength) {
  // length spans more than two header bytes
  std::string payload(70000, 'z');
  auto logs = DemuxLogStream(Frame(1, payload) + Frame(2, "tail"));
  EXPECT_EQ(logs.stdout_text, payload);
  EXPECT_EQ(logs.stderr_text, "tail");
}

TEST(DemuxLogStream, TruncatedHeaderDropped) {
  std::string raw = Frame(1, "complete") + std::string("\x02\0\0", 3);
  auto logs = DemuxLogStream(raw);
  EXPECT_EQ(logs.stdout_text, "complete");
  EXPECT_EQ(logs.stderr_text, "");
}

TEST(DemuxLogStream, TruncatedPayloadDropped) {
  std::string raw = Frame(2, "first") + Frame(1, "cut short");
  raw.resize(raw.size() - 3);
  auto logs = DemuxLogStream(raw);
  EXPECT_EQ(logs.stdout_text, "");
  EXPECT_EQ(logs.stderr_text, "first");
}

TEST(DemuxLogStream, RandomFrames) {
  std::mt19937 gen(20240611);
  std::uniform_int_distribution<int> count_dist(0, 40), len_dist(0, 300), byte_dist(0, 255);
  for (int round = 0; round < 50; round++) {
    std::string raw, expect_out, expect_err;
    int frames = count_dist(gen);
    for (int i = 0; i < frames; i++) {
      std::string payload(len_dist(gen), '\0');
      for (auto& c : payload) c = (char)byte_dist(gen);
      bool to_out = byte_dist(gen) & 1;
      raw += Frame(to_out ? 1 : 2, payload);
      (to_out ? expect_out : expect_err) += payload;
    }
    auto logs = DemuxLogStream(raw);
    ASSERT_EQ(logs.stdout_text, expect_out) << "round " << round;
    ASSERT_EQ(logs.stderr_text, expect_err) << "round " << round;
  }
}
