#include <gtest/gtest.h>

#include "ollama/client.hpp"
#include "ollama/error.hpp"
#include "ollama/streaming.hpp"

#include "support/env_guard.hpp"
#include "support/mock_http_client.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using ollama::DecodeError;
using ollama::NdjsonParser;
using ollama::ServerStreamError;
using ollama::Stream;
using ollama::StreamCompletion;
using ollama::TransportError;
using ollama::TruncationError;
namespace mock = ollama::testing;
using json = nlohmann::json;

namespace {

Stream<json> make_json_stream(std::vector<std::string> chunks,
                              std::shared_ptr<mock::SourceStats> stats,
                              std::optional<std::string> failure = std::nullopt) {
  auto source = std::make_unique<mock::ScriptedByteSource>(std::move(chunks), std::move(failure), std::move(stats));
  return Stream<json>(
      std::move(source), [](const json& payload) { return payload; },
      [](const json& payload) { return StreamCompletion{payload.value("done", false), std::nullopt}; });
}

std::vector<json> drain(Stream<json>& stream) {
  std::vector<json> records;
  for (auto& event : stream) {
    records.push_back(event.payload);
  }
  return records;
}

}  // namespace

TEST(NdjsonParserTest, KeepsPartialRecordUntilNewline) {
  NdjsonParser parser;
  auto first = parser.feed("{\"a\":", std::strlen("{\"a\":"));
  EXPECT_TRUE(first.empty());
  EXPECT_TRUE(parser.has_partial_record());

  auto second = parser.feed("1}\r\n\n  \n{\"b\":2}\n", std::strlen("1}\r\n\n  \n{\"b\":2}\n"));
  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(second[0], "{\"a\":1}");
  EXPECT_EQ(second[1], "{\"b\":2}");
  EXPECT_FALSE(parser.has_partial_record());
  EXPECT_FALSE(parser.finalize().has_value());
}

TEST(NdjsonParserTest, ParseWholePayloadRejectsTruncatedTail) {
  auto records = ollama::parse_ndjson_stream("{\"a\":1}\n{\"b\":2}");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1], "{\"b\":2}");

  EXPECT_THROW(ollama::parse_ndjson_stream("{\"a\":1}\n{\"b\":"), TruncationError);
}

TEST(StreamTest, ChunkBoundariesDoNotChangeRecords) {
  const std::string payload =
      "{\"status\":\"downloading\",\"completed\":10,\"total\":100}\n"
      "{\"status\":\"verifying\",\"text\":\"caf\xC3\xA9\"}\r\n"
      "\n"
      "{\"status\":\"success\",\"done\":true}\n";

  auto reference_stats = std::make_shared<mock::SourceStats>();
  auto reference_stream = make_json_stream({payload}, reference_stats);
  const auto reference = drain(reference_stream);
  ASSERT_EQ(reference.size(), 3u);

  for (std::size_t first = 0; first <= payload.size(); ++first) {
    for (std::size_t second = first; second <= payload.size(); second += 7) {
      std::vector<std::string> chunks = {payload.substr(0, first), payload.substr(first, second - first),
                                         payload.substr(second)};
      auto stats = std::make_shared<mock::SourceStats>();
      auto stream = make_json_stream(chunks, stats);
      EXPECT_EQ(drain(stream), reference) << "split at " << first << "/" << second;
    }
  }
}

TEST(StreamTest, SingleByteChunksYieldSameRecords) {
  const std::string payload = "{\"n\":1}\n{\"n\":2}\n{\"n\":3,\"done\":true}\n";
  std::vector<std::string> chunks;
  for (char ch : payload) {
    chunks.emplace_back(1, ch);
  }
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream(chunks, stats);
  auto records = drain(stream);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[2]["n"], 3);
  EXPECT_TRUE(stream.saw_done());
}

TEST(StreamTest, TruncatedTailRaisesWithoutYieldingPartialRecord) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\n{\"n\":", "2"}, stats);

  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->payload["n"], 1);

  try {
    stream.next();
    FAIL() << "Expected TruncationError";
  } catch (const TruncationError& error) {
    EXPECT_EQ(error.partial_record(), "{\"n\":2");
  }

  EXPECT_EQ(stream.events_delivered(), 1u);
  EXPECT_EQ(stats->closes, 1u);
  EXPECT_FALSE(stream.next().has_value());
}

TEST(StreamTest, CompleteTailWithoutNewlineIsYielded) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\n{\"n\":2}"}, stats);
  auto records = drain(stream);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1]["n"], 2);
}

TEST(StreamTest, WhitespaceTailEndsCleanly) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\n", "  \r\n\t"}, stats);
  auto records = drain(stream);
  EXPECT_EQ(records.size(), 1u);
  EXPECT_TRUE(stream.closed());
}

TEST(StreamTest, ErrorRecordStopsStreamWithServerMessage) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\n{\"error\":\"model runner has unexpectedly stopped\"}\n{\"n\":3}\n"}, stats);

  ASSERT_TRUE(stream.next().has_value());
  try {
    stream.next();
    FAIL() << "Expected ServerStreamError";
  } catch (const ServerStreamError& error) {
    EXPECT_STREQ(error.what(), "model runner has unexpectedly stopped");
  }
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(stream.events_delivered(), 1u);
}

TEST(StreamTest, MalformedRecordRaisesDecodeError) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\nnot json\n"}, stats);

  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->payload["n"], 1);
  EXPECT_THROW(stream.next(), DecodeError);
  EXPECT_EQ(stats->closes, 1u);
}

TEST(StreamTest, TransportFailureClosesSource) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":1}\n"}, stats, std::string("connection reset by peer"));

  ASSERT_TRUE(stream.next().has_value());
  EXPECT_THROW(stream.next(), TransportError);
  EXPECT_EQ(stats->closes, 1u);
  EXPECT_FALSE(stream.next().has_value());
}

TEST(StreamTest, BreakingOutOfLoopStopsReading) {
  std::vector<std::string> chunks;
  for (int i = 0; i < 10; ++i) {
    chunks.push_back("{\"n\":" + std::to_string(i) + "}\n");
  }
  auto stats = std::make_shared<mock::SourceStats>();
  {
    auto stream = make_json_stream(chunks, stats);
    int seen = 0;
    for (auto& event : stream) {
      EXPECT_EQ(event.payload["n"], seen);
      if (++seen == 3) {
        break;
      }
    }
    EXPECT_EQ(stats->reads, 3u);
    EXPECT_EQ(stream.source_reads(), 3u);
  }
  EXPECT_EQ(stats->reads, 3u);
  EXPECT_EQ(stats->chunks_delivered, 3u);
  EXPECT_EQ(stats->closes, 1u);
}

TEST(StreamTest, BufferedRecordsAreServedWithoutFurtherReads) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto stream = make_json_stream({"{\"n\":0}\n{\"n\":1}\n{\"n\":2}\n", "{\"n\":3}\n"}, stats);

  ASSERT_TRUE(stream.next().has_value());
  ASSERT_TRUE(stream.next().has_value());
  ASSERT_TRUE(stream.next().has_value());
  EXPECT_EQ(stats->reads, 1u);

  stream.close();
  EXPECT_TRUE(stream.closed());
  EXPECT_FALSE(stream.next().has_value());
  EXPECT_EQ(stats->reads, 1u);
  EXPECT_EQ(stats->closes, 1u);
}

TEST(StreamTest, MoveTransfersOwnershipOfSource) {
  auto stats = std::make_shared<mock::SourceStats>();
  auto original = make_json_stream({"{\"n\":0}\n{\"n\":1}\n"}, stats);
  ASSERT_TRUE(original.next().has_value());

  Stream<json> moved = std::move(original);
  auto next = moved.next();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->payload["n"], 1);
  EXPECT_EQ(stats->closes, 0u);
}

TEST(StreamTest, PullProgressEndToEnd) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_stream({
      "{\"status\":\"downloading\",\"completed\":10,\"total\":100}\n"
      "{\"status\":\"downloading\",\"completed\":100,\"total\":100}\n"
      "{\"status\":\"success\"}\n"});

  ollama::OllamaClient client({}, std::move(http_mock));
  auto stream = client.models().pull({"llama3.2", std::nullopt});

  std::vector<ollama::StreamEvent<ollama::ProgressResponse>> events;
  for (auto& event : stream) {
    events.push_back(event);
  }

  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].payload.status, "downloading");
  EXPECT_EQ(events[0].payload.completed, 10);
  EXPECT_EQ(events[0].payload.total, 100);
  EXPECT_FALSE(events[0].done);
  EXPECT_EQ(events[1].payload.completed, 100);
  EXPECT_FALSE(events[1].done);
  EXPECT_EQ(events[2].payload.status, "success");
  EXPECT_TRUE(events[2].done);
  EXPECT_TRUE(ollama::is_progress_success(events[2].payload));
  EXPECT_FALSE(events[2].payload.completed.has_value());
  EXPECT_TRUE(stream.saw_done());
  EXPECT_TRUE(stream.closed());

  const auto& request = mock_ptr->last_request();
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->url, "http://127.0.0.1:11434/api/pull");
  EXPECT_EQ(request->headers.at("Accept"), "application/x-ndjson");
  auto body = json::parse(request->body);
  EXPECT_EQ(body["model"], "llama3.2");
  EXPECT_EQ(body["stream"], true);
  EXPECT_FALSE(body.contains("insecure"));
}
