#include <catch2/catch.hpp>

#include "log_builder.hpp"
#include "test_helpers.hpp"
#include <chronicle/chronicle.hpp>

#include <algorithm>

using namespace chronicle;
using namespace chronicle::test;

namespace {

std::vector<Timestamp> MultiChunkTimesFrom(Timestamp start) {
  std::vector<Timestamp> times;
  for (Timestamp t = 0; t < 300; t += 10) {
    if (t >= start) {
      times.push_back(t);
    }
  }
  return times;
}

}  // namespace

TEST_CASE("MessageIterator ordering", "[iterator]") {
  LogReader reader;

  SECTION("every message once, in time order") {
    requireOk(reader.open(MultiChunkLog()));
    auto iterator = reader.messageIterator();
    REQUIRE(iterator.state() == MessageIterator::State::Uninitialized);
    REQUIRE(Drain(iterator) == MultiChunkTimesFrom(0));
    REQUIRE(iterator.currentIndex() == 30);
    REQUIRE(iterator.state() == MessageIterator::State::Exhausted);
    REQUIRE_FALSE(iterator.hasNext());
    REQUIRE(iterator.next() == nullptr);
  }

  SECTION("messages are sorted within a chunk") {
    LogBuilder builder;
    builder.addChannel(1, "/a");
    builder.addChannel(2, "/b");
    builder.addMessage(1, 30);
    builder.addMessage(2, 10);
    builder.addMessage(1, 20);
    builder.addMessage(2, 20);
    requireOk(reader.open(builder.finish()));
    auto iterator = reader.messageIterator();
    const auto first = iterator.next();
    const auto second = iterator.next();
    const auto third = iterator.next();
    REQUIRE(first->logTime == 10);
    // Equal times keep storage order
    REQUIRE(second->logTime == 20);
    REQUIRE(second->channelId() == 1);
    REQUIRE(third->logTime == 20);
    REQUIRE(third->channelId() == 2);
    REQUIRE(iterator.next()->logTime == 30);
    REQUIRE_FALSE(iterator.hasNext());
  }

  SECTION("peek does not advance") {
    requireOk(reader.open(TwoChannelLog()));
    auto iterator = reader.messageIterator();
    const auto peeked = iterator.peek();
    REQUIRE(iterator.peek() == peeked);
    REQUIRE(iterator.currentIndex() == 0);
    REQUIRE(iterator.next() == peeked);
    REQUIRE(iterator.currentIndex() == 1);
    REQUIRE(iterator.peek()->logTime == 15);
  }

  SECTION("iterators outlive their reader") {
    requireOk(reader.open(TwoChannelLog()));
    auto iterator = reader.messageIterator();
    reader.close();
    REQUIRE(Drain(iterator) == std::vector<Timestamp>{10, 15, 20, 25, 30});
  }

  SECTION("the summary can be loaded lazily") {
    auto source = std::make_shared<BufferSource>(TwoChannelLog());
    MessageIterator iterator{source};
    REQUIRE(Drain(iterator) == std::vector<Timestamp>{10, 15, 20, 25, 30});
  }
}

TEST_CASE("MessageIterator::forChannel()", "[iterator]") {
  LogReader reader;
  requireOk(reader.open(MultiChunkLog()));
  auto iterator = reader.messageIterator();

  iterator.forChannel(2);
  const auto times = Drain(iterator);
  REQUIRE(times == std::vector<Timestamp>{10, 40, 70, 110, 140, 170, 210, 240, 270});

  iterator.forChannel(7);
  REQUIRE_FALSE(iterator.hasNext());

  iterator.clearFilter();
  REQUIRE(Drain(iterator).size() == 30);

  iterator.rewind();
  REQUIRE(iterator.peek()->logTime == 0);
}

/**
 * Seeking then draining yields exactly the messages at or after the seek time.
 */
TEST_CASE("MessageIterator::seekToTime()", "[iterator]") {
  LogReader reader;
  requireOk(reader.open(MultiChunkLog()));
  auto iterator = reader.messageIterator();

  for (const Timestamp t : {0, 1, 95, 100, 155, 190, 191, 290}) {
    CAPTURE(t);
    REQUIRE(iterator.seekToTime(t));
    REQUIRE(iterator.currentIndex() == 0);
    REQUIRE(Drain(iterator) == MultiChunkTimesFrom(t));
  }

  SECTION("past the end") {
    REQUIRE_FALSE(iterator.seekToTime(291));
    REQUIRE(iterator.state() == MessageIterator::State::Exhausted);
    REQUIRE_FALSE(iterator.hasNext());
    iterator.rewind();
    REQUIRE(iterator.state() == MessageIterator::State::Ready);
    REQUIRE(Drain(iterator).size() == 30);
  }

  SECTION("with a channel filter") {
    iterator.forChannel(3);
    REQUIRE(iterator.seekToTime(130));
    REQUIRE(Drain(iterator) == std::vector<Timestamp>{150, 180, 220, 250, 280});
  }
}

TEST_CASE("MessageIterator::seekToTimeNearest()", "[iterator]") {
  LogReader reader;
  requireOk(reader.open(TwoChannelLog()));
  auto iterator = reader.messageIterator();

  SECTION("before the first message") {
    REQUIRE(iterator.seekToTimeNearest(5));
    REQUIRE(iterator.peek()->logTime == 10);
  }

  SECTION("past the end") {
    REQUIRE(iterator.seekToTimeNearest(100));
    REQUIRE(iterator.next()->logTime == 30);
    REQUIRE_FALSE(iterator.hasNext());
  }

  SECTION("between messages") {
    REQUIRE(iterator.seekToTimeNearest(22));
    REQUIRE(iterator.peek()->logTime == 25);
  }

  SECTION("past the end of a filtered channel") {
    iterator.forChannel(1);
    REQUIRE(iterator.seekToTimeNearest(28));
    const auto message = iterator.next();
    REQUIRE(message->logTime == 25);
    REQUIRE(message->channelId() == 1);
    REQUIRE_FALSE(iterator.hasNext());
  }

  SECTION("across chunks") {
    requireOk(reader.open(MultiChunkLog()));
    auto multi = reader.messageIterator();
    multi.forChannel(1);
    REQUIRE(multi.seekToTimeNearest(1000));
    REQUIRE(multi.peek()->logTime == 290);
  }
}

TEST_CASE("MessageIterator::seekToNextOnChannel()", "[iterator]") {
  LogReader reader;

  SECTION("the earliest later message on the channel") {
    requireOk(reader.open(MultiChunkLog()));
    auto iterator = reader.messageIterator();
    REQUIRE(iterator.seekToNextOnChannel(3, 80));
    const auto message = iterator.peek();
    REQUIRE(message->logTime == 120);
    REQUIRE(message->channelId() == 3);
    // Iteration continues across channels from there
    REQUIRE(Drain(iterator) == MultiChunkTimesFrom(120));
  }

  SECTION("other channels sharing the time are skipped") {
    LogBuilder builder;
    builder.addChannel(1, "/a");
    builder.addChannel(2, "/b");
    builder.addMessage(1, 40);
    builder.addMessage(1, 50, "first");
    builder.addMessage(2, 50, "second");
    builder.addMessage(1, 60);
    requireOk(reader.open(builder.finish()));
    auto iterator = reader.messageIterator();
    REQUIRE(iterator.seekToNextOnChannel(2, 40));
    const auto message = iterator.next();
    REQUIRE(message->channelId() == 2);
    REQUIRE(Payload(message->data) == "second");
    REQUIRE(iterator.next()->logTime == 60);
  }

  SECTION("nothing later on the channel") {
    requireOk(reader.open(MultiChunkLog()));
    auto iterator = reader.messageIterator();
    REQUIRE_FALSE(iterator.seekToNextOnChannel(3, 280));
    REQUIRE(iterator.state() == MessageIterator::State::Exhausted);
    REQUIRE_FALSE(iterator.seekToNextOnChannel(3, MaxTime));
  }

  SECTION("channels excluded by the filter") {
    requireOk(reader.open(MultiChunkLog()));
    auto iterator = reader.messageIterator();
    iterator.forChannel(1);
    REQUIRE_FALSE(iterator.seekToNextOnChannel(2, 0));
    REQUIRE(iterator.status().code == StatusCode::InvalidChannelId);
    REQUIRE(iterator.seekToNextOnChannel(1, 0));
    REQUIRE(iterator.peek()->logTime == 30);
  }
}

TEST_CASE("MessageIterator::getMessageAtTime()", "[iterator]") {
  LogReader reader;

  SECTION("exact matches only") {
    requireOk(reader.open(TwoChannelLog()));
    auto iterator = reader.messageIterator();
    const auto message = iterator.getMessageAtTime(1, 25);
    REQUIRE(message != nullptr);
    REQUIRE(Payload(message->data) == "d");
    REQUIRE(message->channel->topic == "/labels");
    REQUIRE(Payload(iterator.getMessageAtTime(0, 20)->data) == "c");
    REQUIRE(iterator.getMessageAtTime(1, 20) == nullptr);
    REQUIRE(iterator.getMessageAtTime(0, 31) == nullptr);
    REQUIRE(iterator.getMessageAtTime(9, 10) == nullptr);

    // Lookups leave the iterator where it was
    REQUIRE(iterator.next()->logTime == 10);
  }

  SECTION("across chunks") {
    requireOk(reader.open(MultiChunkLog()));
    auto iterator = reader.messageIterator();
    const auto message = iterator.getMessageAtTime(3, 250);
    REQUIRE(message != nullptr);
    REQUIRE(Payload(message->data) == "250");
    REQUIRE(iterator.getMessageAtTime(2, 250) == nullptr);
  }

  SECTION("chunks without message indexes are decoded") {
    LogBuilderOptions options;
    options.noMessageIndex = true;
    requireOk(reader.open(TwoChannelLog(options)));
    auto iterator = reader.messageIterator();
    REQUIRE(Payload(iterator.getMessageAtTime(1, 25)->data) == "d");
    REQUIRE(iterator.getMessageAtTime(1, 30) == nullptr);
  }
}

/**
 * Chunks are drained one at a time in summary order, so when their time ranges overlap the
 * output is sorted within each chunk but not across them.
 */
TEST_CASE("MessageIterator with overlapping chunks", "[iterator]") {
  LogBuilder builder;
  builder.addChannel(1, "/a");
  builder.addMessage(1, 40);
  builder.addMessage(1, 10);
  builder.closeChunk();
  builder.addMessage(1, 30);
  builder.addMessage(1, 20);
  builder.closeChunk();
  builder.addMessage(1, 5);

  LogReader reader;
  requireOk(reader.open(builder.finish()));
  auto iterator = reader.messageIterator();
  const auto times = Drain(iterator);
  REQUIRE(times == std::vector<Timestamp>{10, 40, 20, 30, 5});
  REQUIRE_FALSE(std::is_sorted(times.begin(), times.end()));

  // The query engine makes the same trade-off
  REQUIRE(Times(reader.query().messagesInTimeRange(-1, -1)) == times);
}

TEST_CASE("MessageIterator without a summary", "[iterator]") {
  LogBuilderOptions options;
  options.noSummary = true;
  LogReader reader;
  requireOk(reader.open(TwoChannelLog(options)));

  std::vector<StatusCode> problems;
  auto iterator = reader.messageIterator();
  iterator.setProblemCallback([&](const Status& status) {
    problems.push_back(status.code);
  });

  REQUIRE_FALSE(iterator.hasNext());
  REQUIRE(iterator.state() == MessageIterator::State::Unavailable);
  REQUIRE(iterator.status().code == StatusCode::SummaryUnavailable);
  REQUIRE(iterator.peek() == nullptr);
  REQUIRE_FALSE(iterator.seekToTime(0));
  REQUIRE_FALSE(iterator.seekToTimeNearest(0));
  REQUIRE(iterator.getMessageAtTime(0, 10) == nullptr);
  REQUIRE(iterator.state() == MessageIterator::State::Unavailable);
  REQUIRE(problems == std::vector<StatusCode>{StatusCode::SummaryUnavailable});

  auto lazy = MessageIterator{reader.source()};
  REQUIRE_FALSE(lazy.hasNext());
  REQUIRE(lazy.state() == MessageIterator::State::Unavailable);
}

TEST_CASE("MessageIterator reports why the summary is unavailable", "[iterator]") {
  SECTION("a corrupt summary") {
    auto bytes = TwoChannelLog();
    CorruptSummary(bytes);
    LogReader reader;
    requireOk(reader.open(std::move(bytes)));

    auto iterator = reader.messageIterator();
    REQUIRE_FALSE(iterator.hasNext());
    REQUIRE(iterator.state() == MessageIterator::State::Unavailable);
    REQUIRE(iterator.status().code == StatusCode::CrcMismatch);
  }

  SECTION("a closed reader") {
    LogReader reader;
    auto iterator = reader.messageIterator();
    REQUIRE_FALSE(iterator.hasNext());
    REQUIRE(iterator.status().code == StatusCode::NotOpen);
  }
}

TEST_CASE("MessageIterator skips corrupt chunks", "[iterator]") {
  auto bytes = MultiChunkLog();
  {
    LogReader reader;
    requireOk(reader.open(bytes));
    const auto chunkIndex = reader.chunkIndexes().at(1);
    bytes[chunkIndex.chunkStartOffset + chunkIndex.chunkLength - 1] = std::byte('9');
  }

  std::vector<StatusCode> problems;
  LogReader reader;
  reader.setProblemCallback([&](const Status& status) {
    problems.push_back(status.code);
  });
  requireOk(reader.open(std::move(bytes)));
  auto iterator = reader.messageIterator();

  std::vector<Timestamp> expected;
  for (Timestamp t : MultiChunkTimesFrom(0)) {
    if (t < 100 || t >= 200) {
      expected.push_back(t);
    }
  }
  REQUIRE(Drain(iterator) == expected);
  REQUIRE(problems == std::vector<StatusCode>{StatusCode::CrcMismatch});
  REQUIRE(iterator.status().code == StatusCode::CrcMismatch);

  REQUIRE(iterator.seekToTime(150));
  REQUIRE(iterator.peek()->logTime == 200);
}
