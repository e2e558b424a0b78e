#include <chronicle/chronicle.hpp>

#include "log_builder.hpp"
#include <benchmark/benchmark.h>

#include <chrono>
#include <memory>
#include <string>

constexpr size_t ChunkCount = 100;
constexpr char Payload[] = "{\"x\": 1.0, \"y\": 2.0, \"z\": 3.0}";

// Builds a log of ChunkCount chunks of `perChunk` messages each, 10us apart, cycling over four
// channels
static chronicle::ByteArray BuildLog(size_t perChunk,
                                     chronicle::Compression compression = chronicle::Compression::None) {
  chronicle::test::LogBuilderOptions options;
  options.compression = compression;
  chronicle::test::LogBuilder builder{options};
  const auto schemaId = builder.addSchema("Vector3", "jsonschema", "{}");
  for (chronicle::ChannelId channelId = 1; channelId <= 4; ++channelId) {
    builder.addChannel(channelId, "/sensor/" + std::to_string(channelId), schemaId);
  }

  chronicle::Timestamp time = 0;
  for (size_t chunk = 0; chunk < ChunkCount; ++chunk) {
    for (size_t i = 0; i < perChunk; ++i) {
      builder.addMessage(chronicle::ChannelId(1 + i % 4), time, Payload, uint32_t(i));
      time += 10;
    }
    builder.closeChunk();
  }
  return builder.finish();
}

static void OpenOrSkip(benchmark::State& state, chronicle::LogReader& reader,
                       chronicle::ByteArray bytes) {
  const auto status = reader.open(std::move(bytes));
  if (!status.ok()) {
    state.SkipWithError(status.message.c_str());
  }
}

static void BM_LogReaderMessages(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));

  while (state.KeepRunning()) {
    auto messages = reader.messages();
    benchmark::DoNotOptimize(messages);
  }
  state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(ChunkCount) * state.range(0));
}

static void BM_MessageIteratorDrain(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));

  while (state.KeepRunning()) {
    auto iterator = reader.messageIterator();
    while (auto message = iterator.next()) {
      benchmark::DoNotOptimize(message);
    }
  }
  state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(ChunkCount) * state.range(0));
}

static void BM_MessageIteratorDrainCompressed(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(1000, chronicle::Compression(state.range(0))));

  while (state.KeepRunning()) {
    auto iterator = reader.messageIterator();
    while (auto message = iterator.next()) {
      benchmark::DoNotOptimize(message);
    }
  }
  state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(ChunkCount) * 1000);
}

static void BM_MessageIteratorSeekToTime(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));
  auto iterator = reader.messageIterator();
  const chronicle::Timestamp end = chronicle::Timestamp(ChunkCount * state.range(0) * 10);

  chronicle::Timestamp target = 0;
  while (state.KeepRunning()) {
    benchmark::DoNotOptimize(iterator.seekToTime(target));
    target = (target + 7919) % end;
  }
}

static void BM_MessageIteratorGetMessageAtTime(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));
  auto iterator = reader.messageIterator();
  const size_t total = ChunkCount * size_t(state.range(0));

  size_t index = 0;
  while (state.KeepRunning()) {
    const auto channelId = chronicle::ChannelId(1 + index % 4);
    benchmark::DoNotOptimize(iterator.getMessageAtTime(channelId, index * 10));
    index = (index + 4099) % total;
  }
}

static void BM_QueryEngineCountInRange(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));
  auto& query = reader.query();
  const int64_t end = int64_t(ChunkCount) * state.range(0) * 10;

  while (state.KeepRunning()) {
    benchmark::DoNotOptimize(query.messageCountInRange(end / 4, end / 2));
  }
}

static void BM_QueryEngineMessagesForChannel(benchmark::State& state) {
  chronicle::LogReader reader;
  OpenOrSkip(state, reader, BuildLog(size_t(state.range(0))));
  auto& query = reader.query();

  while (state.KeepRunning()) {
    auto messages = query.messagesForChannel(2);
    benchmark::DoNotOptimize(messages);
  }
}

static void BM_ReplaySchedulerTick(benchmark::State& state) {
  auto reader = std::make_shared<chronicle::LogReader>();
  OpenOrSkip(state, *reader, BuildLog(1000));
  auto clock = std::make_shared<chronicle::ManualClock>();
  chronicle::ReplayScheduler scheduler{clock};
  scheduler.setReader(reader);
  scheduler.setLooping(true);
  size_t emitted = 0;
  scheduler.setMessageCallback([&](const chronicle::LogMessagePtr&) {
    ++emitted;
  });
  if (const auto status = scheduler.start(); !status.ok()) {
    state.SkipWithError(status.message.c_str());
  }

  // Each tick advances the clock by range(0) microseconds of log time
  while (state.KeepRunning()) {
    clock->advance(std::chrono::microseconds(state.range(0)));
    benchmark::DoNotOptimize(scheduler.tick());
  }
  state.SetItemsProcessed(int64_t(emitted));
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_LogReaderMessages", BM_LogReaderMessages)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000);
  benchmark::RegisterBenchmark("BM_MessageIteratorDrain", BM_MessageIteratorDrain)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000);
  benchmark::RegisterBenchmark("BM_MessageIteratorDrainCompressed",
                               BM_MessageIteratorDrainCompressed)
#ifndef CHRONICLE_COMPRESSION_NO_LZ4
    ->Arg(int64_t(chronicle::Compression::Lz4))
#endif
#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
    ->Arg(int64_t(chronicle::Compression::Zstd))
#endif
    ->Arg(int64_t(chronicle::Compression::None));
  benchmark::RegisterBenchmark("BM_MessageIteratorSeekToTime", BM_MessageIteratorSeekToTime)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000);
  benchmark::RegisterBenchmark("BM_MessageIteratorGetMessageAtTime",
                               BM_MessageIteratorGetMessageAtTime)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000);
  benchmark::RegisterBenchmark("BM_QueryEngineCountInRange", BM_QueryEngineCountInRange)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000);
  benchmark::RegisterBenchmark("BM_QueryEngineMessagesForChannel",
                               BM_QueryEngineMessagesForChannel)
    ->Arg(100)
    ->Arg(1000);
  benchmark::RegisterBenchmark("BM_ReplaySchedulerTick", BM_ReplaySchedulerTick)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(16667);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
