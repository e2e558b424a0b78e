#include <chronicle/chronicle.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

constexpr auto TickInterval = std::chrono::milliseconds(16);

struct Arguments {
  std::string inputFile;
  double speed = 1.0;
  bool loop = false;
  std::vector<std::string> topics;
  int64_t start = -1;
  int64_t end = -1;
};

static bool ParseArguments(int argc, char* argv[], Arguments* output) {
  auto& args = *output;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "--loop") {
      args.loop = true;
    } else if (arg == "--speed" && hasValue) {
      args.speed = std::strtod(argv[++i], nullptr);
    } else if (arg == "--topic" && hasValue) {
      args.topics.emplace_back(argv[++i]);
    } else if (arg == "--start" && hasValue) {
      args.start = std::strtoll(argv[++i], nullptr, 10);
    } else if (arg == "--end" && hasValue) {
      args.end = std::strtoll(argv[++i], nullptr, 10);
    } else if (args.inputFile.empty() && !arg.empty() && arg[0] != '-') {
      args.inputFile = std::string(arg);
    } else {
      return false;
    }
  }
  return !args.inputFile.empty();
}

// Every channel publishing on one of `topics`
static std::vector<chronicle::ChannelId> ChannelsForTopics(const chronicle::Summary& summary,
                                                           const std::vector<std::string>& topics) {
  std::vector<chronicle::ChannelId> channelIds;
  for (const auto& [channelId, channel] : summary.channels()) {
    for (const auto& topic : topics) {
      if (channel->topic == topic) {
        channelIds.push_back(channelId);
        break;
      }
    }
  }
  return channelIds;
}

int main(int argc, char* argv[]) {
  Arguments args;
  if (!ParseArguments(argc, argv, &args)) {
    fmt::print(stderr,
               "Usage: {} <input.log> [--speed x] [--loop] [--topic t]... [--start us] [--end us]\n",
               argv[0]);
    return 1;
  }

  auto reader = std::make_shared<chronicle::LogReader>();
  reader->setProblemCallback([](const chronicle::Status& problem) {
    fmt::print(stderr, "! {}\n", problem.message);
  });
  if (const auto status = reader->open(args.inputFile); !status.ok()) {
    fmt::print(stderr, "! failed to open {}: {}\n", args.inputFile, status.message);
    return 1;
  }
  const auto summary = reader->summary();
  if (!summary) {
    fmt::print(stderr, "! {} has no summary section and cannot be replayed\n", args.inputFile);
    return 1;
  }

  chronicle::ReplayOptions options;
  options.speed = args.speed;
  options.looping = args.loop;
  chronicle::ReplayScheduler scheduler{nullptr, options};
  scheduler.setReader(reader);
  scheduler.setProblemCallback([](const chronicle::Status& problem) {
    fmt::print(stderr, "! {}\n", problem.message);
  });

  if (!args.topics.empty()) {
    const auto channelIds = ChannelsForTopics(*summary, args.topics);
    if (channelIds.empty()) {
      fmt::print(stderr, "! no channel publishes on the requested topics\n");
      return 1;
    }
    scheduler.setFilterChannels(channelIds);
  }
  if (args.start >= 0 || args.end >= 0) {
    scheduler.setTimeRange(args.start, args.end);
    if (!scheduler.lastError().ok()) {
      fmt::print(stderr, "! {}\n", scheduler.lastError().message);
      return 1;
    }
  }

  scheduler.setMessageCallback([](const chronicle::LogMessagePtr& message) {
    fmt::print("{} [{}] sequence={} data=<{} bytes>\n", message->logTime, message->channel->topic,
               message->sequence, message->data.size());
  });

  if (const auto status = scheduler.start(); !status.ok()) {
    fmt::print(stderr, "! failed to start replay: {}\n", status.message);
    return 1;
  }

  while (scheduler.isRunning()) {
    scheduler.tick();
    std::this_thread::sleep_for(TickInterval);
  }

  return scheduler.lastError().ok() ? 0 : 1;
}
