#pragma once

#include "message_iterator.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace chronicle {

/**
 * @brief Source of wall-clock instants for the replay scheduler.
 */
class CHRONICLE_PUBLIC IClock {
public:
  virtual ~IClock() = default;
  virtual std::chrono::steady_clock::time_point now() const = 0;
};

class CHRONICLE_PUBLIC SteadyClock final : public IClock {
public:
  std::chrono::steady_clock::time_point now() const override;
};

/**
 * @brief A clock that only moves when told to, for hosts that drive time themselves and for
 * tests.
 */
class CHRONICLE_PUBLIC ManualClock final : public IClock {
public:
  std::chrono::steady_clock::time_point now() const override;
  void advance(std::chrono::nanoseconds duration);
  void set(std::chrono::steady_clock::time_point time);

private:
  std::chrono::steady_clock::time_point now_;
};

struct CHRONICLE_PUBLIC ReplayOptions {
  /**
   * @brief Log microseconds replayed per wall-clock microsecond. Non-positive values are
   * treated as 1.0.
   */
  double speed = 1.0;
  /**
   * @brief Restart from the start of the time range when the log is exhausted.
   */
  bool looping = false;
};

using MessageCallback = std::function<void(const LogMessagePtr&)>;

/**
 * @brief Replays a log in real time. Each `tick()` maps the wall-clock time elapsed since the
 * last anchor to a target log time and emits, in log time order, every message at or before
 * that target that has not been emitted yet.
 *
 * The scheduler is single-threaded and driven entirely by the host calling `tick()`. All
 * messages due in a tick are collected before the first callback runs, so callbacks may stop,
 * seek, or reconfigure the scheduler; such changes take effect on the next tick.
 *
 * Time range endpoints are signed microseconds where a negative value means unbounded.
 */
class CHRONICLE_PUBLIC ReplayScheduler {
public:
  /**
   * @param clock Wall-clock source. A SteadyClock is used when null.
   */
  explicit ReplayScheduler(std::shared_ptr<IClock> clock = nullptr, ReplayOptions options = {});

  ReplayScheduler(const ReplayScheduler&) = delete;
  ReplayScheduler& operator=(const ReplayScheduler&) = delete;

  /**
   * @brief Attach the log to replay. Stops playback.
   */
  void setReader(std::shared_ptr<LogReader> reader);
  void clearReader();

  /**
   * @brief Called once per emitted message, in log time order.
   */
  void setMessageCallback(MessageCallback onMessage);
  void setProblemCallback(ProblemCallback onProblem);

  /**
   * @brief Only emit messages on these channels. An empty list clears the filter. When running,
   * playback continues from the current log time.
   */
  void setFilterChannels(const std::vector<ChannelId>& channelIds);
  void clearFilterChannels();

  /**
   * @brief Limit playback to [start, end]. When running, playback restarts at the new start, or
   * stops if no message falls in the new range.
   */
  void setTimeRange(int64_t start, int64_t end);

  void setSpeed(double speed);
  double speed() const;
  void setLooping(bool looping);
  bool looping() const;

  /**
   * @brief Begin playback at the start of the time range, or at the first message of the log.
   *
   * @return NotOpen without an open reader, InvalidArgument when no message falls in the time
   * range, or the reason the log cannot be iterated.
   */
  Status start();

  /**
   * @brief Stop playback and drop the iterator. Safe to call from a message callback.
   */
  void stop();

  /**
   * @brief Continue playback from log time `time`. Returns false if the log has no message at
   * or after `time`; the position is then unchanged.
   */
  bool seekToTime(int64_t time);

  bool isRunning() const;

  /**
   * @brief The log time playback has reached, or -1 if playback has not been positioned.
   */
  int64_t currentTimeUsec() const;

  /**
   * @brief Emit every message that has become due. Returns the number of messages emitted.
   */
  size_t tick();

  const Status& lastError() const;

private:
  enum class EndAction { None, Stop, Restart };

  std::shared_ptr<IClock> clock_;
  std::shared_ptr<LogReader> reader_;
  MessageCallback onMessage_;
  ProblemCallback onProblem_;
  std::optional<std::unordered_set<ChannelId>> filter_;
  std::optional<Timestamp> timeStart_;
  std::optional<Timestamp> timeEnd_;
  double speed_ = 1.0;
  bool looping_ = false;
  bool running_ = false;
  bool ticking_ = false;
  std::unique_ptr<MessageIterator> iterator_;
  std::optional<std::chrono::steady_clock::time_point> wallAnchor_;
  std::optional<Timestamp> logAnchor_;
  Timestamp resumeFrom_ = 0;
  uint64_t generation_ = 0;
  Status lastError_;

  Status restartFromRangeStart_();
  Status makeIterator_(Timestamp position, std::unique_ptr<MessageIterator>* output);
  void anchor_(Timestamp logTime);
  Timestamp targetAt_(std::chrono::steady_clock::time_point now) const;
  void recordError_(Status status);
};

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "replay.inl"
#endif
