#include "internal.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace chronicle {

// Clocks //////////////////////////////////////////////////////////////////////

std::chrono::steady_clock::time_point SteadyClock::now() const {
  return std::chrono::steady_clock::now();
}

std::chrono::steady_clock::time_point ManualClock::now() const {
  return now_;
}

void ManualClock::advance(std::chrono::nanoseconds duration) {
  now_ += duration;
}

void ManualClock::set(std::chrono::steady_clock::time_point time) {
  now_ = time;
}

// ReplayScheduler /////////////////////////////////////////////////////////////

ReplayScheduler::ReplayScheduler(std::shared_ptr<IClock> clock, ReplayOptions options)
    : clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()) {
  setSpeed(options.speed);
  setLooping(options.looping);
}

void ReplayScheduler::setReader(std::shared_ptr<LogReader> reader) {
  stop();
  reader_ = std::move(reader);
}

void ReplayScheduler::clearReader() {
  stop();
  reader_.reset();
}

void ReplayScheduler::setMessageCallback(MessageCallback onMessage) {
  onMessage_ = std::move(onMessage);
}

void ReplayScheduler::setProblemCallback(ProblemCallback onProblem) {
  onProblem_ = std::move(onProblem);
}

void ReplayScheduler::setFilterChannels(const std::vector<ChannelId>& channelIds) {
  if (channelIds.empty()) {
    filter_.reset();
  } else {
    filter_ = std::unordered_set<ChannelId>(channelIds.begin(), channelIds.end());
  }
  if (!running_) {
    return;
  }

  // Rebuild the iterator at the first log time not yet emitted and keep the logical clock
  // where it is
  const Timestamp now = targetAt_(clock_->now());
  std::unique_ptr<MessageIterator> iterator;
  if (auto status = makeIterator_(resumeFrom_, &iterator); !status.ok()) {
    recordError_(std::move(status));
    stop();
    return;
  }
  iterator_ = std::move(iterator);
  const Timestamp resumeFrom = resumeFrom_;
  anchor_(now);
  resumeFrom_ = resumeFrom;
  ++generation_;
}

void ReplayScheduler::clearFilterChannels() {
  setFilterChannels({});
}

void ReplayScheduler::setTimeRange(int64_t start, int64_t end) {
  if (start >= 0 && end >= 0 && start > end) {
    recordError_(Status{StatusCode::InvalidArgument,
                        internal::StrCat("time range start ", start, " is after end ", end)});
    return;
  }
  timeStart_ = start >= 0 ? std::optional<Timestamp>(Timestamp(start)) : std::nullopt;
  timeEnd_ = end >= 0 ? std::optional<Timestamp>(Timestamp(end)) : std::nullopt;
  if (!running_) {
    return;
  }
  ++generation_;
  if (auto status = restartFromRangeStart_(); !status.ok()) {
    recordError_(std::move(status));
    stop();
  }
}

void ReplayScheduler::setSpeed(double speed) {
  speed_ = speed > 0.0 && std::isfinite(speed) ? speed : 1.0;
}

double ReplayScheduler::speed() const {
  return speed_;
}

void ReplayScheduler::setLooping(bool looping) {
  looping_ = looping;
}

bool ReplayScheduler::looping() const {
  return looping_;
}

Status ReplayScheduler::start() {
  if (!reader_ || !reader_->isOpen()) {
    Status status{StatusCode::NotOpen, "no open reader attached"};
    recordError_(status);
    return status;
  }
  ++generation_;
  if (auto status = restartFromRangeStart_(); !status.ok()) {
    recordError_(status);
    stop();
    return status;
  }
  return StatusCode::Success;
}

void ReplayScheduler::stop() {
  running_ = false;
  iterator_.reset();
  wallAnchor_.reset();
  logAnchor_.reset();
  resumeFrom_ = 0;
  ++generation_;
}

bool ReplayScheduler::seekToTime(int64_t time) {
  if (!reader_ || !reader_->isOpen()) {
    recordError_(Status{StatusCode::NotOpen, "no open reader attached"});
    return false;
  }
  const Timestamp position = time < 0 ? 0 : Timestamp(time);
  std::unique_ptr<MessageIterator> iterator;
  if (auto status = makeIterator_(position, &iterator); !status.ok()) {
    recordError_(std::move(status));
    return false;
  }
  if (!iterator->hasNext()) {
    return false;
  }
  iterator_ = std::move(iterator);
  anchor_(position);
  ++generation_;
  return true;
}

bool ReplayScheduler::isRunning() const {
  return running_;
}

int64_t ReplayScheduler::currentTimeUsec() const {
  if (!logAnchor_ || !wallAnchor_) {
    return -1;
  }
  constexpr Timestamp MaxSigned = Timestamp(std::numeric_limits<int64_t>::max());
  return int64_t(std::min(targetAt_(clock_->now()), MaxSigned));
}

size_t ReplayScheduler::tick() {
  if (!running_ || !iterator_ || ticking_) {
    return 0;
  }

  const Timestamp target = targetAt_(clock_->now());
  std::vector<LogMessagePtr> due;
  EndAction action = EndAction::None;
  while (true) {
    const auto next = iterator_->peek();
    if (!next) {
      action = looping_ ? EndAction::Restart : EndAction::Stop;
      break;
    }
    if (timeEnd_ && next->logTime > *timeEnd_) {
      // Playback ends once the logical clock reaches the end bound
      if (target >= *timeEnd_) {
        action = looping_ ? EndAction::Restart : EndAction::Stop;
      }
      break;
    }
    if (next->logTime > target) {
      break;
    }
    iterator_->next();
    if (filter_ && filter_->count(next->channelId()) == 0) {
      continue;
    }
    due.push_back(next);
  }
  resumeFrom_ = target == MaxTime ? MaxTime : target + 1;

  // Callbacks may call back into the scheduler; anything they change supersedes the end
  // action computed above
  const uint64_t generation = generation_;
  {
    // Cleared on unwind as well
    struct TickingGuard {
      bool& ticking;
      ~TickingGuard() {
        ticking = false;
      }
    } guard{ticking_};
    ticking_ = true;
    for (const auto& message : due) {
      if (onMessage_) {
        onMessage_(message);
      }
    }
  }

  if (generation == generation_) {
    if (action == EndAction::Restart) {
      if (auto status = restartFromRangeStart_(); !status.ok()) {
        recordError_(std::move(status));
        stop();
      }
    } else if (action == EndAction::Stop) {
      stop();
    }
  }
  return due.size();
}

const Status& ReplayScheduler::lastError() const {
  return lastError_;
}

Status ReplayScheduler::restartFromRangeStart_() {
  const Timestamp position = timeStart_.value_or(0);
  std::unique_ptr<MessageIterator> iterator;
  if (auto status = makeIterator_(position, &iterator); !status.ok()) {
    return status;
  }
  const auto first = iterator->peek();
  if (!first || (timeEnd_ && first->logTime > *timeEnd_)) {
    if (!first && !iterator->status().ok()) {
      return iterator->status();
    }
    return Status{StatusCode::InvalidArgument,
                  internal::StrCat("no messages to replay at or after ", position)};
  }

  Timestamp logStart = position;
  if (!timeStart_) {
    const auto summary = reader_->summary();
    if (summary && summary->statistics()) {
      logStart = summary->statistics()->messageStartTime;
    } else {
      logStart = first->logTime;
    }
  }

  iterator_ = std::move(iterator);
  anchor_(logStart);
  resumeFrom_ = position;
  running_ = true;
  return StatusCode::Success;
}

Status ReplayScheduler::makeIterator_(Timestamp position,
                                      std::unique_ptr<MessageIterator>* output) {
  auto iterator = std::make_unique<MessageIterator>(reader_->messageIterator());
  if (onProblem_) {
    iterator->setProblemCallback(onProblem_);
  }
  // A single channel is filtered inside the iterator; larger sets are checked per message
  if (filter_ && filter_->size() == 1) {
    iterator->forChannel(*filter_->begin());
  }
  if (!iterator->seekToTime(position) &&
      iterator->state() == MessageIterator::State::Unavailable) {
    return iterator->status();
  }
  *output = std::move(iterator);
  return StatusCode::Success;
}

void ReplayScheduler::anchor_(Timestamp logTime) {
  wallAnchor_ = clock_->now();
  logAnchor_ = logTime;
  resumeFrom_ = logTime;
}

Timestamp ReplayScheduler::targetAt_(std::chrono::steady_clock::time_point now) const {
  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - *wallAnchor_);
  const double elapsedNs = elapsed.count() > 0 ? double(elapsed.count()) : 0.0;
  const double advance = std::floor(elapsedNs * speed_ / 1000.0);

  const Timestamp headroom = MaxTime - *logAnchor_;
  Timestamp target =
    advance >= double(headroom) ? MaxTime : *logAnchor_ + Timestamp(advance);
  if (timeEnd_ && target > *timeEnd_) {
    target = *timeEnd_;
  }
  return target;
}

void ReplayScheduler::recordError_(Status status) {
  lastError_ = std::move(status);
  if (onProblem_) {
    onProblem_(lastError_);
  }
}

}  // namespace chronicle
