#include "internal.hpp"
#include <algorithm>

namespace chronicle {

namespace internal {

inline bool CompareLogTime(const LogMessagePtr& a, const LogMessagePtr& b) {
  return a->logTime < b->logTime;
}

inline std::vector<LogMessagePtr>::const_iterator LowerBoundTime(
  const std::vector<LogMessagePtr>& messages, Timestamp time) {
  return std::lower_bound(messages.begin(), messages.end(), time,
                          [](const LogMessagePtr& message, Timestamp t) {
                            return message->logTime < t;
                          });
}

}  // namespace internal

MessageIterator::MessageIterator(ByteSourcePtr source, SummaryPtr summary, bool validateCrc,
                                 Status summaryStatus)
    : source_(std::move(source))
    , summary_(std::move(summary))
    , summaryStatus_(std::move(summaryStatus))
    , validateCrc_(validateCrc)
    , decompressor_(std::make_unique<ChunkDecompressor>()) {}

MessageIterator::MessageIterator(ByteSourcePtr source)
    : source_(std::move(source))
    , loadSummary_(true)
    , decompressor_(std::make_unique<ChunkDecompressor>()) {}

void MessageIterator::forChannel(ChannelId channelId) {
  filter_.channels = std::unordered_set<ChannelId>{channelId};
  rewind();
}

void MessageIterator::clearFilter() {
  filter_.channels.reset();
  rewind();
}

void MessageIterator::rewind() {
  if (ensureSummary_()) {
    reset_(0);
  }
}

bool MessageIterator::hasNext() {
  if (!ensureSummary_() || state_ == State::Exhausted) {
    return false;
  }
  return fillBuffer_();
}

LogMessagePtr MessageIterator::peek() {
  return hasNext() ? buffer_[bufferPos_] : nullptr;
}

LogMessagePtr MessageIterator::next() {
  auto message = peek();
  if (message) {
    ++bufferPos_;
    ++consumed_;
  }
  return message;
}

bool MessageIterator::seekToTime(Timestamp time) {
  if (!ensureSummary_()) {
    return false;
  }

  const auto& chunkIndexes = summary_->chunkIndexes();
  std::vector<LogMessagePtr> messages;
  for (size_t i = 0; i < chunkIndexes.size(); ++i) {
    const auto& chunkIndex = chunkIndexes[i];
    if (chunkIndex.messageEndTime < time || !filter_.chunkMightMatch(chunkIndex)) {
      continue;
    }
    if (!loadChunk_(chunkIndex, filter_, &messages).ok()) {
      continue;
    }
    const auto it = internal::LowerBoundTime(messages, time);
    if (it != messages.end()) {
      reset_(i + 1);
      bufferPos_ = size_t(it - messages.begin());
      buffer_ = std::move(messages);
      return true;
    }
  }

  exhaust_();
  return false;
}

bool MessageIterator::seekToTimeNearest(Timestamp time) {
  if (seekToTime(time)) {
    return true;
  }
  if (state_ == State::Unavailable) {
    return false;
  }

  // Nothing at or after `time`: find the latest message at or before it. Every chunk that
  // starts in range is checked since chunk ranges may overlap.
  const auto& chunkIndexes = summary_->chunkIndexes();
  std::optional<size_t> bestChunk;
  Timestamp bestTime = 0;
  std::vector<LogMessagePtr> messages;
  for (size_t i = 0; i < chunkIndexes.size(); ++i) {
    const auto& chunkIndex = chunkIndexes[i];
    if (chunkIndex.messageStartTime > time || !filter_.chunkMightMatch(chunkIndex)) {
      continue;
    }
    if (!loadChunk_(chunkIndex, filter_, &messages).ok()) {
      continue;
    }
    const auto it = std::upper_bound(messages.begin(), messages.end(), time,
                                     [](Timestamp t, const LogMessagePtr& message) {
                                       return t < message->logTime;
                                     });
    if (it == messages.begin()) {
      continue;
    }
    const Timestamp candidate = (*(it - 1))->logTime;
    if (!bestChunk || candidate > bestTime) {
      bestChunk = i;
      bestTime = candidate;
    }
  }
  if (!bestChunk) {
    return false;
  }

  if (!loadChunk_(chunkIndexes[*bestChunk], filter_, &messages).ok()) {
    exhaust_();
    return false;
  }
  reset_(*bestChunk + 1);
  bufferPos_ = size_t(internal::LowerBoundTime(messages, bestTime) - messages.begin());
  buffer_ = std::move(messages);
  return true;
}

bool MessageIterator::seekToNextOnChannel(ChannelId channelId, Timestamp afterTime) {
  if (!ensureSummary_()) {
    return false;
  }
  if (!filter_.matchesChannel(channelId)) {
    reportProblem_(Status{StatusCode::InvalidChannelId,
                          internal::StrCat("channel ", channelId,
                                           " is excluded by the iterator's filter")});
    return false;
  }
  if (afterTime == MaxTime) {
    exhaust_();
    return false;
  }

  MessageFilter channelFilter{afterTime + 1, MaxTime};
  channelFilter.channels = std::unordered_set<ChannelId>{channelId};

  const auto& chunkIndexes = summary_->chunkIndexes();
  std::optional<size_t> bestChunk;
  Timestamp bestTime = MaxTime;
  std::vector<LogMessagePtr> messages;
  for (size_t i = 0; i < chunkIndexes.size(); ++i) {
    const auto& chunkIndex = chunkIndexes[i];
    if (!channelFilter.chunkMightMatch(chunkIndex)) {
      continue;
    }
    if (!loadChunk_(chunkIndex, channelFilter, &messages).ok() || messages.empty()) {
      continue;
    }
    const Timestamp candidate = messages.front()->logTime;
    if (!bestChunk || candidate < bestTime) {
      bestChunk = i;
      bestTime = candidate;
    }
  }
  if (!bestChunk) {
    exhaust_();
    return false;
  }

  if (!loadChunk_(chunkIndexes[*bestChunk], filter_, &messages).ok()) {
    exhaust_();
    return false;
  }
  // Skip messages of other channels that share the found log time
  auto it = internal::LowerBoundTime(messages, bestTime);
  while (it != messages.end() && (*it)->logTime == bestTime && (*it)->channelId() != channelId) {
    ++it;
  }
  if (it == messages.end() || (*it)->logTime != bestTime) {
    exhaust_();
    return false;
  }
  reset_(*bestChunk + 1);
  bufferPos_ = size_t(it - messages.begin());
  buffer_ = std::move(messages);
  return true;
}

LogMessagePtr MessageIterator::getMessageAtTime(ChannelId channelId, Timestamp time) {
  if (!ensureSummary_()) {
    return nullptr;
  }

  const std::optional<std::unordered_set<ChannelId>> channels =
    std::unordered_set<ChannelId>{channelId};
  ByteArray uncompressed;
  MessageIndexMap indexes;
  for (const auto& chunkIndex : summary_->chunkIndexes()) {
    if (chunkIndex.messageStartTime > time || chunkIndex.messageEndTime < time) {
      continue;
    }

    auto status = summary_->messageIndex(*source_, chunkIndex, channels, &indexes);
    if (status.code == StatusCode::IndexUnavailable) {
      // No index to search; decode the chunk and look for the message directly
      MessageFilter exact{time, time};
      exact.channels = channels;
      std::vector<LogMessagePtr> messages;
      if (loadChunk_(chunkIndex, exact, &messages).ok() && !messages.empty()) {
        return messages.front();
      }
      continue;
    }
    if (!status.ok()) {
      reportProblem_(std::move(status));
      continue;
    }

    const auto found = indexes.find(channelId);
    if (found == indexes.end()) {
      continue;
    }
    const auto& entries = found->second;
    const auto entry = std::lower_bound(
      entries.begin(), entries.end(), time,
      [](const MessageIndexEntry& e, Timestamp t) { return e.logTime < t; });
    if (entry == entries.end() || entry->logTime != time) {
      continue;
    }

    Message message;
    LogMessagePtr logMessage;
    if (auto loadStatus =
          LoadChunk(*source_, chunkIndex, *decompressor_, &uncompressed, validateCrc_);
        !loadStatus.ok()) {
      reportProblem_(std::move(loadStatus));
      continue;
    }
    if (auto readStatus = ReadMessageAt(uncompressed, *entry, &message); !readStatus.ok()) {
      reportProblem_(std::move(readStatus));
      continue;
    }
    if (auto resolveStatus = summary_->resolve(message, &logMessage); !resolveStatus.ok()) {
      reportProblem_(std::move(resolveStatus));
      continue;
    }
    return logMessage;
  }
  return nullptr;
}

uint64_t MessageIterator::currentIndex() const {
  return consumed_;
}

MessageIterator::State MessageIterator::state() const {
  return state_;
}

const Status& MessageIterator::status() const {
  return status_;
}

void MessageIterator::setProblemCallback(ProblemCallback onProblem) {
  onProblem_ = std::move(onProblem);
}

bool MessageIterator::ensureSummary_() {
  if (state_ != State::Uninitialized) {
    return state_ != State::Unavailable;
  }

  if (!summary_ && loadSummary_ && source_) {
    if (auto status = Summary::Load(*source_, &summary_); !status.ok()) {
      state_ = State::Unavailable;
      reportProblem_(std::move(status));
      return false;
    }
  }
  if (!summary_ || !source_) {
    state_ = State::Unavailable;
    reportProblem_(!summaryStatus_.ok()
                     ? summaryStatus_
                     : Status{StatusCode::SummaryUnavailable, "log has no summary section"});
    return false;
  }
  state_ = State::Ready;
  return true;
}

void MessageIterator::reset_(size_t chunk) {
  buffer_.clear();
  bufferPos_ = 0;
  nextChunk_ = chunk;
  consumed_ = 0;
  state_ = State::Ready;
}

void MessageIterator::exhaust_() {
  reset_(summary_->chunkIndexes().size());
  state_ = State::Exhausted;
}

bool MessageIterator::fillBuffer_() {
  if (bufferPos_ < buffer_.size()) {
    return true;
  }
  buffer_.clear();
  bufferPos_ = 0;

  const auto& chunkIndexes = summary_->chunkIndexes();
  while (nextChunk_ < chunkIndexes.size()) {
    const auto& chunkIndex = chunkIndexes[nextChunk_++];
    if (!filter_.chunkMightMatch(chunkIndex)) {
      continue;
    }
    if (loadChunk_(chunkIndex, filter_, &buffer_).ok() && !buffer_.empty()) {
      return true;
    }
  }
  state_ = State::Exhausted;
  return false;
}

Status MessageIterator::loadChunk_(const ChunkIndex& chunkIndex, const MessageFilter& filter,
                                   std::vector<LogMessagePtr>* output) {
  output->clear();
  auto status = ReadChunkMessages(*source_, *summary_, chunkIndex, filter, *decompressor_,
                                  scratch_, output, validateCrc_);
  if (!status.ok()) {
    output->clear();
    reportProblem_(status);
    return status;
  }
  std::stable_sort(output->begin(), output->end(), internal::CompareLogTime);
  return status;
}

void MessageIterator::reportProblem_(Status status) {
  status_ = std::move(status);
  if (onProblem_) {
    onProblem_(status_);
  }
}

}  // namespace chronicle
