#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "message_filter.hpp"
#include "summary.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <memory>
#include <vector>

namespace chronicle {

/**
 * @brief Yields the messages of an indexed log in non-decreasing log time order, with peek,
 * consume and seek operations.
 *
 * The iterator walks chunk indexes in summary order. For each chunk it decodes the messages
 * that pass the active channel filter, stable-sorts them by log time and yields them one at a
 * time. Ordering is therefore exact within a chunk and across chunks whose time ranges do not
 * overlap. When chunk ranges overlap the output is only approximately ordered: messages are
 * never merged across chunks.
 *
 * A chunk that fails to decode is reported through the problem callback, recorded in
 * `status()` and skipped. Seek operations need a summary; without one they return false (or
 * null) and the iterator stays Unavailable.
 *
 * Many iterators may share one byte source and summary; neither is ever modified.
 */
class CHRONICLE_PUBLIC MessageIterator {
public:
  enum class State {
    /// No operation has run yet; the summary has not been checked.
    Uninitialized,
    /// Positioned; `hasNext()` may still find the remaining chunks empty.
    Ready,
    /// The log has no summary, or it failed to load.
    Unavailable,
    /// Every remaining chunk has been drained, or the last seek found nothing.
    Exhausted,
  };

  /**
   * @brief Iterate `source` using an already loaded summary. A null summary leaves the
   * iterator Unavailable, reporting `summaryStatus` when it carries the reason.
   */
  MessageIterator(ByteSourcePtr source, SummaryPtr summary, bool validateCrc = true,
                  Status summaryStatus = {});

  /**
   * @brief Iterate `source`, loading its summary on first use.
   */
  explicit MessageIterator(ByteSourcePtr source);

  MessageIterator(MessageIterator&&) = default;
  MessageIterator& operator=(MessageIterator&&) = default;

  /**
   * @brief Restrict iteration to a single channel and rewind to the first chunk.
   */
  void forChannel(ChannelId channelId);

  /**
   * @brief Remove the channel filter and rewind to the first chunk.
   */
  void clearFilter();

  /**
   * @brief Return to the first chunk, keeping the channel filter.
   */
  void rewind();

  /**
   * @brief Returns true if another message is available. Does not advance.
   */
  bool hasNext();

  /**
   * @brief Returns the next message without advancing, or null at the end.
   */
  LogMessagePtr peek();

  /**
   * @brief Returns the next message and advances past it, or null at the end.
   */
  LogMessagePtr next();

  /**
   * @brief Position on the first message with log time >= `time`.
   *
   * @return false if no such message exists; the iterator is then Exhausted.
   */
  bool seekToTime(Timestamp time);

  /**
   * @brief Position on the first message with log time >= `time`, or when there is none,
   * on the message with the greatest log time <= `time`.
   */
  bool seekToTimeNearest(Timestamp time);

  /**
   * @brief Position on the earliest message of `channelId` with log time > `afterTime`,
   * keeping the active filter. The following `next()` returns that message.
   */
  bool seekToNextOnChannel(ChannelId channelId, Timestamp afterTime);

  /**
   * @brief Look up the message of `channelId` whose log time is exactly `time` using the
   * message index of the chunk containing `time`. The iterator position is not changed.
   *
   * @return The first such message in index order, or null if none exists.
   */
  LogMessagePtr getMessageAtTime(ChannelId channelId, Timestamp time);

  /**
   * @brief The number of messages consumed with `next()` since the last rewind or seek.
   */
  uint64_t currentIndex() const;

  State state() const;

  /**
   * @brief The most recent failure, or Success.
   */
  const Status& status() const;

  void setProblemCallback(ProblemCallback onProblem);

private:
  ByteSourcePtr source_;
  SummaryPtr summary_;
  Status summaryStatus_;
  bool validateCrc_ = true;
  bool loadSummary_ = false;
  std::unique_ptr<ChunkDecompressor> decompressor_;
  ByteArray scratch_;
  MessageFilter filter_;
  std::vector<LogMessagePtr> buffer_;
  size_t bufferPos_ = 0;
  size_t nextChunk_ = 0;
  uint64_t consumed_ = 0;
  State state_ = State::Uninitialized;
  Status status_;
  ProblemCallback onProblem_;

  bool ensureSummary_();
  void reset_(size_t chunk);
  void exhaust_();
  bool fillBuffer_();
  Status loadChunk_(const ChunkIndex& chunkIndex, const MessageFilter& filter,
                    std::vector<LogMessagePtr>* output);
  void reportProblem_(Status status);
};

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "message_iterator.inl"
#endif
