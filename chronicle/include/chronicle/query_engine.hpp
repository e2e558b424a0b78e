#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "message_filter.hpp"
#include "summary.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace chronicle {

/**
 * @brief Answers bulk questions about an indexed log by walking chunk indexes and message
 * indexes directly, without building a MessageIterator.
 *
 * Methods never fail loudly. When the summary is missing, an argument is invalid, or a read
 * fails, they return an empty collection, zero, -1 or null, record the failure as
 * `lastError()` and pass it to the problem callback. Results accumulated before a read
 * failure are kept.
 *
 * Range endpoints are signed microseconds: a negative start means "from the beginning" and a
 * negative end means "to the end".
 */
class CHRONICLE_PUBLIC QueryEngine {
public:
  /**
   * @param summary The loaded summary, or null if the log has none.
   * @param summaryStatus Why `summary` is null, reported by methods that need it.
   */
  QueryEngine(ByteSourcePtr source, SummaryPtr summary,
              Status summaryStatus = StatusCode::SummaryUnavailable, bool validateCrc = true);

  /**
   * @brief Messages with log time in [start, end]. Each chunk's matches are sorted by log time
   * and chunks are concatenated in summary order.
   */
  std::vector<LogMessagePtr> messagesInTimeRange(int64_t start, int64_t end);
  std::vector<LogMessagePtr> messagesForChannel(ChannelId channelId);
  std::vector<LogMessagePtr> messagesForChannels(const std::vector<ChannelId>& channelIds);

  /**
   * @brief Messages of the lowest-numbered channel publishing on `topic`.
   */
  std::vector<LogMessagePtr> messagesForTopic(std::string_view topic);

  /**
   * @brief Total message count, from statistics when present. Returns -1 without a summary.
   */
  int64_t messageCountTotal();
  int64_t messageCountForChannel(ChannelId channelId);

  /**
   * @brief Number of messages with log time in [start, end], computed by binary search over
   * message index entries without decoding any message.
   */
  int64_t messageCountInRange(int64_t start, int64_t end);
  int64_t messageCountForChannelInRange(ChannelId channelId, int64_t start, int64_t end);

  /**
   * @brief All channel ids, ascending.
   */
  std::vector<ChannelId> channelIds();

  /**
   * @brief Distinct topics in channel id order.
   */
  std::vector<std::string> topicNames();

  /**
   * @brief The lowest channel id publishing on `topic`, or -1.
   */
  int32_t topicToChannelId(std::string_view topic);

  /**
   * @brief Ids of the channels referencing `schemaId`, ascending.
   */
  std::vector<ChannelId> channelsForSchema(SchemaId schemaId);

  /**
   * @brief The schema of a channel, or null if the channel is unknown or has no schema.
   */
  SchemaPtr schemaForChannel(ChannelId channelId);

  const Status& lastError() const;
  void clearLastError();
  void setProblemCallback(ProblemCallback onProblem);

private:
  ByteSourcePtr source_;
  SummaryPtr summary_;
  Status summaryStatus_;
  bool validateCrc_;
  ChunkDecompressor decompressor_;
  ByteArray scratch_;
  Status lastError_;
  ProblemCallback onProblem_;

  bool requireSummary_();
  bool requireChannel_(ChannelId channelId);
  bool makeFilter_(int64_t start, int64_t end, MessageFilter* filter);
  std::vector<LogMessagePtr> collect_(const MessageFilter& filter);
  int64_t count_(const MessageFilter& filter);
  Status countChunk_(const ChunkIndex& chunkIndex, const MessageFilter& filter, uint64_t* count);
  void recordError_(Status status);
};

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "query_engine.inl"
#endif
