#include "internal.hpp"
#include <algorithm>

namespace chronicle {

QueryEngine::QueryEngine(ByteSourcePtr source, SummaryPtr summary, Status summaryStatus,
                         bool validateCrc)
    : source_(std::move(source))
    , summary_(std::move(summary))
    , summaryStatus_(std::move(summaryStatus))
    , validateCrc_(validateCrc) {
  if (summaryStatus_.ok()) {
    summaryStatus_ = Status{StatusCode::SummaryUnavailable, "log has no summary section"};
  }
}

std::vector<LogMessagePtr> QueryEngine::messagesInTimeRange(int64_t start, int64_t end) {
  MessageFilter filter;
  if (!requireSummary_() || !makeFilter_(start, end, &filter)) {
    return {};
  }
  return collect_(filter);
}

std::vector<LogMessagePtr> QueryEngine::messagesForChannel(ChannelId channelId) {
  return messagesForChannels({channelId});
}

std::vector<LogMessagePtr> QueryEngine::messagesForChannels(
  const std::vector<ChannelId>& channelIds) {
  if (!requireSummary_()) {
    return {};
  }
  MessageFilter filter;
  filter.channels.emplace();
  for (const auto channelId : channelIds) {
    if (!requireChannel_(channelId)) {
      return {};
    }
    filter.channels->insert(channelId);
  }
  if (filter.channels->empty()) {
    return {};
  }
  return collect_(filter);
}

std::vector<LogMessagePtr> QueryEngine::messagesForTopic(std::string_view topic) {
  const int32_t channelId = topicToChannelId(topic);
  if (channelId < 0) {
    return {};
  }
  return messagesForChannel(ChannelId(channelId));
}

int64_t QueryEngine::messageCountTotal() {
  if (!requireSummary_()) {
    return -1;
  }
  if (const auto& statistics = summary_->statistics()) {
    return int64_t(statistics->messageCount);
  }
  return count_(MessageFilter{});
}

int64_t QueryEngine::messageCountForChannel(ChannelId channelId) {
  if (!requireSummary_() || !requireChannel_(channelId)) {
    return summary_ ? 0 : -1;
  }
  const auto& statistics = summary_->statistics();
  if (statistics && !statistics->channelMessageCounts.empty()) {
    const auto it = statistics->channelMessageCounts.find(channelId);
    return it != statistics->channelMessageCounts.end() ? int64_t(it->second) : 0;
  }
  MessageFilter filter;
  filter.channels = std::unordered_set<ChannelId>{channelId};
  return count_(filter);
}

int64_t QueryEngine::messageCountInRange(int64_t start, int64_t end) {
  MessageFilter filter;
  if (!requireSummary_()) {
    return -1;
  }
  if (!makeFilter_(start, end, &filter)) {
    return 0;
  }
  return count_(filter);
}

int64_t QueryEngine::messageCountForChannelInRange(ChannelId channelId, int64_t start,
                                                   int64_t end) {
  MessageFilter filter;
  if (!requireSummary_()) {
    return -1;
  }
  if (!requireChannel_(channelId) || !makeFilter_(start, end, &filter)) {
    return 0;
  }
  filter.channels = std::unordered_set<ChannelId>{channelId};
  return count_(filter);
}

std::vector<ChannelId> QueryEngine::channelIds() {
  std::vector<ChannelId> ids;
  if (!requireSummary_()) {
    return ids;
  }
  ids.reserve(summary_->channels().size());
  for (const auto& [channelId, _] : summary_->channels()) {
    ids.push_back(channelId);
  }
  return ids;
}

std::vector<std::string> QueryEngine::topicNames() {
  std::vector<std::string> topics;
  if (!requireSummary_()) {
    return topics;
  }
  for (const auto& [_, channel] : summary_->channels()) {
    if (std::find(topics.begin(), topics.end(), channel->topic) == topics.end()) {
      topics.push_back(channel->topic);
    }
  }
  return topics;
}

int32_t QueryEngine::topicToChannelId(std::string_view topic) {
  if (!requireSummary_()) {
    return -1;
  }
  for (const auto& [channelId, channel] : summary_->channels()) {
    if (channel->topic == topic) {
      return int32_t(channelId);
    }
  }
  recordError_(Status{StatusCode::InvalidArgument, internal::StrCat("unknown topic \"", topic,
                                                                    "\"")});
  return -1;
}

std::vector<ChannelId> QueryEngine::channelsForSchema(SchemaId schemaId) {
  std::vector<ChannelId> ids;
  if (!requireSummary_()) {
    return ids;
  }
  for (const auto& [channelId, channel] : summary_->channels()) {
    if (channel->schemaId == schemaId) {
      ids.push_back(channelId);
    }
  }
  return ids;
}

SchemaPtr QueryEngine::schemaForChannel(ChannelId channelId) {
  if (!requireSummary_() || !requireChannel_(channelId)) {
    return nullptr;
  }
  return summary_->schema(summary_->channel(channelId)->schemaId);
}

const Status& QueryEngine::lastError() const {
  return lastError_;
}

void QueryEngine::clearLastError() {
  lastError_ = Status{};
}

void QueryEngine::setProblemCallback(ProblemCallback onProblem) {
  onProblem_ = std::move(onProblem);
}

bool QueryEngine::requireSummary_() {
  if (summary_ && source_) {
    return true;
  }
  recordError_(summaryStatus_);
  return false;
}

bool QueryEngine::requireChannel_(ChannelId channelId) {
  if (summary_->channel(channelId)) {
    return true;
  }
  recordError_(
    Status{StatusCode::InvalidArgument, internal::StrCat("unknown channel id ", channelId)});
  return false;
}

bool QueryEngine::makeFilter_(int64_t start, int64_t end, MessageFilter* filter) {
  filter->startTime = start < 0 ? 0 : Timestamp(start);
  filter->endTime = end < 0 ? MaxTime : Timestamp(end);
  if (filter->startTime > filter->endTime) {
    recordError_(Status{StatusCode::InvalidArgument,
                        internal::StrCat("time range start ", start, " is after end ", end)});
    return false;
  }
  return true;
}

std::vector<LogMessagePtr> QueryEngine::collect_(const MessageFilter& filter) {
  std::vector<LogMessagePtr> output;
  std::vector<LogMessagePtr> chunkMessages;
  for (const auto& chunkIndex : summary_->chunkIndexes()) {
    if (!filter.chunkMightMatch(chunkIndex)) {
      continue;
    }
    chunkMessages.clear();
    const auto status = ReadChunkMessages(*source_, *summary_, chunkIndex, filter, decompressor_,
                                          scratch_, &chunkMessages, validateCrc_);
    std::stable_sort(chunkMessages.begin(), chunkMessages.end(),
                     [](const LogMessagePtr& a, const LogMessagePtr& b) {
                       return a->logTime < b->logTime;
                     });
    output.insert(output.end(), chunkMessages.begin(), chunkMessages.end());
    if (!status.ok()) {
      recordError_(status);
      break;
    }
  }
  return output;
}

int64_t QueryEngine::count_(const MessageFilter& filter) {
  uint64_t total = 0;
  for (const auto& chunkIndex : summary_->chunkIndexes()) {
    if (!filter.chunkMightMatch(chunkIndex)) {
      continue;
    }
    uint64_t count = 0;
    const auto status = countChunk_(chunkIndex, filter, &count);
    total += count;
    if (!status.ok()) {
      recordError_(status);
      break;
    }
  }
  return int64_t(total);
}

Status QueryEngine::countChunk_(const ChunkIndex& chunkIndex, const MessageFilter& filter,
                                uint64_t* count) {
  *count = 0;
  MessageIndexMap indexes;
  auto status = summary_->messageIndex(*source_, chunkIndex, filter.channels, &indexes);
  if (status.code == StatusCode::IndexUnavailable) {
    // Chunks written without message indexes can only be counted by decoding them
    return ForEachChunkMessage(
      *source_, chunkIndex, filter, decompressor_, scratch_,
      [count](const Message&, ByteOffset) {
        ++*count;
      },
      validateCrc_);
  }
  if (!status.ok()) {
    return status;
  }

  for (const auto& [_, entries] : indexes) {
    const auto first = std::lower_bound(
      entries.begin(), entries.end(), filter.startTime,
      [](const MessageIndexEntry& entry, Timestamp t) { return entry.logTime < t; });
    const auto last = std::upper_bound(
      first, entries.end(), filter.endTime,
      [](Timestamp t, const MessageIndexEntry& entry) { return t < entry.logTime; });
    *count += uint64_t(last - first);
  }
  return StatusCode::Success;
}

void QueryEngine::recordError_(Status status) {
  lastError_ = std::move(status);
  if (onProblem_) {
    onProblem_(lastError_);
  }
}

}  // namespace chronicle
