#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "summary.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <functional>
#include <optional>
#include <unordered_set>
#include <vector>

namespace chronicle {

/**
 * @brief Selects messages by an inclusive log time window and an optional channel set.
 */
struct CHRONICLE_PUBLIC MessageFilter {
  Timestamp startTime = 0;
  Timestamp endTime = MaxTime;
  std::optional<std::unordered_set<ChannelId>> channels;

  MessageFilter() = default;
  MessageFilter(Timestamp start, Timestamp end)
      : startTime(start)
      , endTime(end) {}

  bool matchesTime(Timestamp logTime) const;
  bool matchesChannel(ChannelId channelId) const;
  bool matches(const Message& message) const;

  /**
   * @brief Returns false only when the chunk provably holds no matching message: its time
   * range misses the window, or its message index lists no selected channel.
   */
  bool chunkMightMatch(const ChunkIndex& chunkIndex) const;
};

using ChunkMessageCallback = std::function<void(const Message&, ByteOffset)>;

/**
 * @brief Decompress one chunk into `scratch` and invoke `callback` for every message that
 * passes `filter`, in storage order, together with its offset in the uncompressed records.
 *
 * The Message passed to the callback borrows from `scratch`.
 */
CHRONICLE_PUBLIC
Status ForEachChunkMessage(const IByteSource& source, const ChunkIndex& chunkIndex,
                           const MessageFilter& filter, ChunkDecompressor& decompressor,
                           ByteArray& scratch, const ChunkMessageCallback& callback,
                           bool validateCrc = true);

/**
 * @brief Decode the messages of one chunk that pass `filter` and append them to `output`
 * in storage order, with channels and schemas resolved through `summary`.
 *
 * On failure the messages decoded before the failing record are kept in `output`.
 */
CHRONICLE_PUBLIC
Status ReadChunkMessages(const IByteSource& source, const Summary& summary,
                         const ChunkIndex& chunkIndex, const MessageFilter& filter,
                         ChunkDecompressor& decompressor, ByteArray& scratch,
                         std::vector<LogMessagePtr>* output, bool validateCrc = true);

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "message_filter.inl"
#endif
