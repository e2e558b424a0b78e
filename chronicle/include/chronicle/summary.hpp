#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <map>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace chronicle {

class Summary;
using SummaryPtr = std::shared_ptr<const Summary>;

/**
 * @brief The parsed trailing index section of a log: channel and schema tables, chunk
 * indexes in the order they were written, optional statistics, and attachment and metadata
 * indexes.
 *
 * A Summary is built once per byte source by Load() and never changes afterwards. It holds
 * no reference to the source; operations that need bytes take the source explicitly.
 */
class CHRONICLE_PUBLIC Summary {
public:
  /**
   * @brief Parse the summary section of `source`.
   *
   * @param output Set to the parsed summary, or to null when the log has no summary section.
   * A missing summary is not an error.
   * @return A decode status if the footer or summary section is malformed.
   */
  static Status Load(const IByteSource& source, SummaryPtr* output);

  const Footer& footer() const;
  const std::map<ChannelId, ChannelPtr>& channels() const;
  const std::map<SchemaId, SchemaPtr>& schemas() const;
  const std::vector<ChunkIndex>& chunkIndexes() const;
  const std::optional<Statistics>& statistics() const;
  const std::vector<AttachmentIndex>& attachmentIndexes() const;
  const std::vector<MetadataIndex>& metadataIndexes() const;

  /**
   * @brief Look up a channel by id. Returns null if the id is unknown.
   */
  ChannelPtr channel(ChannelId channelId) const;

  /**
   * @brief Look up a schema by id. Returns null for id 0 or an unknown id.
   */
  SchemaPtr schema(SchemaId schemaId) const;

  /**
   * @brief Read the per-channel message index entries of one chunk.
   *
   * Only the chunk's message index block is read, never its payload, so the cost is
   * proportional to the number of entries in the chunk.
   *
   * @param channels Restrict the result to these channels.
   * @return IndexUnavailable if the chunk holds records but was written without message
   * indexes.
   */
  Status messageIndex(const IByteSource& source, const ChunkIndex& chunkIndex,
                      const std::optional<std::unordered_set<ChannelId>>& channels,
                      MessageIndexMap* output) const;

  /**
   * @brief Build an owning message from a Message record, resolving its channel and schema.
   *
   * @return InvalidRecord if the message references a channel missing from the summary.
   */
  Status resolve(const Message& message, LogMessagePtr* output) const;

private:
  Footer footer_;
  std::map<ChannelId, ChannelPtr> channels_;
  std::map<SchemaId, SchemaPtr> schemas_;
  std::vector<ChunkIndex> chunkIndexes_;
  std::optional<Statistics> statistics_;
  std::vector<AttachmentIndex> attachmentIndexes_;
  std::vector<MetadataIndex> metadataIndexes_;
};

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "summary.inl"
#endif
