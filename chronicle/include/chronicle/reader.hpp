#pragma once

#include "byte_source.hpp"
#include "codec.hpp"
#include "message_iterator.hpp"
#include "query_engine.hpp"
#include "summary.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle {

/**
 * @brief Options for opening and reading a log.
 */
struct CHRONICLE_PUBLIC ReaderOptions {
  /**
   * @brief Accept logs whose Footer or trailing magic is missing, such as recordings cut short.
   * Indexed features are unavailable for such logs but linear reads still work and stop
   * quietly at a truncated trailing record.
   */
  bool ignoreEndMagic = false;
  /**
   * @brief Verify the CRC of each decompressed chunk when the chunk records one.
   */
  bool validateChunkCrc = true;
  /**
   * @brief Memory-map files where possible instead of reading them into memory.
   */
  bool preferMemoryMap = true;
};

/**
 * @brief A read session over one log. Owns the byte source, caches the summary once it has
 * been parsed, and hands out message iterators and a query engine that share both.
 *
 * Methods that return collections or numbers never fail loudly: on failure they return an
 * empty collection, zero, -1 or null and record the failure as `lastError()`.
 */
class CHRONICLE_PUBLIC LogReader final {
public:
  explicit LogReader(ReaderOptions options = {});

  LogReader(const LogReader&) = delete;
  LogReader& operator=(const LogReader&) = delete;

  /**
   * @brief Open a log file. Any previously open log is closed first.
   *
   * @return Status StatusCode::Success on success. Otherwise the reader is left closed.
   */
  Status open(std::string_view path);
  /**
   * @brief Open a log held in memory.
   */
  Status open(ByteArray bytes);
  /**
   * @brief Open a log from an existing byte source, which may be shared with other readers.
   */
  Status open(ByteSourcePtr source);

  /**
   * @brief Drop the byte source, the cached summary and the query engine.
   */
  void close();

  bool isOpen() const;

  /**
   * @brief The byte source backing this reader, or null if it is not open.
   */
  ByteSourcePtr source() const;

  const std::optional<Header>& header() const;
  /**
   * @brief The parsed Footer. Empty when the log was opened with `ignoreEndMagic` and has
   * none.
   */
  const std::optional<Footer>& footer() const;

  /**
   * @brief Parse the summary section if that has not been attempted yet. A log without a
   * summary section is not an error; `summary()` is then null.
   *
   * @return The status of the first parse attempt.
   */
  Status readSummary();
  bool hasSummary();
  SummaryPtr summary();

  /**
   * @brief Read every message in storage order by scanning the data section. Needs no
   * summary. Channels and schemas are resolved as they are encountered.
   */
  std::vector<LogMessagePtr> messages();
  /**
   * @brief As `messages()`, without channel resolution.
   */
  std::vector<RawMessage> rawMessages();

  std::vector<Attachment> attachments();
  std::vector<Metadata> metadataEntries();

  size_t chunkCount();
  std::vector<ChunkIndex> chunkIndexes();
  /**
   * @brief The message index entries of the chunk at position `chunk` in summary order.
   */
  MessageIndexMap messageIndexesForChunk(size_t chunk);
  /**
   * @brief Decode the single message that `entry` points at in the chunk at position `chunk`.
   */
  LogMessagePtr seekMessage(size_t chunk, const MessageIndexEntry& entry);

  /**
   * @brief Earliest message log time from the statistics, or -1.
   */
  int64_t firstMessageTime();
  /**
   * @brief Latest message log time from the statistics, or -1.
   */
  int64_t lastMessageTime();
  int64_t duration();

  /**
   * @brief A new merge iterator over this log. It shares the byte source and summary and
   * stays valid after the reader is closed.
   */
  MessageIterator messageIterator();

  /**
   * @brief The query engine of this session. Its failures are recorded as this reader's
   * `lastError()`. The reference is invalidated by `open()` and `close()`.
   */
  QueryEngine& query();

  const Status& lastError() const;
  void clearLastError();
  void setProblemCallback(ProblemCallback onProblem);
  const ReaderOptions& options() const;

private:
  struct ScanTables {
    std::map<ChannelId, ChannelPtr> channels;
    std::map<SchemaId, SchemaPtr> schemas;
  };
  using ScanCallback = std::function<Status(const Message&, const ScanTables&)>;

  ReaderOptions options_;
  ByteSourcePtr source_;
  std::optional<Header> header_;
  std::optional<Footer> footer_;
  ByteOffset dataStart_ = 0;
  SummaryPtr summary_;
  bool summaryRead_ = false;
  Status summaryStatus_;
  std::unique_ptr<QueryEngine> query_;
  Status lastError_;
  ProblemCallback onProblem_;

  bool requireOpen_();
  bool requireSummary_();
  Status scanDataSection_(const ScanCallback& onMessage);
  void recordError_(Status status);
};

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "reader.inl"
#endif
