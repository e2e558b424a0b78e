#pragma once

#include "byte_source.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <functional>
#include <optional>
#include <unordered_set>

// Forward declaration
#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
struct ZSTD_DCtx_s;
#endif

namespace chronicle {

/**
 * @brief Record framing and per-record parsers for the log format. All parsers validate
 * lengths and return InvalidRecord for malformed bodies; none of them allocate more than
 * the record they decode.
 */
struct CHRONICLE_PUBLIC RecordCodec {
  /**
   * @brief Read the opcode and length prefix at `offset` and point `record` at its body.
   */
  static Status ReadRecord(const std::byte* data, uint64_t size, uint64_t offset,
                           Record* record);
  static Status ReadRecord(const IByteSource& source, uint64_t offset, Record* record);

  /**
   * @brief Read the fixed-size Footer and the trailing magic that precedes the end of the
   * source.
   */
  static Status ReadFooter(const IByteSource& source, Footer* footer);

  /**
   * @brief Validate the leading magic and parse the Header record that follows it.
   *
   * @param dataStart Set to the offset of the first record after the Header.
   */
  static Status ReadHeader(const IByteSource& source, Header* header, ByteOffset* dataStart);

  static Status ParseHeader(const Record& record, Header* header);
  static Status ParseFooter(const Record& record, Footer* footer);
  static Status ParseSchema(const Record& record, Schema* schema);
  static Status ParseChannel(const Record& record, Channel* channel);
  static Status ParseMessage(const Record& record, Message* message);
  static Status ParseChunk(const Record& record, Chunk* chunk);
  static Status ParseMessageIndex(const Record& record, MessageIndex* messageIndex);
  static Status ParseChunkIndex(const Record& record, ChunkIndex* chunkIndex);
  static Status ParseAttachment(const Record& record, Attachment* attachment);
  static Status ParseAttachmentIndex(const Record& record, AttachmentIndex* attachmentIndex);
  static Status ParseStatistics(const Record& record, Statistics* statistics);
  static Status ParseMetadata(const Record& record, Metadata* metadata);
  static Status ParseMetadataIndex(const Record& record, MetadataIndex* metadataIndex);
  static Status ParseSummaryOffset(const Record& record, SummaryOffset* summaryOffset);
  static Status ParseDataEnd(const Record& record, DataEnd* dataEnd);
};

/**
 * @brief Decompresses chunk record payloads. Instances keep their decompression context
 * between calls, so reuse one per reader or iterator.
 */
class CHRONICLE_PUBLIC ChunkDecompressor {
public:
  ChunkDecompressor();
  ~ChunkDecompressor();

  ChunkDecompressor(const ChunkDecompressor&) = delete;
  ChunkDecompressor& operator=(const ChunkDecompressor&) = delete;

  /**
   * @brief Decompress `chunk.records` into `output`, which is resized to exactly
   * `chunk.uncompressedSize` bytes on success and cleared on failure.
   *
   * @param validateCrc Check the uncompressed bytes against `chunk.uncompressedCrc`
   * when the chunk records a non-zero CRC.
   */
  Status decompress(const Chunk& chunk, ByteArray* output, bool validateCrc = true);

private:
  Status decompressLz4_(const Chunk& chunk, ByteArray* output);
  Status decompressZstd_(const Chunk& chunk, ByteArray* output);

  void* lz4Context_ = nullptr;
#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
  ZSTD_DCtx_s* zstdContext_ = nullptr;
#endif
};

/**
 * @brief Walks the records of a decompressed chunk in storage order, yielding each
 * Message record with its offset from the start of the uncompressed records.
 *
 * Schema and Channel records inside the chunk are handed to `onSchema` and `onChannel` when
 * those are set and skipped otherwise; unknown opcodes are ignored; opcodes that may not
 * appear inside a chunk end the walk with InvalidOpCode.
 */
class CHRONICLE_PUBLIC ChunkMessageReader {
public:
  std::function<void(SchemaPtr)> onSchema;
  std::function<void(ChannelPtr)> onChannel;

  ChunkMessageReader(const std::byte* records, uint64_t size);

  /**
   * @brief Advance to the next Message record.
   *
   * @return false when the chunk is exhausted or a record failed to decode; check
   * `status()` to tell the two apart.
   */
  bool next(Message* message, ByteOffset* offset);

  const Status& status() const;

private:
  const std::byte* records_;
  uint64_t size_;
  uint64_t offset_ = 0;
  Status status_;
};

/**
 * @brief Read and decompress the Chunk record referenced by `chunkIndex`.
 */
CHRONICLE_PUBLIC
Status LoadChunk(const IByteSource& source, const ChunkIndex& chunkIndex,
                 ChunkDecompressor& decompressor, ByteArray* uncompressed,
                 bool validateCrc = true);

/**
 * @brief Read the message index block of one chunk, touching only the MessageIndex records
 * referenced by `chunkIndex` and never the chunk payload.
 *
 * Entries of each channel are stable-sorted by log time in case a writer stored them out of
 * order. When `channels` is given, only those channels are read.
 */
CHRONICLE_PUBLIC
Status ReadMessageIndexes(const IByteSource& source, const ChunkIndex& chunkIndex,
                          const std::optional<std::unordered_set<ChannelId>>& channels,
                          MessageIndexMap* output);

/**
 * @brief Parse the single Message record at `entry.offset` inside the already
 * decompressed chunk `uncompressed`.
 *
 * @return InvalidChunkOffset if the offset does not land on a Message record.
 */
CHRONICLE_PUBLIC
Status ReadMessageAt(const ByteArray& uncompressed, const MessageIndexEntry& entry,
                     Message* message);

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "codec.inl"
#endif
