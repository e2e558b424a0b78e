#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chronicle {

#define CHRONICLE_LIBRARY_VERSION "0.4.1"

using SchemaId = uint16_t;
using ChannelId = uint16_t;
/// Microseconds since an arbitrary epoch shared by every record in one log.
using Timestamp = uint64_t;
using ByteOffset = uint64_t;
using KeyValueMap = std::unordered_map<std::string, std::string>;
using ByteArray = std::vector<std::byte>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char FormatVersion = '0';
constexpr char LibraryVersion[] = CHRONICLE_LIBRARY_VERSION;
constexpr uint8_t Magic[] = {137, 77, 67, 65, 80, FormatVersion, 13, 10};  // "\x89MCAP0\r\n"
constexpr ByteOffset EndOffset = std::numeric_limits<ByteOffset>::max();
constexpr Timestamp MaxTime = std::numeric_limits<Timestamp>::max();

/**
 * @brief Chunk compression algorithms understood by the codec.
 */
enum struct Compression {
  None,
  Lz4,
  Zstd,
};

/**
 * @brief Record types.
 */
enum struct OpCode : uint8_t {
  Header = 0x01,
  Footer = 0x02,
  Schema = 0x03,
  Channel = 0x04,
  Message = 0x05,
  Chunk = 0x06,
  MessageIndex = 0x07,
  ChunkIndex = 0x08,
  Attachment = 0x09,
  AttachmentIndex = 0x0A,
  Statistics = 0x0B,
  Metadata = 0x0C,
  MetadataIndex = 0x0D,
  SummaryOffset = 0x0E,
  DataEnd = 0x0F,
};

/**
 * @brief Get the string representation of an OpCode.
 */
constexpr std::string_view OpCodeString(OpCode opcode) {
  switch (opcode) {
    case OpCode::Header:
      return "Header";
    case OpCode::Footer:
      return "Footer";
    case OpCode::Schema:
      return "Schema";
    case OpCode::Channel:
      return "Channel";
    case OpCode::Message:
      return "Message";
    case OpCode::Chunk:
      return "Chunk";
    case OpCode::MessageIndex:
      return "MessageIndex";
    case OpCode::ChunkIndex:
      return "ChunkIndex";
    case OpCode::Attachment:
      return "Attachment";
    case OpCode::AttachmentIndex:
      return "AttachmentIndex";
    case OpCode::Statistics:
      return "Statistics";
    case OpCode::Metadata:
      return "Metadata";
    case OpCode::MetadataIndex:
      return "MetadataIndex";
    case OpCode::SummaryOffset:
      return "SummaryOffset";
    case OpCode::DataEnd:
      return "DataEnd";
    default:
      return "Unknown";
  }
}

/**
 * @brief A type-length-value record: a uint8 opcode, a uint64 length and `dataSize` bytes
 * pointed to by `data`. The pointer borrows from the byte source or a decompressed chunk.
 */
struct CHRONICLE_PUBLIC Record {
  OpCode opcode;
  uint64_t dataSize;
  const std::byte* data;

  uint64_t recordSize() const {
    return sizeof(opcode) + sizeof(dataSize) + dataSize;
  }
};

/**
 * @brief First record of every log, after the leading magic bytes.
 */
struct CHRONICLE_PUBLIC Header {
  std::string profile;
  std::string library;
};

/**
 * @brief Final record of a log, before the trailing magic bytes. A zero `summaryStart`
 * means the log carries no summary section.
 */
struct CHRONICLE_PUBLIC Footer {
  ByteOffset summaryStart = 0;
  ByteOffset summaryOffsetStart = 0;
  uint32_t summaryCrc = 0;
};

/**
 * @brief Describes the encoding of the payloads of one or more channels.
 */
struct CHRONICLE_PUBLIC Schema {
  SchemaId id = 0;
  std::string name;
  std::string encoding;
  ByteArray data;
};

/**
 * @brief A named stream of messages sharing an encoding. `schemaId` 0 means the channel
 * references no schema.
 */
struct CHRONICLE_PUBLIC Channel {
  ChannelId id = 0;
  std::string topic;
  std::string messageEncoding;
  SchemaId schemaId = 0;
  KeyValueMap metadata;
};

using SchemaPtr = std::shared_ptr<const Schema>;
using ChannelPtr = std::shared_ptr<const Channel>;

/**
 * @brief A Message record as stored in a chunk. The payload pointer borrows from the buffer
 * the record was parsed from and is only valid while that buffer is alive.
 */
struct CHRONICLE_PUBLIC Message {
  ChannelId channelId;
  uint32_t sequence;
  Timestamp logTime;
  Timestamp publishTime;
  uint64_t dataSize;
  const std::byte* data = nullptr;
};

/**
 * @brief A decoded message that owns its payload and holds its resolved channel (never null)
 * and schema (null when the channel has none).
 */
struct CHRONICLE_PUBLIC LogMessage {
  ChannelPtr channel;
  SchemaPtr schema;
  uint32_t sequence = 0;
  Timestamp logTime = 0;
  Timestamp publishTime = 0;
  ByteArray data;

  ChannelId channelId() const {
    return channel->id;
  }
};

using LogMessagePtr = std::shared_ptr<const LogMessage>;

/**
 * @brief A message without channel resolution, as returned by raw linear reads.
 */
struct CHRONICLE_PUBLIC RawMessage {
  ChannelId channelId = 0;
  uint32_t sequence = 0;
  Timestamp logTime = 0;
  Timestamp publishTime = 0;
  ByteArray data;
};

/**
 * @brief An independently compressed block of records. `records` borrows from the byte
 * source and holds `compressedSize` bytes.
 */
struct CHRONICLE_PUBLIC Chunk {
  Timestamp messageStartTime;
  Timestamp messageEndTime;
  ByteOffset uncompressedSize;
  uint32_t uncompressedCrc;
  std::string compression;
  ByteOffset compressedSize;
  const std::byte* records = nullptr;
};

/**
 * @brief One (log time, intra-chunk offset) pair of a message index.
 */
struct CHRONICLE_PUBLIC MessageIndexEntry {
  Timestamp logTime;
  ByteOffset offset;

  bool operator==(const MessageIndexEntry& other) const {
    return logTime == other.logTime && offset == other.offset;
  }
};

/**
 * @brief The message index of one channel within one chunk.
 */
struct CHRONICLE_PUBLIC MessageIndex {
  ChannelId channelId;
  std::vector<MessageIndexEntry> records;
};

/// Per-channel message index entries of one chunk, each sorted by log time.
using MessageIndexMap = std::map<ChannelId, std::vector<MessageIndexEntry>>;

/**
 * @brief Summary information for one chunk: its time range, where it lives, and where the
 * message index record of each channel it contains starts.
 */
struct CHRONICLE_PUBLIC ChunkIndex {
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  ByteOffset chunkStartOffset = 0;
  ByteOffset chunkLength = 0;
  std::map<ChannelId, ByteOffset> messageIndexOffsets;
  ByteOffset messageIndexLength = 0;
  std::string compression;
  ByteOffset compressedSize = 0;
  ByteOffset uncompressedSize = 0;

  bool overlaps(Timestamp start, Timestamp end) const {
    return messageStartTime <= end && messageEndTime >= start;
  }
};

/**
 * @brief An arbitrary named blob embedded in the data section.
 */
struct CHRONICLE_PUBLIC Attachment {
  Timestamp logTime = 0;
  Timestamp createTime = 0;
  std::string name;
  std::string mediaType;
  ByteArray data;
  uint32_t crc = 0;
};

struct CHRONICLE_PUBLIC AttachmentIndex {
  ByteOffset offset;
  ByteOffset length;
  Timestamp logTime;
  Timestamp createTime;
  uint64_t dataSize;
  std::string name;
  std::string mediaType;
};

/**
 * @brief Whole-log counts and time bounds, found in the summary section.
 */
struct CHRONICLE_PUBLIC Statistics {
  uint64_t messageCount = 0;
  uint16_t schemaCount = 0;
  uint32_t channelCount = 0;
  uint32_t attachmentCount = 0;
  uint32_t metadataCount = 0;
  uint32_t chunkCount = 0;
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  std::map<ChannelId, uint64_t> channelMessageCounts;
};

/**
 * @brief A named map of user key/value strings stored in the data section.
 */
struct CHRONICLE_PUBLIC Metadata {
  std::string name;
  KeyValueMap metadata;
};

struct CHRONICLE_PUBLIC MetadataIndex {
  ByteOffset offset;
  ByteOffset length;
  std::string name;
};

struct CHRONICLE_PUBLIC SummaryOffset {
  OpCode groupOpCode;
  ByteOffset groupStart;
  ByteOffset groupLength;
};

struct CHRONICLE_PUBLIC DataEnd {
  uint32_t dataSectionCrc;
};

}  // namespace chronicle
