#include "crc32.hpp"
#include "internal.hpp"
#include <algorithm>
#include <cassert>

#ifndef CHRONICLE_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#endif
#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#  include <zstd_errors.h>
#endif

namespace chronicle {

// RecordCodec /////////////////////////////////////////////////////////////////

Status RecordCodec::ReadRecord(const std::byte* data, uint64_t size, uint64_t offset,
                               Record* record) {
  if (offset > size || size - offset < internal::RecordPrefixLength) {
    const auto msg = internal::StrCat("cannot read record at offset ", offset, ", ",
                                      offset > size ? 0 : size - offset, " bytes remaining");
    return Status{StatusCode::InvalidFile, msg};
  }

  record->opcode = OpCode(data[offset]);
  record->dataSize = internal::ParseUint64(data + offset + 1);

  const uint64_t maxSize = size - offset - internal::RecordPrefixLength;
  if (record->dataSize > maxSize) {
    const auto msg = internal::StrCat("record type 0x", internal::ToHex(uint8_t(record->opcode)),
                                      " at offset ", offset, " has length ", record->dataSize,
                                      " but only ", maxSize, " bytes remaining");
    return Status{StatusCode::InvalidRecord, msg};
  }
  record->data = data + offset + internal::RecordPrefixLength;
  return StatusCode::Success;
}

Status RecordCodec::ReadRecord(const IByteSource& source, uint64_t offset, Record* record) {
  return ReadRecord(source.data(), source.size(), offset, record);
}

Status RecordCodec::ReadFooter(const IByteSource& source, Footer* footer) {
  if (source.size() < sizeof(Magic) + internal::FooterLength) {
    return StatusCode::FileTooSmall;
  }
  const uint64_t footerOffset = source.size() - internal::FooterLength;
  const std::byte* data = nullptr;
  if (auto status = source.slice(footerOffset, internal::FooterLength, &data); !status.ok()) {
    return status;
  }

  const std::byte* magic = data + internal::FooterLength - sizeof(Magic);
  if (std::memcmp(magic, Magic, sizeof(Magic)) != 0) {
    const auto msg =
      internal::StrCat("invalid magic bytes in Footer: 0x", internal::MagicToHex(magic));
    return Status{StatusCode::MagicMismatch, msg};
  }

  Record record;
  if (auto status = ReadRecord(source, footerOffset, &record); !status.ok()) {
    return status;
  }
  if (record.opcode != OpCode::Footer) {
    const auto msg =
      internal::StrCat("invalid opcode, expected Footer: 0x", internal::ToHex(data[0]));
    return Status{StatusCode::InvalidFooter, msg};
  }
  return ParseFooter(record, footer);
}

Status RecordCodec::ReadHeader(const IByteSource& source, Header* header,
                               ByteOffset* dataStart) {
  if (source.size() < internal::MinHeaderLength) {
    return StatusCode::FileTooSmall;
  }
  if (std::memcmp(source.data(), Magic, sizeof(Magic)) != 0) {
    const auto msg =
      internal::StrCat("invalid magic bytes in Header: 0x", internal::MagicToHex(source.data()));
    return Status{StatusCode::MagicMismatch, msg};
  }

  Record record;
  if (auto status = ReadRecord(source, sizeof(Magic), &record); !status.ok()) {
    return status;
  }
  if (record.opcode != OpCode::Header) {
    const auto msg = internal::StrCat("invalid opcode, expected Header: 0x",
                                      internal::ToHex(uint8_t(record.opcode)));
    return Status{StatusCode::InvalidFile, msg};
  }
  if (auto status = ParseHeader(record, header); !status.ok()) {
    return status;
  }
  *dataStart = sizeof(Magic) + record.recordSize();
  return StatusCode::Success;
}

Status RecordCodec::ParseHeader(const Record& record, Header* header) {
  assert(record.opcode == OpCode::Header);
  internal::ByteCursor in{record};
  in.read(&header->profile, "profile");
  in.read(&header->library, "library");
  return in.status();
}

Status RecordCodec::ParseFooter(const Record& record, Footer* footer) {
  constexpr uint64_t FooterSize = 8 + 8 + 4;

  assert(record.opcode == OpCode::Footer);
  if (record.dataSize != FooterSize) {
    const auto msg = internal::StrCat("invalid Footer length: ", record.dataSize);
    return Status{StatusCode::InvalidFooter, msg};
  }
  internal::ByteCursor in{record};
  in.read(&footer->summaryStart, "summary_start");
  in.read(&footer->summaryOffsetStart, "summary_offset_start");
  in.read(&footer->summaryCrc, "summary_crc");
  return in.status();
}

Status RecordCodec::ParseSchema(const Record& record, Schema* schema) {
  assert(record.opcode == OpCode::Schema);
  internal::ByteCursor in{record};
  in.read(&schema->id, "id");
  in.read(&schema->name, "name");
  in.read(&schema->encoding, "encoding");
  in.read(&schema->data, "data");
  return in.status();
}

Status RecordCodec::ParseChannel(const Record& record, Channel* channel) {
  assert(record.opcode == OpCode::Channel);
  internal::ByteCursor in{record};
  in.read(&channel->id, "id");
  in.read(&channel->schemaId, "schema_id");
  in.read(&channel->topic, "topic");
  in.read(&channel->messageEncoding, "message_encoding");
  in.read(&channel->metadata, "metadata");
  return in.status();
}

Status RecordCodec::ParseMessage(const Record& record, Message* message) {
  assert(record.opcode == OpCode::Message);
  internal::ByteCursor in{record};
  in.read(&message->channelId, "channel_id");
  in.read(&message->sequence, "sequence");
  in.read(&message->logTime, "log_time");
  in.read(&message->publishTime, "publish_time");
  message->dataSize = in.remaining();
  in.view(message->dataSize, &message->data, "data");
  return in.status();
}

Status RecordCodec::ParseChunk(const Record& record, Chunk* chunk) {
  assert(record.opcode == OpCode::Chunk);
  internal::ByteCursor in{record};
  in.read(&chunk->messageStartTime, "message_start_time");
  in.read(&chunk->messageEndTime, "message_end_time");
  in.read(&chunk->uncompressedSize, "uncompressed_size");
  in.read(&chunk->uncompressedCrc, "uncompressed_crc");
  in.read(&chunk->compression, "compression");
  in.read(&chunk->compressedSize, "compressed_size");
  in.view(chunk->compressedSize, &chunk->records, "records");
  return in.status();
}

Status RecordCodec::ParseMessageIndex(const Record& record, MessageIndex* messageIndex) {
  assert(record.opcode == OpCode::MessageIndex);
  internal::ByteCursor in{record};
  in.read(&messageIndex->channelId, "channel_id");
  auto entries = in.array(8 + 8, "records");
  if (!in.ok()) {
    return in.status();
  }
  messageIndex->records.clear();
  messageIndex->records.reserve(entries.remaining() / 16);
  while (entries.remaining() > 0) {
    MessageIndexEntry entry{};
    entries.read(&entry.logTime, "records");
    entries.read(&entry.offset, "records");
    messageIndex->records.push_back(entry);
  }
  return entries.status();
}

Status RecordCodec::ParseChunkIndex(const Record& record, ChunkIndex* chunkIndex) {
  assert(record.opcode == OpCode::ChunkIndex);
  internal::ByteCursor in{record};
  in.read(&chunkIndex->messageStartTime, "message_start_time");
  in.read(&chunkIndex->messageEndTime, "message_end_time");
  in.read(&chunkIndex->chunkStartOffset, "chunk_start_offset");
  in.read(&chunkIndex->chunkLength, "chunk_length");
  auto offsets = in.array(2 + 8, "message_index_offsets");
  chunkIndex->messageIndexOffsets.clear();
  while (offsets.ok() && offsets.remaining() > 0) {
    ChannelId channelId = 0;
    ByteOffset offset = 0;
    offsets.read(&channelId, "message_index_offsets");
    offsets.read(&offset, "message_index_offsets");
    chunkIndex->messageIndexOffsets.emplace(channelId, offset);
  }
  in.read(&chunkIndex->messageIndexLength, "message_index_length");
  in.read(&chunkIndex->compression, "compression");
  in.read(&chunkIndex->compressedSize, "compressed_size");
  in.read(&chunkIndex->uncompressedSize, "uncompressed_size");
  return in.status();
}

Status RecordCodec::ParseAttachment(const Record& record, Attachment* attachment) {
  assert(record.opcode == OpCode::Attachment);
  internal::ByteCursor in{record};
  in.read(&attachment->logTime, "log_time");
  in.read(&attachment->createTime, "create_time");
  in.read(&attachment->name, "name");
  in.read(&attachment->mediaType, "media_type");
  uint64_t dataSize = 0;
  const std::byte* data = nullptr;
  in.read(&dataSize, "data_size");
  in.view(dataSize, &data, "data");
  const uint64_t crcOffset = in.position();
  in.read(&attachment->crc, "crc");
  if (!in.ok()) {
    return in.status();
  }
  attachment->data.assign(data, data + dataSize);

  // The CRC covers every field that precedes it; zero means it was not computed
  if (attachment->crc != 0) {
    const uint32_t actual = internal::crc32(record.data, crcOffset);
    if (actual != attachment->crc) {
      const auto msg = internal::StrCat("attachment \"", attachment->name, "\" crc ", actual,
                                        " does not match recorded crc ", attachment->crc);
      return Status{StatusCode::CrcMismatch, msg};
    }
  }
  return StatusCode::Success;
}

Status RecordCodec::ParseAttachmentIndex(const Record& record, AttachmentIndex* attachmentIndex) {
  assert(record.opcode == OpCode::AttachmentIndex);
  internal::ByteCursor in{record};
  in.read(&attachmentIndex->offset, "offset");
  in.read(&attachmentIndex->length, "length");
  in.read(&attachmentIndex->logTime, "log_time");
  in.read(&attachmentIndex->createTime, "create_time");
  in.read(&attachmentIndex->dataSize, "data_size");
  in.read(&attachmentIndex->name, "name");
  in.read(&attachmentIndex->mediaType, "media_type");
  return in.status();
}

Status RecordCodec::ParseStatistics(const Record& record, Statistics* statistics) {
  assert(record.opcode == OpCode::Statistics);
  internal::ByteCursor in{record};
  in.read(&statistics->messageCount, "message_count");
  in.read(&statistics->schemaCount, "schema_count");
  in.read(&statistics->channelCount, "channel_count");
  in.read(&statistics->attachmentCount, "attachment_count");
  in.read(&statistics->metadataCount, "metadata_count");
  in.read(&statistics->chunkCount, "chunk_count");
  in.read(&statistics->messageStartTime, "message_start_time");
  in.read(&statistics->messageEndTime, "message_end_time");
  auto counts = in.array(2 + 8, "channel_message_counts");
  statistics->channelMessageCounts.clear();
  while (counts.ok() && counts.remaining() > 0) {
    ChannelId channelId = 0;
    uint64_t messageCount = 0;
    counts.read(&channelId, "channel_message_counts");
    counts.read(&messageCount, "channel_message_counts");
    statistics->channelMessageCounts.emplace(channelId, messageCount);
  }
  return in.status();
}

Status RecordCodec::ParseMetadata(const Record& record, Metadata* metadata) {
  assert(record.opcode == OpCode::Metadata);
  internal::ByteCursor in{record};
  in.read(&metadata->name, "name");
  in.read(&metadata->metadata, "metadata");
  return in.status();
}

Status RecordCodec::ParseMetadataIndex(const Record& record, MetadataIndex* metadataIndex) {
  assert(record.opcode == OpCode::MetadataIndex);
  internal::ByteCursor in{record};
  in.read(&metadataIndex->offset, "offset");
  in.read(&metadataIndex->length, "length");
  in.read(&metadataIndex->name, "name");
  return in.status();
}

Status RecordCodec::ParseSummaryOffset(const Record& record, SummaryOffset* summaryOffset) {
  assert(record.opcode == OpCode::SummaryOffset);
  internal::ByteCursor in{record};
  uint8_t opcode = 0;
  in.read(&opcode, "group_opcode");
  in.read(&summaryOffset->groupStart, "group_start");
  in.read(&summaryOffset->groupLength, "group_length");
  summaryOffset->groupOpCode = OpCode(opcode);
  return in.status();
}

Status RecordCodec::ParseDataEnd(const Record& record, DataEnd* dataEnd) {
  assert(record.opcode == OpCode::DataEnd);
  internal::ByteCursor in{record};
  in.read(&dataEnd->dataSectionCrc, "data_section_crc");
  return in.status();
}

// ChunkDecompressor ///////////////////////////////////////////////////////////

ChunkDecompressor::ChunkDecompressor() = default;

ChunkDecompressor::~ChunkDecompressor() {
#ifndef CHRONICLE_COMPRESSION_NO_LZ4
  if (lz4Context_) {
    LZ4F_freeDecompressionContext(static_cast<LZ4F_dctx*>(lz4Context_));
  }
#endif
#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
  if (zstdContext_) {
    ZSTD_freeDCtx(zstdContext_);
  }
#endif
}

Status ChunkDecompressor::decompress(const Chunk& chunk, ByteArray* output, bool validateCrc) {
  const auto compression = internal::ParseCompression(chunk.compression);
  if (!compression.has_value()) {
    const auto msg = internal::StrCat("unrecognized compression \"", chunk.compression, "\"");
    return Status{StatusCode::UnrecognizedCompression, msg};
  }

  Status status;
  switch (*compression) {
    case Compression::None:
      if (chunk.compressedSize != chunk.uncompressedSize) {
        const auto msg = internal::StrCat("uncompressed chunk holds ", chunk.compressedSize,
                                          " bytes but declares ", chunk.uncompressedSize);
        status = Status{StatusCode::DecompressionSizeMismatch, msg};
      } else {
        output->assign(chunk.records, chunk.records + chunk.compressedSize);
      }
      break;
    case Compression::Lz4:
      status = decompressLz4_(chunk, output);
      break;
    case Compression::Zstd:
      status = decompressZstd_(chunk, output);
      break;
  }
  if (!status.ok()) {
    output->clear();
    return status;
  }

  if (validateCrc && chunk.uncompressedCrc != 0) {
    const uint32_t actual = internal::crc32(output->data(), output->size());
    if (actual != chunk.uncompressedCrc) {
      const auto msg = internal::StrCat("chunk crc ", actual, " does not match recorded crc ",
                                        chunk.uncompressedCrc);
      output->clear();
      return Status{StatusCode::CrcMismatch, msg};
    }
  }
  return StatusCode::Success;
}

Status ChunkDecompressor::decompressLz4_(const Chunk& chunk, ByteArray* output) {
#ifdef CHRONICLE_COMPRESSION_NO_LZ4
  (void)chunk;
  (void)output;
  return Status{StatusCode::UnsupportedCompression, "lz4 support was not compiled in"};
#else
  if (!lz4Context_) {
    LZ4F_dctx* context = nullptr;
    const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&context, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
      const auto msg =
        internal::StrCat("failed to create lz4 decompression context: ", LZ4F_getErrorName(err));
      return Status{StatusCode::DecompressionFailed, msg};
    }
    lz4Context_ = context;
  }
  auto* context = static_cast<LZ4F_dctx*>(lz4Context_);

  output->resize(chunk.uncompressedSize);
  size_t dstSize = chunk.uncompressedSize;
  size_t srcSize = chunk.compressedSize;
  LZ4F_resetDecompressionContext(context);
  const auto result =
    LZ4F_decompress(context, output->data(), &dstSize, chunk.records, &srcSize, nullptr);
  if (LZ4F_isError(result)) {
    const auto msg = internal::StrCat("lz4 decompression of ", chunk.compressedSize,
                                      " bytes into ", chunk.uncompressedSize,
                                      " output bytes failed: ", LZ4F_getErrorName(result));
    return Status{StatusCode::DecompressionFailed, msg};
  }
  if (result != 0 || srcSize != chunk.compressedSize || dstSize != chunk.uncompressedSize) {
    const auto msg = internal::StrCat("lz4 decompression of ", chunk.compressedSize,
                                      " bytes consumed ", srcSize, " and produced ", dstSize,
                                      " bytes, expected ", chunk.uncompressedSize);
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
#endif
}

Status ChunkDecompressor::decompressZstd_(const Chunk& chunk, ByteArray* output) {
#ifdef CHRONICLE_COMPRESSION_NO_ZSTD
  (void)chunk;
  (void)output;
  return Status{StatusCode::UnsupportedCompression, "zstd support was not compiled in"};
#else
  if (!zstdContext_) {
    zstdContext_ = ZSTD_createDCtx();
    if (!zstdContext_) {
      return Status{StatusCode::DecompressionFailed, "failed to create zstd context"};
    }
  }

  output->resize(chunk.uncompressedSize);
  const size_t result = ZSTD_decompressDCtx(zstdContext_, output->data(), output->size(),
                                            chunk.records, chunk.compressedSize);
  if (ZSTD_isError(result)) {
    const auto msg = internal::StrCat("zstd decompression of ", chunk.compressedSize,
                                      " bytes into ", chunk.uncompressedSize,
                                      " output bytes failed: ", ZSTD_getErrorName(result));
    return Status{StatusCode::DecompressionFailed, msg};
  }
  if (result != chunk.uncompressedSize) {
    const auto msg = internal::StrCat("zstd decompression of ", chunk.compressedSize,
                                      " bytes produced ", result, " bytes, expected ",
                                      chunk.uncompressedSize);
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
#endif
}

// ChunkMessageReader //////////////////////////////////////////////////////////

ChunkMessageReader::ChunkMessageReader(const std::byte* records, uint64_t size)
    : records_(records)
    , size_(size) {}

bool ChunkMessageReader::next(Message* message, ByteOffset* offset) {
  while (status_.ok() && offset_ < size_) {
    Record record;
    const ByteOffset recordOffset = offset_;
    if (auto status = RecordCodec::ReadRecord(records_, size_, recordOffset, &record);
        !status.ok()) {
      status_ = status;
      break;
    }
    offset_ += record.recordSize();

    switch (record.opcode) {
      case OpCode::Message:
        status_ = RecordCodec::ParseMessage(record, message);
        if (!status_.ok()) {
          return false;
        }
        *offset = recordOffset;
        return true;
      case OpCode::Schema:
        if (onSchema) {
          auto schema = std::make_shared<Schema>();
          status_ = RecordCodec::ParseSchema(record, schema.get());
          if (status_.ok()) {
            onSchema(std::move(schema));
          }
        }
        break;
      case OpCode::Channel:
        if (onChannel) {
          auto channel = std::make_shared<Channel>();
          status_ = RecordCodec::ParseChannel(record, channel.get());
          if (status_.ok()) {
            onChannel(std::move(channel));
          }
        }
        break;
      case OpCode::Header:
      case OpCode::Footer:
      case OpCode::Chunk:
      case OpCode::MessageIndex:
      case OpCode::ChunkIndex:
      case OpCode::Attachment:
      case OpCode::AttachmentIndex:
      case OpCode::Statistics:
      case OpCode::Metadata:
      case OpCode::MetadataIndex:
      case OpCode::SummaryOffset:
      case OpCode::DataEnd: {
        const auto msg = internal::StrCat("record type ", OpCodeString(record.opcode),
                                          " cannot appear in a chunk (offset ", recordOffset, ")");
        status_ = Status{StatusCode::InvalidOpCode, msg};
        break;
      }
      default:
        // Unknown opcodes are reserved for future use and skipped
        break;
    }
  }
  return false;
}

const Status& ChunkMessageReader::status() const {
  return status_;
}

// Free functions //////////////////////////////////////////////////////////////

Status LoadChunk(const IByteSource& source, const ChunkIndex& chunkIndex,
                 ChunkDecompressor& decompressor, ByteArray* uncompressed, bool validateCrc) {
  Record record;
  if (auto status = RecordCodec::ReadRecord(source, chunkIndex.chunkStartOffset, &record);
      !status.ok()) {
    return status;
  }
  if (record.opcode != OpCode::Chunk) {
    const auto msg = internal::StrCat("chunk index points at a ", OpCodeString(record.opcode),
                                      " record at offset ", chunkIndex.chunkStartOffset);
    return Status{StatusCode::InvalidChunkOffset, msg};
  }
  Chunk chunk;
  if (auto status = RecordCodec::ParseChunk(record, &chunk); !status.ok()) {
    return status;
  }
  return decompressor.decompress(chunk, uncompressed, validateCrc);
}

Status ReadMessageIndexes(const IByteSource& source, const ChunkIndex& chunkIndex,
                          const std::optional<std::unordered_set<ChannelId>>& channels,
                          MessageIndexMap* output) {
  output->clear();
  for (const auto& [channelId, offset] : chunkIndex.messageIndexOffsets) {
    if (channels && channels->count(channelId) == 0) {
      continue;
    }

    Record record;
    if (auto status = RecordCodec::ReadRecord(source, offset, &record); !status.ok()) {
      return status;
    }
    if (record.opcode != OpCode::MessageIndex) {
      const auto msg = internal::StrCat("expected MessageIndex for channel ", channelId,
                                        " at offset ", offset, ", found ",
                                        OpCodeString(record.opcode));
      return Status{StatusCode::InvalidRecord, msg};
    }
    MessageIndex messageIndex;
    if (auto status = RecordCodec::ParseMessageIndex(record, &messageIndex); !status.ok()) {
      return status;
    }
    if (messageIndex.channelId != channelId) {
      const auto msg = internal::StrCat("MessageIndex at offset ", offset, " is for channel ",
                                        messageIndex.channelId, ", expected ", channelId);
      return Status{StatusCode::InvalidRecord, msg};
    }

    auto& entries = messageIndex.records;
    const auto byTime = [](const MessageIndexEntry& a, const MessageIndexEntry& b) {
      return a.logTime < b.logTime;
    };
    if (!std::is_sorted(entries.begin(), entries.end(), byTime)) {
      std::stable_sort(entries.begin(), entries.end(), byTime);
    }
    output->emplace(channelId, std::move(entries));
  }
  return StatusCode::Success;
}

Status ReadMessageAt(const ByteArray& uncompressed, const MessageIndexEntry& entry,
                     Message* message) {
  Record record;
  if (auto status =
        RecordCodec::ReadRecord(uncompressed.data(), uncompressed.size(), entry.offset, &record);
      !status.ok()) {
    return Status{StatusCode::InvalidChunkOffset, status.message};
  }
  if (record.opcode != OpCode::Message) {
    const auto msg = internal::StrCat("index entry at chunk offset ", entry.offset,
                                      " points at a ", OpCodeString(record.opcode), " record");
    return Status{StatusCode::InvalidChunkOffset, msg};
  }
  if (auto status = RecordCodec::ParseMessage(record, message); !status.ok()) {
    return status;
  }
  if (message->logTime != entry.logTime) {
    const auto msg = internal::StrCat("index entry at chunk offset ", entry.offset, " has time ",
                                      entry.logTime, " but the message has time ",
                                      message->logTime);
    return Status{StatusCode::InvalidChunkOffset, msg};
  }
  return StatusCode::Success;
}

}  // namespace chronicle
