#include "crc32.hpp"
#include "internal.hpp"

namespace chronicle {

Status Summary::Load(const IByteSource& source, SummaryPtr* output) {
  output->reset();

  Footer footer;
  if (auto status = RecordCodec::ReadFooter(source, &footer); !status.ok()) {
    return status;
  }
  if (footer.summaryStart == 0) {
    return StatusCode::Success;
  }

  const uint64_t footerOffset = source.size() - internal::FooterLength;
  const ByteOffset summaryEnd =
    footer.summaryOffsetStart != 0 ? footer.summaryOffsetStart : footerOffset;
  if (footer.summaryStart > summaryEnd || summaryEnd > footerOffset) {
    const auto msg = internal::StrCat("summary section [", footer.summaryStart, ", ", summaryEnd,
                                      ") does not fit before the footer at ", footerOffset);
    return Status{StatusCode::InvalidFooter, msg};
  }

  // The summary CRC covers the summary and summary offset sections plus the footer up to
  // and including its summary_offset_start field
  if (footer.summaryCrc != 0) {
    const uint64_t crcEnd = footerOffset + internal::RecordPrefixLength + 8 + 8;
    const uint32_t actual =
      internal::crc32(source.data() + footer.summaryStart, crcEnd - footer.summaryStart);
    if (actual != footer.summaryCrc) {
      const auto msg = internal::StrCat("summary crc ", actual, " does not match recorded crc ",
                                        footer.summaryCrc);
      return Status{StatusCode::CrcMismatch, msg};
    }
  }

  auto summary = std::make_shared<Summary>();
  summary->footer_ = footer;
  std::unordered_set<ByteOffset> seenChunks;

  ByteOffset offset = footer.summaryStart;
  while (offset < summaryEnd) {
    Record record;
    if (auto status = RecordCodec::ReadRecord(source.data(), summaryEnd, offset, &record);
        !status.ok()) {
      return status;
    }
    offset += record.recordSize();

    Status status;
    switch (record.opcode) {
      case OpCode::Schema: {
        auto schema = std::make_shared<Schema>();
        status = RecordCodec::ParseSchema(record, schema.get());
        if (status.ok()) {
          summary->schemas_.try_emplace(schema->id, std::move(schema));
        }
        break;
      }
      case OpCode::Channel: {
        auto channel = std::make_shared<Channel>();
        status = RecordCodec::ParseChannel(record, channel.get());
        if (status.ok()) {
          summary->channels_.try_emplace(channel->id, std::move(channel));
        }
        break;
      }
      case OpCode::ChunkIndex: {
        ChunkIndex chunkIndex;
        status = RecordCodec::ParseChunkIndex(record, &chunkIndex);
        // Keep write order; a repeated chunk index adds nothing
        if (status.ok() && seenChunks.insert(chunkIndex.chunkStartOffset).second) {
          summary->chunkIndexes_.push_back(std::move(chunkIndex));
        }
        break;
      }
      case OpCode::Statistics: {
        Statistics statistics;
        status = RecordCodec::ParseStatistics(record, &statistics);
        if (status.ok()) {
          summary->statistics_ = std::move(statistics);
        }
        break;
      }
      case OpCode::AttachmentIndex: {
        AttachmentIndex attachmentIndex;
        status = RecordCodec::ParseAttachmentIndex(record, &attachmentIndex);
        if (status.ok()) {
          summary->attachmentIndexes_.push_back(std::move(attachmentIndex));
        }
        break;
      }
      case OpCode::MetadataIndex: {
        MetadataIndex metadataIndex;
        status = RecordCodec::ParseMetadataIndex(record, &metadataIndex);
        if (status.ok()) {
          summary->metadataIndexes_.push_back(std::move(metadataIndex));
        }
        break;
      }
      default:
        break;
    }
    if (!status.ok()) {
      return status;
    }
  }

  *output = std::move(summary);
  return StatusCode::Success;
}

const Footer& Summary::footer() const {
  return footer_;
}

const std::map<ChannelId, ChannelPtr>& Summary::channels() const {
  return channels_;
}

const std::map<SchemaId, SchemaPtr>& Summary::schemas() const {
  return schemas_;
}

const std::vector<ChunkIndex>& Summary::chunkIndexes() const {
  return chunkIndexes_;
}

const std::optional<Statistics>& Summary::statistics() const {
  return statistics_;
}

const std::vector<AttachmentIndex>& Summary::attachmentIndexes() const {
  return attachmentIndexes_;
}

const std::vector<MetadataIndex>& Summary::metadataIndexes() const {
  return metadataIndexes_;
}

ChannelPtr Summary::channel(ChannelId channelId) const {
  const auto it = channels_.find(channelId);
  return it != channels_.end() ? it->second : nullptr;
}

SchemaPtr Summary::schema(SchemaId schemaId) const {
  const auto it = schemas_.find(schemaId);
  return it != schemas_.end() ? it->second : nullptr;
}

Status Summary::messageIndex(const IByteSource& source, const ChunkIndex& chunkIndex,
                             const std::optional<std::unordered_set<ChannelId>>& channels,
                             MessageIndexMap* output) const {
  if (chunkIndex.messageIndexOffsets.empty() && chunkIndex.uncompressedSize > 0 &&
      chunkIndex.messageIndexLength == 0) {
    output->clear();
    const auto msg = internal::StrCat("chunk at offset ", chunkIndex.chunkStartOffset,
                                      " has no message indexes");
    return Status{StatusCode::IndexUnavailable, msg};
  }
  return ReadMessageIndexes(source, chunkIndex, channels, output);
}

Status Summary::resolve(const Message& message, LogMessagePtr* output) const {
  auto channel = this->channel(message.channelId);
  if (!channel) {
    const auto msg = internal::StrCat("message at time ", message.logTime,
                                      " references unknown channel ", message.channelId);
    return Status{StatusCode::InvalidRecord, msg};
  }
  auto logMessage = std::make_shared<LogMessage>();
  logMessage->schema = schema(channel->schemaId);
  logMessage->channel = std::move(channel);
  logMessage->sequence = message.sequence;
  logMessage->logTime = message.logTime;
  logMessage->publishTime = message.publishTime;
  logMessage->data.assign(message.data, message.data + message.dataSize);
  *output = std::move(logMessage);
  return StatusCode::Success;
}

}  // namespace chronicle
