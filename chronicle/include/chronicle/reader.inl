#include "internal.hpp"

namespace chronicle {

LogReader::LogReader(ReaderOptions options)
    : options_(options) {}

Status LogReader::open(std::string_view path) {
  close();
  ByteSourcePtr source;
  if (auto status = OpenByteSource(path, options_.preferMemoryMap, &source); !status.ok()) {
    return status;
  }
  return open(std::move(source));
}

Status LogReader::open(ByteArray bytes) {
  return open(std::make_shared<BufferSource>(std::move(bytes)));
}

Status LogReader::open(ByteSourcePtr source) {
  close();
  if (!source) {
    return Status{StatusCode::OpenFailed, "no byte source"};
  }

  Header header;
  ByteOffset dataStart = 0;
  if (auto status = RecordCodec::ReadHeader(*source, &header, &dataStart); !status.ok()) {
    return status;
  }

  Footer footer;
  auto footerStatus = RecordCodec::ReadFooter(*source, &footer);
  if (footerStatus.ok()) {
    footer_ = footer;
  } else if (!options_.ignoreEndMagic) {
    return footerStatus;
  }

  source_ = std::move(source);
  header_ = std::move(header);
  dataStart_ = dataStart;
  return StatusCode::Success;
}

void LogReader::close() {
  query_.reset();
  summary_.reset();
  summaryRead_ = false;
  summaryStatus_ = Status{};
  header_.reset();
  footer_.reset();
  dataStart_ = 0;
  source_.reset();
}

bool LogReader::isOpen() const {
  return source_ != nullptr;
}

ByteSourcePtr LogReader::source() const {
  return source_;
}

const std::optional<Header>& LogReader::header() const {
  return header_;
}

const std::optional<Footer>& LogReader::footer() const {
  return footer_;
}

Status LogReader::readSummary() {
  if (!requireOpen_()) {
    return StatusCode::NotOpen;
  }
  if (summaryRead_) {
    return summaryStatus_;
  }
  summaryRead_ = true;

  if (!footer_) {
    // Opened with ignoreEndMagic and no footer: there is nothing to locate a summary with
    return summaryStatus_;
  }
  summaryStatus_ = Summary::Load(*source_, &summary_);
  if (!summaryStatus_.ok()) {
    recordError_(summaryStatus_);
  }
  return summaryStatus_;
}

bool LogReader::hasSummary() {
  const auto status = readSummary();
  return status.ok() && summary_ != nullptr;
}

SummaryPtr LogReader::summary() {
  const auto status = readSummary();
  return status.ok() ? summary_ : nullptr;
}

std::vector<LogMessagePtr> LogReader::messages() {
  std::vector<LogMessagePtr> output;
  if (!requireOpen_()) {
    return output;
  }

  auto status = scanDataSection_([&](const Message& message, const ScanTables& tables) -> Status {
    const auto channel = tables.channels.find(message.channelId);
    if (channel == tables.channels.end()) {
      const auto msg = internal::StrCat("message at time ", message.logTime,
                                        " references channel ", message.channelId,
                                        " before its Channel record");
      return Status{StatusCode::InvalidRecord, msg};
    }
    auto logMessage = std::make_shared<LogMessage>();
    const auto schema = tables.schemas.find(channel->second->schemaId);
    logMessage->schema = schema != tables.schemas.end() ? schema->second : nullptr;
    logMessage->channel = channel->second;
    logMessage->sequence = message.sequence;
    logMessage->logTime = message.logTime;
    logMessage->publishTime = message.publishTime;
    logMessage->data.assign(message.data, message.data + message.dataSize);
    output.push_back(std::move(logMessage));
    return StatusCode::Success;
  });
  if (!status.ok()) {
    recordError_(std::move(status));
  }
  return output;
}

std::vector<RawMessage> LogReader::rawMessages() {
  std::vector<RawMessage> output;
  if (!requireOpen_()) {
    return output;
  }

  auto status = scanDataSection_([&](const Message& message, const ScanTables&) -> Status {
    RawMessage& raw = output.emplace_back();
    raw.channelId = message.channelId;
    raw.sequence = message.sequence;
    raw.logTime = message.logTime;
    raw.publishTime = message.publishTime;
    raw.data.assign(message.data, message.data + message.dataSize);
    return StatusCode::Success;
  });
  if (!status.ok()) {
    recordError_(std::move(status));
  }
  return output;
}

std::vector<Attachment> LogReader::attachments() {
  std::vector<Attachment> output;
  if (!requireSummary_()) {
    return output;
  }

  for (const auto& attachmentIndex : summary_->attachmentIndexes()) {
    Record record;
    Attachment attachment;
    auto status = RecordCodec::ReadRecord(*source_, attachmentIndex.offset, &record);
    if (status.ok() && record.opcode != OpCode::Attachment) {
      status = Status{StatusCode::InvalidRecord,
                      internal::StrCat("attachment index for \"", attachmentIndex.name,
                                       "\" points at a ", OpCodeString(record.opcode),
                                       " record at offset ", attachmentIndex.offset)};
    }
    if (status.ok()) {
      status = RecordCodec::ParseAttachment(record, &attachment);
    }
    if (!status.ok()) {
      recordError_(std::move(status));
      break;
    }
    output.push_back(std::move(attachment));
  }
  return output;
}

std::vector<Metadata> LogReader::metadataEntries() {
  std::vector<Metadata> output;
  if (!requireSummary_()) {
    return output;
  }

  for (const auto& metadataIndex : summary_->metadataIndexes()) {
    Record record;
    Metadata metadata;
    auto status = RecordCodec::ReadRecord(*source_, metadataIndex.offset, &record);
    if (status.ok() && record.opcode != OpCode::Metadata) {
      status = Status{StatusCode::InvalidRecord,
                      internal::StrCat("metadata index for \"", metadataIndex.name,
                                       "\" points at a ", OpCodeString(record.opcode),
                                       " record at offset ", metadataIndex.offset)};
    }
    if (status.ok()) {
      status = RecordCodec::ParseMetadata(record, &metadata);
    }
    if (!status.ok()) {
      recordError_(std::move(status));
      break;
    }
    output.push_back(std::move(metadata));
  }
  return output;
}

size_t LogReader::chunkCount() {
  return requireSummary_() ? summary_->chunkIndexes().size() : 0;
}

std::vector<ChunkIndex> LogReader::chunkIndexes() {
  return requireSummary_() ? summary_->chunkIndexes() : std::vector<ChunkIndex>{};
}

MessageIndexMap LogReader::messageIndexesForChunk(size_t chunk) {
  MessageIndexMap indexes;
  if (!requireSummary_()) {
    return indexes;
  }
  const auto& chunkIndexes = summary_->chunkIndexes();
  if (chunk >= chunkIndexes.size()) {
    recordError_(Status{StatusCode::InvalidArgument,
                        internal::StrCat("chunk ", chunk, " out of range, log has ",
                                         chunkIndexes.size(), " chunks")});
    return indexes;
  }
  if (auto status = summary_->messageIndex(*source_, chunkIndexes[chunk], std::nullopt, &indexes);
      !status.ok()) {
    recordError_(std::move(status));
  }
  return indexes;
}

LogMessagePtr LogReader::seekMessage(size_t chunk, const MessageIndexEntry& entry) {
  if (!requireSummary_()) {
    return nullptr;
  }
  const auto& chunkIndexes = summary_->chunkIndexes();
  if (chunk >= chunkIndexes.size()) {
    recordError_(Status{StatusCode::InvalidArgument,
                        internal::StrCat("chunk ", chunk, " out of range, log has ",
                                         chunkIndexes.size(), " chunks")});
    return nullptr;
  }

  ChunkDecompressor decompressor;
  ByteArray uncompressed;
  Message message;
  LogMessagePtr output;
  auto status = LoadChunk(*source_, chunkIndexes[chunk], decompressor, &uncompressed,
                          options_.validateChunkCrc);
  if (status.ok()) {
    status = ReadMessageAt(uncompressed, entry, &message);
  }
  if (status.ok()) {
    status = summary_->resolve(message, &output);
  }
  if (!status.ok()) {
    recordError_(std::move(status));
    return nullptr;
  }
  return output;
}

int64_t LogReader::firstMessageTime() {
  if (!requireSummary_()) {
    return -1;
  }
  if (!summary_->statistics()) {
    recordError_(Status{StatusCode::SummaryUnavailable, "log has no statistics"});
    return -1;
  }
  return int64_t(summary_->statistics()->messageStartTime);
}

int64_t LogReader::lastMessageTime() {
  if (!requireSummary_()) {
    return -1;
  }
  if (!summary_->statistics()) {
    recordError_(Status{StatusCode::SummaryUnavailable, "log has no statistics"});
    return -1;
  }
  return int64_t(summary_->statistics()->messageEndTime);
}

int64_t LogReader::duration() {
  const int64_t start = firstMessageTime();
  const int64_t end = start < 0 ? -1 : lastMessageTime();
  if (start < 0 || end < 0) {
    return -1;
  }
  return end - start;
}

MessageIterator LogReader::messageIterator() {
  Status summaryStatus = source_ ? readSummary() : Status{StatusCode::NotOpen, "no log is open"};
  SummaryPtr loaded = summaryStatus.ok() ? summary_ : nullptr;
  MessageIterator iterator{source_, std::move(loaded), options_.validateChunkCrc,
                           std::move(summaryStatus)};
  if (onProblem_) {
    iterator.setProblemCallback(onProblem_);
  }
  return iterator;
}

QueryEngine& LogReader::query() {
  if (!query_) {
    if (!source_) {
      query_ = std::make_unique<QueryEngine>(nullptr, nullptr, StatusCode::NotOpen);
    } else {
      auto status = readSummary();
      if (status.ok()) {
        status = Status{StatusCode::SummaryUnavailable, "log has no summary section"};
      }
      query_ = std::make_unique<QueryEngine>(source_, summary_, std::move(status),
                                             options_.validateChunkCrc);
    }
    query_->setProblemCallback([this](const Status& status) {
      recordError_(status);
    });
  }
  return *query_;
}

const Status& LogReader::lastError() const {
  return lastError_;
}

void LogReader::clearLastError() {
  lastError_ = Status{};
  if (query_) {
    query_->clearLastError();
  }
}

void LogReader::setProblemCallback(ProblemCallback onProblem) {
  onProblem_ = std::move(onProblem);
}

const ReaderOptions& LogReader::options() const {
  return options_;
}

bool LogReader::requireOpen_() {
  if (source_) {
    return true;
  }
  recordError_(StatusCode::NotOpen);
  return false;
}

bool LogReader::requireSummary_() {
  if (!requireOpen_()) {
    return false;
  }
  const auto status = readSummary();
  if (!status.ok()) {
    return false;
  }
  if (!summary_) {
    recordError_(Status{StatusCode::SummaryUnavailable, "log has no summary section"});
    return false;
  }
  return true;
}

Status LogReader::scanDataSection_(const ScanCallback& onMessage) {
  const uint64_t end = footer_ ? source_->size() - internal::FooterLength : source_->size();
  const bool truncatedTail = options_.ignoreEndMagic && !footer_;
  ScanTables tables;
  ChunkDecompressor decompressor;
  ByteArray uncompressed;

  ByteOffset offset = dataStart_;
  while (offset < end) {
    Record record;
    if (auto status = RecordCodec::ReadRecord(source_->data(), end, offset, &record);
        !status.ok()) {
      // A recording cut short ends in a partial record
      return truncatedTail ? Status{} : status;
    }
    offset += record.recordSize();

    Status status;
    switch (record.opcode) {
      case OpCode::Schema: {
        auto schema = std::make_shared<Schema>();
        status = RecordCodec::ParseSchema(record, schema.get());
        if (status.ok()) {
          tables.schemas[schema->id] = std::move(schema);
        }
        break;
      }
      case OpCode::Channel: {
        auto channel = std::make_shared<Channel>();
        status = RecordCodec::ParseChannel(record, channel.get());
        if (status.ok()) {
          tables.channels[channel->id] = std::move(channel);
        }
        break;
      }
      case OpCode::Message: {
        Message message;
        status = RecordCodec::ParseMessage(record, &message);
        if (status.ok()) {
          status = onMessage(message, tables);
        }
        break;
      }
      case OpCode::Chunk: {
        Chunk chunk;
        status = RecordCodec::ParseChunk(record, &chunk);
        if (status.ok()) {
          status = decompressor.decompress(chunk, &uncompressed, options_.validateChunkCrc);
        }
        if (!status.ok()) {
          break;
        }
        ChunkMessageReader reader{uncompressed.data(), uncompressed.size()};
        reader.onSchema = [&](SchemaPtr schema) {
          tables.schemas[schema->id] = std::move(schema);
        };
        reader.onChannel = [&](ChannelPtr channel) {
          tables.channels[channel->id] = std::move(channel);
        };
        Message message;
        ByteOffset messageOffset = 0;
        while (status.ok() && reader.next(&message, &messageOffset)) {
          status = onMessage(message, tables);
        }
        if (status.ok()) {
          status = reader.status();
        }
        break;
      }
      case OpCode::DataEnd:
      case OpCode::Footer:
        return StatusCode::Success;
      default:
        break;
    }
    if (!status.ok()) {
      return status;
    }
  }
  return StatusCode::Success;
}

void LogReader::recordError_(Status status) {
  lastError_ = std::move(status);
  if (onProblem_) {
    onProblem_(lastError_);
  }
}

}  // namespace chronicle
