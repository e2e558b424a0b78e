#include <chronicle/chronicle.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(fmt::runtime(msg), std::forward<T>(args)...);
}

std::string ToString(const chronicle::KeyValueMap& map) {
  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& [key, value] : map) {
    if (!first) {
      ss << ", ";
    }
    first = false;
    ss << "\"" << key << "\": \"" << value << "\"";
  }
  ss << "}";
  return ss.str();
}

template <typename K, typename V>
std::string ToString(const std::map<K, V>& map) {
  if (map.size() > 8) {
    return StrFormat("<{} entries>", map.size());
  }

  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& [key, value] : map) {
    if (!first) {
      ss << ", ";
    }
    first = false;
    ss << key << ": " << value;
  }
  ss << "}";
  return ss.str();
}

std::string ToString(const chronicle::Header& header) {
  return StrFormat("[Header] profile={}, library={}", header.profile, header.library);
}

std::string ToString(const chronicle::Footer& footer) {
  return StrFormat("[Footer] summary_start={}, summary_offset_start={}, summary_crc={}",
                   footer.summaryStart, footer.summaryOffsetStart, footer.summaryCrc);
}

std::string ToString(const chronicle::Schema& schema) {
  return StrFormat("[Schema] id={}, name={}, encoding={}, data=<{} bytes>", schema.id, schema.name,
                   schema.encoding, schema.data.size());
}

std::string ToString(const chronicle::Channel& channel) {
  return StrFormat("[Channel] id={}, schema_id={}, topic={}, message_encoding={}, metadata={}",
                   channel.id, channel.schemaId, channel.topic, channel.messageEncoding,
                   ToString(channel.metadata));
}

std::string ToString(const chronicle::LogMessage& message) {
  return StrFormat("[{}] channel_id={}, sequence={}, publish_time={}, log_time={}, data=<{} bytes>",
                   message.channel->topic, message.channelId(), message.sequence,
                   message.publishTime, message.logTime, message.data.size());
}

std::string ToString(const chronicle::ChunkIndex& chunkIndex) {
  return StrFormat(
    "[ChunkIndex] message_start_time={}, message_end_time={}, chunk_start_offset={}, "
    "chunk_length={}, message_index_offsets={}, message_index_length={}, compression={}, "
    "compressed_size={}, uncompressed_size={}",
    chunkIndex.messageStartTime, chunkIndex.messageEndTime, chunkIndex.chunkStartOffset,
    chunkIndex.chunkLength, ToString(chunkIndex.messageIndexOffsets), chunkIndex.messageIndexLength,
    chunkIndex.compression.empty() ? "none" : chunkIndex.compression, chunkIndex.compressedSize,
    chunkIndex.uncompressedSize);
}

std::string ToString(const chronicle::AttachmentIndex& attachmentIndex) {
  return StrFormat(
    "[AttachmentIndex] offset={}, length={}, log_time={}, create_time={}, data_size={}, name={}, "
    "media_type={}",
    attachmentIndex.offset, attachmentIndex.length, attachmentIndex.logTime,
    attachmentIndex.createTime, attachmentIndex.dataSize, attachmentIndex.name,
    attachmentIndex.mediaType);
}

std::string ToString(const chronicle::Statistics& statistics) {
  return StrFormat(
    "[Statistics] message_count={}, schema_count={}, channel_count={}, attachment_count={}, "
    "metadata_count={}, chunk_count={}, message_start_time={}, message_end_time={}, "
    "channel_message_counts={}",
    statistics.messageCount, statistics.schemaCount, statistics.channelCount,
    statistics.attachmentCount, statistics.metadataCount, statistics.chunkCount,
    statistics.messageStartTime, statistics.messageEndTime,
    ToString(statistics.channelMessageCounts));
}

std::string ToString(const chronicle::MetadataIndex& metadataIndex) {
  return StrFormat("[MetadataIndex] offset={}, length={}, name={}", metadataIndex.offset,
                   metadataIndex.length, metadataIndex.name);
}

void DumpSummary(const chronicle::Summary& summary) {
  for (const auto& [_, schema] : summary.schemas()) {
    fmt::print("{}\n", ToString(*schema));
  }
  for (const auto& [_, channel] : summary.channels()) {
    fmt::print("{}\n", ToString(*channel));
  }
  if (const auto& statistics = summary.statistics()) {
    fmt::print("{}\n", ToString(*statistics));
  }
  for (const auto& chunkIndex : summary.chunkIndexes()) {
    fmt::print("{}\n", ToString(chunkIndex));
  }
  for (const auto& attachmentIndex : summary.attachmentIndexes()) {
    fmt::print("{}\n", ToString(attachmentIndex));
  }
  for (const auto& metadataIndex : summary.metadataIndexes()) {
    fmt::print("{}\n", ToString(metadataIndex));
  }
}

void DumpMessages(chronicle::LogReader& reader) {
  if (!reader.hasSummary()) {
    // Without an index the data section is read in storage order
    for (const auto& message : reader.messages()) {
      fmt::print("{}\n", ToString(*message));
    }
    return;
  }

  auto iterator = reader.messageIterator();
  while (const auto message = iterator.next()) {
    fmt::print("{}\n", ToString(*message));
  }
}

int main(int argc, char* argv[]) {
  bool printMessages = false;
  bool ignoreEndMagic = false;
  std::string_view inputFile;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--messages") {
      printMessages = true;
    } else if (arg == "--ignore-end-magic") {
      ignoreEndMagic = true;
    } else if (inputFile.empty()) {
      inputFile = arg;
    } else {
      inputFile = {};
      break;
    }
  }
  if (inputFile.empty()) {
    fmt::print(stderr, "Usage: {} [--messages] [--ignore-end-magic] <input.log>\n", argv[0]);
    return 1;
  }

  chronicle::ReaderOptions options;
  options.ignoreEndMagic = ignoreEndMagic;
  chronicle::LogReader reader{options};
  reader.setProblemCallback([](const chronicle::Status& problem) {
    fmt::print(stderr, "! {}\n", problem.message);
  });

  if (const auto status = reader.open(inputFile); !status.ok()) {
    fmt::print(stderr, "! failed to open {}: {}\n", inputFile, status.message);
    return 1;
  }

  fmt::print("{}\n", ToString(*reader.header()));
  if (reader.footer()) {
    fmt::print("{}\n", ToString(*reader.footer()));
  }
  if (const auto summary = reader.summary()) {
    DumpSummary(*summary);
  } else {
    fmt::print("(no summary section)\n");
  }

  if (printMessages) {
    DumpMessages(reader);
  }

  reader.close();
  return reader.lastError().ok() ? 0 : 1;
}
