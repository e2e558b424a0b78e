#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "log_builder.hpp"
#include "test_helpers.hpp"
#include <chronicle/chronicle.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <numeric>

using namespace chronicle;
using namespace chronicle::test;

namespace {

Chunk PlainChunk(const ByteArray& records) {
  Chunk chunk;
  chunk.messageStartTime = 0;
  chunk.messageEndTime = 0;
  chunk.uncompressedSize = records.size();
  chunk.uncompressedCrc = internal::crc32(records.data(), records.size());
  chunk.compression = "";
  chunk.compressedSize = records.size();
  chunk.records = records.data();
  return chunk;
}

}  // namespace

TEST_CASE("internal::crc32", "[codec]") {
  const auto crc32 = [](const uint8_t* data, size_t len) {
    return internal::crc32Final(
      internal::crc32Update(internal::CRC32_INIT, reinterpret_cast<const std::byte*>(data), len));
  };

  std::array<uint8_t, 32> data;
  std::iota(data.begin(), data.end(), (uint8_t)(1));

  REQUIRE(crc32(data.data(), 0) == 0);
  REQUIRE(crc32(data.data(), 1) == 2768625435);
  REQUIRE(internal::crc32(reinterpret_cast<const std::byte*>(data.data()), data.size()) ==
          2280057893);

  for (size_t split = 0; split <= data.size(); split++) {
    CAPTURE(split);
    uint32_t crc = internal::CRC32_INIT;
    crc = internal::crc32Update(crc, reinterpret_cast<const std::byte*>(data.data()), split);
    crc = internal::crc32Update(crc, reinterpret_cast<const std::byte*>(data.data() + split),
                                data.size() - split);
    REQUIRE(internal::crc32Final(crc) == 2280057893);
  }
}

TEST_CASE("internal::Parse*()", "[codec]") {
  SECTION("uint64_t") {
    const std::array<std::byte, 8> input = {std::byte(0xef), std::byte(0xcd), std::byte(0xab),
                                            std::byte(0x90), std::byte(0x78), std::byte(0x56),
                                            std::byte(0x34), std::byte(0x12)};
    REQUIRE(internal::ParseUint64(input.data()) == 0x1234567890abcdefull);
  }

  SECTION("compression names") {
    REQUIRE(internal::ParseCompression("") == Compression::None);
    REQUIRE(internal::ParseCompression("lz4") == Compression::Lz4);
    REQUIRE(internal::ParseCompression("zstd") == Compression::Zstd);
    REQUIRE_FALSE(internal::ParseCompression("brotli").has_value());
    REQUIRE(internal::CompressionString(Compression::Zstd) == "zstd");
  }
}

TEST_CASE("internal::ByteCursor", "[codec]") {
  const std::array<std::byte, 6> input = {std::byte(0x02), std::byte(0x00), std::byte(0x00),
                                          std::byte(0x00), std::byte('h'),  std::byte('i')};

  SECTION("reads length-prefixed strings") {
    internal::ByteCursor in{input.data(), input.size(), "Test"};
    std::string value;
    in.read(&value, "value");
    requireOk(in.status());
    REQUIRE(value == "hi");
    REQUIRE(in.remaining() == 0);
  }

  SECTION("the first short read latches an error") {
    internal::ByteCursor in{input.data(), input.size(), "Test"};
    uint32_t first = 0;
    uint64_t second = 7;
    in.read(&first, "first");
    in.read(&second, "second");
    REQUIRE(first == 2);
    REQUIRE(second == 7);
    REQUIRE(in.status().code == StatusCode::InvalidRecord);
    REQUIRE(in.status().message.find("Test.second") != std::string::npos);
  }
}

TEST_CASE("Error kinds", "[errors]") {
  REQUIRE(KindOf(Status{}) == ErrorKind::None);
  REQUIRE(KindOf(StatusCode::NotOpen) == ErrorKind::NotOpen);
  REQUIRE(KindOf(StatusCode::IndexUnavailable) == ErrorKind::SummaryUnavailable);
  REQUIRE(KindOf(StatusCode::InvalidChannelId) == ErrorKind::InvalidArgument);
  REQUIRE(KindOf(StatusCode::CrcMismatch) == ErrorKind::DecodeFailure);
  REQUIRE(KindOf(StatusCode::InvalidChunkOffset) == ErrorKind::DecodeFailure);
}

TEST_CASE("Byte sources", "[source]") {
  SECTION("slices are bounds checked") {
    BufferSource source{ByteArray(16)};
    const std::byte* data = nullptr;
    requireOk(source.slice(8, 8, &data));
    REQUIRE(data == source.data() + 8);
    REQUIRE(source.slice(9, 8, &data).code == StatusCode::ReadFailed);
    REQUIRE(source.slice(17, 0, &data).code == StatusCode::ReadFailed);
  }

  SECTION("missing files fail to open") {
    ByteSourcePtr source;
    REQUIRE(OpenByteSource("/nonexistent/chronicle.log", true, &source).code ==
            StatusCode::OpenFailed);
    REQUIRE(OpenByteSource("/nonexistent/chronicle.log", false, &source).code ==
            StatusCode::OpenFailed);
    REQUIRE(source == nullptr);
  }

  SECTION("files are mapped or read") {
    const auto bytes = TwoChannelLog();
    const auto path = std::filesystem::temp_directory_path() / "chronicle_byte_source_test.log";
    {
      std::ofstream out{path, std::ios::binary};
      out.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
    }

    for (const bool preferMemoryMap : {true, false}) {
      CAPTURE(preferMemoryMap);
      ByteSourcePtr source;
      requireOk(OpenByteSource(path.string(), preferMemoryMap, &source));
      REQUIRE(source->size() == bytes.size());
      REQUIRE(std::equal(bytes.begin(), bytes.end(), source->data()));

      ReaderOptions options;
      options.preferMemoryMap = preferMemoryMap;
      LogReader reader{options};
      requireOk(reader.open(path.string()));
      REQUIRE(reader.messages().size() == 5);
    }
    std::filesystem::remove(path);
  }

  SECTION("empty files map to empty sources") {
    const auto path = std::filesystem::temp_directory_path() / "chronicle_empty_source_test.log";
    std::ofstream{path, std::ios::binary}.close();

    std::shared_ptr<MappedFileSource> mapped;
    requireOk(MappedFileSource::Map(path.string(), &mapped));
    REQUIRE(mapped->size() == 0);
    const std::byte* data = nullptr;
    REQUIRE(mapped->slice(0, 1, &data).code == StatusCode::ReadFailed);
    std::filesystem::remove(path);
  }
}

TEST_CASE("RecordCodec", "[codec]") {
  SECTION("header and footer") {
    const auto bytes = TwoChannelLog();
    BufferSource source{bytes};
    Header header;
    ByteOffset dataStart = 0;
    requireOk(RecordCodec::ReadHeader(source, &header, &dataStart));
    REQUIRE(header.profile == "test");
    REQUIRE(header.library == "chronicle-test");
    REQUIRE(dataStart == sizeof(Magic) + internal::RecordPrefixLength + 4 + 4 + 4 + 14);

    Footer footer;
    requireOk(RecordCodec::ReadFooter(source, &footer));
    REQUIRE(footer.summaryStart > dataStart);
    REQUIRE(footer.summaryOffsetStart > footer.summaryStart);
    REQUIRE(footer.summaryCrc != 0);
  }

  SECTION("files that are too small") {
    BufferSource source{ByteArray(4)};
    Footer footer;
    REQUIRE(RecordCodec::ReadFooter(source, &footer).code == StatusCode::FileTooSmall);
  }

  SECTION("bad magic") {
    auto bytes = TwoChannelLog();
    bytes.back() = std::byte('X');
    BufferSource trailing{bytes};
    Footer footer;
    REQUIRE(RecordCodec::ReadFooter(trailing, &footer).code == StatusCode::MagicMismatch);

    bytes = TwoChannelLog();
    bytes[1] = std::byte('X');
    BufferSource leading{bytes};
    Header header;
    ByteOffset dataStart = 0;
    REQUIRE(RecordCodec::ReadHeader(leading, &header, &dataStart).code ==
            StatusCode::MagicMismatch);
  }

  SECTION("records longer than the input") {
    const std::array<std::byte, 10> input = {std::byte(OpCode::Message), std::byte(0xff)};
    Record record;
    REQUIRE(RecordCodec::ReadRecord(input.data(), input.size(), 0, &record).code ==
            StatusCode::InvalidRecord);
    REQUIRE(RecordCodec::ReadRecord(input.data(), input.size(), 4, &record).code ==
            StatusCode::InvalidFile);
  }
}

TEST_CASE("ChunkDecompressor::decompress()", "[codec]") {
  const ByteArray records = {std::byte(1), std::byte(2), std::byte(3), std::byte(4)};
  ChunkDecompressor decompressor;
  ByteArray output;

  SECTION("uncompressed chunks are copied") {
    requireOk(decompressor.decompress(PlainChunk(records), &output));
    REQUIRE(output == records);
  }

  SECTION("unknown compression") {
    auto chunk = PlainChunk(records);
    chunk.compression = "brotli";
    REQUIRE(decompressor.decompress(chunk, &output).code == StatusCode::UnrecognizedCompression);
  }

  SECTION("size mismatch") {
    auto chunk = PlainChunk(records);
    chunk.uncompressedSize = 5;
    REQUIRE(decompressor.decompress(chunk, &output).code ==
            StatusCode::DecompressionSizeMismatch);
  }

  SECTION("crc mismatch unless validation is off or no crc is recorded") {
    auto chunk = PlainChunk(records);
    chunk.uncompressedCrc += 1;
    REQUIRE(decompressor.decompress(chunk, &output).code == StatusCode::CrcMismatch);
    REQUIRE(output.empty());
    requireOk(decompressor.decompress(chunk, &output, false));
    chunk.uncompressedCrc = 0;
    requireOk(decompressor.decompress(chunk, &output));
  }
}

TEST_CASE("Summary::Load()", "[summary]") {
  SECTION("complete summary") {
    const auto bytes = TwoChannelLog();
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    REQUIRE(summary != nullptr);

    REQUIRE(summary->schemas().size() == 1);
    REQUIRE(summary->schema(1)->name == "Point");
    REQUIRE(summary->channels().size() == 2);
    REQUIRE(summary->channel(0)->topic == "/points");
    REQUIRE(summary->channel(0)->schemaId == 1);
    REQUIRE(summary->channel(1)->messageEncoding == "json");
    REQUIRE(summary->channel(7) == nullptr);

    REQUIRE(summary->chunkIndexes().size() == 1);
    const auto& chunkIndex = summary->chunkIndexes()[0];
    REQUIRE(chunkIndex.messageStartTime == 10);
    REQUIRE(chunkIndex.messageEndTime == 30);
    REQUIRE(chunkIndex.messageIndexOffsets.size() == 2);

    REQUIRE(summary->statistics().has_value());
    const auto& stats = *summary->statistics();
    REQUIRE(stats.messageCount == 5);
    REQUIRE(stats.messageStartTime == 10);
    REQUIRE(stats.messageEndTime == 30);
    REQUIRE(stats.channelMessageCounts.at(0) == 3);
    REQUIRE(stats.channelMessageCounts.at(1) == 2);
  }

  SECTION("no summary section") {
    LogBuilderOptions options;
    options.noSummary = true;
    const auto bytes = TwoChannelLog(options);
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    REQUIRE(summary == nullptr);
  }

  SECTION("no summary offsets or statistics") {
    LogBuilderOptions options;
    options.noSummaryOffsets = true;
    options.noStatistics = true;
    const auto bytes = TwoChannelLog(options);
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    REQUIRE(summary->chunkIndexes().size() == 1);
    REQUIRE_FALSE(summary->statistics().has_value());
  }

  SECTION("corrupt summary fails the crc check") {
    auto bytes = TwoChannelLog();
    CorruptSummary(bytes);
    BufferSource source{bytes};
    SummaryPtr summary;
    REQUIRE(Summary::Load(source, &summary).code == StatusCode::CrcMismatch);
    REQUIRE(summary == nullptr);
  }

  SECTION("a summary without a crc is not checked") {
    LogBuilderOptions options;
    options.noSummaryCrc = true;
    const auto bytes = TwoChannelLog(options);
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    REQUIRE(summary->footer().summaryCrc == 0);
  }
}

TEST_CASE("Summary::messageIndex()", "[summary]") {
  SECTION("entries are sorted by time even when written out of order") {
    LogBuilder builder;
    builder.addChannel(4, "/unsorted");
    builder.addMessage(4, 30);
    builder.addMessage(4, 10);
    builder.addMessage(4, 20);
    const auto bytes = builder.finish();

    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    MessageIndexMap indexes;
    requireOk(summary->messageIndex(source, summary->chunkIndexes()[0], std::nullopt, &indexes));
    REQUIRE(indexes.size() == 1);
    const auto& entries = indexes.at(4);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].logTime == 10);
    REQUIRE(entries[1].logTime == 20);
    REQUIRE(entries[2].logTime == 30);
  }

  SECTION("channels can be selected") {
    const auto bytes = TwoChannelLog();
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    MessageIndexMap indexes;
    requireOk(summary->messageIndex(source, summary->chunkIndexes()[0],
                                    std::unordered_set<ChannelId>{1}, &indexes));
    REQUIRE(indexes.size() == 1);
    REQUIRE(indexes.at(1).size() == 2);
  }

  SECTION("chunks written without message indexes") {
    LogBuilderOptions options;
    options.noMessageIndex = true;
    const auto bytes = TwoChannelLog(options);
    BufferSource source{bytes};
    SummaryPtr summary;
    requireOk(Summary::Load(source, &summary));
    MessageIndexMap indexes;
    REQUIRE(summary->messageIndex(source, summary->chunkIndexes()[0], std::nullopt, &indexes)
              .code == StatusCode::IndexUnavailable);
    REQUIRE(indexes.empty());
  }
}

TEST_CASE("ReadMessageAt()", "[codec]") {
  const auto bytes = TwoChannelLog();
  BufferSource source{bytes};
  SummaryPtr summary;
  requireOk(Summary::Load(source, &summary));
  const auto& chunkIndex = summary->chunkIndexes()[0];

  ChunkDecompressor decompressor;
  ByteArray uncompressed;
  requireOk(LoadChunk(source, chunkIndex, decompressor, &uncompressed));
  MessageIndexMap indexes;
  requireOk(summary->messageIndex(source, chunkIndex, std::nullopt, &indexes));

  SECTION("index entries locate their messages") {
    const auto entry = indexes.at(1)[1];
    Message message;
    requireOk(ReadMessageAt(uncompressed, entry, &message));
    REQUIRE(message.channelId == 1);
    REQUIRE(message.logTime == 25);
    REQUIRE(std::string_view(reinterpret_cast<const char*>(message.data), message.dataSize) ==
            "d");
  }

  SECTION("entries that do not point at a message") {
    Message message;
    REQUIRE(ReadMessageAt(uncompressed, MessageIndexEntry{10, 1}, &message).code ==
            StatusCode::InvalidChunkOffset);
    REQUIRE(ReadMessageAt(uncompressed, MessageIndexEntry{10, uncompressed.size() + 8}, &message)
              .code == StatusCode::InvalidChunkOffset);
    auto entry = indexes.at(0)[0];
    entry.logTime += 1;
    REQUIRE(ReadMessageAt(uncompressed, entry, &message).code == StatusCode::InvalidChunkOffset);
  }
}

TEST_CASE("LogReader::open()", "[reader]") {
  SECTION("complete logs") {
    LogReader reader;
    requireOk(reader.open(TwoChannelLog()));
    REQUIRE(reader.isOpen());
    REQUIRE(reader.header()->library == "chronicle-test");
    REQUIRE(reader.footer().has_value());
    REQUIRE(reader.hasSummary());
  }

  SECTION("empty and garbage input") {
    LogReader reader;
    REQUIRE(reader.open(ByteArray{}).code == StatusCode::FileTooSmall);
    REQUIRE_FALSE(reader.isOpen());
    REQUIRE(reader.open(ByteArray(64, std::byte(0x42))).code == StatusCode::MagicMismatch);
    REQUIRE_FALSE(reader.isOpen());
  }

  SECTION("closed readers return sentinels") {
    LogReader reader;
    REQUIRE(reader.messages().empty());
    REQUIRE(reader.lastError().code == StatusCode::NotOpen);
    reader.clearLastError();
    REQUIRE(reader.chunkCount() == 0);
    REQUIRE(reader.firstMessageTime() == -1);
    REQUIRE(reader.readSummary().code == StatusCode::NotOpen);
    REQUIRE(reader.query().messageCountTotal() == -1);
    REQUIRE(reader.lastError().code == StatusCode::NotOpen);

    requireOk(reader.open(TwoChannelLog()));
    reader.close();
    REQUIRE_FALSE(reader.isOpen());
    REQUIRE(reader.source() == nullptr);
    REQUIRE(reader.attachments().empty());
  }

  SECTION("a corrupt summary is reported once and linear reads still work") {
    auto bytes = TwoChannelLog();
    CorruptSummary(bytes);

    std::vector<StatusCode> problems;
    LogReader reader;
    reader.setProblemCallback([&](const Status& status) {
      problems.push_back(status.code);
    });
    requireOk(reader.open(std::move(bytes)));
    REQUIRE(reader.readSummary().code == StatusCode::CrcMismatch);
    REQUIRE(reader.readSummary().code == StatusCode::CrcMismatch);
    REQUIRE_FALSE(reader.hasSummary());
    REQUIRE(problems == std::vector<StatusCode>{StatusCode::CrcMismatch});
    REQUIRE(reader.messages().size() == 5);
  }
}

TEST_CASE("LogReader::messages()", "[reader]") {
  SECTION("storage order with channels and schemas resolved") {
    LogReader reader;
    requireOk(reader.open(TwoChannelLog()));
    const auto messages = reader.messages();
    requireOk(reader.lastError());
    REQUIRE(Times(messages) == std::vector<Timestamp>{10, 15, 20, 25, 30});
    REQUIRE(Payload(messages[3]->data) == "d");
    REQUIRE(messages[0]->channel->topic == "/points");
    REQUIRE(messages[0]->schema->name == "Point");
    REQUIRE(messages[1]->channelId() == 1);
    REQUIRE(messages[1]->schema == nullptr);
  }

  SECTION("storage order is kept for unsorted chunks") {
    LogBuilder builder;
    builder.addChannel(1, "/a");
    builder.addMessage(1, 30);
    builder.addMessage(1, 10);
    builder.closeChunk();
    builder.addMessage(1, 5);
    LogReader reader;
    requireOk(reader.open(builder.finish()));
    REQUIRE(Times(reader.messages()) == std::vector<Timestamp>{30, 10, 5});
  }

  SECTION("logs without a summary") {
    LogBuilderOptions options;
    options.noSummary = true;
    LogReader reader;
    requireOk(reader.open(TwoChannelLog(options)));
    REQUIRE_FALSE(reader.hasSummary());
    REQUIRE(reader.messages().size() == 5);

    const auto raw = reader.rawMessages();
    REQUIRE(raw.size() == 5);
    REQUIRE(raw[4].channelId == 0);
    REQUIRE(raw[4].logTime == 30);
    REQUIRE(Payload(raw[4].data) == "e");
  }

  SECTION("chunk crc is validated unless disabled") {
    auto bytes = TwoChannelLog();
    {
      LogReader reader;
      requireOk(reader.open(bytes));
      const auto chunkIndex = reader.chunkIndexes().at(0);
      // The last byte of the chunk is the payload of the last message
      bytes[chunkIndex.chunkStartOffset + chunkIndex.chunkLength - 1] = std::byte('z');
    }

    LogReader strict;
    requireOk(strict.open(bytes));
    REQUIRE(strict.rawMessages().empty());
    REQUIRE(strict.lastError().code == StatusCode::CrcMismatch);

    ReaderOptions options;
    options.validateChunkCrc = false;
    LogReader lenient{options};
    requireOk(lenient.open(bytes));
    const auto raw = lenient.rawMessages();
    REQUIRE(raw.size() == 5);
    REQUIRE(Payload(raw[4].data) == "z");
  }
}

TEST_CASE("ReaderOptions::ignoreEndMagic", "[reader]") {
  LogBuilderOptions builderOptions;
  builderOptions.truncated = true;
  auto bytes = TwoChannelLog(builderOptions);

  LogReader strict;
  REQUIRE(strict.open(bytes).code == StatusCode::MagicMismatch);

  ReaderOptions options;
  options.ignoreEndMagic = true;
  LogReader reader{options};

  SECTION("logs without a footer") {
    requireOk(reader.open(bytes));
    REQUIRE_FALSE(reader.footer().has_value());
    REQUIRE_FALSE(reader.hasSummary());
    REQUIRE(reader.messages().size() == 5);
    requireOk(reader.lastError());
  }

  SECTION("a partial trailing record ends the scan quietly") {
    bytes.resize(bytes.size() - 3);
    requireOk(reader.open(bytes));
    REQUIRE(reader.messages().size() == 5);
    requireOk(reader.lastError());
  }

  SECTION("a partial chunk yields nothing") {
    // The chunk is the first record after the header
    Header header;
    ByteOffset dataStart = 0;
    requireOk(RecordCodec::ReadHeader(BufferSource{bytes}, &header, &dataStart));
    bytes.resize(dataStart + 30);
    requireOk(reader.open(bytes));
    REQUIRE(reader.messages().empty());
    requireOk(reader.lastError());
  }

  SECTION("indexed features are unavailable") {
    requireOk(reader.open(bytes));
    REQUIRE(reader.chunkCount() == 0);
    REQUIRE(reader.lastError().code == StatusCode::SummaryUnavailable);
    auto iterator = reader.messageIterator();
    REQUIRE_FALSE(iterator.hasNext());
    REQUIRE(iterator.state() == MessageIterator::State::Unavailable);
  }
}

TEST_CASE("LogReader attachments and metadata", "[reader]") {
  LogBuilder builder;
  builder.addChannel(1, "/a");
  builder.addMessage(1, 10, "x");
  builder.addAttachment("calibration.yaml", "application/yaml", 5, "fx: 1");
  builder.addMetadata("robot", {{"id", "7"}, {"site", "lab"}});
  builder.addMessage(1, 20, "y");

  LogReader reader;
  requireOk(reader.open(builder.finish()));

  const auto attachments = reader.attachments();
  REQUIRE(attachments.size() == 1);
  REQUIRE(attachments[0].name == "calibration.yaml");
  REQUIRE(attachments[0].mediaType == "application/yaml");
  REQUIRE(attachments[0].logTime == 5);
  REQUIRE(Payload(attachments[0].data) == "fx: 1");

  const auto metadata = reader.metadataEntries();
  REQUIRE(metadata.size() == 1);
  REQUIRE(metadata[0].name == "robot");
  REQUIRE(metadata[0].metadata.at("id") == "7");
  REQUIRE(metadata[0].metadata.at("site") == "lab");

  REQUIRE(reader.chunkCount() == 2);
  REQUIRE(reader.messages().size() == 2);
  requireOk(reader.lastError());
}

TEST_CASE("LogReader index access", "[reader]") {
  LogReader reader;
  requireOk(reader.open(MultiChunkLog()));

  SECTION("statistics") {
    REQUIRE(reader.firstMessageTime() == 0);
    REQUIRE(reader.lastMessageTime() == 290);
    REQUIRE(reader.duration() == 290);
  }

  SECTION("chunk indexes and message indexes") {
    REQUIRE(reader.chunkCount() == 3);
    const auto chunkIndexes = reader.chunkIndexes();
    REQUIRE(chunkIndexes[1].messageStartTime == 100);
    REQUIRE(chunkIndexes[1].messageEndTime == 190);

    const auto indexes = reader.messageIndexesForChunk(1);
    REQUIRE(indexes.size() == 3);
    REQUIRE(indexes.at(1).size() == 4);
    REQUIRE(indexes.at(2).size() == 3);

    const auto message = reader.seekMessage(1, indexes.at(2)[1]);
    REQUIRE(message != nullptr);
    REQUIRE(message->logTime == 140);
    REQUIRE(message->channel->topic == "/gps");
    REQUIRE(Payload(message->data) == "140");
  }

  SECTION("out of range chunks") {
    REQUIRE(reader.messageIndexesForChunk(3).empty());
    REQUIRE(reader.lastError().code == StatusCode::InvalidArgument);
    reader.clearLastError();
    REQUIRE(reader.seekMessage(9, MessageIndexEntry{0, 0}) == nullptr);
    REQUIRE(reader.lastError().code == StatusCode::InvalidArgument);
  }

  SECTION("no statistics") {
    LogBuilderOptions options;
    options.noStatistics = true;
    requireOk(reader.open(MultiChunkLog(options)));
    REQUIRE(reader.duration() == -1);
    REQUIRE(reader.lastError().code == StatusCode::SummaryUnavailable);
  }
}

#ifndef CHRONICLE_COMPRESSION_NO_LZ4
TEST_CASE("LZ4 compression", "[reader][codec]") {
  LogBuilderOptions options;
  options.compression = Compression::Lz4;
  LogReader reader;
  requireOk(reader.open(MultiChunkLog(options)));
  REQUIRE(reader.chunkIndexes()[0].compression == "lz4");
  REQUIRE(reader.messages().size() == 30);

  auto iterator = reader.messageIterator();
  REQUIRE(Drain(iterator).size() == 30);
  REQUIRE(reader.query().messageCountInRange(100, 199) == 10);
  requireOk(reader.lastError());
}
#endif

#ifndef CHRONICLE_COMPRESSION_NO_ZSTD
TEST_CASE("zstd compression", "[reader][codec]") {
  LogBuilderOptions options;
  options.compression = Compression::Zstd;
  LogReader reader;
  requireOk(reader.open(MultiChunkLog(options)));
  REQUIRE(reader.chunkIndexes()[0].compression == "zstd");
  REQUIRE(reader.messages().size() == 30);

  auto iterator = reader.messageIterator();
  REQUIRE(Drain(iterator).size() == 30);
  REQUIRE(reader.query().messagesForChannel(3).size() == 9);
  requireOk(reader.lastError());
}
#endif
