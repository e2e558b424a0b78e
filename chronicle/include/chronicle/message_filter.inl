namespace chronicle {

// MessageFilter ///////////////////////////////////////////////////////////////

bool MessageFilter::matchesTime(Timestamp logTime) const {
  return logTime >= startTime && logTime <= endTime;
}

bool MessageFilter::matchesChannel(ChannelId channelId) const {
  return !channels || channels->count(channelId) > 0;
}

bool MessageFilter::matches(const Message& message) const {
  return matchesTime(message.logTime) && matchesChannel(message.channelId);
}

bool MessageFilter::chunkMightMatch(const ChunkIndex& chunkIndex) const {
  if (!chunkIndex.overlaps(startTime, endTime)) {
    return false;
  }
  if (!channels || chunkIndex.messageIndexOffsets.empty()) {
    // Without message indexes the chunk's channels are unknown until it is decoded
    return true;
  }
  for (const auto& [channelId, _] : chunkIndex.messageIndexOffsets) {
    if (channels->count(channelId) > 0) {
      return true;
    }
  }
  return false;
}

// Free functions //////////////////////////////////////////////////////////////

Status ForEachChunkMessage(const IByteSource& source, const ChunkIndex& chunkIndex,
                           const MessageFilter& filter, ChunkDecompressor& decompressor,
                           ByteArray& scratch, const ChunkMessageCallback& callback,
                           bool validateCrc) {
  if (auto status = LoadChunk(source, chunkIndex, decompressor, &scratch, validateCrc);
      !status.ok()) {
    return status;
  }

  ChunkMessageReader reader{scratch.data(), scratch.size()};
  Message message;
  ByteOffset offset = 0;
  while (reader.next(&message, &offset)) {
    if (filter.matches(message)) {
      callback(message, offset);
    }
  }
  return reader.status();
}

Status ReadChunkMessages(const IByteSource& source, const Summary& summary,
                         const ChunkIndex& chunkIndex, const MessageFilter& filter,
                         ChunkDecompressor& decompressor, ByteArray& scratch,
                         std::vector<LogMessagePtr>* output, bool validateCrc) {
  Status resolveStatus;
  auto status = ForEachChunkMessage(
    source, chunkIndex, filter, decompressor, scratch,
    [&](const Message& message, ByteOffset) {
      if (!resolveStatus.ok()) {
        return;
      }
      LogMessagePtr logMessage;
      resolveStatus = summary.resolve(message, &logMessage);
      if (resolveStatus.ok()) {
        output->push_back(std::move(logMessage));
      }
    },
    validateCrc);
  if (!resolveStatus.ok()) {
    return resolveStatus;
  }
  return status;
}

}  // namespace chronicle
