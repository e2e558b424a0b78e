#pragma once

#include "types.hpp"
#include <cstring>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace chronicle {

namespace internal {

constexpr uint64_t RecordPrefixLength = /* opcode */ 1 + /* record length */ 8;
constexpr uint64_t MinHeaderLength = /* magic bytes */ sizeof(Magic) + RecordPrefixLength +
                                     /* profile length */ 4 +
                                     /* library length */ 4;
constexpr uint64_t FooterLength = RecordPrefixLength +
                                  /* summary start */ 8 +
                                  /* summary offset start */ 8 +
                                  /* summary crc */ 4 +
                                  /* magic bytes */ sizeof(Magic);

inline std::string ToHex(uint8_t byte) {
  std::string result(2, '\0');
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using chronicle::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline std::string MagicToHex(const std::byte* data) {
  std::string result;
  for (size_t i = 0; i < sizeof(Magic); ++i) {
    result += ToHex(data[i]);
  }
  return result;
}

inline std::optional<Compression> ParseCompression(std::string_view compression) {
  if (compression.empty()) {
    return Compression::None;
  } else if (compression == "lz4") {
    return Compression::Lz4;
  } else if (compression == "zstd") {
    return Compression::Zstd;
  }
  return std::nullopt;
}

inline std::string CompressionString(Compression compression) {
  switch (compression) {
    case Compression::Lz4:
      return "lz4";
    case Compression::Zstd:
      return "zstd";
    case Compression::None:
    default:
      return std::string{};
  }
}

inline uint16_t ParseUint16(const std::byte* data) {
  return uint16_t(data[0]) | (uint16_t(data[1]) << 8);
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(ParseUint32(data)) | (uint64_t(ParseUint32(data + 4)) << 32);
}

/**
 * @brief Bounds-checked little-endian reader over one record body.
 *
 * The first out-of-bounds read latches an InvalidRecord status naming the record type and
 * field; every later read is a no-op that leaves its output untouched, so a parser can read
 * all fields and check `status()` once at the end.
 */
class ByteCursor {
public:
  ByteCursor(const std::byte* data, uint64_t size, std::string_view recordName)
      : data_(data)
      , size_(size)
      , recordName_(recordName) {}

  explicit ByteCursor(const Record& record)
      : ByteCursor(record.data, record.dataSize, OpCodeString(record.opcode)) {}

  void read(uint8_t* out, const char* field) {
    if (require_(1, field)) {
      *out = uint8_t(data_[pos_]);
      pos_ += 1;
    }
  }

  void read(uint16_t* out, const char* field) {
    if (require_(2, field)) {
      *out = ParseUint16(data_ + pos_);
      pos_ += 2;
    }
  }

  void read(uint32_t* out, const char* field) {
    if (require_(4, field)) {
      *out = ParseUint32(data_ + pos_);
      pos_ += 4;
    }
  }

  void read(uint64_t* out, const char* field) {
    if (require_(8, field)) {
      *out = ParseUint64(data_ + pos_);
      pos_ += 8;
    }
  }

  void read(std::string* out, const char* field) {
    uint32_t length = 0;
    read(&length, field);
    if (require_(length, field)) {
      out->assign(reinterpret_cast<const char*>(data_ + pos_), length);
      pos_ += length;
    }
  }

  /// Reads a uint32 length-prefixed byte array.
  void read(ByteArray* out, const char* field) {
    uint32_t length = 0;
    read(&length, field);
    if (require_(length, field)) {
      out->assign(data_ + pos_, data_ + pos_ + length);
      pos_ += length;
    }
  }

  /// Borrows `length` bytes without copying.
  void view(uint64_t length, const std::byte** out, const char* field) {
    if (require_(length, field)) {
      *out = data_ + pos_;
      pos_ += length;
    }
  }

  /// Reads a uint32 byte-length-prefixed map of length-prefixed key/value strings.
  void read(KeyValueMap* out, const char* field) {
    uint32_t byteLength = 0;
    read(&byteLength, field);
    if (!require_(byteLength, field)) {
      return;
    }
    ByteCursor entries{data_ + pos_, byteLength, recordName_};
    out->clear();
    while (entries.ok() && entries.remaining() > 0) {
      std::string key, value;
      entries.read(&key, field);
      entries.read(&value, field);
      if (entries.ok()) {
        out->emplace(std::move(key), std::move(value));
      }
    }
    if (!entries.ok()) {
      status_ = entries.status();
      return;
    }
    pos_ += byteLength;
  }

  /**
   * @brief Reads a uint32 byte-length-prefixed array of fixed-size entries, returning a
   * cursor over the entries. Fails when the byte length is not a multiple of `entrySize`.
   */
  ByteCursor array(uint64_t entrySize, const char* field) {
    uint32_t byteLength = 0;
    read(&byteLength, field);
    if (ok() && byteLength % entrySize != 0) {
      status_ = Status{StatusCode::InvalidRecord,
                       StrCat("invalid ", recordName_, ".", field, " length: ", byteLength)};
    }
    if (!require_(byteLength, field)) {
      return ByteCursor{nullptr, 0, recordName_};
    }
    ByteCursor entries{data_ + pos_, byteLength, recordName_};
    pos_ += byteLength;
    return entries;
  }

  uint64_t position() const {
    return pos_;
  }

  uint64_t remaining() const {
    return size_ - pos_;
  }

  bool ok() const {
    return status_.ok();
  }

  const Status& status() const {
    return status_;
  }

private:
  const std::byte* data_;
  uint64_t size_;
  uint64_t pos_ = 0;
  std::string_view recordName_;
  Status status_;

  bool require_(uint64_t length, const char* field) {
    if (!status_.ok()) {
      return false;
    }
    if (length > size_ - pos_) {
      status_ = Status{StatusCode::InvalidRecord,
                       StrCat("cannot read ", recordName_, ".", field, ": need ", length,
                              " bytes at position ", pos_, ", ", size_ - pos_, " remaining")};
      return false;
    }
    return true;
  }
};

}  // namespace internal

}  // namespace chronicle
