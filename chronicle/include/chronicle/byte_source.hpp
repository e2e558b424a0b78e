#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <memory>
#include <string_view>

namespace chronicle {

/**
 * @brief An immutable, random-access view over the bytes of one log. Implementations are
 * created once when a log is opened and shared read-only between the summary, iterators and
 * query results; nothing mutates a source after construction.
 */
class CHRONICLE_PUBLIC IByteSource {
public:
  virtual ~IByteSource() = default;

  /**
   * @brief Total size of the source in bytes.
   */
  virtual uint64_t size() const = 0;

  /**
   * @brief Pointer to the first byte. Valid for the lifetime of the source.
   */
  virtual const std::byte* data() const = 0;

  /**
   * @brief Borrow `length` bytes starting at `offset`.
   *
   * @return ReadFailed if the range extends past the end of the source.
   */
  Status slice(uint64_t offset, uint64_t length, const std::byte** output) const;
};

using ByteSourcePtr = std::shared_ptr<const IByteSource>;

/**
 * @brief A byte source holding its own copy of the log, either handed over by the caller or
 * read from a file.
 */
class CHRONICLE_PUBLIC BufferSource final : public IByteSource {
public:
  explicit BufferSource(ByteArray bytes);

  uint64_t size() const override;
  const std::byte* data() const override;

private:
  ByteArray bytes_;
};

/**
 * @brief A read-only memory mapping of a whole file. The mapping is released when the
 * source is destroyed.
 */
class CHRONICLE_PUBLIC MappedFileSource final : public IByteSource {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  // Only reachable through Map()
  MappedFileSource(PrivateTag, const std::byte* data, uint64_t size);
  ~MappedFileSource() override;

  MappedFileSource(const MappedFileSource&) = delete;
  MappedFileSource& operator=(const MappedFileSource&) = delete;

  /**
   * @brief Map `path` into memory.
   *
   * @return OpenFailed if the file cannot be opened or mapped on this platform.
   */
  static Status Map(std::string_view path, std::shared_ptr<MappedFileSource>* output);

  uint64_t size() const override;
  const std::byte* data() const override;

private:
  const std::byte* data_;
  uint64_t size_;
};

/**
 * @brief Read a whole file into an owned buffer.
 */
CHRONICLE_PUBLIC
Status ReadFileSource(std::string_view path, ByteSourcePtr* output);

/**
 * @brief Acquire the bytes of the file at `path`: map it when `preferMemoryMap` is set and
 * mapping succeeds, otherwise read it into memory.
 */
CHRONICLE_PUBLIC
Status OpenByteSource(std::string_view path, bool preferMemoryMap, ByteSourcePtr* output);

}  // namespace chronicle

#ifdef CHRONICLE_IMPLEMENTATION
#  include "byte_source.inl"
#endif
