#include "internal.hpp"
#include <cstdio>
#include <string>

#if defined __unix__ || defined __APPLE__
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <unistd.h>
#  define CHRONICLE_HAVE_MMAP 1
#endif

namespace chronicle {

// IByteSource /////////////////////////////////////////////////////////////////

Status IByteSource::slice(uint64_t offset, uint64_t length, const std::byte** output) const {
  const uint64_t total = size();
  if (offset > total || length > total - offset) {
    const auto msg = internal::StrCat("cannot read ", length, " bytes at offset ", offset,
                                      " from a source of ", total, " bytes");
    return Status{StatusCode::ReadFailed, msg};
  }
  *output = data() + offset;
  return StatusCode::Success;
}

// BufferSource ////////////////////////////////////////////////////////////////

BufferSource::BufferSource(ByteArray bytes)
    : bytes_(std::move(bytes)) {}

uint64_t BufferSource::size() const {
  return bytes_.size();
}

const std::byte* BufferSource::data() const {
  return bytes_.data();
}

// MappedFileSource ////////////////////////////////////////////////////////////

MappedFileSource::MappedFileSource(PrivateTag, const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

MappedFileSource::~MappedFileSource() {
#ifdef CHRONICLE_HAVE_MMAP
  if (data_ != nullptr && size_ > 0) {
    ::munmap(const_cast<std::byte*>(data_), size_t(size_));
  }
#endif
}

Status MappedFileSource::Map(std::string_view path, std::shared_ptr<MappedFileSource>* output) {
#ifdef CHRONICLE_HAVE_MMAP
  const std::string pathStr{path};
  const int fd = ::open(pathStr.c_str(), O_RDONLY);
  if (fd < 0) {
    const auto msg = internal::StrCat("failed to open \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }

  struct stat info {};
  if (::fstat(fd, &info) != 0) {
    ::close(fd);
    const auto msg = internal::StrCat("failed to stat \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }

  const uint64_t fileSize = uint64_t(info.st_size);
  if (fileSize == 0) {
    // mmap rejects zero-length mappings; an empty file maps to an empty source
    ::close(fd);
    *output = std::make_shared<MappedFileSource>(PrivateTag{}, nullptr, 0);
    return StatusCode::Success;
  }

  void* mapped = ::mmap(nullptr, size_t(fileSize), PROT_READ, MAP_PRIVATE, fd, 0);
  ::close(fd);
  if (mapped == MAP_FAILED) {
    const auto msg = internal::StrCat("failed to map \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }
  *output = std::make_shared<MappedFileSource>(
    PrivateTag{}, static_cast<const std::byte*>(mapped), fileSize);
  return StatusCode::Success;
#else
  (void)output;
  const auto msg = internal::StrCat("memory mapping unavailable for \"", path, "\"");
  return Status{StatusCode::OpenFailed, msg};
#endif
}

uint64_t MappedFileSource::size() const {
  return size_;
}

const std::byte* MappedFileSource::data() const {
  return data_;
}

// Free functions //////////////////////////////////////////////////////////////

Status ReadFileSource(std::string_view path, ByteSourcePtr* output) {
  const std::string pathStr{path};
  std::FILE* file = std::fopen(pathStr.c_str(), "rb");
  if (!file) {
    const auto msg = internal::StrCat("failed to open \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }

  ByteArray bytes;
  std::byte chunk[64 * 1024];
  size_t bytesRead = 0;
  while ((bytesRead = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
    bytes.insert(bytes.end(), chunk, chunk + bytesRead);
  }
  const bool failed = std::ferror(file) != 0;
  std::fclose(file);
  if (failed) {
    const auto msg = internal::StrCat("failed to read \"", path, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }

  *output = std::make_shared<BufferSource>(std::move(bytes));
  return StatusCode::Success;
}

Status OpenByteSource(std::string_view path, bool preferMemoryMap, ByteSourcePtr* output) {
  if (preferMemoryMap) {
    std::shared_ptr<MappedFileSource> mapped;
    if (MappedFileSource::Map(path, &mapped).ok()) {
      *output = std::move(mapped);
      return StatusCode::Success;
    }
    // Mapping can fail on special files and some filesystems; reading still works there
  }
  return ReadFileSource(path, output);
}

}  // namespace chronicle
