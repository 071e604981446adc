#include "dedupgen/source/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "dedupgen/core/error.hpp"
#include "dedupgen/random/random_source.hpp"

namespace dedupgen {
namespace {

constexpr uint64_t kGolden = 0x9e3779b97f4a7c15ULL;

void check_range(uint64_t offset, size_t size, uint64_t length) {
  if (offset > length || size > length - offset) {
    throw Error{ErrorCode::SourceError,
                std::format("read of {} bytes at offset {} exceeds source length {}",
                            size, offset, length)};
  }
}

void pread_all(int fd, std::byte* data, size_t size, uint64_t offset) {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::pread(fd, data + done, size - done,
                              static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw Error{ErrorCode::SourceError, std::strerror(errno)};
    }
    if (n == 0) {
      throw Error{ErrorCode::SourceError,
                  std::format("unexpected EOF at offset {}", offset + done)};
    }
    done += static_cast<size_t>(n);
  }
}

class FileSource final : public IByteSource {
 public:
  FileSource(int fd, uint64_t length) : fd_(fd), length_(length) {}

  ~FileSource() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  uint64_t length() const noexcept override { return length_; }

  void read_at(uint64_t offset, std::span<std::byte> out) override {
    check_range(offset, out.size(), length_);
    pread_all(fd_, out.data(), out.size(), offset);
  }

 private:
  int fd_{-1};
  uint64_t length_{0};
};

class MemorySource final : public IByteSource {
 public:
  explicit MemorySource(std::vector<std::byte> bytes) : bytes_(std::move(bytes)) {}

  uint64_t length() const noexcept override { return bytes_.size(); }

  void read_at(uint64_t offset, std::span<std::byte> out) override {
    check_range(offset, out.size(), bytes_.size());
    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(offset), out.size(), out.begin());
  }

 private:
  std::vector<std::byte> bytes_;
};

class ProceduralSource final : public IByteSource {
 public:
  ProceduralSource(uint64_t length, uint64_t seed) : length_(length), key_(mix64(seed)) {}

  uint64_t length() const noexcept override { return length_; }

  void read_at(uint64_t offset, std::span<std::byte> out) override {
    check_range(offset, out.size(), length_);
    size_t i = 0;
    uint64_t pos = offset;
    while (i < out.size()) {
      const uint64_t word = word_at(pos / sizeof(uint64_t));
      const size_t lane = static_cast<size_t>(pos % sizeof(uint64_t));
      const size_t take = std::min(sizeof(uint64_t) - lane, out.size() - i);
      std::memcpy(out.data() + i, reinterpret_cast<const std::byte*>(&word) + lane, take);
      i += take;
      pos += take;
    }
  }

 private:
  uint64_t word_at(uint64_t index) const noexcept { return mix64(key_ ^ (index * kGolden)); }

  uint64_t length_;
  uint64_t key_;
};

}  // namespace

std::unique_ptr<IByteSource> make_file_source(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw Error{ErrorCode::SourceError,
                std::format("open for read failed: {}: {}", path.string(), std::strerror(errno))};
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    throw Error{ErrorCode::SourceError,
                std::format("stat failed: {}: {}", path.string(), std::strerror(err))};
  }
  if (!S_ISREG(st.st_mode)) {
    ::close(fd);
    throw Error{ErrorCode::SourceError,
                std::format("baseline is not a regular file: {}", path.string())};
  }
#ifdef __linux__
  (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
  return std::make_unique<FileSource>(fd, static_cast<uint64_t>(st.st_size));
}

std::unique_ptr<IByteSource> make_memory_source(std::vector<std::byte> bytes) {
  return std::make_unique<MemorySource>(std::move(bytes));
}

std::unique_ptr<IByteSource> make_procedural_source(uint64_t length, uint64_t seed) {
  return std::make_unique<ProceduralSource>(length, seed);
}

}  // namespace dedupgen
