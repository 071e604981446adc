#include "dedupgen/sink/byte_sink.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "dedupgen/core/error.hpp"

namespace dedupgen {
namespace {

void write_all(int fd, const std::byte* data, size_t size) {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::write(fd, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw Error{ErrorCode::SinkWrite, std::strerror(errno)};
    }
    if (n == 0) {
      throw Error{ErrorCode::SinkWrite, "write made no forward progress"};
    }
    done += static_cast<size_t>(n);
  }
}

class FileSink final : public IByteSink {
 public:
  explicit FileSink(int fd) : fd_(fd) {}

  ~FileSink() override {
    if (!closed_ && fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void append(std::span<const std::byte> bytes) override {
    if (closed_ || fd_ < 0) {
      throw Error{ErrorCode::SinkWrite, "file sink is closed"};
    }
    write_all(fd_, bytes.data(), bytes.size());
    written_ += bytes.size();
  }

  void sync() override {
    if (closed_ || fd_ < 0) {
      throw Error{ErrorCode::SinkWrite, "file sink is closed"};
    }
#if defined(__APPLE__)
    if (::fsync(fd_) != 0) {
#else
    if (::fdatasync(fd_) != 0) {
#endif
      throw Error{ErrorCode::SinkWrite, std::strerror(errno)};
    }
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (fd_ >= 0) {
      const int rc = ::close(fd_);
      fd_ = -1;
      if (rc != 0) {
        throw Error{ErrorCode::SinkWrite, std::strerror(errno)};
      }
    }
  }

  uint64_t bytes_written() const noexcept override { return written_; }

 private:
  int fd_{-1};
  bool closed_{false};
  uint64_t written_{0};
};

}  // namespace

void MemorySink::append(std::span<const std::byte> bytes) {
  if (closed_) {
    throw Error{ErrorCode::SinkWrite, "memory sink is closed"};
  }
  data_.insert(data_.end(), bytes.begin(), bytes.end());
}

std::unique_ptr<IByteSink> make_file_sink(const FileSinkParams& params) {
  if (params.path.empty()) {
    throw Error{ErrorCode::InvalidConfig, "output path is empty"};
  }
  if (params.path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(params.path.parent_path(), ec);
    if (ec) {
      throw Error{ErrorCode::SinkWrite,
                  std::format("create directory failed: {}: {}",
                              params.path.parent_path().string(), ec.message())};
    }
  }
  int flags = O_CREAT | O_WRONLY;
  flags |= params.truncate ? O_TRUNC : O_APPEND;
  const int fd = ::open(params.path.c_str(), flags, 0644);
  if (fd < 0) {
    throw Error{ErrorCode::SinkWrite,
                std::format("open for write failed: {}: {}", params.path.string(),
                            std::strerror(errno))};
  }
  return std::make_unique<FileSink>(fd);
}

}  // namespace dedupgen
