#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace dedupgen {

struct FileSinkParams {
  std::filesystem::path path{};
  bool truncate{true};
};

// Sequential append target. Errors are reported as Error{SinkWrite}.
class IByteSink {
 public:
  virtual ~IByteSink() = default;

  virtual void append(std::span<const std::byte> bytes) = 0;
  virtual void sync() = 0;
  virtual void close() = 0;
  virtual uint64_t bytes_written() const noexcept = 0;
};

std::unique_ptr<IByteSink> make_file_sink(const FileSinkParams& params);

class MemorySink final : public IByteSink {
 public:
  MemorySink() = default;

  void append(std::span<const std::byte> bytes) override;
  void sync() override {}
  void close() override { closed_ = true; }
  uint64_t bytes_written() const noexcept override { return data_.size(); }

  const std::vector<std::byte>& data() const noexcept { return data_; }

 private:
  std::vector<std::byte> data_{};
  bool closed_{false};
};

}  // namespace dedupgen
