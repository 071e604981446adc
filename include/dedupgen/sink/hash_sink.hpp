#pragma once

#include <cstdint>
#include <span>

#include "dedupgen/sink/byte_sink.hpp"

struct XXH64_state_s;

namespace dedupgen {

// Streaming XXH64 of every appended byte, optionally forwarding to `inner`.
// digest() matches XXH64 of the whole stream with the same seed.
class HashSink final : public IByteSink {
 public:
  explicit HashSink(uint64_t seed = 0, IByteSink* inner = nullptr);
  ~HashSink() override;

  HashSink(const HashSink&) = delete;
  HashSink& operator=(const HashSink&) = delete;

  void append(std::span<const std::byte> bytes) override;
  void sync() override;
  void close() override;
  uint64_t bytes_written() const noexcept override { return bytes_; }

  uint64_t digest() const;

 private:
  uint64_t seed_{0};
  IByteSink* inner_{nullptr};
  XXH64_state_s* state_{nullptr};
  uint64_t bytes_{0};
};

}  // namespace dedupgen
