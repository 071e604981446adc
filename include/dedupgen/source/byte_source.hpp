#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace dedupgen {

// Read-only, random-access view of a baseline of known length.
class IByteSource {
 public:
  virtual ~IByteSource() = default;

  virtual uint64_t length() const noexcept = 0;

  // Fills `out` with the bytes at [offset, offset + out.size()).
  // Throws Error{SourceError} if the range is not fully available.
  virtual void read_at(uint64_t offset, std::span<std::byte> out) = 0;
};

std::unique_ptr<IByteSource> make_file_source(const std::filesystem::path& path);
std::unique_ptr<IByteSource> make_memory_source(std::vector<std::byte> bytes);

// Uniformly random bytes computed from (seed, offset); nothing is stored.
std::unique_ptr<IByteSource> make_procedural_source(uint64_t length, uint64_t seed);

}  // namespace dedupgen
