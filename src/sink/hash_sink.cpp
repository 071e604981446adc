#include "dedupgen/sink/hash_sink.hpp"

#include <new>

#include <xxhash.h>

#include "dedupgen/core/error.hpp"

namespace dedupgen {

HashSink::HashSink(uint64_t seed, IByteSink* inner)
    : seed_(seed), inner_(inner), state_(XXH64_createState()) {
  if (state_ == nullptr) {
    throw std::bad_alloc();
  }
  if (XXH64_reset(state_, seed_) == XXH_ERROR) {
    XXH64_freeState(state_);
    throw Error{ErrorCode::Internal, "XXH64_reset failed"};
  }
}

HashSink::~HashSink() { XXH64_freeState(state_); }

void HashSink::append(std::span<const std::byte> bytes) {
  if (inner_ != nullptr) {
    inner_->append(bytes);
  }
  if (XXH64_update(state_, bytes.data(), bytes.size()) == XXH_ERROR) {
    throw Error{ErrorCode::Internal, "XXH64_update failed"};
  }
  bytes_ += bytes.size();
}

void HashSink::sync() {
  if (inner_ != nullptr) {
    inner_->sync();
  }
}

void HashSink::close() {
  if (inner_ != nullptr) {
    inner_->close();
  }
}

uint64_t HashSink::digest() const { return XXH64_digest(state_); }

}  // namespace dedupgen
