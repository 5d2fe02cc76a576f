#pragma once

#include <cstddef>

namespace splicenet {

// Tuning of the splice transfer engine.
struct SpliceConfig {
  static constexpr std::size_t kDefaultMaxChunkBytes = 64UL * 1024;

  // Validate the configuration against the running kernel.
  // Throws std::invalid_argument on invalid values, std::system_error if no relay pipe can be created.
  void validate() const;

  // Largest number of bytes requested by a single splice(2) call, which is also the maximum number of bytes
  // buffered in the relay pipe at any time.
  // It must not exceed the capacity of the relay pipe: a transfer filling the pipe beyond what the kernel can
  // hold would block forever on its own pipe. Default: 64 KiB, the default pipe capacity on Linux.
  std::size_t maxChunkBytes{kDefaultMaxChunkBytes};

  // If non-zero, each relay pipe is resized to this capacity (F_SETPIPE_SZ) before use, allowing a larger
  // maxChunkBytes. Unprivileged processes are limited by /proc/sys/fs/pipe-max-size. Default: 0 (kernel default).
  std::size_t pipeCapacityBytes{0};

  // Buffer size of the generic copy used when zero-copy cannot handle a transfer. Default: 32 KiB.
  std::size_t fallbackBufferBytes{32UL * 1024};

  // Whether SpliceEngine::copy falls back to a buffered copy for transfers splice could not handle.
  bool enableFallback{true};

  SpliceConfig& withMaxChunkBytes(std::size_t maxChunkBytes) {
    this->maxChunkBytes = maxChunkBytes;
    return *this;
  }

  SpliceConfig& withPipeCapacityBytes(std::size_t pipeCapacityBytes) {
    this->pipeCapacityBytes = pipeCapacityBytes;
    return *this;
  }

  SpliceConfig& withFallbackBufferBytes(std::size_t fallbackBufferBytes) {
    this->fallbackBufferBytes = fallbackBufferBytes;
    return *this;
  }

  SpliceConfig& withFallback(bool on = true) {
    this->enableFallback = on;
    return *this;
  }

  bool operator==(const SpliceConfig&) const noexcept = default;
};

// Capacity granted by the kernel to a fresh pipe, after requesting requestedBytes if non-zero.
// Returns 0 if the pipe cannot be created or resized.
[[nodiscard]] std::size_t ProbeRelayPipeCapacity(std::size_t requestedBytes = 0);

}  // namespace splicenet
