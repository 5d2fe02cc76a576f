#pragma once

#include <cstddef>
#include <cstdint>

#include "splicenet/platform.hpp"

namespace splicenet {

// Result of a single splice(2) call, classified for the transfer loop.
struct SpliceStatus {
  enum class Kind : std::uint8_t {
    Progress,    // bytes moved (0 means end of input)
    WouldBlock,  // EAGAIN on a non-blocking endpoint, wait for readiness and retry
    Fatal        // any other error, err holds the errno
  };

  static constexpr SpliceStatus Progress(std::size_t nbBytes) noexcept { return {Kind::Progress, nbBytes, 0}; }
  static constexpr SpliceStatus WouldBlock() noexcept { return {Kind::WouldBlock, 0, error::kWouldBlock}; }
  static constexpr SpliceStatus Fatal(int err) noexcept { return {Kind::Fatal, 0, err}; }

  bool operator==(const SpliceStatus&) const noexcept = default;

  Kind kind;
  std::size_t bytes;
  int err;
};

// Move up to len bytes from inFd to outFd with splice(2); one of them must be a pipe.
// Neither offset is used: files are read from their current position, which splice advances.
// moreData hints the kernel that more data follows (SPLICE_F_MORE), which lets TCP coalesce segments.
// nonBlockingPipe makes the pipe side non-blocking (SPLICE_F_NONBLOCK): a pipe without a free buffer slot then
// reports WouldBlock instead of parking the caller. A pipe holds a limited number of buffers regardless of their
// size, so a pipe can be full long before its byte capacity is reached.
// EINTR is retried.
[[nodiscard]] SpliceStatus Splice(NativeHandle inFd, NativeHandle outFd, std::size_t len, bool moreData,
                                  bool nonBlockingPipe = false) noexcept;

}  // namespace splicenet
