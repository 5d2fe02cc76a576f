#pragma once

#include <cstddef>

#include "splicenet/base-fd.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

// RAII pair of pipe ends, used as the kernel relay between the two splice(2) stages.
// Both ends are created with O_CLOEXEC and stay in blocking mode: the transfer loop never asks
// the pipe for more than it holds, nor pushes more than its capacity.
class Pipe {
 public:
  // Default-constructed Pipe is closed / empty.
  Pipe() noexcept = default;

  // Tag type selecting the constructor that actually creates the pipe.
  struct Create {};

  // Create a new pipe. On failure, operator bool() returns false and openError() holds the errno.
  explicit Pipe(Create);

  // Returns true when both ends are opened.
  explicit operator bool() const noexcept { return static_cast<bool>(_readEnd) && static_cast<bool>(_writeEnd); }

  [[nodiscard]] NativeHandle readFd() const noexcept { return _readEnd.fd(); }
  [[nodiscard]] NativeHandle writeFd() const noexcept { return _writeEnd.fd(); }

  // errno of the failed pipe2 call, 0 if creation succeeded.
  [[nodiscard]] int openError() const noexcept { return _openErr; }

  // Capacity in bytes granted by the kernel (F_GETPIPE_SZ), or 0 on failure (logged).
  [[nodiscard]] std::size_t capacity() const noexcept;

  // Ask the kernel to resize the pipe buffer (F_SETPIPE_SZ). The kernel rounds up to a power of two pages
  // and may refuse sizes above /proc/sys/fs/pipe-max-size for unprivileged users.
  // Returns the new capacity on success, 0 on failure (logged).
  std::size_t resize(std::size_t capacityBytes) noexcept;

  void close() noexcept {
    _readEnd.close();
    _writeEnd.close();
  }

 private:
  BaseFd _readEnd;
  BaseFd _writeEnd;
  int _openErr{0};
};

}  // namespace splicenet
