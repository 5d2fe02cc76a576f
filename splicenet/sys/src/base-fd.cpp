#include "splicenet/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <utility>

#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    while (true) {
      if (::close(_fd) == 0) {
        break;
      }
      if (errno == EINTR) {
        // Retry close if interrupted; POSIX allows either retry or treat as closed.
        continue;
      }
      // Other errors: EBADF (benign if race closed elsewhere), EIO, etc.
      log::error("close fd # {} failed: {}", _fd, SystemErrorMessage(errno));
      break;
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace splicenet
