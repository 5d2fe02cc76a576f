#include "splicenet/pipe.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <limits>

#include "splicenet/base-fd.hpp"
#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

Pipe::Pipe(Create) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    _openErr = errno;
    log::error("pipe2 failed: errno={}, msg={}", _openErr, SystemErrorMessage(_openErr));
    return;
  }
  _readEnd = BaseFd(fds[0]);
  _writeEnd = BaseFd(fds[1]);
  log::debug("Pipe fds # {} / # {} opened", fds[0], fds[1]);
}

std::size_t Pipe::capacity() const noexcept {
  const int ret = ::fcntl(_writeEnd.fd(), F_GETPIPE_SZ);
  if (ret == -1) {
    const auto err = errno;
    log::error("F_GETPIPE_SZ failed on fd # {}: errno={}, msg={}", _writeEnd.fd(), err, SystemErrorMessage(err));
    return 0;
  }
  return static_cast<std::size_t>(ret);
}

std::size_t Pipe::resize(std::size_t capacityBytes) noexcept {
  if (capacityBytes > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    log::error("Pipe capacity of {} bytes is out of range", capacityBytes);
    return 0;
  }
  const int ret = ::fcntl(_writeEnd.fd(), F_SETPIPE_SZ, static_cast<int>(capacityBytes));
  if (ret == -1) {
    // EPERM: above pipe-max-size for an unprivileged user, EBUSY: shrinking below the buffered amount.
    const auto err = errno;
    log::error("F_SETPIPE_SZ({}) failed on fd # {}: errno={}, msg={}", capacityBytes, _writeEnd.fd(), err,
               SystemErrorMessage(err));
    return 0;
  }
  return static_cast<std::size_t>(ret);
}

}  // namespace splicenet
