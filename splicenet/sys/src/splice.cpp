#include "splicenet/splice.hpp"

#include <fcntl.h>
#include <sys/types.h>

#include <cerrno>
#include <cstddef>

#include "splicenet/platform.hpp"

namespace splicenet {

SpliceStatus Splice(NativeHandle inFd, NativeHandle outFd, std::size_t len, bool moreData,
                    bool nonBlockingPipe) noexcept {
  unsigned int flags = moreData ? SPLICE_F_MORE : 0U;
  if (nonBlockingPipe) {
    flags |= SPLICE_F_NONBLOCK;
  }
  for (;;) {
    const ssize_t ret = ::splice(inFd, nullptr, outFd, nullptr, len, flags);
    if (ret >= 0) {
      return SpliceStatus::Progress(static_cast<std::size_t>(ret));
    }
    const int err = errno;
    if (err == error::kInterrupted) {
      continue;
    }
    if (err == error::kWouldBlock) {
      return SpliceStatus::WouldBlock();
    }
    return SpliceStatus::Fatal(err);
  }
}

}  // namespace splicenet
