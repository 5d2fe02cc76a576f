#include "splicenet/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "splicenet/io-result.hpp"
#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

namespace {

int OpenReadOnly(const char* path) {
  int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const auto err = errno;
    log::error("Unable to open file '{}' (errno {}: {})", path, err, SystemErrorMessage(err));
    fd = -1;
  } else {
    log::debug("File '{}' opened as fd # {}", path, fd);
  }
  return fd;
}

}  // namespace

File::File(std::string_view path) : _fd(OpenReadOnly(std::string(path).c_str())) {}

File::File(const char* path) : _fd(OpenReadOnly(path)) {}

std::size_t File::size() const noexcept {
  struct stat st{};
  if (_fd && ::fstat(_fd.fd(), &st) == 0) {
    return static_cast<std::size_t>(st.st_size);
  }
  return kError;
}

IoResult File::read(std::span<std::byte> dst) const {
  for (;;) {
    const ssize_t ret = ::read(_fd.fd(), dst.data(), dst.size());
    if (ret >= 0) {
      return {static_cast<std::size_t>(ret), {}};
    }
    if (errno == EINTR) {
      continue;
    }
    return {0, std::error_code(errno, std::generic_category())};
  }
}

}  // namespace splicenet
