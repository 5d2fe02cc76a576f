#include "splicenet/socket-ops.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>

#include <csignal>
#include <cstring>
#include <format>
#include <string>
#include <string_view>

#include "splicenet/errno-throw.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

bool SetNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return (flags & O_NONBLOCK) != 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetCloseOnExec(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return LastSystemError();
  }
  return err;
}

bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

std::string FormatAddress(const sockaddr_storage& addr) {
  char ipBuf[INET6_ADDRSTRLEN]{};
  switch (addr.ss_family) {
    case AF_INET: {
      const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
      if (::inet_ntop(AF_INET, &in->sin_addr, ipBuf, sizeof(ipBuf)) == nullptr) {
        return {};
      }
      return std::format("{}:{}", ipBuf, ntohs(in->sin_port));
    }
    case AF_INET6: {
      const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
      if (::inet_ntop(AF_INET6, &in6->sin6_addr, ipBuf, sizeof(ipBuf)) == nullptr) {
        return {};
      }
      return std::format("[{}]:{}", ipBuf, ntohs(in6->sin6_port));
    }
    case AF_UNIX: {
      const auto* un = reinterpret_cast<const sockaddr_un*>(&addr);
      return {un->sun_path, ::strnlen(un->sun_path, sizeof(un->sun_path))};
    }
    default:
      return {};
  }
}

std::string_view NetworkName(NativeHandle fd) noexcept {
  sockaddr_storage addr{};
  if (!GetLocalAddress(fd, addr)) {
    return "unknown";
  }
  switch (addr.ss_family) {
    case AF_INET:
      return "tcp";
    case AF_INET6:
      return "tcp6";
    case AF_UNIX:
      return "unix";
    default:
      return "unknown";
  }
}

bool ShutdownRead(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RD) == 0; }

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

bool ShutdownReadWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

void IgnoreSigPipe() {
  if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    throw_errno("Unable to ignore SIGPIPE");
  }
}

}  // namespace splicenet
