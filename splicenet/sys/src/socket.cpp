#include "splicenet/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>

#include "splicenet/base-fd.hpp"
#include "splicenet/errno-throw.hpp"
#include "splicenet/log.hpp"
#include "splicenet/socket-ops.hpp"

namespace splicenet {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ComputeSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, bool loopbackOnly, uint16_t port) const {
  static constexpr int kEnable = 1;
  const int fd = _baseFd.fd();
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY);
  addr.sin_port = htons(port);
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

void Socket::bindAndListen(bool reusePort, bool loopbackOnly, uint16_t& port) {
  if (!tryBind(reusePort, loopbackOnly, port)) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(_baseFd.fd(), SOMAXCONN) < 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_storage addr{};
    if (!GetLocalAddress(_baseFd.fd(), addr)) {
      throw_errno("getsockname failed");
    }
    port = ntohs(reinterpret_cast<const sockaddr_in&>(addr).sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", _baseFd.fd(), port);
}

}  // namespace splicenet
