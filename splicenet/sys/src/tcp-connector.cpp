#include "splicenet/tcp-connector.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "splicenet/base-fd.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/socket-ops.hpp"
#include "splicenet/timedef.hpp"

namespace splicenet {

ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family) {
  // getaddrinfo expects null-terminated strings
  const std::string hostStr(host);
  const std::string portStr(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    BaseFd sock(::socket(rp->ai_family, socktype, rp->ai_protocol));
    if (!sock) [[unlikely]] {
      const int saved = errno;
      log::error("ConnectTCP: socket() failed for addrinfo entry (family={}, socktype={}, protocol={}): errno={}, msg={}",
                 rp->ai_family, rp->ai_socktype, rp->ai_protocol, saved, SystemErrorMessage(saved));
      if (saved == EMFILE || saved == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    if (::connect(sock.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      connectResult.cnx = Connection(std::move(sock));
      return connectResult;
    }

    const int connectErr = errno;
    switch (connectErr) {
      case EINPROGRESS:
        [[fallthrough]];
      case EALREADY:
        // completion will be signalled by writability
        connectResult.cnx = Connection(std::move(sock));
        connectResult.connectPending = true;
        return connectResult;
      case EINTR:
        // interrupted system call; treat as transient and try next address
        continue;
      default:
        log::error("ConnectTCP: connect() failed for addrinfo entry (family={}, socktype={}, protocol={}): errno={}, msg={}",
                   rp->ai_family, rp->ai_socktype, rp->ai_protocol, connectErr, SystemErrorMessage(connectErr));
        break;
    }
  }
  connectResult.failure = true;
  return connectResult;
}

Connection DialTCP(std::string_view host, uint16_t port, std::chrono::milliseconds timeout) {
  const auto portStr = std::to_string(port);
  auto [cnx, connectPending, failure] = ConnectTCP(host, portStr);
  if (failure) {
    throw std::system_error(std::make_error_code(std::errc::connection_refused),
                            std::format("Unable to connect to {}:{}", host, port));
  }
  if (connectPending) {
    cnx.setDeadline(IoDirection::Write, SteadyClock::now() + timeout);
    if (auto ec = cnx.waitReady(IoDirection::Write)) {
      throw std::system_error(ec, std::format("Connect to {}:{} did not complete", host, port));
    }
    cnx.setDeadline(IoDirection::Write, kNoDeadline);
    if (const int soErr = GetSocketError(cnx.fd()); soErr != 0) {
      throw std::system_error(std::error_code(soErr, std::generic_category()),
                              std::format("Connect to {}:{} failed", host, port));
    }
    // The peer address was unknown until the handshake completed.
    cnx.refreshEndpointInfo();
  }
  log::debug("Connection fd # {} established to {}:{}", cnx.fd(), host, port);
  return std::move(cnx);
}

}  // namespace splicenet
