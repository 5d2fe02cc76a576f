#include "splicenet/splice-endpoint.hpp"

#include <system_error>
#include <variant>

#include "splicenet/byte-reader.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/file.hpp"
#include "splicenet/splice-source.hpp"

namespace splicenet {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

std::error_code SpliceEndpoint::lock() {
  if (cnx == nullptr) {
    return {};
  }
  std::error_code ec = cnx->lock(direction);
  if (!ec) {
    fd = cnx->fd();
  }
  return ec;
}

void SpliceEndpoint::unlock() const noexcept {
  if (cnx != nullptr) {
    cnx->unlock(direction);
  }
}

std::error_code SpliceEndpoint::wait() const {
  if (cnx == nullptr) {
    // Regular files are always ready.
    return {};
  }
  return cnx->waitReady(direction);
}

SpliceEndpoint ResolveSource(const SpliceSource& source) noexcept {
  return std::visit(Overloaded{[](File* file) {
                                 return SpliceEndpoint{EndpointKind::PlainFile, file->fd(), IoDirection::Read,
                                                       nullptr};
                               },
                               [](Connection* cnx) {
                                 return SpliceEndpoint{EndpointKind::SocketConnection, kInvalidHandle,
                                                       IoDirection::Read, cnx};
                               },
                               [](IByteReader*) { return SpliceEndpoint{}; }},
                    source);
}

SpliceEndpoint ResolveDestination(Connection& dst) noexcept {
  return {EndpointKind::SocketConnection, kInvalidHandle, IoDirection::Write, &dst};
}

}  // namespace splicenet
