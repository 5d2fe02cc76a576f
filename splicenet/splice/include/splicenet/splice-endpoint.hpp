#pragma once

#include <cstdint>
#include <system_error>

#include "splicenet/connection.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/splice-source.hpp"

namespace splicenet {

enum class EndpointKind : std::uint8_t { PlainFile, SocketConnection, Unsupported };

// Resolved view of one side of a splice transfer: the raw descriptor plus the capabilities the transfer loop
// needs around it. The capabilities are carried as data: a socket connection endpoint refers to its connection
// and the direction in use, while a plain file endpoint has no connection, making lock, unlock and wait no-ops.
struct SpliceEndpoint {
  [[nodiscard]] bool supported() const noexcept { return kind != EndpointKind::Unsupported; }

  // Acquire the exclusive access token of the connection side in use, then capture the connection descriptor.
  // close() releases the descriptor only while holding both tokens, so fd stays valid until unlock().
  [[nodiscard]] std::error_code lock();

  void unlock() const noexcept;

  // Block until the descriptor is ready for the direction in use.
  [[nodiscard]] std::error_code wait() const;

  EndpointKind kind{EndpointKind::Unsupported};
  // Set at resolution for plain files, by a successful lock() for connections.
  NativeHandle fd{kInvalidHandle};
  IoDirection direction{IoDirection::Read};
  Connection* cnx{nullptr};
};

// Resolve the source of a transfer. Generic readers resolve to an Unsupported endpoint.
// Does not touch the underlying descriptor, and does not read it for connections.
[[nodiscard]] SpliceEndpoint ResolveSource(const SpliceSource& source) noexcept;

// Resolve the destination connection (write side).
[[nodiscard]] SpliceEndpoint ResolveDestination(Connection& dst) noexcept;

// Scoped acquisition of an endpoint token, released on destruction if it was acquired.
class EndpointLock {
 public:
  explicit EndpointLock(SpliceEndpoint& endpoint) : _endpoint(endpoint), _ec(endpoint.lock()) {}

  EndpointLock(const EndpointLock&) = delete;
  EndpointLock(EndpointLock&&) = delete;
  EndpointLock& operator=(const EndpointLock&) = delete;
  EndpointLock& operator=(EndpointLock&&) = delete;

  ~EndpointLock() {
    if (!_ec) {
      _endpoint.unlock();
    }
  }

  [[nodiscard]] std::error_code error() const noexcept { return _ec; }

 private:
  SpliceEndpoint& _endpoint;
  std::error_code _ec;
};

}  // namespace splicenet
