#pragma once

#include <cstdint>

#include "splicenet/base-fd.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

// Simple RAII class wrapping a listening stream socket (IPv4).
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure, std::invalid_argument for an unknown type.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket to the given port, on the loopback interface if loopbackOnly is set.
  // Returns true on success, false on failure.
  // Throws std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(bool reusePort, bool loopbackOnly, uint16_t port) const;

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool loopbackOnly, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace splicenet
