#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "splicenet/base-fd.hpp"
#include "splicenet/io-result.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/socket.hpp"
#include "splicenet/timedef.hpp"

namespace splicenet {

enum class IoDirection : std::uint8_t { Read, Write };

// A connected, non-blocking stream socket shared by concurrent transfers.
//
// Each direction has its own exclusive access token: a connection may be read by one transfer while another
// one writes to it, but two transfers never interleave system calls on the same half.
// Blocking behaviour is provided by waitReady(), which parks the calling thread in poll(2) until the
// descriptor is ready for the given direction, its deadline passes, or the connection is closed.
//
// Closing is the only cancellation mechanism: cancel() marks the connection as closing and shuts down both
// halves to wake up pending waits, close() additionally waits for in-flight locked operations to unwind and only
// then releases the fd.
class Connection {
 public:
  Connection() noexcept;

  // Accept a pending connection on the listening socket (blocking or not, depending on the socket).
  // On failure (logged), the Connection is empty.
  explicit Connection(const Socket& listener);

  // Take ownership of an existing connected socket. The socket is switched to non-blocking mode.
  explicit Connection(BaseFd&& bd);

  Connection(const Connection&) = delete;
  Connection(Connection&& other) noexcept;
  Connection& operator=(const Connection&) = delete;
  Connection& operator=(Connection&& other) noexcept;

  ~Connection();

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // "tcp", "tcp6", "unix" or "unknown".
  [[nodiscard]] std::string_view network() const noexcept { return _network; }

  // Peer address as "ip:port", captured when the connection was adopted.
  [[nodiscard]] std::string_view remoteAddress() const noexcept { return _remoteAddress; }

  // Acquire the exclusive access token of the given direction.
  // Returns operation_canceled if the connection is closing (the token is then not held).
  [[nodiscard]] std::error_code lock(IoDirection dir);

  void unlock(IoDirection dir) noexcept;

  // Block until the descriptor is ready for the given direction.
  // Returns timed_out once the direction deadline has passed, operation_canceled if the connection is closed
  // concurrently. Socket errors are reported as readiness: the next I/O call surfaces them.
  [[nodiscard]] std::error_code waitReady(IoDirection dir) const;

  // Set the deadline of one direction. kNoDeadline removes it.
  void setDeadline(IoDirection dir, SteadyTimePoint deadline) noexcept;

  // Set the deadline of both directions.
  void setDeadline(SteadyTimePoint deadline) noexcept {
    setDeadline(IoDirection::Read, deadline);
    setDeadline(IoDirection::Write, deadline);
  }

  // Read up to dst.size() bytes, waiting for readiness if needed. Takes the read token.
  // Returns {0, {}} on end of stream.
  [[nodiscard]] IoResult read(std::span<std::byte> dst);

  // Write all bytes, waiting for readiness if needed. Takes the write token.
  [[nodiscard]] IoResult writeAll(std::span<const std::byte> src);

  [[nodiscard]] IoResult writeAll(std::string_view data) { return writeAll(std::as_bytes(std::span(data))); }

  // Half-close helpers, taking the token of the half they shut down. Return true on success, false on error
  // (errno is set, to ECANCELED if the connection is closing).
  bool shutdownRead();
  bool shutdownWrite();

  [[nodiscard]] bool isClosing() const noexcept;

  // Re-read the network family and peer address, once a pending non-blocking connect has completed.
  void refreshEndpointInfo();

  // Mark the connection as closing and shut down both halves, without waiting for the token holders nor
  // releasing the descriptor. Pending waits and lock attempts fail with operation_canceled.
  // Idempotent, never blocks on a transfer: safe to call on several connections in a row, even when a transfer
  // holds a token of one of them while waiting on another.
  void cancel() noexcept;

  // cancel(), then wait for the token holders to unwind and release the descriptor.
  // Idempotent and safe to call from any thread. Must not be called by a thread holding one of the access tokens.
  void close() noexcept;

 private:
  struct SyncState;

  BaseFd _baseFd;
  std::unique_ptr<SyncState> _sync;
  std::string _network;
  std::string _remoteAddress;
};

}  // namespace splicenet
