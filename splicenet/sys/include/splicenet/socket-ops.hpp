#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <string>
#include <string_view>

#include "splicenet/platform.hpp"

namespace splicenet {

// Thin wrappers centralising socket system calls so that the transfer modules
// never include networking headers directly.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(NativeHandle fd) noexcept;

// Set the close-on-exec flag on a file descriptor.
// Returns true on success.
bool SetCloseOnExec(NativeHandle fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
// On failure to query, returns the errno from getsockopt itself.
int GetSocketError(NativeHandle fd) noexcept;

// Fill `addr` with the local address bound to `fd`.
// Returns true on success.
bool GetLocalAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Fill `addr` with the remote peer address of `fd`.
// Returns true on success.
bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Render an address as "ip:port" ("[ip6]:port" for IPv6, the path for unix sockets).
// Returns an empty string for unknown families.
std::string FormatAddress(const sockaddr_storage& addr);

// Network family name of a connected socket: "tcp", "tcp6", "unix", or "unknown".
std::string_view NetworkName(NativeHandle fd) noexcept;

// Shutdown the read half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownRead(NativeHandle fd) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

// Shutdown both read and write halves of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(NativeHandle fd) noexcept;

// splice(2) into a socket whose peer has gone raises SIGPIPE (there is no MSG_NOSIGNAL equivalent).
// Processes driving transfers call this once so that such writes fail with EPIPE instead.
// Throws std::system_error if the disposition cannot be changed.
void IgnoreSigPipe();

}  // namespace splicenet
