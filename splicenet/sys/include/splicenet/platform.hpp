#pragma once

// Platform detection and error helpers for splicenet's system layer.
//
// splice(2) and F_GETPIPE_SZ only exist on Linux, so unlike a portable socket
// library there is a single supported target.
//
//   SPLICENET_LINUX    - defined on Linux
//   NativeHandle       - the OS descriptor type
//   kInvalidHandle     - sentinel value representing an invalid descriptor
//   LastSystemError()  - last system error code (errno)
//   SystemErrorMessage - human-readable description for an error code

#ifdef __linux__
#define SPLICENET_LINUX
#else
#error "Unsupported platform - splicenet relies on splice(2) and requires Linux"
#endif

#include <cerrno>
#include <cstring>

namespace splicenet {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

inline int LastSystemError() noexcept { return errno; }

inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

// Error codes the transfer path distinguishes.
namespace error {
inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
inline constexpr int kBrokenPipe = EPIPE;
inline constexpr int kConnectionReset = ECONNRESET;
// splice(2) not implemented by the kernel
inline constexpr int kNotImplemented = ENOSYS;
// descriptor pairing splice(2) cannot handle (e.g. two regular files, or an O_APPEND target)
inline constexpr int kInvalidPairing = EINVAL;
}  // namespace error

}  // namespace splicenet
