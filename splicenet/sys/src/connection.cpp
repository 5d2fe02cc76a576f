#include "splicenet/connection.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "splicenet/base-fd.hpp"
#include "splicenet/io-result.hpp"
#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/socket-ops.hpp"
#include "splicenet/socket.hpp"
#include "splicenet/timedef.hpp"

namespace splicenet {

struct Connection::SyncState {
  std::mutex& mutexFor(IoDirection dir) noexcept { return dir == IoDirection::Read ? readMutex : writeMutex; }

  std::atomic<SteadyDuration::rep>& deadlineFor(IoDirection dir) noexcept {
    return dir == IoDirection::Read ? readDeadline : writeDeadline;
  }

  std::mutex readMutex;
  std::mutex writeMutex;
  // Guards the descriptor between the shutdown done by cancel() and its release by close().
  std::mutex closeMutex;
  std::atomic<bool> closing{false};
  // Deadlines stored as steady clock ticks since epoch, for lock-free access from waiters.
  std::atomic<SteadyDuration::rep> readDeadline{kNoDeadline.time_since_epoch().count()};
  std::atomic<SteadyDuration::rep> writeDeadline{kNoDeadline.time_since_epoch().count()};
};

namespace {

int ComputeConnectionFd(int socketFd) {
  sockaddr_storage addr{};
  socklen_t addrLen = sizeof(addr);
  int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&addr), &addrLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;  // capture errno before any other call
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("Connection accept would block: {} - this is expected if no pending connections",
                 SystemErrorMessage(savedErr));
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, SystemErrorMessage(savedErr));
    }
    fd = -1;
  } else {
    log::debug("Connection fd # {} accepted", fd);
  }
  return fd;
}

std::error_code MakeErrorCode(int err) { return {err, std::generic_category()}; }

// Holds one access token of a connection for the duration of a helper call.
class DirectionGuard {
 public:
  DirectionGuard(Connection& cnx, IoDirection dir) : _cnx(cnx), _dir(dir), _ec(cnx.lock(dir)) {}

  DirectionGuard(const DirectionGuard&) = delete;
  DirectionGuard(DirectionGuard&&) = delete;
  DirectionGuard& operator=(const DirectionGuard&) = delete;
  DirectionGuard& operator=(DirectionGuard&&) = delete;

  ~DirectionGuard() {
    if (!_ec) {
      _cnx.unlock(_dir);
    }
  }

  [[nodiscard]] std::error_code error() const noexcept { return _ec; }

 private:
  Connection& _cnx;
  IoDirection _dir;
  std::error_code _ec;
};

}  // namespace

Connection::Connection() noexcept = default;

Connection::Connection(const Socket& listener)
    : _baseFd(ComputeConnectionFd(listener.fd())), _sync(std::make_unique<SyncState>()) {
  if (_baseFd) {
    refreshEndpointInfo();
  }
}

Connection::Connection(BaseFd&& bd) : _baseFd(std::move(bd)), _sync(std::make_unique<SyncState>()) {
  if (_baseFd) {
    if (!SetNonBlocking(_baseFd.fd())) {
      const auto err = errno;
      log::error("Unable to set fd # {} non-blocking: {}", _baseFd.fd(), SystemErrorMessage(err));
    }
    refreshEndpointInfo();
  }
}

Connection::Connection(Connection&& other) noexcept = default;

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    close();
    _baseFd = std::move(other._baseFd);
    _sync = std::move(other._sync);
    _network = std::move(other._network);
    _remoteAddress = std::move(other._remoteAddress);
  }
  return *this;
}

Connection::~Connection() { close(); }

void Connection::refreshEndpointInfo() {
  _network = NetworkName(_baseFd.fd());
  sockaddr_storage peer{};
  if (GetPeerAddress(_baseFd.fd(), peer)) {
    _remoteAddress = FormatAddress(peer);
  }
}

std::error_code Connection::lock(IoDirection dir) {
  if (!_sync) {
    return MakeErrorCode(EBADF);
  }
  if (_sync->closing.load(std::memory_order_acquire)) {
    return std::make_error_code(std::errc::operation_canceled);
  }
  auto& mutex = _sync->mutexFor(dir);
  mutex.lock();
  // close() may have started while we were blocked behind the previous holder.
  if (_sync->closing.load(std::memory_order_acquire)) {
    mutex.unlock();
    return std::make_error_code(std::errc::operation_canceled);
  }
  return {};
}

void Connection::unlock(IoDirection dir) noexcept { _sync->mutexFor(dir).unlock(); }

void Connection::setDeadline(IoDirection dir, SteadyTimePoint deadline) noexcept {
  if (_sync) {
    _sync->deadlineFor(dir).store(deadline.time_since_epoch().count(), std::memory_order_release);
  }
}

std::error_code Connection::waitReady(IoDirection dir) const {
  if (!_sync || !_baseFd) {
    return MakeErrorCode(EBADF);
  }
  pollfd pfd{};
  pfd.fd = _baseFd.fd();
  pfd.events = dir == IoDirection::Read ? POLLIN : POLLOUT;

  for (;;) {
    if (_sync->closing.load(std::memory_order_acquire)) {
      return std::make_error_code(std::errc::operation_canceled);
    }

    int timeoutMs = -1;
    const SteadyTimePoint deadline{SteadyDuration{_sync->deadlineFor(dir).load(std::memory_order_acquire)}};
    if (deadline != kNoDeadline) {
      const auto left = deadline - SteadyClock::now();
      if (left <= SteadyDuration::zero()) {
        return std::make_error_code(std::errc::timed_out);
      }
      // Round up so that we never wake up right before the deadline and spin.
      const auto leftMs = std::chrono::ceil<std::chrono::milliseconds>(left).count();
      timeoutMs = static_cast<int>(std::min<decltype(leftMs)>(leftMs, 60'000));
    }

    const int ret = ::poll(&pfd, 1, timeoutMs);
    if (ret > 0) {
      if (_sync->closing.load(std::memory_order_acquire)) {
        return std::make_error_code(std::errc::operation_canceled);
      }
      // POLLERR / POLLHUP included: the subsequent I/O call reports the precise error.
      return {};
    }
    if (ret == 0) {
      continue;  // timeout slice elapsed, deadline re-evaluated above
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    log::error("poll failed for fd # {}: errno={}, msg={}", pfd.fd, err, SystemErrorMessage(err));
    return MakeErrorCode(err);
  }
}

IoResult Connection::read(std::span<std::byte> dst) {
  DirectionGuard guard(*this, IoDirection::Read);
  if (guard.error()) {
    return {0, guard.error()};
  }
  for (;;) {
    const ssize_t ret = ::recv(_baseFd.fd(), dst.data(), dst.size(), 0);
    if (ret >= 0) {
      return {static_cast<std::size_t>(ret), {}};
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == error::kWouldBlock) {
      if (auto ec = waitReady(IoDirection::Read)) {
        return {0, ec};
      }
      continue;
    }
    return {0, MakeErrorCode(err)};
  }
}

IoResult Connection::writeAll(std::span<const std::byte> src) {
  DirectionGuard guard(*this, IoDirection::Write);
  if (guard.error()) {
    return {0, guard.error()};
  }
  IoResult result;
  while (result.bytes < src.size()) {
    const ssize_t ret =
        ::send(_baseFd.fd(), src.data() + result.bytes, src.size() - result.bytes, MSG_NOSIGNAL);
    if (ret >= 0) {
      result.bytes += static_cast<std::size_t>(ret);
      continue;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == error::kWouldBlock) {
      if (auto ec = waitReady(IoDirection::Write)) {
        result.ec = ec;
        break;
      }
      continue;
    }
    result.ec = MakeErrorCode(err);
    break;
  }
  return result;
}

bool Connection::shutdownRead() {
  DirectionGuard guard(*this, IoDirection::Read);
  if (guard.error()) {
    errno = guard.error().value();
    return false;
  }
  return ShutdownRead(_baseFd.fd());
}

bool Connection::shutdownWrite() {
  DirectionGuard guard(*this, IoDirection::Write);
  if (guard.error()) {
    errno = guard.error().value();
    return false;
  }
  return ShutdownWrite(_baseFd.fd());
}

bool Connection::isClosing() const noexcept { return !_sync || _sync->closing.load(std::memory_order_acquire); }

void Connection::cancel() noexcept {
  if (!_sync || _sync->closing.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  std::scoped_lock<std::mutex> lock(_sync->closeMutex);
  if (!_baseFd) {
    return;
  }
  // Wake up threads parked in waitReady: both halves become ready with an error / EOF.
  if (!ShutdownReadWrite(_baseFd.fd())) {
    const auto err = errno;
    log::debug("shutdown of fd # {} failed: {}", _baseFd.fd(), SystemErrorMessage(err));
  }
}

void Connection::close() noexcept {
  if (!_sync) {
    _baseFd.close();
    return;
  }
  cancel();
  // Wait for in-flight locked operations to unwind before releasing the descriptor.
  std::scoped_lock<std::mutex, std::mutex> ioLock(_sync->readMutex, _sync->writeMutex);
  std::scoped_lock<std::mutex> closeLock(_sync->closeMutex);
  _baseFd.close();
}

}  // namespace splicenet
