#include "splicenet/test-util.hpp"

#include <sys/socket.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <stdexcept>
#include <string>

#include "splicenet/base-fd.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/socket.hpp"
#include "splicenet/tcp-connector.hpp"

namespace splicenet::test {

LoopbackListener::LoopbackListener() : socket(Socket::Type::Stream) {
  socket.bindAndListen(false, true, port);
}

ConnectionPair MakeTcpPair(const LoopbackListener& listener) {
  ConnectionPair pair;
  pair.client = DialTCP("127.0.0.1", listener.port);
  // The connection is already established in the backlog, accept returns immediately.
  pair.server = Connection(listener.socket);
  if (!pair.server) {
    throw std::runtime_error("Unable to accept loopback connection");
  }
  return pair;
}

ConnectionPair MakeTcpPair() {
  LoopbackListener listener;
  return MakeTcpPair(listener);
}

ConnectionPair MakeUnixPair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
    throw std::runtime_error("Unable to create unix socket pair");
  }
  return {Connection(BaseFd(fds[0])), Connection(BaseFd(fds[1]))};
}

std::string MakePayload(std::size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string payload(size, '\0');
  for (auto& ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

std::string ReadUntilEof(Connection& cnx) {
  std::string out;
  std::array<std::byte, 16384> buf;
  for (;;) {
    const auto res = cnx.read(buf);
    if (res.ec || res.bytes == 0) {
      break;
    }
    out.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
  }
  return out;
}

}  // namespace splicenet::test
