#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "splicenet/connection.hpp"
#include "splicenet/socket.hpp"

namespace splicenet::test {

// Both ends of an established loopback TCP connection.
struct ConnectionPair {
  Connection client;
  Connection server;
};

// Loopback listener on an ephemeral port.
struct LoopbackListener {
  LoopbackListener();

  Socket socket;
  uint16_t port{0};
};

// Connect a new client to the listener and accept it. Throws on failure.
[[nodiscard]] ConnectionPair MakeTcpPair(const LoopbackListener& listener);

[[nodiscard]] ConnectionPair MakeTcpPair();

// Connected AF_UNIX stream sockets. Each send is queued as its own segment on the receiving side.
[[nodiscard]] ConnectionPair MakeUnixPair();

// Deterministic pseudo random payload of the given size.
[[nodiscard]] std::string MakePayload(std::size_t size, uint32_t seed = 42);

// Read from the connection until end of stream or error.
[[nodiscard]] std::string ReadUntilEof(Connection& cnx);

}  // namespace splicenet::test
