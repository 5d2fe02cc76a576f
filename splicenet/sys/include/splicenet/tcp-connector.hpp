#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "splicenet/connection.hpp"

namespace splicenet {

struct ConnectResult {
  Connection cnx;
  bool connectPending{false};
  bool failure{false};
};

// Attempt to resolve host:port and connect to one of the returned addresses.
// On success returns a ConnectResult owning the connected socket and a flag
// indicating whether the connect is still pending (non-blocking EINPROGRESS).
// On failure, the failure flag is set (details are logged).
//
// The default family value is 0 (unspecified).
ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family = 0);

// Connect to host:port and wait for the connection to be established.
// Throws std::system_error on failure or when the timeout expires.
Connection DialTCP(std::string_view host, uint16_t port,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

}  // namespace splicenet
