#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace splicenet {

class Connection;

// Error of a network operation, wrapped with the context needed for diagnostics:
// the operation name, the network family and the remote address of the connection involved.
// Rendered as "<op> <net> <addr>: <cause>", for instance "splice tcp 127.0.0.1:40112: Broken pipe".
class OpError {
 public:
  OpError(std::string_view op, std::string_view net, std::string_view addr, std::error_code cause)
      : _op(op), _net(net), _addr(addr), _cause(cause) {}

  // Convenience constructor taking net and addr from the connection.
  OpError(std::string_view op, const Connection& cnx, std::error_code cause);

  [[nodiscard]] std::string_view op() const noexcept { return _op; }
  [[nodiscard]] std::string_view net() const noexcept { return _net; }
  [[nodiscard]] std::string_view addr() const noexcept { return _addr; }
  [[nodiscard]] std::error_code cause() const noexcept { return _cause; }

  [[nodiscard]] std::string message() const;

  bool operator==(const OpError&) const = default;

 private:
  std::string _op;
  std::string _net;
  std::string _addr;
  std::error_code _cause;
};

}  // namespace splicenet
