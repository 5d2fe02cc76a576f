#include "splicenet/op-error.hpp"

#include <format>
#include <string>
#include <string_view>
#include <system_error>

#include "splicenet/connection.hpp"

namespace splicenet {

OpError::OpError(std::string_view op, const Connection& cnx, std::error_code cause)
    : OpError(op, cnx.network(), cnx.remoteAddress(), cause) {}

std::string OpError::message() const {
  std::string out = _op;
  if (!_net.empty()) {
    out.push_back(' ');
    out.append(_net);
  }
  if (!_addr.empty()) {
    out.push_back(' ');
    out.append(_addr);
  }
  out.append(std::format(": {}", _cause.message()));
  return out;
}

}  // namespace splicenet
