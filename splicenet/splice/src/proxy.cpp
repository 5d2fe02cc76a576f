#include "splicenet/proxy.hpp"

#include <string_view>
#include <thread>
#include <utility>

#include "splicenet/connection.hpp"
#include "splicenet/log.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/splice-engine.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

namespace {

TransferResult Relay(Connection& src, Connection& dst, const SpliceEngine& engine, std::string_view name) {
  TransferResult result = engine.copy(dst, &src);

  // Propagate the end of stream to the peer, and stop reading from a source we are done with.
  if (!dst.shutdownWrite()) {
    log::debug("{}: shutdown write towards {} failed: {}", name, dst.remoteAddress(),
               SystemErrorMessage(LastSystemError()));
  }
  if (!src.shutdownRead()) {
    log::debug("{}: shutdown read from {} failed: {}", name, src.remoteAddress(),
               SystemErrorMessage(LastSystemError()));
  }

  const bool peerGone = result.error && (result.error->cause().value() == error::kBrokenPipe ||
                                         result.error->cause().value() == error::kConnectionReset);
  if (peerGone) {
    log::debug("{}: peer {} went away after {} bytes", name, dst.remoteAddress(), result.written);
  } else if (result.error) {
    log::warn("{}: relay {} -> {} ended after {} bytes: {}", name, src.remoteAddress(), dst.remoteAddress(),
              result.written, result.error->message());
  } else {
    log::debug("{}: relay {} -> {} done, {} bytes", name, src.remoteAddress(), dst.remoteAddress(),
               result.written);
  }
  return result;
}

}  // namespace

ProxyResult Proxy(Connection first, Connection second, const SpliceEngine& engine) {
  return ProxyConnections(first, second, engine);
}

ProxyResult ProxyConnections(Connection& first, Connection& second, const SpliceEngine& engine) {
  ProxyResult result;
  {
    std::jthread forward([&] { result.forward = Relay(first, second, engine, "forward"); });
    std::jthread backward([&] { result.backward = Relay(second, first, engine, "backward"); });
  }
  first.close();
  second.close();
  return result;
}

}  // namespace splicenet
