#pragma once

#include "splicenet/connection.hpp"
#include "splicenet/splice-engine.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

struct ProxyResult {
  TransferResult forward;   // first connection -> second connection
  TransferResult backward;  // second connection -> first connection
};

// Relay bytes in both directions between two connections until both directions reached end of stream.
//
// Each direction runs on its own thread with SpliceEngine::copy. When a direction completes, it shuts down the
// write half of its destination and the read half of its source, so an EOF on one side is propagated without
// interrupting the other direction. Both connections are closed once both directions completed.
[[nodiscard]] ProxyResult Proxy(Connection first, Connection second, const SpliceEngine& engine);

// Same relay on connections owned by the caller. Closing either connection from another thread cancels the
// directions using it. Both connections are closed on return.
[[nodiscard]] ProxyResult ProxyConnections(Connection& first, Connection& second, const SpliceEngine& engine);

}  // namespace splicenet
