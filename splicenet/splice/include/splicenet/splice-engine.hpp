#pragma once

#include <cstddef>

#include "splicenet/connection.hpp"
#include "splicenet/pipe.hpp"
#include "splicenet/splice-config.hpp"
#include "splicenet/splice-source.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

// Zero-copy transfer engine.
//
// Bytes are moved from the source into a private relay pipe, then from the pipe into the destination socket,
// with splice(2), in chunks of at most maxChunkBytes. Payload bytes never reach user space.
//
// Thread safety: a SpliceEngine is immutable after construction and may be shared by any number of threads.
// Concurrent transfers on the same connection are serialized per direction by the connection access tokens.
//
// Cancellation: there is no cancellation token. Closing the source or destination connection from another
// thread wakes up a transfer blocked on readiness and makes it return with an error.
// The process must ignore SIGPIPE (see IgnoreSigPipe), as splice(2) into a socket reset by its peer raises it.
class SpliceEngine {
 public:
  // Validates the configuration. Throws std::invalid_argument / std::system_error on failure.
  explicit SpliceEngine(SpliceConfig config = {});

  // Move bytes from source to dst with splice(2) until the source reaches end of stream or, if budget is
  // given, until budget->remaining bytes were consumed.
  //
  //  - source not spliceable (generic reader): {0, no error, handled = false}, nothing touched.
  //  - budget->remaining <= 0                : {0, no error, handled = true}.
  //  - relay pipe creation failure           : {0, "pipe" error, handled = false}.
  //  - access token failure                  : {0, "lock" error, handled = true}.
  //  - fatal error during the loop           : {bytes delivered so far, "splice" or "wait" error,
  //                                             handled = true if anything was consumed from the source}.
  // budget->remaining is updated with the number of bytes not consumed from the source.
  [[nodiscard]] TransferResult transfer(Connection& dst, SpliceSource source, ByteBudget* budget = nullptr) const;

  // Same as transfer, but falls back to GenericCopy when the transfer was not handled and the fallback is
  // enabled in the configuration.
  [[nodiscard]] TransferResult copy(Connection& dst, SpliceSource source, ByteBudget* budget = nullptr) const;

  [[nodiscard]] const SpliceConfig& config() const noexcept { return _config; }

 private:
  // Applies the configured capacity to the relay pipe and returns the chunk ceiling for this transfer,
  // never above the capacity granted by the kernel.
  [[nodiscard]] std::size_t prepareRelay(Pipe& relay) const;

  SpliceConfig _config;
};

}  // namespace splicenet
