#pragma once

#include <cstdint>
#include <optional>

#include "splicenet/op-error.hpp"

namespace splicenet {

// Outcome of a transfer.
//
// handled == false: nothing was consumed from the source nor written to the destination;
//                   the caller can run a generic copy with the same arguments.
//                   error may still be set, for information (for instance the relay pipe could not be created).
// handled == true : written is the exact number of bytes confirmed delivered to the destination,
//                   including when error is set.
struct TransferResult {
  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  int64_t written{0};
  std::optional<OpError> error;
  bool handled{false};
};

}  // namespace splicenet
