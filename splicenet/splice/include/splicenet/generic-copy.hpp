#pragma once

#include <cstddef>

#include "splicenet/connection.hpp"
#include "splicenet/splice-source.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

// Buffered copy from any source kind to dst, through a user-space buffer of bufferBytes.
// Honours the same budget semantics as SpliceEngine::transfer (non-positive budget is a successful no-op,
// remaining is written back) and always reports handled == true.
// Errors are wrapped with the "read" or "write" operation name.
[[nodiscard]] TransferResult GenericCopy(Connection& dst, SpliceSource source, ByteBudget* budget,
                                         std::size_t bufferBytes);

}  // namespace splicenet
