#pragma once

#include <cstdint>
#include <variant>

#include "splicenet/byte-reader.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/file.hpp"

namespace splicenet {

// Source of a transfer. Pointers are non-owning and must not be null.
//  - File*        : plain file, read from its current offset
//  - Connection*  : socket connection, read side
//  - IByteReader* : any other reader, never spliced
using SpliceSource = std::variant<File*, Connection*, IByteReader*>;

// Caller-owned byte budget of a bounded transfer.
// On return, remaining holds the number of bytes that were not consumed from the source,
// so the caller can resume the transfer or report how much was left.
struct ByteBudget {
  int64_t remaining{0};
};

}  // namespace splicenet
