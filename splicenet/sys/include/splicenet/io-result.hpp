#pragma once

#include <cstddef>
#include <system_error>

namespace splicenet {

// Outcome of a blocking read or write helper.
// bytes is meaningful even when ec is set (partial progress before the failure).
// A read returning {0, {}} means end of stream.
struct IoResult {
  std::size_t bytes{0};
  std::error_code ec;
};

}  // namespace splicenet
