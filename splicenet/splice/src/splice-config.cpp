#include "splicenet/splice-config.hpp"

#include <cstddef>
#include <format>
#include <stdexcept>
#include <system_error>

#include "splicenet/log.hpp"
#include "splicenet/pipe.hpp"

namespace splicenet {

void SpliceConfig::validate() const {
  if (maxChunkBytes == 0) {
    throw std::invalid_argument("maxChunkBytes should be strictly positive");
  }
  if (fallbackBufferBytes == 0) {
    throw std::invalid_argument("fallbackBufferBytes should be strictly positive");
  }

  Pipe probe(Pipe::Create{});
  if (!probe) {
    throw std::system_error(probe.openError(), std::generic_category(),
                            "Unable to create a relay pipe to validate the splice configuration");
  }
  if (pipeCapacityBytes != 0 && probe.resize(pipeCapacityBytes) == 0) {
    throw std::invalid_argument(
        std::format("pipeCapacityBytes ({}) refused by the kernel, check /proc/sys/fs/pipe-max-size",
                    pipeCapacityBytes));
  }
  const std::size_t capacity = probe.capacity();
  if (capacity == 0) {
    throw std::invalid_argument("Unable to query the relay pipe capacity");
  }
  if (maxChunkBytes > capacity) {
    throw std::invalid_argument(std::format(
        "maxChunkBytes ({}) exceeds the relay pipe capacity ({}), transfers would block on their own pipe",
        maxChunkBytes, capacity));
  }
  log::debug("Splice configuration validated: chunk {} bytes, relay pipe capacity {} bytes", maxChunkBytes,
             capacity);
}

std::size_t ProbeRelayPipeCapacity(std::size_t requestedBytes) {
  Pipe probe(Pipe::Create{});
  if (!probe) {
    return 0;
  }
  if (requestedBytes != 0) {
    return probe.resize(requestedBytes);
  }
  return probe.capacity();
}

}  // namespace splicenet
