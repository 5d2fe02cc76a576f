#include "splicenet/byte-reader.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>

#include "splicenet/io-result.hpp"

namespace splicenet {

IoResult StringReader::read(std::span<std::byte> dst) {
  const std::size_t nbBytes = std::min(dst.size(), _data.size());
  if (nbBytes != 0) {
    std::memcpy(dst.data(), _data.data(), nbBytes);
    _data.remove_prefix(nbBytes);
  }
  return {nbBytes, {}};
}

}  // namespace splicenet
