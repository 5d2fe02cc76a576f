#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "splicenet/io-result.hpp"

namespace splicenet {

// Generic byte source that is neither a plain file nor a socket connection.
// Such sources cannot be spliced; transfers from them always go through the buffered copy.
class IByteReader {
 public:
  virtual ~IByteReader() = default;

  // Read up to dst.size() bytes. Returns {0, {}} at end of stream.
  [[nodiscard]] virtual IoResult read(std::span<std::byte> dst) = 0;
};

// In-memory reader over a caller-owned buffer.
class StringReader : public IByteReader {
 public:
  explicit StringReader(std::string_view data) noexcept : _data(data) {}

  [[nodiscard]] IoResult read(std::span<std::byte> dst) override;

  // Number of bytes not read yet.
  [[nodiscard]] std::size_t remaining() const noexcept { return _data.size(); }

 private:
  std::string_view _data;
};

}  // namespace splicenet
