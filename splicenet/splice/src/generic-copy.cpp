#include "splicenet/generic-copy.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <variant>

#include "splicenet/byte-reader.hpp"
#include "splicenet/connection.hpp"
#include "splicenet/file.hpp"
#include "splicenet/io-result.hpp"
#include "splicenet/log.hpp"
#include "splicenet/splice-source.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

TransferResult GenericCopy(Connection& dst, SpliceSource source, ByteBudget* budget, std::size_t bufferBytes) {
  TransferResult result;
  result.handled = true;

  int64_t remaining = budget != nullptr ? budget->remaining : std::numeric_limits<int64_t>::max();
  if (remaining <= 0) {
    return result;
  }

  bufferBytes = std::max<std::size_t>(bufferBytes, 1);
  auto buffer = std::make_unique_for_overwrite<std::byte[]>(bufferBytes);

  const Connection& readContext = std::holds_alternative<Connection*>(source) ? *std::get<Connection*>(source) : dst;

  while (remaining > 0) {
    const std::span<std::byte> chunk(buffer.get(),
                                     static_cast<std::size_t>(std::min<int64_t>(
                                         static_cast<int64_t>(bufferBytes), remaining)));
    const IoResult rd = std::visit(Overloaded{[chunk](File* file) { return file->read(chunk); },
                                              [chunk](Connection* cnx) { return cnx->read(chunk); },
                                              [chunk](IByteReader* reader) { return reader->read(chunk); }},
                                   source);
    if (rd.ec) {
      result.error.emplace("read", readContext, rd.ec);
      break;
    }
    if (rd.bytes == 0) {
      break;
    }
    remaining -= static_cast<int64_t>(rd.bytes);

    const IoResult wr = dst.writeAll(std::span<const std::byte>(buffer.get(), rd.bytes));
    result.written += static_cast<int64_t>(wr.bytes);
    if (wr.ec) {
      result.error.emplace("write", dst, wr.ec);
      break;
    }
  }

  if (budget != nullptr) {
    budget->remaining = remaining;
  }
  log::trace("Buffered copy to {}: {} bytes", dst.remoteAddress(), result.written);
  return result;
}

}  // namespace splicenet
