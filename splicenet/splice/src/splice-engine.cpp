#include "splicenet/splice-engine.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <system_error>
#include <utility>

#include "splicenet/connection.hpp"
#include "splicenet/generic-copy.hpp"
#include "splicenet/log.hpp"
#include "splicenet/op-error.hpp"
#include "splicenet/pipe.hpp"
#include "splicenet/platform.hpp"
#include "splicenet/splice-config.hpp"
#include "splicenet/splice-endpoint.hpp"
#include "splicenet/splice-source.hpp"
#include "splicenet/splice.hpp"
#include "splicenet/transfer-result.hpp"

namespace splicenet {

namespace {

constexpr int64_t kUntilEndOfStream = std::numeric_limits<int64_t>::max();

std::error_code MakeErrorCode(int err) { return {err, std::generic_category()}; }

// Connection used to describe errors on the source side: the source itself when it is a connection,
// the destination otherwise (plain files carry no network context).
const Connection& SourceContext(const SpliceEndpoint& src, const Connection& dst) {
  return src.cnx != nullptr ? *src.cnx : dst;
}

}  // namespace

SpliceEngine::SpliceEngine(SpliceConfig config) : _config(std::move(config)) { _config.validate(); }

std::size_t SpliceEngine::prepareRelay(Pipe& relay) const {
  if (_config.pipeCapacityBytes != 0) {
    // Failure is logged by resize, the capacity check below decides what we can use.
    [[maybe_unused]] const auto granted = relay.resize(_config.pipeCapacityBytes);
  }
  const std::size_t capacity = relay.capacity();
  if (capacity != 0 && capacity < _config.maxChunkBytes) {
    log::warn("Relay pipe capacity {} is lower than the configured chunk size {}, clamping", capacity,
              _config.maxChunkBytes);
    return capacity;
  }
  return _config.maxChunkBytes;
}

TransferResult SpliceEngine::transfer(Connection& dst, SpliceSource source, ByteBudget* budget) const {
  TransferResult result;

  SpliceEndpoint src = ResolveSource(source);
  if (!src.supported()) {
    log::trace("Source of transfer to {} cannot be spliced", dst.remoteAddress());
    return result;
  }
  if (budget != nullptr && budget->remaining <= 0) {
    result.handled = true;
    return result;
  }
  SpliceEndpoint out = ResolveDestination(dst);

  EndpointLock outLock(out);
  if (outLock.error()) {
    result.error.emplace("lock", dst, outLock.error());
    result.handled = true;
    return result;
  }
  EndpointLock srcLock(src);
  if (srcLock.error()) {
    result.error.emplace("lock", SourceContext(src, dst), srcLock.error());
    result.handled = true;
    return result;
  }

  Pipe relay(Pipe::Create{});
  if (!relay) {
    result.error.emplace("pipe", dst, MakeErrorCode(relay.openError()));
    return result;
  }
  const std::size_t chunkCeiling = prepareRelay(relay);

  int64_t remaining = budget != nullptr ? budget->remaining : kUntilEndOfStream;
  int64_t consumed = 0;
  std::size_t pipeLen = 0;
  bool sourceDone = false;

  while ((!sourceDone && remaining > 0) || pipeLen > 0) {
    // Read step: only if the chunk fits in what is left of the pipe. The pipe side is non-blocking because the
    // pipe may also run out of buffer slots (one per socket segment) before its byte capacity is reached: a
    // full pipe then reports WouldBlock and the drain below frees it, as only this loop reads from it.
    const std::size_t toRead =
        sourceDone ? 0 : static_cast<std::size_t>(std::min(static_cast<int64_t>(chunkCeiling), remaining));
    if (toRead > 0 && pipeLen + toRead <= chunkCeiling) {
      const SpliceStatus status =
          Splice(src.fd, relay.writeFd(), toRead, remaining > static_cast<int64_t>(toRead), true);
      switch (status.kind) {
        case SpliceStatus::Kind::Progress:
          if (status.bytes == 0) {
            sourceDone = true;
          } else {
            pipeLen += status.bytes;
            remaining -= static_cast<int64_t>(status.bytes);
            consumed += static_cast<int64_t>(status.bytes);
          }
          break;
        case SpliceStatus::Kind::WouldBlock:
          // An empty pipe has free slots: the source is not ready.
          if (pipeLen == 0) {
            if (auto ec = src.wait()) {
              result.error.emplace("wait", SourceContext(src, dst), ec);
              break;
            }
            continue;
          }
          // Source not ready or pipe out of slots: drain what is buffered first.
          break;
        case SpliceStatus::Kind::Fatal:
          result.error.emplace("splice", SourceContext(src, dst), MakeErrorCode(status.err));
          break;
      }
      if (result.error) {
        break;
      }
    }

    if (pipeLen == 0) {
      continue;
    }

    // Drain step: never ask more than the pipe holds, so the blocking read end never waits.
    const SpliceStatus status = Splice(relay.readFd(), out.fd, pipeLen, remaining > 0 && !sourceDone);
    if (status.kind == SpliceStatus::Kind::Progress) {
      if (status.bytes == 0) {
        break;
      }
      pipeLen -= status.bytes;
      result.written += static_cast<int64_t>(status.bytes);
    } else if (status.kind == SpliceStatus::Kind::WouldBlock) {
      if (auto ec = out.wait()) {
        result.error.emplace("wait", dst, ec);
        break;
      }
    } else {
      result.error.emplace("splice", dst, MakeErrorCode(status.err));
      break;
    }
  }

  if (budget != nullptr) {
    budget->remaining = remaining;
  }
  result.handled = result.written > 0 || consumed > 0;
  if (result.error) {
    log::debug("Splice transfer fd # {} -> fd # {} stopped after {} bytes: {}", src.fd, out.fd, result.written,
               result.error->message());
  } else {
    log::trace("Splice transfer fd # {} -> fd # {} done, {} bytes", src.fd, out.fd, result.written);
  }
  return result;
}

TransferResult SpliceEngine::copy(Connection& dst, SpliceSource source, ByteBudget* budget) const {
  TransferResult result = transfer(dst, source, budget);
  if (result.handled || !_config.enableFallback) {
    return result;
  }
  if (result.error) {
    const int cause = result.error->cause().value();
    if (cause == error::kNotImplemented || cause == error::kInvalidPairing) {
      log::debug("splice unsupported towards {} ({}), falling back to buffered copy", dst.remoteAddress(),
                 result.error->message());
    } else {
      log::warn("Zero-copy transfer failed before any progress ({}), falling back to buffered copy",
                result.error->message());
    }
  }
  return GenericCopy(dst, source, budget, _config.fallbackBufferBytes);
}

}  // namespace splicenet
