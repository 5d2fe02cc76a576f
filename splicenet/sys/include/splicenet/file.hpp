#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "splicenet/base-fd.hpp"
#include "splicenet/io-result.hpp"
#include "splicenet/platform.hpp"

namespace splicenet {

// Read-only plain file usable as a transfer source.
// Reads advance the file offset, so a partially transferred File can be handed to another transfer to resume.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path.
  // On success, the File owns the underlying descriptor and will close it on destruction.
  // On failure (logged), operator bool() returns false.
  explicit File(const std::string& path) : File(path.c_str()) {}

  explicit File(std::string_view path);

  explicit File(const char* path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

  // Current size in bytes, or kError if the file is closed or fstat fails.
  [[nodiscard]] std::size_t size() const noexcept;

  // Read up to dst.size() bytes at the current offset, retrying EINTR.
  // Returns {0, {}} at end of file.
  [[nodiscard]] IoResult read(std::span<std::byte> dst) const;

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
};

}  // namespace splicenet
