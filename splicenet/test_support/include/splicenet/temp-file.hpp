#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace splicenet::test {

// Uniquely named temporary directory under the system temp directory, removed with its content on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "splicenet-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// File with the given content, created with a unique name inside an existing ScopedTempDir.
// The file is removed on destruction, the directory is left to its owner.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  ScopedTempFile(ScopedTempDir&& dir, std::string_view content) = delete;

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile() { cleanup(); }

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  void cleanup() noexcept;

 private:
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace splicenet::test
