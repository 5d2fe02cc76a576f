#include "splicenet/temp-file.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "splicenet/log.hpp"

namespace splicenet::test {

namespace {

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

std::string UniqueSuffix() {
  std::uniform_int_distribution<uint64_t> dist;
  return std::format("{:016x}", dist(ThreadRng()));
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + UniqueSuffix());
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (_dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("ScopedTempDir: failed to remove {}: {}", _dir.string(), ec.message());
  }
  _dir.clear();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content)
    : _path(dir.dirPath() / ("file-" + UniqueSuffix())), _content(content) {
  std::ofstream ofs(_path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error(std::format("ScopedTempFile: unable to create {}", _path.string()));
  }
  ofs.write(_content.data(), static_cast<std::streamsize>(_content.size()));
  if (!ofs) {
    throw std::runtime_error(std::format("ScopedTempFile: unable to write {}", _path.string()));
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

void ScopedTempFile::cleanup() noexcept {
  if (_path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(_path, ec);
  _path.clear();
}

}  // namespace splicenet::test
