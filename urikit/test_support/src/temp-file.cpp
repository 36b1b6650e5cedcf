#include "urikit/temp-file.hpp"

#include <unistd.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "urikit/base-fd.hpp"
#include "urikit/errno-throw.hpp"
#include "urikit/log.hpp"

namespace urikit::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  static std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view content) : _content(content) {
  // mkstemp gives an atomic create+open
  std::string tmpl = (dir.dirPath() / "urikit_temp_XXXXXX").string();

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    throw_errno("ScopedTempFile: mkstemp failed in {}", dir.dirPath().string());
  }
  _path = std::filesystem::path(tmpl);

  const auto written = ::write(raii.fd(), content.data(), content.size());
  if (std::cmp_not_equal(written, content.size())) {
    cleanup();
    throw std::runtime_error("ScopedTempFile: write failed");
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {} ({})", _path.string(), ec.value(), ec.message());
    } else if (!removed) {
      log::error("ScopedTempFile::cleanup: expected to remove file {}, but nothing was removed", _path.string());
    }
    _path.clear();
  }
}

}  // namespace urikit::test
