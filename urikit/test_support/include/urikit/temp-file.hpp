#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace urikit::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (with its content) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "urikit-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Path of a (not created) file named 'name' inside this directory.
  [[nodiscard]] std::filesystem::path filePath(std::string_view name) const { return _dir / name; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: creates a uniquely named file with given content inside an existing ScopedTempDir,
// and removes it on destruction.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  // Full path to the file
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] std::string pathStr() const { return _path.string(); }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace urikit::test
