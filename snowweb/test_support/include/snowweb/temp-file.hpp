#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace snowweb::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "snowweb-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Create (or overwrite) file 'relativePath' with 'content', creating parent directories as needed.
  // Returns the full path of the file.
  std::filesystem::path writeFile(std::string_view relativePath, std::string_view content) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Write 'content' to 'path' (truncating). Throws std::runtime_error on failure.
void WriteFile(const std::filesystem::path& path, std::string_view content);

}  // namespace snowweb::test
