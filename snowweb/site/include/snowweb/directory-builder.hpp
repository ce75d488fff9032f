#pragma once

#include <string>
#include <string_view>

#include "snowweb/content-root.hpp"
#include "snowweb/site-builder.hpp"

namespace snowweb {

// Serves an existing directory as is. The installable is a directory path (symlinks resolved at each build),
// and the hash is a SHA-256 digest of the whole tree, so the ETag changes exactly when the content does.
class DirectoryBuilder final : public SiteBuilder {
 public:
  // Throws Error{Build} if the installable is not a readable directory.
  [[nodiscard]] ContentRoot build(std::string_view installable) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "directory"; }
};

// SRI form ("sha256-<base64>") digest over the sorted entries of 'directory': relative path, entry type, then the
// file content or the symlink target. Symlinks are not followed.
// Throws std::filesystem::filesystem_error or std::system_error on I/O failure.
[[nodiscard]] std::string HashDirectoryTree(const std::string& directory);

}  // namespace snowweb
