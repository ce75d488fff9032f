#pragma once

#include <string>

namespace snowweb {

// Immutable directory tree to serve, identified by its content digest.
struct ContentRoot {
  // Absolute path of the tree (a Nix store path, or a resolved directory).
  std::string path;
  // SRI digest of the whole tree ("sha256-..."), shared by every file as ETag.
  std::string hash;

  bool operator==(const ContentRoot&) const = default;
};

}  // namespace snowweb
