#pragma once

#include <filesystem>

namespace snowweb::test {

// Writes an executable shell script at 'dir'/nix mimicking the nix commands used by NixBuilder:
//  * "build <installable>" requires the installable to be an existing directory and reports it as the "out" path
//    (updating the --profile symlink if given)
//  * "path-info --json <path>" reports the content of '<path>/.nar-hash' as narHash, or "sha256-<basename>"
// Each invocation appends its arguments to 'dir'/invocations.
// Environment knobs: FAKE_NIX_FAIL (exit 1), FAKE_NIX_GARBAGE (print invalid JSON),
// FAKE_NIX_PATH_INFO_FORMAT=object (newer path-info output keyed by store path).
std::filesystem::path WriteFakeNix(const std::filesystem::path& dir);

}  // namespace snowweb::test
