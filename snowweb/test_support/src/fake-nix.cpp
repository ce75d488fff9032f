#include "snowweb/fake-nix.hpp"

#include <sys/stat.h>

#include <filesystem>
#include <string_view>

#include "snowweb/errno-throw.hpp"
#include "snowweb/temp-file.hpp"

namespace snowweb::test {

namespace {

constexpr std::string_view kFakeNixScript = R"(#!/bin/sh
echo "$@" >> "$(dirname "$0")/invocations"
cmd=""
target=""
profile=""
prev=""
for arg in "$@"; do
  case "$prev" in
    build) target="$arg" ;;
    --profile) profile="$arg" ;;
  esac
  case "$arg" in
    build|path-info) cmd="$arg" ;;
  esac
  prev="$arg"
done
if [ -n "$FAKE_NIX_FAIL" ]; then
  echo "error: fake nix failure" >&2
  exit 1
fi
if [ -n "$FAKE_NIX_GARBAGE" ]; then
  echo "this is not json"
  exit 0
fi
case "$cmd" in
  build)
    if [ ! -d "$target" ]; then
      echo "error: cannot build '$target'" >&2
      exit 1
    fi
    if [ -n "$profile" ]; then
      ln -sfn "$target" "$profile"
    fi
    printf '[{"drvPath":"/nix/store/fake.drv","outputs":{"out":"%s"}}]\n' "$target"
    ;;
  path-info)
    target="$prev"
    hash="sha256-$(basename "$target")"
    if [ -f "$target/.nar-hash" ]; then
      hash="$(cat "$target/.nar-hash")"
    fi
    if [ "$FAKE_NIX_PATH_INFO_FORMAT" = "object" ]; then
      printf '{"%s":{"deriver":null,"narHash":"%s","narSize":1}}\n' "$target" "$hash"
    else
      printf '[{"path":"%s","narHash":"%s","narSize":1,"references":[]}]\n' "$target" "$hash"
    fi
    ;;
  *)
    echo "error: unsupported fake nix command" >&2
    exit 2
    ;;
esac
)";

}  // namespace

std::filesystem::path WriteFakeNix(const std::filesystem::path& dir) {
  const auto path = dir / "nix";
  WriteFile(path, kFakeNixScript);
  if (::chmod(path.c_str(), 0755) != 0) {
    ThrowErrno("chmod failed for '{}'", path.string());
  }
  return path;
}

}  // namespace snowweb::test
