#include "snowweb/directory-builder.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "snowweb/content-root.hpp"
#include "snowweb/error.hpp"
#include "snowweb/file.hpp"
#include "snowweb/log.hpp"

namespace snowweb {

namespace {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

class Sha256 {
 public:
  Sha256() : _ctx(::EVP_MD_CTX_new(), ::EVP_MD_CTX_free) {
    if (!_ctx || ::EVP_DigestInit_ex(_ctx.get(), ::EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
  }

  void update(std::string_view data) { update(data.data(), data.size()); }

  void update(const void* data, std::size_t len) {
    if (::EVP_DigestUpdate(_ctx.get(), data, len) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  // Terminates the entry with a NUL separator.
  void field(std::string_view data) {
    update(data);
    update("\0", 1);
  }

  std::string sriDigest() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md;
    unsigned int mdLen = 0;
    if (::EVP_DigestFinal_ex(_ctx.get(), md.data(), &mdLen) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    std::array<unsigned char, 4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1> b64;
    const int b64Len = ::EVP_EncodeBlock(b64.data(), md.data(), static_cast<int>(mdLen));
    return "sha256-" + std::string(reinterpret_cast<const char*>(b64.data()), static_cast<std::size_t>(b64Len));
  }

 private:
  EvpMdCtxPtr _ctx;
};

void HashFileContent(const std::filesystem::path& path, Sha256& sha) {
  const File file(path.string());
  sha.field(std::to_string(file.size()));
  std::array<std::byte, 16384> buf;
  for (std::size_t offset = 0;;) {
    const auto nbRead = file.readAt(buf, offset);
    if (nbRead == File::kError) {
      throw std::system_error(errno, std::generic_category(), "Unable to read '" + path.string() + "'");
    }
    if (nbRead == 0) {
      break;
    }
    sha.update(buf.data(), nbRead);
    offset += nbRead;
  }
}

}  // namespace

std::string HashDirectoryTree(const std::string& directory) {
  const std::filesystem::path base(directory);
  std::vector<std::filesystem::path> entries;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base)) {
    entries.push_back(entry.path().lexically_relative(base));
  }
  std::ranges::sort(entries, [](const auto& lhs, const auto& rhs) { return lhs.generic_string() < rhs.generic_string(); });

  Sha256 sha;
  for (const auto& relative : entries) {
    const auto full = base / relative;
    const auto status = std::filesystem::symlink_status(full);
    sha.field(relative.generic_string());
    if (std::filesystem::is_symlink(status)) {
      sha.field("l");
      sha.field(std::filesystem::read_symlink(full).generic_string());
    } else if (std::filesystem::is_directory(status)) {
      sha.field("d");
    } else if (std::filesystem::is_regular_file(status)) {
      sha.field("f");
      HashFileContent(full, sha);
    } else {
      sha.field("o");
    }
  }
  return sha.sriDigest();
}

ContentRoot DirectoryBuilder::build(std::string_view installable) {
  const std::string requested(installable);
  ContentRoot root;
  try {
    root.path = std::filesystem::canonical(requested).string();
    if (!std::filesystem::is_directory(root.path)) {
      throw Error(ErrorKind::Build, "not a directory", {{"path", root.path}});
    }
    root.hash = HashDirectoryTree(root.path);
  } catch (const Error&) {
    throw;
  } catch (const std::system_error&) {
    ThrowWithCause(ErrorKind::Build, "unable to read site directory", {{"path", requested}});
  }
  log::debug("Resolved {} to {} ({})", requested, root.path, root.hash);
  return root;
}

}  // namespace snowweb
