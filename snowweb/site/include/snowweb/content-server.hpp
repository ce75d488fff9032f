#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "snowweb/content-root.hpp"
#include "snowweb/error-responder.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"

namespace snowweb {

// Serves the files of one ContentRoot. Immutable after construction, safe for concurrent use.
//
// Every file shares the tree-wide ETag derived from the root hash. When the client accepts Brotli, a precompressed
// "<file>.br" sibling is served instead of the file itself, with "Content-Encoding: br".
class ContentServer {
 public:
  static constexpr std::string_view kCacheControl = "public, max-age=0, proxy-revalidate";
  static constexpr std::string_view kIndexFile = "index.html";

  ContentServer(ContentRoot root, std::shared_ptr<const ErrorResponder> errorResponder);

  [[nodiscard]] HttpResponse serve(const HttpRequest& request) const;

  [[nodiscard]] const ContentRoot& root() const noexcept { return _root; }

  // Quoted strong entity tag of the tree.
  [[nodiscard]] const std::string& etag() const noexcept { return _etag; }

  // Maps a decoded request path to a path relative to the root: leading slashes are stripped, "index.html" is
  // appended to an empty path or a path ending with '/'.
  // Returns std::nullopt if the result has an empty, "." or ".." segment, or a NUL byte.
  [[nodiscard]] static std::optional<std::string> NormalizePath(std::string_view requestPath);

 private:
  ContentRoot _root;
  std::string _etag;
  std::shared_ptr<const ErrorResponder> _errorResponder;
};

}  // namespace snowweb
