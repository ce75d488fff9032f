#pragma once

#include <string_view>

#include "snowweb/content-root.hpp"

namespace snowweb {

// Turns an installable identifier into a ContentRoot.
// Implementations throw on failure (snowweb::Error with kind Build or BuildOutput, std::system_error...).
class SiteBuilder {
 public:
  virtual ~SiteBuilder() = default;

  [[nodiscard]] virtual ContentRoot build(std::string_view installable) = 0;

  // Short name for logs ("nix", "directory").
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace snowweb
