#include "snowweb/mime-mappings.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>

namespace snowweb {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view DetermineMIMEType(std::string_view path) noexcept {
  const auto slashPos = path.rfind('/');
  const std::string_view fileName = slashPos == std::string_view::npos ? path : path.substr(slashPos + 1);
  const auto dotPos = fileName.rfind('.');
  if (dotPos != std::string_view::npos) {
    const std::string_view ext = fileName.substr(dotPos + 1);
    const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
    if (it != std::end(kMIMEMappings) && it->extension == ext) {
      return it->mimeType;
    }
  }
  return kDefaultMIMEType;
}

}  // namespace snowweb
