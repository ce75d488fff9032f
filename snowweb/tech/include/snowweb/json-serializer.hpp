#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace snowweb {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

/// Parse 'json' into 'obj', ignoring unknown keys.
/// Returns an empty string on success, otherwise a human readable description of the parse error.
template <typename T>
[[nodiscard]] inline std::string ParseJson(const std::string& json, T& obj) {
  static constexpr glz::opts kOpts{.error_on_unknown_keys = false};
  const auto ec = glz::read<kOpts>(obj, json);
  if (ec) {
    return glz::format_error(ec, json);
  }
  return {};
}

}  // namespace snowweb
