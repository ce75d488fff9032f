#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace snowweb {

enum class ErrorKind : std::uint8_t {
  Usage,
  ListenerParse,
  ListenerLookup,
  NoSocketsPassed,
  Build,
  BuildOutput,
  TlsMaterial,
  CertificateAuthority,
  Watch,
  Io,
};

[[nodiscard]] std::string_view ErrorKindName(ErrorKind kind) noexcept;

// Tagged error carrying structured context fields (which installable, which file...).
// The underlying cause, if any, is attached with std::throw_with_nested (see ThrowWithCause).
class Error : public std::runtime_error {
 public:
  struct Field {
    std::string key;
    std::string value;
  };

  using Fields = std::vector<Field>;

  Error(ErrorKind kind, const std::string& message, Fields context = {})
      : std::runtime_error(message), _context(std::move(context)), _kind(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] const Fields& context() const noexcept { return _context; }

  // Returns the value of the first context field named 'key', if any.
  [[nodiscard]] std::optional<std::string_view> contextValue(std::string_view key) const noexcept;

 private:
  Fields _context;
  ErrorKind _kind;
};

// Throws an Error whose cause is the exception currently being handled.
// Must be called from within a catch block.
[[noreturn]] inline void ThrowWithCause(ErrorKind kind, const std::string& message, Error::Fields context = {}) {
  std::throw_with_nested(Error(kind, message, std::move(context)));
}

// Renders the full cause chain as "message (key=value, ...): cause: root cause".
[[nodiscard]] std::string FormatErrorChain(const std::exception& ex);

// Returns the kind of the outermost snowweb::Error found in the chain starting at 'ex'.
[[nodiscard]] std::optional<ErrorKind> FindErrorKind(const std::exception& ex);

}  // namespace snowweb
