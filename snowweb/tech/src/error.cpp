#include "snowweb/error.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace snowweb {

namespace {

void AppendOne(const std::exception& ex, std::string& out) {
  out.append(ex.what());
  const auto* err = dynamic_cast<const Error*>(&ex);
  if (err == nullptr || err->context().empty()) {
    return;
  }
  out.append(" (");
  bool first = true;
  for (const auto& field : err->context()) {
    if (!first) {
      out.append(", ");
    }
    first = false;
    out.append(field.key);
    out.push_back('=');
    out.append(field.value);
  }
  out.push_back(')');
}

void AppendChain(const std::exception& ex, std::string& out) {
  AppendOne(ex, out);
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& cause) {
    out.append(": ");
    AppendChain(cause, out);
  }
}

}  // namespace

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Usage:
      return "usage";
    case ErrorKind::ListenerParse:
      return "listener-parse";
    case ErrorKind::ListenerLookup:
      return "listener-lookup";
    case ErrorKind::NoSocketsPassed:
      return "no-sockets-passed";
    case ErrorKind::Build:
      return "build";
    case ErrorKind::BuildOutput:
      return "build-output";
    case ErrorKind::TlsMaterial:
      return "tls-material";
    case ErrorKind::CertificateAuthority:
      return "certificate-authority";
    case ErrorKind::Watch:
      return "watch";
    case ErrorKind::Io:
      return "io";
  }
  return "unknown";
}

std::optional<std::string_view> Error::contextValue(std::string_view key) const noexcept {
  for (const auto& field : _context) {
    if (field.key == key) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

std::string FormatErrorChain(const std::exception& ex) {
  std::string out;
  AppendChain(ex, out);
  return out;
}

std::optional<ErrorKind> FindErrorKind(const std::exception& ex) {
  if (const auto* err = dynamic_cast<const Error*>(&ex)) {
    return err->kind();
  }
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& cause) {
    return FindErrorKind(cause);
  }
  return std::nullopt;
}

}  // namespace snowweb
