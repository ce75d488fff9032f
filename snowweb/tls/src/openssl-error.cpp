#include "snowweb/openssl-error.hpp"

#include <openssl/err.h>

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace snowweb {

std::string DrainOpenSslErrors() {
  std::string out;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    std::array<char, 256> errBuf;
    ::ERR_error_string_n(errVal, errBuf.data(), errBuf.size());
    if (!out.empty()) {
      out.append("; ");
    }
    out.append(errBuf.data());
  }
  return out;
}

void ThrowOpenSslError(std::string_view what) {
  std::string msg(what);
  const auto details = DrainOpenSslErrors();
  if (!details.empty()) {
    msg.append(": ");
    msg.append(details);
  }
  throw std::runtime_error(msg);
}

}  // namespace snowweb
