#pragma once

#include <string>
#include <string_view>

namespace snowweb {

// Pops all errors of the thread's OpenSSL error queue, formatted and joined with "; ".
[[nodiscard]] std::string DrainOpenSslErrors();

// Throws std::runtime_error with 'what' followed by the drained OpenSSL error queue.
[[noreturn]] void ThrowOpenSslError(std::string_view what);

}  // namespace snowweb
