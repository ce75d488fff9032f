#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "snowweb/certificate-authority.hpp"
#include "snowweb/http-status-code.hpp"

namespace snowweb {

// Process configuration, from the command line and SNOWWEB_* environment variables.
// Command line values take precedence over environment ones.
struct CliOptions {
  static constexpr std::string_view kDefaultListen = "tcp:[::1]:";

  std::string installable;

  std::string listen{kDefaultListen};
  std::string logSink{"stderr"};
  std::string logLevel{"info"};

  std::string certificate;
  std::string key;
  std::string clientCa;

  std::vector<std::string> acmeDomains;
  std::string acmeCa{AcmeConfig::kLetsEncryptProductionDirectory};
  std::string acmeCaRoots;
  std::string acmeEmail;
  std::string acmeStorage;
  std::string acmeClient{"lego"};
  std::vector<std::string> acmeClientArgs;

  std::string builder{"nix"};
  std::string profile;
  std::vector<std::string> watchPaths;

  http::StatusCode reloadFailureStatus{http::StatusCodeOK};
  std::chrono::seconds drainTimeout{30};

  bool help{false};

  [[nodiscard]] bool fileTls() const noexcept { return !certificate.empty(); }

  [[nodiscard]] bool acmeTls() const noexcept { return !acmeDomains.empty(); }

  [[nodiscard]] bool tlsEnabled() const noexcept { return fileTls() || acmeTls(); }

  [[nodiscard]] AcmeConfig acmeConfig() const;
};

// Parses and validates the options. Throws Error{Usage} (with the parser error as nested cause, if any).
[[nodiscard]] CliOptions ParseCliOptions(int argc, const char* const* argv);

// Help text listing all options and their environment variables.
[[nodiscard]] std::string CliUsage(std::string_view programName);

}  // namespace snowweb
