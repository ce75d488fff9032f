#include "snowweb/certificate-authority.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "snowweb/error.hpp"
#include "snowweb/log.hpp"
#include "snowweb/subprocess.hpp"

namespace snowweb {

namespace {

// lego stores '*.example.org' as '_.example.org'.
std::string SanitizedDomain(std::string_view domain) {
  std::string out(domain);
  std::ranges::replace(out, '*', '_');
  return out;
}

std::string JoinDomains(const std::vector<std::string>& domains) {
  std::string out;
  for (const auto& domain : domains) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(domain);
  }
  return out;
}

}  // namespace

AcmeConfig& AcmeConfig::withDomains(std::vector<std::string> domainList) {
  domains = std::move(domainList);
  return *this;
}

AcmeConfig& AcmeConfig::withDirectoryUrl(std::string_view url) {
  directoryUrl = url;
  return *this;
}

AcmeConfig& AcmeConfig::withCaRootsPath(std::string_view path) {
  caRootsPath = path;
  return *this;
}

AcmeConfig& AcmeConfig::withEmail(std::string_view address) {
  email = address;
  return *this;
}

AcmeConfig& AcmeConfig::withStoragePath(std::string_view path) {
  storagePath = path;
  return *this;
}

AcmeConfig& AcmeConfig::withClient(std::string_view executable) {
  client = executable;
  return *this;
}

AcmeConfig& AcmeConfig::withExtraArgs(std::vector<std::string> args) {
  extraArgs = std::move(args);
  return *this;
}

void AcmeConfig::validate() {
  if (domains.empty()) {
    throw std::invalid_argument("ACME requires at least one domain");
  }
  for (const auto& domain : domains) {
    if (domain.empty() || domain.find_first_of(" /,") != std::string::npos) {
      throw std::invalid_argument(std::format("Invalid ACME domain '{}'", domain));
    }
  }
  if (directoryUrl.empty()) {
    throw std::invalid_argument("ACME directory URL must not be empty");
  }
  if (client.empty()) {
    throw std::invalid_argument("ACME client must not be empty");
  }
  if (renewDays <= 0) {
    throw std::invalid_argument("ACME renewal window must be positive");
  }
  if (storagePath.empty()) {
    storagePath = DefaultAcmeStoragePath();
  }
}

std::string DefaultAcmeStoragePath() {
  std::filesystem::path base;
  if (const char* dataHome = std::getenv("XDG_DATA_HOME"); dataHome != nullptr && *dataHome != '\0') {
    base = dataHome;
  } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    base = std::filesystem::path(home) / ".local" / "share";
  } else {
    base = ".";
  }
  return (base / "snowweb" / "certstorage").string();
}

AcmeClientAuthority::AcmeClientAuthority(AcmeConfig config) : _config(std::move(config)) { _config.validate(); }

CertificateFiles AcmeClientAuthority::certificateFiles() const {
  const auto certificatesDir = std::filesystem::path(_config.storagePath) / "certificates";
  const auto name = SanitizedDomain(_config.domains.front());
  return {(certificatesDir / (name + ".crt")).string(), (certificatesDir / (name + ".key")).string()};
}

std::vector<std::string> AcmeClientAuthority::buildCommand(bool certificateExists) const {
  std::vector<std::string> argv{_config.client, "--accept-tos", "--server", _config.directoryUrl,
                                "--path", _config.storagePath};
  if (!_config.email.empty()) {
    argv.emplace_back("--email");
    argv.push_back(_config.email);
  }
  for (const auto& domain : _config.domains) {
    argv.emplace_back("--domains");
    argv.push_back(domain);
  }
  argv.insert(argv.end(), _config.extraArgs.begin(), _config.extraArgs.end());
  if (certificateExists) {
    argv.emplace_back("renew");
    argv.emplace_back("--days");
    argv.push_back(std::to_string(_config.renewDays));
  } else {
    argv.emplace_back("run");
  }
  return argv;
}

CertificateFiles AcmeClientAuthority::obtainOrRenew() {
  auto files = certificateFiles();
  std::error_code ec;
  const bool exists = std::filesystem::exists(files.certificatePath, ec);
  const auto argv = buildCommand(exists);
  const auto command = FormatCommand(argv);

  EnvironmentOverrides env;
  if (!_config.caRootsPath.empty()) {
    env.emplace_back("LEGO_CA_CERTIFICATES", _config.caRootsPath);
  }

  log::info("{} certificate for {} with '{}'", exists ? "Renewing" : "Obtaining", JoinDomains(_config.domains),
            command);
  CommandResult result;
  try {
    result = RunCommand(argv, env);
  } catch (const std::system_error&) {
    ThrowWithCause(ErrorKind::CertificateAuthority, "unable to run ACME client", {{"command", command}});
  }
  if (result.exitStatus != 0) {
    throw Error(ErrorKind::CertificateAuthority, "ACME client failed",
                {{"command", command}, {"status", std::to_string(result.exitStatus)}});
  }
  if (!std::filesystem::exists(files.certificatePath, ec)) {
    throw Error(ErrorKind::CertificateAuthority, "ACME client did not produce a certificate",
                {{"path", files.certificatePath}});
  }
  return files;
}

std::string AcmeClientAuthority::describe() const {
  return std::format("ACME {} for {}", _config.directoryUrl, JoinDomains(_config.domains));
}

}  // namespace snowweb
