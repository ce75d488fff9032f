#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace snowweb {

struct CertificateFiles {
  std::string certificatePath;
  std::string keyPath;
};

// Obtains certificates from an external authority.
class CertificateAuthority {
 public:
  virtual ~CertificateAuthority() = default;

  // Makes sure a valid certificate is available, obtaining a new one or renewing the existing one when it is close
  // to expiry (the authority decides), and returns where the PEM files are.
  // Throws snowweb::Error{CertificateAuthority} on failure.
  virtual CertificateFiles obtainOrRenew() = 0;

  // Human readable summary, for logs.
  [[nodiscard]] virtual std::string describe() const = 0;
};

struct AcmeConfig {
  static constexpr std::string_view kLetsEncryptProductionDirectory = "https://acme-v02.api.letsencrypt.org/directory";

  // Domains of the certificate. The first one names the certificate files.
  std::vector<std::string> domains;

  // URL of the ACME directory.
  std::string directoryUrl{kLetsEncryptProductionDirectory};

  // Optional PEM bundle of the roots trusted when talking to the ACME directory (exported as LEGO_CA_CERTIFICATES).
  std::string caRootsPath;

  // Optional account email address.
  std::string email;

  // Where accounts and certificates are kept. Empty selects "$XDG_DATA_HOME/snowweb/certstorage".
  std::string storagePath;

  // ACME client executable, looked up in PATH. Must be command line compatible with lego.
  std::string client{"lego"};

  // Extra global arguments given to the client (challenge selection, such as "--dns=rfc2136").
  std::vector<std::string> extraArgs;

  // Certificates expiring in fewer days than this are renewed.
  int renewDays{30};

  AcmeConfig& withDomains(std::vector<std::string> domainList);
  AcmeConfig& withDirectoryUrl(std::string_view url);
  AcmeConfig& withCaRootsPath(std::string_view path);
  AcmeConfig& withEmail(std::string_view address);
  AcmeConfig& withStoragePath(std::string_view path);
  AcmeConfig& withClient(std::string_view executable);
  AcmeConfig& withExtraArgs(std::vector<std::string> args);

  // Throws std::invalid_argument if the configuration is unusable. Fills the default storage path.
  void validate();
};

// Drives a lego compatible ACME client: 'run' when no certificate has been obtained yet, 'renew' otherwise.
class AcmeClientAuthority final : public CertificateAuthority {
 public:
  // Validates 'config'.
  explicit AcmeClientAuthority(AcmeConfig config);

  CertificateFiles obtainOrRenew() override;

  [[nodiscard]] std::string describe() const override;

  // Files produced by the client for the first domain.
  [[nodiscard]] CertificateFiles certificateFiles() const;

  // Full command line to run, depending on whether a certificate already exists.
  [[nodiscard]] std::vector<std::string> buildCommand(bool certificateExists) const;

  [[nodiscard]] const AcmeConfig& config() const noexcept { return _config; }

 private:
  AcmeConfig _config;
};

// Default certificate storage directory: "$XDG_DATA_HOME/snowweb/certstorage", XDG_DATA_HOME defaulting to
// "$HOME/.local/share".
[[nodiscard]] std::string DefaultAcmeStoragePath();

}  // namespace snowweb
