#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "snowweb/certificate-authority.hpp"
#include "snowweb/tls-material.hpp"

namespace snowweb {

// Where TLS material comes from.
class TlsMaterialSource {
 public:
  virtual ~TlsMaterialSource() = default;

  // Produces the current material. May throw any exception, the manager wraps it.
  virtual TlsMaterial load() = 0;

  // Files whose replacement should trigger a reload (empty if not file based).
  [[nodiscard]] virtual std::vector<std::string> watchedFiles() const { return {}; }

  [[nodiscard]] virtual std::string describe() const = 0;
};

// Reads a certificate chain and key from two PEM files on each load.
class FileMaterialSource final : public TlsMaterialSource {
 public:
  FileMaterialSource(std::string certificatePath, std::string keyPath);

  TlsMaterial load() override;

  [[nodiscard]] std::vector<std::string> watchedFiles() const override { return {_certificatePath, _keyPath}; }

  [[nodiscard]] std::string describe() const override;

 private:
  std::string _certificatePath;
  std::string _keyPath;
};

// Asks a certificate authority to obtain or renew the certificate, then reads the resulting files.
class AuthorityMaterialSource final : public TlsMaterialSource {
 public:
  explicit AuthorityMaterialSource(std::unique_ptr<CertificateAuthority> authority);

  TlsMaterial load() override;

  [[nodiscard]] std::string describe() const override;

 private:
  std::unique_ptr<CertificateAuthority> _authority;
};

// Holds the TLS material presented by new handshakes and replaces it at runtime.
// currentCertificate() is lock free and may be called concurrently from any handshake.
// reload() calls are serialized; a failed reload leaves the previous material active.
class TlsMaterialManager {
 public:
  // Performs the initial load. Throws snowweb::Error{TlsMaterial} on failure.
  explicit TlsMaterialManager(std::unique_ptr<TlsMaterialSource> source);

  TlsMaterialManager(const TlsMaterialManager&) = delete;
  TlsMaterialManager& operator=(const TlsMaterialManager&) = delete;

  [[nodiscard]] std::shared_ptr<const TlsMaterial> currentCertificate() const noexcept {
    return _current.load(std::memory_order_acquire);
  }

  // Loads material from the source again and publishes it.
  // Returns false if the loaded PEM bytes are identical to the active ones (the active object is kept).
  // Throws snowweb::Error{TlsMaterial} on failure, the active material being left untouched.
  bool reload();

  [[nodiscard]] const TlsMaterialSource& source() const noexcept { return *_source; }

 private:
  [[nodiscard]] TlsMaterial loadFromSource();

  std::unique_ptr<TlsMaterialSource> _source;
  std::mutex _reloadMutex;
  std::atomic<std::shared_ptr<const TlsMaterial>> _current;
};

}  // namespace snowweb
