#include "snowweb/tls-material-manager.hpp"

#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "snowweb/certificate-authority.hpp"
#include "snowweb/error.hpp"
#include "snowweb/log.hpp"
#include "snowweb/tls-material.hpp"

namespace snowweb {

FileMaterialSource::FileMaterialSource(std::string certificatePath, std::string keyPath)
    : _certificatePath(std::move(certificatePath)), _keyPath(std::move(keyPath)) {}

TlsMaterial FileMaterialSource::load() { return TlsMaterial::FromFiles(_certificatePath, _keyPath); }

std::string FileMaterialSource::describe() const {
  return std::format("certificate {} with key {}", _certificatePath, _keyPath);
}

AuthorityMaterialSource::AuthorityMaterialSource(std::unique_ptr<CertificateAuthority> authority)
    : _authority(std::move(authority)) {}

TlsMaterial AuthorityMaterialSource::load() {
  const auto files = _authority->obtainOrRenew();
  return TlsMaterial::FromFiles(files.certificatePath, files.keyPath);
}

std::string AuthorityMaterialSource::describe() const { return _authority->describe(); }

TlsMaterialManager::TlsMaterialManager(std::unique_ptr<TlsMaterialSource> source) : _source(std::move(source)) {
  auto material = std::make_shared<const TlsMaterial>(loadFromSource());
  log::info("Loaded TLS material for '{}' from {}", material->subject(), _source->describe());
  _current.store(std::move(material), std::memory_order_release);
}

TlsMaterial TlsMaterialManager::loadFromSource() {
  try {
    return _source->load();
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::TlsMaterial, "unable to load TLS material", {{"source", _source->describe()}});
  }
}

bool TlsMaterialManager::reload() {
  std::scoped_lock lock(_reloadMutex);
  auto loaded = loadFromSource();
  const auto active = _current.load(std::memory_order_acquire);
  if (active && active->sameSource(loaded.certPem(), loaded.keyPem())) {
    log::debug("TLS material from {} is unchanged", _source->describe());
    return false;
  }
  auto material = std::make_shared<const TlsMaterial>(std::move(loaded));
  log::info("Reloaded TLS material for '{}' from {}", material->subject(), _source->describe());
  _current.store(std::move(material), std::memory_order_release);
  return true;
}

}  // namespace snowweb
