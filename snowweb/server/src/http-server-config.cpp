#include "snowweb/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace snowweb {

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withIoTimeout(std::chrono::milliseconds timeout) {
  this->ioTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTlsHandshakeTimeout(std::chrono::milliseconds timeout) {
  this->tlsHandshakeTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDrainTimeout(std::chrono::milliseconds timeout) {
  this->drainTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withServerName(std::string_view name) {
  this->serverName = name;
  return *this;
}

void HttpServerConfig::validate() const {
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (keepAliveTimeout.count() <= 0) {
    throw std::invalid_argument("keepAliveTimeout must be positive");
  }
  if (ioTimeout.count() <= 0) {
    throw std::invalid_argument("ioTimeout must be positive");
  }
  if (tlsHandshakeTimeout.count() <= 0) {
    throw std::invalid_argument("tlsHandshakeTimeout must be positive");
  }
  if (drainTimeout.count() < 0) {
    throw std::invalid_argument("drainTimeout must be non-negative");
  }
  if (serverName.find_first_of("\r\n") != std::string_view::npos) {
    throw std::invalid_argument("serverName must not contain line breaks");
  }
}

}  // namespace snowweb
