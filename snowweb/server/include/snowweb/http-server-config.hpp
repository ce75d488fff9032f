#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace snowweb {

struct HttpServerConfig {
  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // Whether HTTP/1.1 persistent connections (keep-alive) are enabled. When false, server always closes after
  // each response regardless of client headers. Default: true.
  bool enableKeepAlive{true};

  // Idle timeout for keep-alive connections (duration to wait for the next request after the previous response is
  // fully sent). Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // Timeout of each read and write once a request has started, and of response writes. Default: 30 s.
  std::chrono::milliseconds ioTimeout{std::chrono::seconds{30}};

  // Maximum duration of the TLS handshake. Default: 10 s.
  std::chrono::milliseconds tlsHandshakeTimeout{std::chrono::seconds{10}};

  // Upper bound of the graceful drain started by stop(): connections still open after it are forcibly shut down.
  // Default: 30 s.
  std::chrono::milliseconds drainTimeout{std::chrono::seconds{30}};

  // ============================
  // Request parsing & body limits
  // ============================

  // Maximum allowed size (in bytes) of the request head (request line + all headers + CRLFCRLF).
  // Larger heads are answered with 431. Default: 16 KiB.
  std::size_t maxHeaderBytes{16UL * 1024UL};

  // Maximum allowed request body size. Larger bodies are answered with 413. Default: 1 MiB.
  std::size_t maxBodyBytes{1UL << 20};

  // Value of the Server header added to every response. Empty disables it.
  std::string serverName{"snowweb"};

  HttpServerConfig& withKeepAliveMode(bool on);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withIoTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withTlsHandshakeTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withDrainTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withServerName(std::string_view name);

  // Throws std::invalid_argument on inconsistent values.
  void validate() const;
};

}  // namespace snowweb
