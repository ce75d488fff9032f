#include "snowweb/http-server.hpp"

#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "snowweb/errno-throw.hpp"
#include "snowweb/event-loop.hpp"
#include "snowweb/event.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-header.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/http-status-code.hpp"
#include "snowweb/log.hpp"
#include "snowweb/string-equal-ignore-case.hpp"
#include "snowweb/string-trim.hpp"
#include "snowweb/timedef.hpp"
#include "snowweb/tls-transport.hpp"

namespace snowweb {

namespace {

constexpr std::chrono::milliseconds kPollTimeout{250};
constexpr std::size_t kReadChunkSize = 8192;
constexpr std::string_view kContinueInterim = "HTTP/1.1 100 Continue\r\n\r\n";

void SetSocketTimeouts(int fd, std::chrono::milliseconds recvTimeout, std::chrono::milliseconds sendTimeout) {
  const auto toTimeval = [](std::chrono::milliseconds timeout) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(secs.count());
    tv.tv_usec = static_cast<suseconds_t>(std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs).count());
    return tv;
  };
  const timeval recvTv = toTimeval(recvTimeout);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &recvTv, sizeof(recvTv)) != 0) {
    ThrowErrno("setsockopt(SO_RCVTIMEO) failed for fd # {}", fd);
  }
  const timeval sendTv = toTimeval(sendTimeout);
  if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &sendTv, sizeof(sendTv)) != 0) {
    ThrowErrno("setsockopt(SO_SNDTIMEO) failed for fd # {}", fd);
  }
}

std::string HttpDate() {
  return std::format("{:%a, %d %b %Y %H:%M:%S} GMT", std::chrono::floor<std::chrono::seconds>(SysClock::now()));
}

bool HasBody(http::StatusCode status) noexcept {
  return status >= 200 && status != 204 && status != http::StatusCodeNotModified;
}

// Sends the response head, then the body unless 'headOnly'.
bool SendResponse(ITransport& transport, const HttpResponse& response, bool headOnly, bool keepAlive,
                  std::string_view version, std::string_view serverName) {
  http::HeaderList extraHeaders;
  extraHeaders.push_back(http::Header{std::string(http::Date), HttpDate()});
  const bool hasBody = HasBody(response.status());
  if (hasBody) {
    extraHeaders.push_back(http::Header{std::string(http::ContentLength), std::to_string(response.bodyLength())});
  }
  if (!keepAlive) {
    extraHeaders.push_back(http::Header{std::string(http::Connection), std::string(http::close)});
  } else if (version == http::HTTP10Sv) {
    extraHeaders.push_back(http::Header{std::string(http::Connection), std::string(http::keepalive)});
  }
  if (!serverName.empty()) {
    extraHeaders.push_back(http::Header{std::string(http::Server), std::string(serverName)});
  }
  if (!transport.writeAll(response.headString(http::HTTP11Sv, extraHeaders))) {
    return false;
  }
  if (headOnly || !hasBody) {
    return true;
  }
  if (const auto* payload = response.filePayload(); payload != nullptr) {
    return transport.sendFile(payload->file, payload->offset, payload->length);
  }
  return transport.writeAll(response.body());
}

// Final error reply for a request that could not be parsed or accepted. The connection is closed afterwards.
void SendErrorAndClose(ITransport& transport, http::StatusCode status, std::string_view serverName) {
  HttpResponse response(status);
  response.body(std::string(http::ReasonPhrase(status)).append("\n"));
  if (!SendResponse(transport, response, false, false, http::HTTP11Sv, serverName)) {
    log::debug("Failed to send {} error response", status);
  }
}

// Parses a Content-Length value. Returns false if it is not a plain decimal number.
bool ParseContentLength(std::string_view value, std::size_t& length) {
  value = TrimOws(value);
  if (value.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  return ec == std::errc{} && ptr == value.data() + value.size();
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, Socket listener, RequestHandler handler,
                       std::shared_ptr<const TlsContext> tlsContext)
    : _config(std::move(config)),
      _listener(std::move(listener)),
      _handler(std::move(handler)),
      _tlsContext(std::move(tlsContext)) {
  _config.validate();
  if (!_listener) {
    throw std::invalid_argument("HttpServer requires an open listening socket");
  }
  if (!_handler) {
    throw std::invalid_argument("HttpServer requires a request handler");
  }
  _localAddress = _listener.localAddress();
  _port = _listener.localPort();
}

void HttpServer::run() {
  if (_running.exchange(true)) {
    throw std::logic_error("HttpServer is already running");
  }
  // sendfile and the OpenSSL socket BIO raise SIGPIPE on a closed peer.
  if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    log::warn("Unable to ignore SIGPIPE");
  }
  EventLoop eventLoop(kPollTimeout);
  try {
    _listener.setNonBlocking();
    eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _listener.fd()});
    eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _wakeupFd.fd()});
  } catch (...) {
    _running.store(false);
    throw;
  }

  log::info("Serving {} on {}", _tlsContext ? "https" : "http", _localAddress);
  while (!_stopRequested.load()) {
    for (const auto& event : eventLoop.poll()) {
      if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.drain();
      } else if (event.fd == _listener.fd()) {
        acceptPending();
      }
    }
    reapFinished();
  }

  eventLoop.del(_listener.fd());
  _listener.close();
  drain(eventLoop);
  _running.store(false);
}

void HttpServer::stop() noexcept {
  _stopRequested.store(true);
  _wakeupFd.notify();
}

std::size_t HttpServer::nbConnections() const {
  std::lock_guard<std::mutex> lock(_connectionsMutex);
  return static_cast<std::size_t>(std::ranges::count_if(
      _connections, [](const std::unique_ptr<Connection>& connection) { return !connection->done.load(); }));
}

void HttpServer::acceptPending() {
  while (true) {
    BaseFd fd = _listener.accept();
    if (!fd) {
      return;
    }
    const int fdNum = fd.fd();
    auto connection = std::make_unique<Connection>();
    connection->fd = std::move(fd);
    Connection& ref = *connection;

    std::lock_guard<std::mutex> lock(_connectionsMutex);
    _connections.push_back(std::move(connection));
    try {
      ref.thread = std::jthread([this, &ref] { serveConnection(ref); });
    } catch (const std::system_error& ex) {
      log::error("Unable to start a worker for fd # {}: {}", fdNum, ex.what());
      _connections.pop_back();
      continue;
    }
    log::trace("Accepted connection fd # {}", fdNum);
  }
}

void HttpServer::serveConnection(Connection& connection) {
  const int fd = connection.fd.fd();
  try {
    if (_tlsContext) {
      SetSocketTimeouts(fd, _config.tlsHandshakeTimeout, _config.tlsHandshakeTimeout);
      TlsTransport transport(_tlsContext->newSession(fd));
      if (transport.handshake()) {
        const TlsPeerInfo peer{transport.peerCertificatePresented(), transport.peerVerified(),
                               transport.peerSubject()};
        serveRequests(connection, transport, &peer);
        transport.shutdown();
      }
    } else {
      PlainTransport transport(fd);
      serveRequests(connection, transport, nullptr);
    }
  } catch (const std::exception& ex) {
    log::error("Connection fd # {} aborted: {}", fd, ex.what());
  }
  connection.state.store(ConnectionState::Closing);
  connection.done.store(true);
  _wakeupFd.notify();
}

void HttpServer::serveRequests(Connection& connection, ITransport& transport, const TlsPeerInfo* tlsPeer) {
  const int fd = connection.fd.fd();
  std::string buffer;
  std::array<char, kReadChunkSize> chunk;

  const auto readMore = [&]() {
    const auto nbRead = transport.read(chunk);
    if (nbRead <= 0) {
      return false;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(nbRead));
    return true;
  };

  for (bool firstRequest = true;; firstRequest = false) {
    SetSocketTimeouts(fd, firstRequest ? _config.ioTimeout : _config.keepAliveTimeout, _config.ioTimeout);
    if (buffer.empty() && !readMore()) {
      // peer closed, idle timeout, or shut down by the drain
      return;
    }
    auto expected = ConnectionState::Idle;
    if (!connection.state.compare_exchange_strong(expected, ConnectionState::Busy)) {
      return;
    }
    SetSocketTimeouts(fd, _config.ioTimeout, _config.ioTimeout);

    std::size_t headEnd;
    while ((headEnd = buffer.find(http::DoubleCRLF)) == std::string::npos) {
      if (buffer.size() > _config.maxHeaderBytes) {
        SendErrorAndClose(transport, http::StatusCodeRequestHeaderFieldsTooLarge, _config.serverName);
        return;
      }
      if (!readMore()) {
        return;
      }
    }
    if (headEnd + http::DoubleCRLF.size() > _config.maxHeaderBytes) {
      SendErrorAndClose(transport, http::StatusCodeRequestHeaderFieldsTooLarge, _config.serverName);
      return;
    }

    HttpRequest request;
    const auto parseStatus = ParseRequestHead(std::string_view(buffer).substr(0, headEnd), request);
    if (parseStatus != http::StatusCodeOK) {
      SendErrorAndClose(transport, parseStatus, _config.serverName);
      return;
    }
    buffer.erase(0, headEnd + http::DoubleCRLF.size());

    if (request.headerValue(http::TransferEncoding)) {
      SendErrorAndClose(transport, http::StatusCodeNotImplemented, _config.serverName);
      return;
    }
    std::size_t contentLength = 0;
    if (const auto lengthStr = request.headerValue(http::ContentLength); lengthStr) {
      if (!ParseContentLength(*lengthStr, contentLength)) {
        SendErrorAndClose(transport, http::StatusCodeBadRequest, _config.serverName);
        return;
      }
      if (contentLength > _config.maxBodyBytes) {
        SendErrorAndClose(transport, http::StatusCodePayloadTooLarge, _config.serverName);
        return;
      }
    }
    if (contentLength != 0) {
      if (buffer.size() < contentLength &&
          CaseInsensitiveEqual(TrimOws(request.headerValueOrEmpty(http::Expect)), "100-continue")) {
        if (!transport.writeAll(kContinueInterim)) {
          return;
        }
      }
      while (buffer.size() < contentLength) {
        if (!readMore()) {
          return;
        }
      }
      request.body(buffer.substr(0, contentLength));
      buffer.erase(0, contentLength);
    }
    if (tlsPeer != nullptr) {
      request.tlsPeer(*tlsPeer);
    }

    HttpResponse response;
    try {
      response = _handler(request);
    } catch (const std::exception& ex) {
      log::error("Handler failed for {} {}: {}", request.methodStr(), request.target(), ex.what());
      response = HttpResponse(http::StatusCodeInternalServerError);
    }

    const bool keepAlive = _config.enableKeepAlive && request.wantsKeepAlive() && !_draining.load();
    const bool sent = SendResponse(transport, response, request.method() == http::Method::HEAD, keepAlive,
                                   request.version(), _config.serverName);
    log::debug("{} {} -> {}", request.methodStr(), request.target(), response.status());
    if (!sent || !keepAlive) {
      return;
    }

    expected = ConnectionState::Busy;
    if (!connection.state.compare_exchange_strong(expected, ConnectionState::Idle) || _draining.load()) {
      return;
    }
  }
}

void HttpServer::reapFinished() {
  std::lock_guard<std::mutex> lock(_connectionsMutex);
  std::erase_if(_connections, [](std::unique_ptr<Connection>& connection) {
    if (!connection->done.load()) {
      return false;
    }
    connection->thread.join();
    return true;
  });
}

void HttpServer::closeIdleConnections() {
  std::lock_guard<std::mutex> lock(_connectionsMutex);
  for (auto& connection : _connections) {
    auto expected = ConnectionState::Idle;
    if (connection->state.compare_exchange_strong(expected, ConnectionState::Closing)) {
      // wakes up the worker blocked in read
      ::shutdown(connection->fd.fd(), SHUT_RD);
    }
  }
}

void HttpServer::forceCloseAll() {
  std::lock_guard<std::mutex> lock(_connectionsMutex);
  for (auto& connection : _connections) {
    if (!connection->done.load()) {
      ::shutdown(connection->fd.fd(), SHUT_RDWR);
    }
  }
  for (auto& connection : _connections) {
    connection->thread.join();
  }
  _connections.clear();
}

void HttpServer::drain(EventLoop& eventLoop) {
  _draining.store(true);
  closeIdleConnections();

  const auto deadline = SteadyClock::now() + _config.drainTimeout;
  while (true) {
    reapFinished();
    const auto remaining = nbConnections();
    if (remaining == 0) {
      reapFinished();
      break;
    }
    if (SteadyClock::now() >= deadline) {
      log::warn("Drain timeout reached, closing {} remaining connection(s)", remaining);
      forceCloseAll();
      break;
    }
    for (const auto& event : eventLoop.poll()) {
      if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.drain();
      }
    }
  }
  log::info("Server on {} stopped", _localAddress);
}

}  // namespace snowweb
