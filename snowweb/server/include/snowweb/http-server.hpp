#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "snowweb/base-fd.hpp"
#include "snowweb/event-fd.hpp"
#include "snowweb/http-server-config.hpp"
#include "snowweb/request-handler.hpp"
#include "snowweb/socket.hpp"
#include "snowweb/tls-context.hpp"
#include "snowweb/transport.hpp"

namespace snowweb {

class EventLoop;

// HttpServer
//  - HTTP/1.1 server over an already listening socket (TCP or Unix domain), with optional TLS.
//  - One acceptor event loop running in the thread calling run(), plus one blocking worker thread per
//    accepted connection. The handler is therefore called concurrently.
//  - stop() is thread safe and async-signal tolerant (it only stores a flag and writes to an eventfd).
//    It starts a graceful drain: the listener is closed, idle keep-alive connections are closed, in-flight
//    requests complete and their connections close after the response. Connections still alive after
//    HttpServerConfig::drainTimeout are forcibly shut down. run() returns once all workers are joined.
class HttpServer {
 public:
  // Throws std::invalid_argument if 'config' is invalid or 'listener' is not open.
  HttpServer(HttpServerConfig config, Socket listener, RequestHandler handler,
             std::shared_ptr<const TlsContext> tlsContext = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // Must not be destroyed while run() executes.
  ~HttpServer() = default;

  // Blocks until stop() is called and the drain is over. Ignores SIGPIPE process wide.
  // Throws std::system_error on unrecoverable event loop failure.
  void run();

  // Request a graceful stop. Returns immediately.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  // Local TCP port of the listener (0 for Unix domain sockets).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const std::string& localAddress() const noexcept { return _localAddress; }

  [[nodiscard]] bool isTls() const noexcept { return static_cast<bool>(_tlsContext); }

  // Number of currently open connections.
  [[nodiscard]] std::size_t nbConnections() const;

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  enum class ConnectionState : uint8_t { Idle, Busy, Closing };

  struct Connection {
    BaseFd fd;
    std::atomic<ConnectionState> state{ConnectionState::Idle};
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  void acceptPending();

  void serveConnection(Connection& connection);

  // Serves requests of the connection until close. Returns when the connection must be closed.
  void serveRequests(Connection& connection, ITransport& transport, const TlsPeerInfo* tlsPeer);

  void reapFinished();

  void closeIdleConnections();

  void forceCloseAll();

  void drain(EventLoop& eventLoop);

  HttpServerConfig _config;
  Socket _listener;
  RequestHandler _handler;
  std::shared_ptr<const TlsContext> _tlsContext;
  std::string _localAddress;
  uint16_t _port{0};

  EventFd _wakeupFd;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _draining{false};
  std::atomic<bool> _running{false};

  mutable std::mutex _connectionsMutex;
  std::vector<std::unique_ptr<Connection>> _connections;
};

}  // namespace snowweb
