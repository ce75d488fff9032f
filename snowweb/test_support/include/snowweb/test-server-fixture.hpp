#pragma once

#include <cstdint>
#include <memory>
#include <thread>
#include <utility>

#include "snowweb/http-server-config.hpp"
#include "snowweb/http-server.hpp"
#include "snowweb/request-handler.hpp"
#include "snowweb/socket.hpp"
#include "snowweb/tls-context.hpp"

namespace snowweb::test {

// Lightweight RAII test server harness.
//  * Listens on 127.0.0.1 with an ephemeral port (connections are queued by the kernel before run() starts)
//  * Runs the server in a background jthread
//  * Stops, drains and joins on destruction (idempotent)
struct TestServer {
  explicit TestServer(HttpServerConfig config, RequestHandler handler,
                      std::shared_ptr<const TlsContext> tlsContext = {})
      : server(std::move(config), Socket::ListenTcp("127.0.0.1", ""), std::move(handler), std::move(tlsContext)),
        loopThread([this] { server.run(); }) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Requests a graceful stop and waits for run() to return.
  void stop() {
    server.stop();
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  HttpServer server;
  std::jthread loopThread;
};

}  // namespace snowweb::test
