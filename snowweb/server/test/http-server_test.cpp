#include "snowweb/http-server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "snowweb/file.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/http-server-config.hpp"
#include "snowweb/request-handler.hpp"
#include "snowweb/socket.hpp"
#include "snowweb/temp-file.hpp"
#include "snowweb/test-http-client.hpp"
#include "snowweb/test-server-fixture.hpp"
#include "snowweb/test-tls-helper.hpp"
#include "snowweb/tls-context.hpp"
#include "snowweb/tls-material-manager.hpp"

namespace snowweb {

using namespace std::chrono_literals;

namespace {

HttpResponse Echo(const HttpRequest& req) {
  HttpResponse resp;
  resp.body(std::string("ECHO") + std::string(req.path()));
  return resp;
}

template <class Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

// Serves 'bigPath' for "/big", echoes otherwise.
RequestHandler BigFileOr(std::string bigPath) {
  return [bigPath = std::move(bigPath)](const HttpRequest& req) {
    if (req.path() != "/big") {
      return Echo(req);
    }
    HttpResponse resp;
    resp.file(File(bigPath));
    return resp;
  };
}

// Requests "/big" and closes the connection with most of the response unread.
void AbortDownload(uint16_t port, test::HttpClient::Options options = {}) {
  test::HttpClient client(port, std::move(options));
  ASSERT_TRUE(client.connected());
  ASSERT_TRUE(client.sendRaw("GET /big HTTP/1.1\r\nHost: localhost\r\n\r\n"));
  std::this_thread::sleep_for(50ms);
}

constexpr std::size_t kBigFileSize = 16UL << 20;

}  // namespace

TEST(HttpServerTest, RejectsClosedListener) {
  EXPECT_THROW(HttpServer(HttpServerConfig{}, Socket{}, Echo), std::invalid_argument);
}

TEST(HttpServerTest, RejectsInvalidConfig) {
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withMaxHeaderBytes(1), Socket::ListenTcp("127.0.0.1", ""), Echo),
               std::invalid_argument);
}

TEST(HttpServerTest, SimpleGet) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  auto resp = client.get("/hello");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 200);
  EXPECT_EQ(resp->reason, "OK");
  EXPECT_EQ(resp->body, "ECHO/hello");
  EXPECT_EQ(resp->headerValue("Content-Length"), "10");
  EXPECT_EQ(resp->headerValue("Server"), "snowweb");
  ASSERT_TRUE(resp->headerValue("Date"));
  EXPECT_TRUE(resp->headerValue("Date")->ends_with(" GMT"));
}

TEST(HttpServerTest, PercentDecodedPathWithoutQuery) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  auto resp = client.get("/a%20b?x=1");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "ECHO/a b");
}

TEST(HttpServerTest, KeepAliveSequentialRequests) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  for (const char* path : {"/one", "/two", "/three"}) {
    auto resp = client.get(path);
    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->body, std::string("ECHO") + path);
    EXPECT_FALSE(resp->headerValue("Connection"));
  }
}

TEST(HttpServerTest, PipelinedRequests) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("GET /a HTTP/1.1\r\nHost: x\r\n\r\nGET /b HTTP/1.1\r\nHost: x\r\n\r\n"));
  auto first = client.readResponse();
  auto second = client.readResponse();
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first->body, "ECHO/a");
  EXPECT_EQ(second->body, "ECHO/b");
}

TEST(HttpServerTest, ConnectionCloseHonored) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  auto resp = client.get("/x", {{"Connection", "close"}});
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->headerValue("Connection"), "close");
  EXPECT_EQ(client.readUntilClose(), "");
}

TEST(HttpServerTest, KeepAliveDisabled) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveMode(false), Echo);
  test::HttpClient client(ts.port());
  auto resp = client.get("/x");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->headerValue("Connection"), "close");
  EXPECT_EQ(client.readUntilClose(), "");
}

TEST(HttpServerTest, Http10ClosesByDefault) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("GET /old HTTP/1.0\r\n\r\n"));
  const std::string raw = client.readUntilClose();
  EXPECT_TRUE(raw.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(raw.contains("Connection: close\r\n"));
  EXPECT_TRUE(raw.ends_with("ECHO/old"));
}

TEST(HttpServerTest, IdleKeepAliveConnectionTimesOut) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveTimeout(100ms), Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.get("/x"));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(client.readUntilClose(), "");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(HttpServerTest, HeadOmitsBody) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  auto head = client.request("HEAD", "/abc");
  ASSERT_TRUE(head);
  EXPECT_EQ(head->status, 200);
  EXPECT_EQ(head->headerValue("Content-Length"), "8");
  EXPECT_TRUE(head->body.empty());
  // no stray body bytes left on the connection
  auto next = client.get("/next");
  ASSERT_TRUE(next);
  EXPECT_EQ(next->body, "ECHO/next");
}

TEST(HttpServerTest, NotModifiedHasNoContentLength) {
  test::TestServer ts(HttpServerConfig{}, [](const HttpRequest&) { return HttpResponse(304); });
  test::HttpClient client(ts.port());
  auto resp = client.get("/x");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 304);
  EXPECT_FALSE(resp->headerValue("Content-Length"));
  EXPECT_TRUE(client.get("/y"));
}

TEST(HttpServerTest, PostBodyDelivered) {
  test::TestServer ts(HttpServerConfig{}, [](const HttpRequest& req) {
    HttpResponse resp;
    resp.body(std::string(req.methodStr()) + ":" + std::string(req.body()));
    return resp;
  });
  test::HttpClient client(ts.port());
  auto resp = client.request("POST", "/p", {}, "payload");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "POST:payload");
  auto empty = client.request("POST", "/p");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->body, "POST:");
}

TEST(HttpServerTest, ExpectContinue) {
  test::TestServer ts(HttpServerConfig{}, [](const HttpRequest& req) {
    HttpResponse resp;
    resp.body(std::string(req.body()));
    return resp;
  });
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("POST /u HTTP/1.1\r\nHost: x\r\nExpect: 100-continue\r\nContent-Length: 4\r\n\r\n"));
  auto interim = client.readResponse();
  ASSERT_TRUE(interim);
  EXPECT_EQ(interim->status, 100);
  ASSERT_TRUE(client.sendRaw("data"));
  auto resp = client.readResponse();
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 200);
  EXPECT_EQ(resp->body, "data");
}

TEST(HttpServerTest, HeaderTooLarge) {
  test::TestServer ts(HttpServerConfig{}.withMaxHeaderBytes(512), Echo);
  test::HttpClient client(ts.port());
  auto resp = client.get("/big", {{"X-Fill", std::string(1024, 'a')}});
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 431);
  EXPECT_EQ(resp->headerValue("Connection"), "close");
}

TEST(HttpServerTest, BodyTooLarge) {
  test::TestServer ts(HttpServerConfig{}.withMaxBodyBytes(8), Echo);
  test::HttpClient client(ts.port());
  auto resp = client.request("POST", "/big", {}, "0123456789");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 413);
  EXPECT_EQ(resp->headerValue("Connection"), "close");
}

TEST(HttpServerTest, TransferEncodingNotImplemented) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("POST /c HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n"));
  auto resp = client.readResponse();
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 501);
}

TEST(HttpServerTest, InvalidContentLength) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("POST /c HTTP/1.1\r\nHost: x\r\nContent-Length: 1x\r\n\r\n"));
  auto resp = client.readResponse();
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 400);
}

TEST(HttpServerTest, MalformedRequestLine) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("GARBAGE\r\n\r\n"));
  auto resp = client.readResponse();
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 400);
  EXPECT_EQ(client.readUntilClose(), "");
}

TEST(HttpServerTest, UnsupportedVersion) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.sendRaw("GET / HTTP/2.0\r\n\r\n"));
  auto resp = client.readResponse();
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 505);
}

TEST(HttpServerTest, HandlerExceptionGives500) {
  test::TestServer ts(HttpServerConfig{}, [](const HttpRequest& req) -> HttpResponse {
    if (req.path() == "/boom") {
      throw std::runtime_error("boom");
    }
    return Echo(req);
  });
  test::HttpClient client(ts.port());
  auto resp = client.get("/boom");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->status, 500);
  auto next = client.get("/fine");
  ASSERT_TRUE(next);
  EXPECT_EQ(next->status, 200);
}

TEST(HttpServerTest, FileBodyWindow) {
  test::ScopedTempDir tmp;
  const auto path = tmp.writeFile("data.txt", "0123456789").string();
  test::TestServer ts(HttpServerConfig{}, [&path](const HttpRequest& req) {
    HttpResponse resp;
    if (req.path() == "/window") {
      resp.file(File(path), 2, 5);
    } else {
      resp.file(File(path));
    }
    return resp;
  });
  test::HttpClient client(ts.port());
  auto whole = client.get("/whole");
  ASSERT_TRUE(whole);
  EXPECT_EQ(whole->body, "0123456789");
  auto window = client.get("/window");
  ASSERT_TRUE(window);
  EXPECT_EQ(window->headerValue("Content-Length"), "5");
  EXPECT_EQ(window->body, "23456");
}

TEST(HttpServerTest, SurvivesClientAbortingFileDownload) {
  test::ScopedTempDir tmp;
  const auto path = tmp.writeFile("big.bin", std::string(kBigFileSize, 'x')).string();
  test::TestServer ts(HttpServerConfig{}, BigFileOr(path));

  AbortDownload(ts.port());
  AbortDownload(ts.port());

  test::HttpClient client(ts.port());
  auto resp = client.get("/after");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "ECHO/after");
}

TEST(HttpServerTest, UnixDomainSocket) {
  test::ScopedTempDir tmp;
  const auto sockPath = (tmp.dirPath() / "s.sock").string();
  HttpServer server(HttpServerConfig{}, Socket::ListenUnix(sockPath), Echo);
  EXPECT_EQ(server.port(), 0);
  EXPECT_EQ(server.localAddress(), "unix:" + sockPath);
  std::jthread loop([&server] { server.run(); });
  {
    test::HttpClient client(sockPath);
    auto resp = client.get("/unix");
    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->body, "ECHO/unix");
  }
  server.stop();
}

class HttpServerTlsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto [cert, key] = test::MakeEphemeralCertKey("server");
    tmpDir.writeFile("cert.pem", cert);
    tmpDir.writeFile("key.pem", key);
    manager = std::make_shared<TlsMaterialManager>(std::make_unique<FileMaterialSource>(
        (tmpDir.dirPath() / "cert.pem").string(), (tmpDir.dirPath() / "key.pem").string()));
  }

  static HttpResponse DescribePeer(const HttpRequest& req) {
    HttpResponse resp;
    resp.body(std::string(req.isTls() ? "tls" : "plain") + " presented=" +
              (req.tlsPeer().certificatePresented ? "1" : "0") + " verified=" + (req.tlsPeer().verified ? "1" : "0") +
              " subject=" + req.tlsPeer().subject);
    return resp;
  }

  test::ScopedTempDir tmpDir;
  std::shared_ptr<TlsMaterialManager> manager;
};

TEST_F(HttpServerTlsTest, ServesOverTls) {
  test::TestServer ts(HttpServerConfig{}, DescribePeer, std::make_shared<TlsContext>(manager));
  EXPECT_TRUE(ts.server.isTls());
  test::HttpClient client(ts.port(), {.tls = true});
  ASSERT_TRUE(client.connected());
  EXPECT_EQ(client.negotiatedAlpn(), "http/1.1");
  EXPECT_TRUE(client.serverSubject().contains("CN=server"));
  auto resp = client.get("/");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "tls presented=0 verified=0 subject=");
  auto again = client.get("/");
  ASSERT_TRUE(again);
}

TEST_F(HttpServerTlsTest, VerifiedClientCertificateReachesHandler) {
  auto [clientCert, clientKey] = test::MakeEphemeralCertKey("admin");
  test::TestServer ts(HttpServerConfig{}, DescribePeer, std::make_shared<TlsContext>(manager, clientCert));
  test::HttpClient client(ts.port(), {.tls = true, .clientCertPem = clientCert, .clientKeyPem = clientKey});
  ASSERT_TRUE(client.connected());
  auto resp = client.get("/");
  ASSERT_TRUE(resp);
  EXPECT_TRUE(resp->body.starts_with("tls presented=1 verified=1 subject="));
  EXPECT_TRUE(resp->body.contains("CN=admin"));
}

TEST_F(HttpServerTlsTest, SurvivesClientAbortingFileDownload) {
  const auto path = tmpDir.writeFile("big.bin", std::string(kBigFileSize, 'x')).string();
  test::TestServer ts(HttpServerConfig{}, BigFileOr(path), std::make_shared<TlsContext>(manager));

  AbortDownload(ts.port(), {.tls = true});
  AbortDownload(ts.port(), {.tls = true});

  test::HttpClient client(ts.port(), {.tls = true});
  auto resp = client.get("/after");
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->body, "ECHO/after");
}

TEST_F(HttpServerTlsTest, PlainClientOnTlsPortFails) {
  test::TestServer ts(HttpServerConfig{}.withTlsHandshakeTimeout(500ms), DescribePeer,
                      std::make_shared<TlsContext>(manager));
  test::HttpClient client(ts.port());
  ASSERT_TRUE(client.connected());
  EXPECT_FALSE(client.get("/"));
}

TEST(HttpServerDrainTest, IdleClosedAndBusyCompletes) {
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  test::TestServer ts(HttpServerConfig{}, [&](const HttpRequest& req) {
    if (req.path() == "/slow") {
      entered.store(true);
      WaitFor([&] { return release.load(); });
    }
    return Echo(req);
  });
  const auto port = ts.port();

  test::HttpClient idle(port);
  ASSERT_TRUE(idle.get("/fast"));

  test::HttpClient busy(port);
  std::optional<test::ClientResponse> slowResponse;
  std::jthread slowThread([&] { slowResponse = busy.get("/slow"); });
  ASSERT_TRUE(WaitFor([&] { return entered.load(); }));

  ts.server.stop();
  // idle keep-alive connection is closed without a response
  EXPECT_EQ(idle.readUntilClose(), "");

  release.store(true);
  slowThread.join();
  ASSERT_TRUE(slowResponse);
  EXPECT_EQ(slowResponse->status, 200);
  EXPECT_EQ(slowResponse->body, "ECHO/slow");
  EXPECT_EQ(slowResponse->headerValue("Connection"), "close");

  ts.stop();
  EXPECT_FALSE(ts.server.isRunning());
  EXPECT_EQ(ts.server.nbConnections(), 0U);

  test::HttpClient late(port);
  EXPECT_FALSE(late.connected());
}

TEST(HttpServerDrainTest, DrainTimeoutForcesClose) {
  test::TestServer ts(HttpServerConfig{}.withDrainTimeout(50ms), [](const HttpRequest& req) {
    std::this_thread::sleep_for(400ms);
    return Echo(req);
  });
  test::HttpClient busy(ts.port());
  ASSERT_TRUE(busy.sendRaw("GET /slow HTTP/1.1\r\nHost: x\r\n\r\n"));
  ASSERT_TRUE(WaitFor([&] { return ts.server.nbConnections() == 1; }));
  std::this_thread::sleep_for(50ms);

  ts.stop();
  // socket shut down while the handler was running: nothing gets through
  EXPECT_FALSE(busy.readResponse());
  EXPECT_EQ(ts.server.nbConnections(), 0U);
}

TEST(HttpServerDrainTest, StopWithoutConnections) {
  test::TestServer ts(HttpServerConfig{}, Echo);
  ts.stop();
  EXPECT_FALSE(ts.server.isRunning());
}

}  // namespace snowweb
