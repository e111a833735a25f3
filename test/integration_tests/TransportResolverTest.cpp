#include "TransportResolver.hpp"

#include "AsyncDispatcher.hpp"
#include "FakeDaemon.hpp"
#include "HttpRequestEngine.hpp"
#include "StreamHandle.hpp"
#include "TcpSocketHandler.hpp"
#include "TestCertificate.hpp"
#include "TestHeaders.hpp"

using namespace dw;

namespace {
void pingOver(shared_ptr<FakeDaemon> daemon) {
  daemon->respondWith(FakeDaemon::response(200, "OK", "text/plain", "OK"));
  TransportResolver resolver(daemon->getAddress());
  HttpRequestEngine engine;

  auto connection = resolver.resolve();
  auto response = engine.send(connection, HttpRequest::get("/_ping"));
  REQUIRE(response->getStatus() == 200);
  REQUIRE(response->getContent() == "OK");
  REQUIRE(connection->isClosed());
}

/** Mutual TLS: the daemon trusts the client certificate and vice versa. */
DaemonAddress mutualTlsAddress(shared_ptr<FakeDaemon> daemon,
                               const TestCertificate& certificate) {
  TlsConfig tlsConfig;
  tlsConfig.caFile = certificate.certFile;
  tlsConfig.certFile = certificate.certFile;
  tlsConfig.keyFile = certificate.keyFile;
  tlsConfig.verifyPeer = true;
  return DaemonAddress::tcpWithTls("127.0.0.1", daemon->getAddress().getPort(),
                                   tlsConfig);
}

class CountingCallback : public StreamCallback {
 public:
  CountingCallback() : events(0), failures(0) {}

  virtual void onEvent(const StreamEvent& event) { events++; }
  virtual void onFinish() {}
  virtual void onFailure(const DockerError& error) { failures++; }

  std::atomic<int> events;
  std::atomic<int> failures;
};
}  // namespace

TEST_CASE("Ping over a unix socket", "[TransportResolver]") {
  auto daemon = FakeDaemon::unixSocket();
  pingOver(daemon);
  REQUIRE(daemon->getRequests()[0].find("Host: localhost\r\n") !=
          string::npos);
}

TEST_CASE("Ping over tcp", "[TransportResolver]") {
  auto daemon = FakeDaemon::tcp();
  pingOver(daemon);
  string host = "Host: 127.0.0.1:" +
                to_string(daemon->getAddress().getPort()) + "\r\n";
  REQUIRE(daemon->getRequests()[0].find(host) != string::npos);
}

TEST_CASE("Concurrent requests use independent connections",
          "[TransportResolver]") {
  auto daemon = FakeDaemon::unixSocket();
  TransportResolver resolver(daemon->getAddress());
  auto first = resolver.resolve();
  auto second = resolver.resolve();
  REQUIRE(first->getSocketFd() != second->getSocketFd());
  first->close();
  REQUIRE_FALSE(second->isClosed());
  second->close();
}

TEST_CASE("A stalled tcp connect does not block other connects",
          "[TransportResolver]") {
  // A listener that never accepts stops answering SYNs once its queue is full
  int stalledFd = ::socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(stalledFd);
  sockaddr_in local;
  memset(&local, 0, sizeof(local));
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  FATAL_FAIL(::bind(stalledFd, (sockaddr*)&local, sizeof(local)));
  FATAL_FAIL(::listen(stalledFd, 0));
  socklen_t len = sizeof(local);
  FATAL_FAIL(::getsockname(stalledFd, (sockaddr*)&local, &len));
  vector<int> backlog;
  for (int i = 0; i < 4; i++) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    FATAL_FAIL(fd);
    FATAL_FAIL(::fcntl(fd, F_SETFL, O_NONBLOCK));
    ::connect(fd, (sockaddr*)&local, sizeof(local));
    backlog.push_back(fd);
  }

  shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler(3));
  TransportResolver stalledResolver(
      DaemonAddress::tcp("127.0.0.1", ntohs(local.sin_port)), socketHandler);
  std::atomic<bool> stalledFailed(false);
  std::thread stalled([&stalledResolver, &stalledFailed]() {
    try {
      stalledResolver.resolve();
    } catch (const ConnectionError& e) {
      stalledFailed = true;
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  auto daemon = FakeDaemon::tcp();
  daemon->respondWith(FakeDaemon::response(200, "OK", "text/plain", "OK"));
  TransportResolver resolver(daemon->getAddress(), socketHandler);
  HttpRequestEngine engine;
  auto startTime = std::chrono::steady_clock::now();
  auto response = engine.send(resolver.resolve(), HttpRequest::get("/_ping"));
  auto elapsed = std::chrono::steady_clock::now() - startTime;
  REQUIRE(response->getStatus() == 200);
  REQUIRE(elapsed < std::chrono::seconds(2));

  stalled.join();
  REQUIRE(stalledFailed);
  for (int fd : backlog) {
    ::close(fd);
  }
  ::close(stalledFd);
}

TEST_CASE("Unreachable daemons", "[TransportResolver]") {
  SECTION("Missing socket path") {
    TransportResolver resolver(
        DaemonAddress::unixSocket("/nonexistent/dockwire/docker.sock"));
    REQUIRE_THROWS_AS(resolver.resolve(), ConnectionError);
  }

  SECTION("Nobody listening on the port") {
    auto daemon = FakeDaemon::tcp();
    int port = daemon->getAddress().getPort();
    daemon->stop();
    TransportResolver resolver(DaemonAddress::tcp("127.0.0.1", port));
    REQUIRE_THROWS_AS(resolver.resolve(), ConnectionError);
  }

  SECTION("Unknown host") {
    TransportResolver resolver(
        DaemonAddress::tcp("no-such-host.invalid", 2375));
    REQUIRE_THROWS_AS(resolver.resolve(), ConnectionError);
  }
}

TEST_CASE("TLS handshake failures are connection errors",
          "[TransportResolver]") {
  // A plain HTTP server cannot complete a TLS handshake
  auto daemon = FakeDaemon::tcp();
  daemon->respondWith(FakeDaemon::response(200, "OK", "text/plain", "OK"));
  TlsConfig tlsConfig;
  tlsConfig.verifyPeer = false;
  TransportResolver resolver(DaemonAddress::tcpWithTls(
      "127.0.0.1", daemon->getAddress().getPort(), tlsConfig));
  REQUIRE_THROWS_AS(resolver.resolve(), ConnectionError);
}

TEST_CASE("Ping over mutual TLS", "[TransportResolver]") {
  TestCertificate certificate;
  auto daemon = FakeDaemon::tls(certificate, true);
  daemon->respondWith(FakeDaemon::response(200, "OK", "text/plain", "OK"));
  TransportResolver resolver(mutualTlsAddress(daemon, certificate));
  HttpRequestEngine engine;

  auto connection = resolver.resolve();
  auto response = engine.send(connection, HttpRequest::get("/_ping"));
  REQUIRE(response->getStatus() == 200);
  REQUIRE(response->getContent() == "OK");
  REQUIRE(daemon->getHandshakeFailures() == 0);
  REQUIRE(startsWith(daemon->getRequests()[0], "GET /_ping HTTP/1.1\r\n"));
}

TEST_CASE("Chunked JSON streams over TLS", "[TransportResolver]") {
  TestCertificate certificate;
  auto daemon = FakeDaemon::tls(certificate, true);
  daemon->respondWith(FakeDaemon::chunkedResponse(
      200, "application/json",
      {"{\"status\":\"Pulling\"}\n", "{\"status\":", "\"Done\"}\n"}));
  TransportResolver resolver(mutualTlsAddress(daemon, certificate));
  HttpRequestEngine engine;

  auto response =
      engine.send(resolver.resolve(), HttpRequest::post("/images/create"));
  vector<StreamEvent> events;
  auto signal = AsyncDispatcher::collect(response, &events);
  REQUIRE(signal.isFinished());
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].getValue()["status"] == "Pulling");
  REQUIRE(events[1].getValue()["status"] == "Done");
}

TEST_CASE("Buffered TLS bytes are read without waiting on the socket",
          "[TransportResolver]") {
  TestCertificate certificate;
  auto daemon = FakeDaemon::tls(certificate, true);
  string raw = FakeDaemon::response(200, "OK", "text/plain", "buffered");
  // Held open so the socket stays quiet once the record has arrived
  daemon->respondWith(raw, true);
  TransportResolver resolver(mutualTlsAddress(daemon, certificate));

  auto connection = resolver.resolve();
  connection->write(string("GET /_ping HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n"));
  auto startTime = std::chrono::steady_clock::now();
  string received;
  char c;
  while (received.length() < raw.length()) {
    REQUIRE(connection->readSome(&c, 1) == 1);
    received.push_back(c);
  }
  auto elapsed = std::chrono::steady_clock::now() - startTime;
  REQUIRE(received == raw);
  REQUIRE(elapsed < std::chrono::seconds(SOCKET_POLL_INTERVAL * 2));
  connection->close();
}

TEST_CASE("Aborting a TLS stream fails it with a connection error",
          "[TransportResolver]") {
  TestCertificate certificate;
  auto daemon = FakeDaemon::tls(certificate, true);
  daemon->respondWith(
      FakeDaemon::chunkedResponse(200, "application/json",
                                  {"{\"stream\":\"Step 1/2\"}\n"}, false),
      true);
  TransportResolver resolver(mutualTlsAddress(daemon, certificate));
  HttpRequestEngine engine;

  auto connection = resolver.resolve();
  shared_ptr<CountingCallback> callback(new CountingCallback());
  StreamHandle handle(engine.send(connection, HttpRequest::post("/build")),
                      callback);
  handle.start();
  for (int i = 0; i < 100 && callback->events == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(callback->events == 1);
  REQUIRE_FALSE(handle.isDone());

  handle.abort();
  auto signal = handle.wait();
  REQUIRE(signal.isFailed());
  REQUIRE(signal.getError()->kind() == ErrorKind::CONNECTION_ERROR);
  REQUIRE(callback->events == 1);
  REQUIRE(callback->failures == 1);
  REQUIRE(connection->isClosed());
}

TEST_CASE("TLS trust failures are connection errors", "[TransportResolver]") {
  TestCertificate certificate;

  SECTION("Daemon certificate from an untrusted CA") {
    auto daemon = FakeDaemon::tls(certificate, false);
    TlsConfig tlsConfig;
    tlsConfig.verifyPeer = true;
    TransportResolver resolver(DaemonAddress::tcpWithTls(
        "127.0.0.1", daemon->getAddress().getPort(), tlsConfig));
    REQUIRE_THROWS_AS(resolver.resolve(), ConnectionError);
  }

  SECTION("Client without a certificate") {
    auto daemon = FakeDaemon::tls(certificate, true);
    daemon->respondWith(FakeDaemon::response(200, "OK", "text/plain", "OK"));
    TlsConfig tlsConfig;
    tlsConfig.caFile = certificate.certFile;
    TransportResolver resolver(DaemonAddress::tcpWithTls(
        "127.0.0.1", daemon->getAddress().getPort(), tlsConfig));
    HttpRequestEngine engine;
    REQUIRE_THROWS_AS(
        engine.send(resolver.resolve(), HttpRequest::get("/_ping")),
        ConnectionError);
    for (int i = 0; i < 100 && daemon->getHandshakeFailures() == 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(daemon->getHandshakeFailures() == 1);
    REQUIRE(daemon->getRequests().empty());
  }

  SECTION("Missing client certificate file") {
    TlsConfig tlsConfig;
    tlsConfig.caFile = certificate.certFile;
    tlsConfig.certFile = certificate.directory + "/missing.pem";
    tlsConfig.keyFile = certificate.keyFile;
    REQUIRE_THROWS_AS(
        TransportResolver(DaemonAddress::tcpWithTls("127.0.0.1", 2376,
                                                    tlsConfig)),
        ConnectionError);
  }
}

#ifndef WIN32
TEST_CASE("Named pipes are unavailable off Windows", "[TransportResolver]") {
  TransportResolver resolver(
      DaemonAddress::parse("npipe:////./pipe/docker_engine"));
  REQUIRE_THROWS_AS(resolver.resolve(), TransportUnavailable);
}
#endif
