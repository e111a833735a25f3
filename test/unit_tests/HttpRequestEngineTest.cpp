#include "HttpRequestEngine.hpp"

#include "FakeDaemon.hpp"
#include "MultiplexedStreamDecoder.hpp"
#include "TestHeaders.hpp"

using namespace dw;

TEST_CASE("HttpRequestEngine writes the request", "[HttpRequestEngine]") {
  LoopbackConnection loopback;
  HttpRequestEngine engine;

  loopback.daemonWrite(FakeDaemon::response(200, "OK", "text/plain", "OK"));

  SECTION("GET without body") {
    auto request = HttpRequest::get("/v1.41/_ping");
    engine.send(loopback.connection, request);
    string written = loopback.daemonReadAvailable();
    REQUIRE(startsWith(written, "GET /v1.41/_ping HTTP/1.1\r\n"));
    REQUIRE(written.find("Host: localhost\r\n") != string::npos);
    REQUIRE(written.find("User-Agent: dockwire/") != string::npos);
    REQUIRE(written.find("Content-Length") == string::npos);
    REQUIRE(written.find("Transfer-Encoding") == string::npos);
    REQUIRE(written.compare(written.length() - 4, 4, "\r\n\r\n") == 0);
  }

  SECTION("Known length body") {
    auto request = HttpRequest::post("/containers/create");
    request.setJsonBody({{"Image", "alpine"}});
    request.setRegistryAuth("opaque");
    engine.send(loopback.connection, request);
    string written = loopback.daemonReadAvailable();
    REQUIRE(written.find("Content-Length: 18\r\n") != string::npos);
    REQUIRE(written.find("Content-Type: application/json\r\n") !=
            string::npos);
    REQUIRE(written.find("X-Registry-Auth: opaque\r\n") != string::npos);
    REQUIRE(written.compare(written.length() - 18, 18,
                            "{\"Image\":\"alpine\"}") == 0);
  }

  SECTION("Unknown length body is chunked") {
    shared_ptr<std::istream> stream(new std::istringstream("tar-archive"));
    auto request = HttpRequest::post("/build");
    request.setTarBody(shared_ptr<BodySource>(new StreamBodySource(stream)));
    engine.send(loopback.connection, request);
    string written = loopback.daemonReadAvailable();
    REQUIRE(written.find("Transfer-Encoding: chunked\r\n") != string::npos);
    REQUIRE(written.find("Content-Length") == string::npos);
    REQUIRE(written.find("\r\n\r\nb\r\ntar-archive\r\n0\r\n\r\n") !=
            string::npos);
  }

  SECTION("POST without body") {
    engine.send(loopback.connection, HttpRequest::post("/containers/x/start"));
    string written = loopback.daemonReadAvailable();
    REQUIRE(written.find("Content-Length: 0\r\n") != string::npos);
  }
}

TEST_CASE("HttpRequestEngine simple responses", "[HttpRequestEngine]") {
  LoopbackConnection loopback;
  HttpRequestEngine engine;

  SECTION("Plain text") {
    loopback.daemonWrite(FakeDaemon::response(200, "OK", "text/plain", "OK"));
    auto response = engine.send(loopback.connection, HttpRequest::get("/_ping"));
    REQUIRE(response->getStatus() == 200);
    REQUIRE(response->getReason() == "OK");
    REQUIRE(response->getKind() == ResponseKind::SIMPLE);
    REQUIRE(response->getBody() == "OK");
    REQUIRE(response->getContent() == "OK");
    REQUIRE(response->getHeader("api-version") == "1.41");
    REQUIRE(loopback.connection->isClosed());
  }

  SECTION("JSON document") {
    loopback.daemonWrite(FakeDaemon::response(
        200, "OK", "application/json", "{\"Id\":\"abc\",\"Warnings\":[]}"));
    auto response =
        engine.send(loopback.connection, HttpRequest::get("/images/x/json"));
    REQUIRE(response->getKind() == ResponseKind::SIMPLE);
    REQUIRE(response->getContent()["Id"] == "abc");
  }

  SECTION("Error status is reported, not raised") {
    loopback.daemonWrite(FakeDaemon::response(
        404, "Not Found", "application/json",
        "{\"message\":\"No such image: busybox:nope\"}"));
    auto response =
        engine.send(loopback.connection, HttpRequest::del("/images/busybox:nope"));
    REQUIRE(response->getStatus() == 404);
    REQUIRE_FALSE(response->isSuccess());
    REQUIRE(response->getContent()["message"] ==
            "No such image: busybox:nope");
  }

  SECTION("Chunked error body is still a single document") {
    loopback.daemonWrite(FakeDaemon::chunkedResponse(
        500, "application/json", {"{\"message\":", "\"boom\"}"}));
    auto response = engine.send(loopback.connection, HttpRequest::get("/x"));
    REQUIRE(response->getKind() == ResponseKind::SIMPLE);
    REQUIRE(response->getContent()["message"] == "boom");
  }

  SECTION("No content") {
    loopback.daemonWrite("HTTP/1.1 204 No Content\r\n\r\n");
    auto response = engine.send(loopback.connection,
                                HttpRequest::post("/containers/x/stop"));
    REQUIRE(response->getStatus() == 204);
    REQUIRE(response->getBody().empty());
    REQUIRE(response->getContent().is_null());
  }

  SECTION("Malformed JSON body") {
    loopback.daemonWrite(
        FakeDaemon::response(200, "OK", "application/json", "{\"Id\":"));
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      DecodeError);
  }
}

TEST_CASE("HttpRequestEngine classifies streaming responses",
          "[HttpRequestEngine]") {
  LoopbackConnection loopback;
  HttpRequestEngine engine;

  SECTION("Chunked JSON") {
    loopback.daemonWrite(FakeDaemon::chunkedResponse(
        200, "application/json",
        {"{\"stream\":\"Step 1/1 : FROM alp", "ine\\n\"}\r\n{\"stream\":",
         "\"done\\n\"}\r\n"}));
    auto response = engine.send(loopback.connection, HttpRequest::post("/build"));
    REQUIRE(response->getKind() == ResponseKind::STREAMED_JSON);
    REQUIRE_FALSE(loopback.connection->isClosed());

    auto decoder = response->getDecoder();
    StreamEvent event;
    REQUIRE(decoder->next(&event));
    REQUIRE(event.getValue()["stream"] == "Step 1/1 : FROM alpine\n");
    REQUIRE(decoder->next(&event));
    REQUIRE(event.getValue()["stream"] == "done\n");
    REQUIRE_FALSE(decoder->next(&event));
  }

  SECTION("JSON read until close") {
    loopback.daemonWrite(
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n"
        "{\"status\":\"Pulling\"}{\"status\":\"Done\"}");
    loopback.closeDaemonSide();
    auto response =
        engine.send(loopback.connection, HttpRequest::post("/images/create"));
    REQUIRE(response->getKind() == ResponseKind::STREAMED_JSON);
    StreamEvent event;
    REQUIRE(response->getDecoder()->next(&event));
    REQUIRE(response->getDecoder()->next(&event));
    REQUIRE(event.getValue()["status"] == "Done");
    REQUIRE_FALSE(response->getDecoder()->next(&event));
  }

  SECTION("Multiplexed stream") {
    loopback.daemonWrite(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/vnd.docker.multiplexed-stream\r\n\r\n" +
        MultiplexedFrame::encode(StreamId::STDOUT, "out\n") +
        MultiplexedFrame::encode(StreamId::STDERR, "err\n"));
    loopback.closeDaemonSide();
    auto response = engine.send(loopback.connection,
                                HttpRequest::get("/containers/x/logs"));
    REQUIRE(response->getKind() == ResponseKind::MULTIPLEXED);
    StreamEvent event;
    REQUIRE(response->getDecoder()->next(&event));
    REQUIRE(event.getStreamId() == StreamId::STDOUT);
    REQUIRE(event.getPayload() == "out\n");
    REQUIRE(response->getDecoder()->next(&event));
    REQUIRE(event.getStreamId() == StreamId::STDERR);
    REQUIRE_FALSE(response->getDecoder()->next(&event));
  }
}

TEST_CASE("HttpRequestEngine classification table", "[HttpRequestEngine]") {
  HeaderMap headers;
  headers["Content-Type"] = "application/json; charset=utf-8";
  headers["Content-Length"] = "12";
  REQUIRE(HttpRequestEngine::classify(200, headers) == ResponseKind::SIMPLE);
  headers.erase("Content-Length");
  REQUIRE(HttpRequestEngine::classify(200, headers) ==
          ResponseKind::STREAMED_JSON);
  REQUIRE(HttpRequestEngine::classify(404, headers) == ResponseKind::SIMPLE);

  headers["content-type"] = "application/x-ndjson";
  REQUIRE(HttpRequestEngine::classify(200, headers) ==
          ResponseKind::STREAMED_JSON);
  headers["Content-Type"] = "application/vnd.docker.raw-stream";
  REQUIRE(HttpRequestEngine::classify(200, headers) ==
          ResponseKind::MULTIPLEXED);
  headers["Content-Type"] = "text/plain";
  REQUIRE(HttpRequestEngine::classify(200, headers) == ResponseKind::SIMPLE);

  REQUIRE(HttpRequestEngine::hasNoBody("HEAD", 200));
  REQUIRE(HttpRequestEngine::hasNoBody("GET", 304));
  REQUIRE_FALSE(HttpRequestEngine::hasNoBody("GET", 200));
}

TEST_CASE("HttpRequestEngine header failures", "[HttpRequestEngine]") {
  LoopbackConnection loopback;
  HttpRequestEngine engine;

  SECTION("Closed before any response") {
    loopback.closeDaemonSide();
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      ConnectionError);
  }

  SECTION("Closed in the middle of the headers") {
    loopback.daemonWrite("HTTP/1.1 200 OK\r\nContent-Type: text/pl");
    loopback.closeDaemonSide();
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      ConnectionError);
  }

  SECTION("Closed after the status line") {
    loopback.daemonWrite("HTTP/1.1 200 OK\r\n");
    loopback.closeDaemonSide();
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      ConnectionError);
  }

  SECTION("Garbage status line") {
    loopback.daemonWrite("SSH-2.0-OpenSSH\r\n\r\n");
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      DecodeError);
  }

  SECTION("Aborted while waiting") {
    std::thread aborter([&loopback]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      loopback.connection->abort();
    });
    REQUIRE_THROWS_AS(engine.send(loopback.connection, HttpRequest::get("/x")),
                      ConnectionError);
    aborter.join();
  }
}
