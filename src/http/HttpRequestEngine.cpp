#include "HttpRequestEngine.hpp"

#include "HttpResponseParser.hpp"
#include "JsonStreamDecoder.hpp"
#include "MultiplexedStreamDecoder.hpp"

namespace dw {
namespace {
const size_t BODY_WRITE_SIZE = 64 * 1024;

const char* USER_AGENT = "dockwire/" DW_VERSION;

bool isJsonMediaType(const string& type) {
  return type == "application/json" ||
         (startsWith(type, "application/") &&
          type.length() > 5 &&
          type.compare(type.length() - 5, 5, "+json") == 0);
}
}  // namespace

string HttpRequestEngine::mediaType(const HeaderMap& headers) {
  auto it = headers.find("Content-Type");
  if (it == headers.end()) {
    return "";
  }
  string type = it->second;
  auto semicolon = type.find(';');
  if (semicolon != string::npos) {
    type = type.substr(0, semicolon);
  }
  return toLower(trim(type));
}

bool HttpRequestEngine::hasNoBody(const string& method, int status) {
  return method == "HEAD" || (status >= 100 && status < 200) ||
         status == 204 || status == 304;
}

ResponseKind HttpRequestEngine::classify(int status, const HeaderMap& headers) {
  // Error bodies are single documents even when sent chunked
  if (status < 200 || status >= 300) {
    return ResponseKind::SIMPLE;
  }
  string type = mediaType(headers);
  if (type == "application/vnd.docker.raw-stream" ||
      type == "application/vnd.docker.multiplexed-stream") {
    return ResponseKind::MULTIPLEXED;
  }
  if (type == "application/x-json-stream" || type == "application/x-ndjson") {
    return ResponseKind::STREAMED_JSON;
  }
  if (type == "application/json" &&
      headers.find("Content-Length") == headers.end()) {
    return ResponseKind::STREAMED_JSON;
  }
  return ResponseKind::SIMPLE;
}

void HttpRequestEngine::writeRequest(shared_ptr<DaemonConnection> connection,
                                     const HttpRequest& request) {
  HeaderMap headers;
  headers["Host"] = connection->getHostHeader();
  headers["User-Agent"] = USER_AGENT;
  headers["Connection"] = "close";
  for (const auto& it : request.getHeaders()) {
    headers[it.first] = it.second;
  }

  auto body = request.getBody();
  headers.erase("Content-Length");
  headers.erase("Transfer-Encoding");
  if (body.get()) {
    if (body->length() >= 0) {
      headers["Content-Length"] = to_string(body->length());
    } else {
      headers["Transfer-Encoding"] = "chunked";
    }
  } else if (request.getMethod() == "POST" || request.getMethod() == "PUT") {
    headers["Content-Length"] = "0";
  }

  string head = request.getMethod() + " " + request.target() + " HTTP/1.1\r\n";
  for (const auto& it : headers) {
    head += it.first + ": " + it.second + "\r\n";
  }
  head += "\r\n";
  VLOG(2) << "Request head:\n" << head;
  connection->write(head);

  if (body.get()) {
    writeBody(connection, body);
  }
}

void HttpRequestEngine::writeBody(shared_ptr<DaemonConnection> connection,
                                  shared_ptr<BodySource> body) {
  int64_t declared = body->length();
  int64_t total = 0;
  vector<char> buf(BODY_WRITE_SIZE);
  while (true) {
    size_t n = body->read(&buf[0], buf.size());
    if (n == 0) {
      break;
    }
    total += n;
    if (declared >= 0) {
      if (total > declared) {
        throw std::runtime_error("Request body longer than its declared " +
                                 to_string(declared) + " bytes");
      }
      connection->write(&buf[0], n);
    } else {
      std::stringstream chunkHeader;
      chunkHeader << std::hex << n << "\r\n";
      connection->write(chunkHeader.str());
      connection->write(&buf[0], n);
      connection->write("\r\n", 2);
    }
  }
  if (declared >= 0) {
    if (total != declared) {
      throw std::runtime_error("Request body ended after " + to_string(total) +
                               " of " + to_string(declared) + " bytes");
    }
  } else {
    connection->write("0\r\n\r\n", 5);
  }
  VLOG(2) << "Wrote " << total << " body bytes";
}

shared_ptr<HttpResponse> HttpRequestEngine::send(
    shared_ptr<DaemonConnection> connection, const HttpRequest& request) {
  writeRequest(connection, request);

  shared_ptr<HttpResponseParser> parser(
      new HttpResponseParser(connection, request.getMethod()));
  parser->readHead();
  int status = parser->getStatus();
  const string& reason = parser->getReason();
  const HeaderMap& headers = parser->getHeaders();

  ResponseKind kind = hasNoBody(request.getMethod(), status)
                          ? ResponseKind::SIMPLE
                          : classify(status, headers);
  VLOG(1) << request.getMethod() << " " << request.getPath() << " -> "
          << status << " " << reason << " (" << responseKindName(kind) << ")";

  shared_ptr<HttpResponse> response(
      new HttpResponse(status, reason, headers, kind, connection));
  shared_ptr<BodyReader> bodyReader(new HttpBodyReader(parser));

  switch (kind) {
    case ResponseKind::SIMPLE: {
      string body = readFully(bodyReader.get(), maxSimpleBodySize);
      json content;
      if (isJsonMediaType(mediaType(headers)) && !trim(body).empty()) {
        try {
          content = json::parse(body);
        } catch (const json::parse_error& e) {
          throw DecodeError(string("Malformed JSON response body: ") +
                            e.what());
        }
      } else if (!body.empty()) {
        content = body;
      }
      response->setBody(body, content);
      response->close();
      break;
    }
    case ResponseKind::STREAMED_JSON:
      response->setDecoder(
          shared_ptr<StreamDecoder>(new JsonStreamDecoder(bodyReader)));
      break;
    case ResponseKind::MULTIPLEXED:
      response->setDecoder(shared_ptr<StreamDecoder>(
          new MultiplexedStreamDecoder(bodyReader)));
      break;
  }
  return response;
}
}  // namespace dw
