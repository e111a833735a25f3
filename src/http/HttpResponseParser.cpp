#include "HttpResponseParser.hpp"

namespace dw {
namespace {
const size_t READ_BUFFER_SIZE = 64 * 1024;
const size_t MAX_HEADER_FIELD_SIZE = 64 * 1024;
const int MAX_HEADER_COUNT = 256;

HttpResponseParser* parserOf(llhttp_t* p) {
  return static_cast<HttpResponseParser*>(p->data);
}
}  // namespace

HttpResponseParser::HttpResponseParser(shared_ptr<DaemonConnection> _connection,
                                       const string& _method)
    : connection(_connection),
      method(_method),
      status(0),
      headerCount(0),
      headersComplete(false),
      messageComplete(false),
      eof(false),
      bodyOffset(0) {
  llhttp_settings_init(&settings);
  settings.on_status = &HttpResponseParser::onStatus;
  settings.on_header_field = &HttpResponseParser::onHeaderField;
  settings.on_header_field_complete =
      &HttpResponseParser::onHeaderFieldComplete;
  settings.on_header_value = &HttpResponseParser::onHeaderValue;
  settings.on_header_value_complete =
      &HttpResponseParser::onHeaderValueComplete;
  settings.on_headers_complete = &HttpResponseParser::onHeadersComplete;
  settings.on_body = &HttpResponseParser::onBody;
  settings.on_message_complete = &HttpResponseParser::onMessageComplete;
  llhttp_init(&parser, HTTP_RESPONSE, &settings);
  parser.data = this;
}

void HttpResponseParser::execute(const char* data, size_t length) {
  llhttp_errno_t err = llhttp_execute(&parser, data, length);
  if (err == HPE_OK || err == HPE_PAUSED) {
    return;
  }
  if (err == HPE_USER) {
    throw DecodeError(callbackError);
  }
  const char* reason = llhttp_get_error_reason(&parser);
  throw DecodeError(string("Malformed HTTP response (") +
                    llhttp_errno_name(err) +
                    "): " + (reason ? reason : "unknown error"));
}

bool HttpResponseParser::feed() {
  if (eof) {
    return false;
  }
  char buf[READ_BUFFER_SIZE];
  size_t bytesRead = connection->readSome(buf, sizeof(buf));
  if (bytesRead > 0) {
    execute(buf, bytesRead);
    return true;
  }

  eof = true;
  // Completes a read-until-close body; fails for a cut Content-Length or
  // chunked body, or a partial head
  llhttp_errno_t err = llhttp_finish(&parser);
  if (err != HPE_OK && err != HPE_PAUSED) {
    throw ConnectionError(
        string("Daemon closed the connection in the middle of the response (") +
        llhttp_errno_name(err) + ")");
  }
  return false;
}

void HttpResponseParser::readHead() {
  while (!headersComplete) {
    if (!feed() && !headersComplete) {
      throw ConnectionError("Daemon closed the connection before responding");
    }
  }
  VLOG(2) << "Response head: " << status << " " << reason << ", "
          << headers.size() << " headers";
}

size_t HttpResponseParser::readBody(char* buf, size_t count) {
  if (count == 0) {
    return 0;
  }
  while (bodyOffset == body.length()) {
    body.clear();
    bodyOffset = 0;
    if (messageComplete) {
      return 0;
    }
    if (!feed() && !messageComplete) {
      throw ConnectionError("Connection closed before the body was complete");
    }
  }
  size_t n = std::min(count, body.length() - bodyOffset);
  memcpy(buf, body.data() + bodyOffset, n);
  bodyOffset += n;
  return n;
}

int HttpResponseParser::onStatus(llhttp_t* p, const char* at, size_t length) {
  parserOf(p)->reason.append(at, length);
  return 0;
}

int HttpResponseParser::onHeaderField(llhttp_t* p, const char* at,
                                      size_t length) {
  auto self = parserOf(p);
  self->headerField.append(at, length);
  if (self->headerField.length() > MAX_HEADER_FIELD_SIZE) {
    self->callbackError = "Response header name too long";
    return -1;
  }
  return 0;
}

int HttpResponseParser::onHeaderFieldComplete(llhttp_t* p) {
  auto self = parserOf(p);
  if (++self->headerCount > MAX_HEADER_COUNT) {
    self->callbackError = "Too many response headers";
    return -1;
  }
  return 0;
}

int HttpResponseParser::onHeaderValue(llhttp_t* p, const char* at,
                                      size_t length) {
  auto self = parserOf(p);
  self->headerValue.append(at, length);
  if (self->headerValue.length() > MAX_HEADER_FIELD_SIZE) {
    self->callbackError =
        "Response header " + self->headerField + " too long";
    return -1;
  }
  return 0;
}

int HttpResponseParser::onHeaderValueComplete(llhttp_t* p) {
  auto self = parserOf(p);
  string value = trim(self->headerValue);
  auto existing = self->headers.find(self->headerField);
  if (existing != self->headers.end()) {
    existing->second += ", " + value;
  } else {
    self->headers[self->headerField] = value;
  }
  self->headerField.clear();
  self->headerValue.clear();
  return 0;
}

int HttpResponseParser::onHeadersComplete(llhttp_t* p) {
  auto self = parserOf(p);
  self->status = p->status_code;
  self->reason = trim(self->reason);
  self->headersComplete = true;
  // 1 tells llhttp the response has no body
  return self->method == "HEAD" ? 1 : 0;
}

int HttpResponseParser::onBody(llhttp_t* p, const char* at, size_t length) {
  parserOf(p)->body.append(at, length);
  return 0;
}

int HttpResponseParser::onMessageComplete(llhttp_t* p) {
  auto self = parserOf(p);
  self->messageComplete = true;
  VLOG(4) << "Response complete";
  // Ignore anything the daemon sends after the response
  return HPE_PAUSED;
}
}  // namespace dw
