#ifndef __DW_HTTP_RESPONSE__
#define __DW_HTTP_RESPONSE__

#include "DaemonConnection.hpp"
#include "Headers.hpp"
#include "HttpRequest.hpp"
#include "StreamDecoder.hpp"

namespace dw {
/** @brief How a response body is consumed. Decided once, from the headers. */
enum class ResponseKind {
  SIMPLE,
  STREAMED_JSON,
  MULTIPLEXED,
};

inline const char* responseKindName(ResponseKind kind) {
  switch (kind) {
    case ResponseKind::SIMPLE:
      return "simple";
    case ResponseKind::STREAMED_JSON:
      return "streamed-json";
    case ResponseKind::MULTIPLEXED:
      return "multiplexed";
  }
  return "unknown";
}

/**
 * @brief Status, headers and either the materialized body (SIMPLE) or a live
 * decoder (streaming kinds).
 *
 * A streaming response owns its connection until the body is consumed or the
 * response is closed or aborted. A SIMPLE response has already released it.
 */
class HttpResponse {
 public:
  HttpResponse(int _status, const string& _reason, const HeaderMap& _headers,
               ResponseKind _kind, shared_ptr<DaemonConnection> _connection)
      : status(_status),
        reason(_reason),
        headers(_headers),
        kind(_kind),
        connection(_connection) {}

  virtual ~HttpResponse() { close(); }

  int getStatus() const { return status; }
  const string& getReason() const { return reason; }
  const HeaderMap& getHeaders() const { return headers; }
  string getHeader(const string& name, const string& defaultValue = "") const {
    auto it = headers.find(name);
    return it == headers.end() ? defaultValue : it->second;
  }
  ResponseKind getKind() const { return kind; }
  bool isStreaming() const { return kind != ResponseKind::SIMPLE; }
  bool isSuccess() const { return status >= 200 && status < 300; }

  /** @brief Raw body bytes of a SIMPLE response. */
  const string& getBody() const { return body; }
  /**
   * @brief Parsed body of a SIMPLE response: JSON when the content type is
   * JSON, otherwise the body as a JSON string.
   */
  const json& getContent() const { return content; }
  void setBody(const string& _body, const json& _content) {
    body = _body;
    content = _content;
  }

  /** @brief Decoder of a streaming response, NULL for SIMPLE. */
  shared_ptr<StreamDecoder> getDecoder() { return decoder; }
  void setDecoder(shared_ptr<StreamDecoder> _decoder) { decoder = _decoder; }

  shared_ptr<DaemonConnection> getConnection() { return connection; }

  /**
   * @brief Interrupts a streaming body; the decoder's next read fails with
   * ConnectionError. Safe from any thread.
   */
  void abort() {
    if (connection.get()) {
      connection->abort();
    }
  }

  bool isAborted() const {
    return connection.get() != NULL && connection->isAborted();
  }

  /** @brief Releases the connection. */
  void close() {
    if (connection.get()) {
      connection->close();
    }
  }

 protected:
  int status;
  string reason;
  HeaderMap headers;
  ResponseKind kind;
  shared_ptr<DaemonConnection> connection;
  string body;
  json content;
  shared_ptr<StreamDecoder> decoder;
};
}  // namespace dw

#endif  // __DW_HTTP_RESPONSE__
