#ifndef __DW_HTTP_RESPONSE_PARSER__
#define __DW_HTTP_RESPONSE_PARSER__

#include <llhttp.h>

#include "BodyReader.hpp"
#include "DaemonConnection.hpp"
#include "Headers.hpp"
#include "HttpRequest.hpp"

namespace dw {
/**
 * @brief Reads one HTTP/1.1 response from a DaemonConnection with llhttp.
 *
 * Bytes are pulled from the connection only when the caller needs more of
 * the head or the body. llhttp handles Content-Length, chunked (extensions
 * and trailers included) and read-until-close framing; de-framed body bytes
 * are buffered until read, at most one connection read at a time.
 */
class HttpResponseParser {
 public:
  /**
   * @param _method The request method. HEAD responses never carry a body.
   */
  HttpResponseParser(shared_ptr<DaemonConnection> _connection,
                     const string& _method);

  /**
   * @brief Reads until the status line and headers are complete.
   * @throws ConnectionError if the connection closes or fails first.
   * @throws DecodeError for a malformed status line or header.
   */
  void readHead();

  int getStatus() const { return status; }
  const string& getReason() const { return reason; }
  /** @brief Headers by name; repeated headers are joined with ", ". */
  const HeaderMap& getHeaders() const { return headers; }

  /**
   * @brief Reads up to count de-framed body bytes.
   * @return Bytes read, 0 once the response is complete.
   * @throws ConnectionError if the connection ends inside the body.
   * @throws DecodeError on malformed chunk framing.
   */
  size_t readBody(char* buf, size_t count);

  bool isMessageComplete() const { return messageComplete; }

 protected:
  shared_ptr<DaemonConnection> connection;
  string method;
  llhttp_t parser;
  llhttp_settings_t settings;

  int status;
  string reason;
  HeaderMap headers;
  string headerField;
  string headerValue;
  int headerCount;
  bool headersComplete;
  bool messageComplete;
  bool eof;
  string body;
  size_t bodyOffset;
  /** @brief Why a callback stopped the parser. */
  string callbackError;

  /**
   * @brief Reads once from the connection and runs the bytes through llhttp.
   * @return false at EOF.
   */
  bool feed();
  void execute(const char* data, size_t length);

  static int onStatus(llhttp_t* p, const char* at, size_t length);
  static int onHeaderField(llhttp_t* p, const char* at, size_t length);
  static int onHeaderFieldComplete(llhttp_t* p);
  static int onHeaderValue(llhttp_t* p, const char* at, size_t length);
  static int onHeaderValueComplete(llhttp_t* p);
  static int onHeadersComplete(llhttp_t* p);
  static int onBody(llhttp_t* p, const char* at, size_t length);
  static int onMessageComplete(llhttp_t* p);
};

/** @brief The body of a parsed response as a BodyReader. */
class HttpBodyReader : public BodyReader {
 public:
  explicit HttpBodyReader(shared_ptr<HttpResponseParser> _parser)
      : parser(_parser) {}

  virtual size_t read(char* buf, size_t count) {
    return parser->readBody(buf, count);
  }

 protected:
  shared_ptr<HttpResponseParser> parser;
};
}  // namespace dw

#endif  // __DW_HTTP_RESPONSE_PARSER__
