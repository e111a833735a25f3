#ifndef __DW_HTTP_REQUEST_ENGINE__
#define __DW_HTTP_REQUEST_ENGINE__

#include "BodyReader.hpp"
#include "DaemonConnection.hpp"
#include "Headers.hpp"
#include "HttpRequest.hpp"
#include "HttpResponse.hpp"

namespace dw {
/**
 * @brief HTTP/1.1 over a DaemonConnection: writes one request, reads the
 * response head and classifies the body.
 *
 * The response is parsed with llhttp (HttpResponseParser). Status codes are
 * reported, never raised. SIMPLE bodies are read completely and the
 * connection closed; streaming bodies get a decoder and keep the connection
 * open.
 */
class HttpRequestEngine {
 public:
  explicit HttpRequestEngine(int64_t _maxSimpleBodySize = MAX_STREAM_EVENT_SIZE)
      : maxSimpleBodySize(_maxSimpleBodySize) {}

  /**
   * @brief Sends request and reads the response head.
   * @throws ConnectionError if the connection fails or closes before the
   * head is complete.
   * @throws DecodeError for a malformed head, chunk framing or JSON body of
   * a SIMPLE response.
   */
  shared_ptr<HttpResponse> send(shared_ptr<DaemonConnection> connection,
                                const HttpRequest& request);

  /** @brief Chooses how a body is consumed from status and headers. */
  static ResponseKind classify(int status, const HeaderMap& headers);

  /** @brief True for responses that never carry a body. */
  static bool hasNoBody(const string& method, int status);

  /** @brief Media type without parameters, lower case. */
  static string mediaType(const HeaderMap& headers);

 protected:
  int64_t maxSimpleBodySize;

  void writeRequest(shared_ptr<DaemonConnection> connection,
                    const HttpRequest& request);
  void writeBody(shared_ptr<DaemonConnection> connection,
                 shared_ptr<BodySource> body);
};
}  // namespace dw

#endif  // __DW_HTTP_REQUEST_ENGINE__
