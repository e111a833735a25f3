#ifndef __DW_HTTP_REQUEST__
#define __DW_HTTP_REQUEST__

#include "BodySource.hpp"
#include "Headers.hpp"

namespace dw {
/** @brief Orders header names without regard to case. */
struct CaseInsensitiveLess {
  bool operator()(const string& a, const string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
          return std::tolower((unsigned char)x) <
                 std::tolower((unsigned char)y);
        });
  }
};

typedef map<string, string, CaseInsensitiveLess> HeaderMap;

/**
 * @brief A request to the Engine API: built once, sent once, discarded.
 *
 * GET and DELETE requests carry no body unless one is set explicitly.
 */
class HttpRequest {
 public:
  HttpRequest() : method("GET"), path("/") {}
  HttpRequest(const string& _method, const string& _path)
      : method(_method), path(_path) {}

  static HttpRequest get(const string& path) {
    return HttpRequest("GET", path);
  }
  static HttpRequest post(const string& path) {
    return HttpRequest("POST", path);
  }
  static HttpRequest del(const string& path) {
    return HttpRequest("DELETE", path);
  }

  const string& getMethod() const { return method; }
  const string& getPath() const { return path; }
  const map<string, string>& getQuery() const { return query; }
  const HeaderMap& getHeaders() const { return headers; }
  shared_ptr<BodySource> getBody() const { return body; }
  bool hasBody() const { return body.get() != NULL; }

  HttpRequest& setQuery(const string& key, const string& value) {
    query[key] = value;
    return *this;
  }
  /** @brief Sets a query value that the daemon expects as JSON text. */
  HttpRequest& setJsonQuery(const string& key, const json& value) {
    query[key] = value.dump();
    return *this;
  }
  HttpRequest& setHeader(const string& name, const string& value) {
    headers[name] = value;
    return *this;
  }
  /**
   * @brief Attaches an already encoded registry credential. An empty value
   * leaves the request anonymous.
   */
  HttpRequest& setRegistryAuth(const string& encodedAuth) {
    if (!encodedAuth.empty()) {
      headers["X-Registry-Auth"] = encodedAuth;
    }
    return *this;
  }
  HttpRequest& setBody(shared_ptr<BodySource> _body,
                       const string& contentType) {
    body = _body;
    headers["Content-Type"] = contentType;
    return *this;
  }
  HttpRequest& setJsonBody(const json& value) {
    return setBody(shared_ptr<BodySource>(new StringBodySource(value.dump())),
                   "application/json");
  }
  /** @brief Sends an uncompressed tar archive, e.g. a build context. */
  HttpRequest& setTarBody(shared_ptr<BodySource> archive) {
    return setBody(archive, "application/x-tar");
  }
  /** @brief Prepends e.g. "/v1.41" to the path. */
  HttpRequest& setPathPrefix(const string& prefix) {
    if (!prefix.empty() && !startsWith(path, prefix + "/")) {
      path = prefix + path;
    }
    return *this;
  }

  /** @brief Path plus URL encoded query string, as sent on the request line.
   */
  string target() const;

  static string urlEncode(const string& s);

 protected:
  string method;
  string path;
  map<string, string> query;
  HeaderMap headers;
  shared_ptr<BodySource> body;
};
}  // namespace dw

#endif  // __DW_HTTP_REQUEST__
