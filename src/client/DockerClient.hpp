#ifndef __DW_DOCKER_CLIENT__
#define __DW_DOCKER_CLIENT__

#include "AsyncDispatcher.hpp"
#include "BodySource.hpp"
#include "DockerClientException.hpp"
#include "DockerConfig.hpp"
#include "Headers.hpp"
#include "HttpRequest.hpp"
#include "HttpRequestEngine.hpp"
#include "StreamHandle.hpp"
#include "TransportResolver.hpp"

namespace dw {
/**
 * @brief A response with its body fully read: the content of a SIMPLE
 * response, or a JSON array of every event of a streaming one.
 */
class DockerResponse {
 public:
  DockerResponse() : status(0) {}
  DockerResponse(int _status, const HeaderMap& _headers, const json& _content)
      : status(_status), headers(_headers), content(_content) {}

  int getStatus() const { return status; }
  const HeaderMap& getHeaders() const { return headers; }
  const json& getContent() const { return content; }
  bool isSuccess() const { return status >= 200 && status < 300; }

 protected:
  int status;
  HeaderMap headers;
  json content;
};

struct BuildOptions {
  /** @brief Repository name and tag for the result, e.g. "app:latest". */
  string tag;
  /** @brief Path of the Dockerfile inside the context. */
  string dockerfile;
  /** @brief Remove intermediate containers after a successful build. */
  bool rm = true;
  bool noCache = false;
  bool pull = false;
  map<string, string> buildArgs;
  /** @brief Extra /build query parameters passed through verbatim. */
  map<string, string> extraQuery;
};

/** @brief The collected build log and the image it produced. */
struct BuildResult {
  vector<StreamEvent> log;
  string imageId;
};

/**
 * @brief Requests against one daemon. Every request uses its own connection,
 * so one client can serve concurrent callers.
 */
class DockerClient {
 public:
  /**
   * @brief Connects per config and applies its [Debug] verbose level to the
   * process-wide easylogging++ VLOG level when non-zero.
   * @throws std::invalid_argument if the configured host cannot be parsed.
   */
  explicit DockerClient(const DockerConfig& config);
  DockerClient(shared_ptr<TransportResolver> _resolver,
               const string& _apiPathPrefix);

  /** @brief GET /_ping; a healthy daemon answers 200 "OK". */
  DockerResponse ping();

  /**
   * @brief Sends a request and returns its envelope unconsumed.
   * The API version prefix is prepended to the path.
   */
  shared_ptr<HttpResponse> send(HttpRequest request);

  /**
   * @brief Sends a request and reads the whole body. Non-2xx statuses are
   * returned, not thrown.
   * @throws DockerClientException when a streamed body carries an error event.
   * @throws DockerError for transport and decode failures.
   */
  DockerResponse request(const HttpRequest& request);

  /**
   * @brief Starts delivering a streaming response to callback on a worker
   * thread and returns immediately.
   *
   * A 2xx SIMPLE response is delivered before returning, as one event and
   * onFinish(). With a NULL callback the handle buffers the events; read
   * them with StreamHandle::getEvents().
   * @throws DockerClientException for a non-2xx status.
   */
  shared_ptr<StreamHandle> stream(const HttpRequest& request,
                                  shared_ptr<StreamCallback> callback);

  /**
   * @brief Builds an image from a tar context and waits for the result.
   * @return The new image id.
   * @throws DockerClientException("docker build failed") when the daemon
   * rejects the build.
   */
  string build(shared_ptr<BodySource> context, const BuildOptions& options);

  /**
   * @brief Streams build progress to callback, as stream() does. A NULL
   * callback buffers the log in the returned handle.
   * @throws DockerClientException("docker build failed") for a non-2xx
   * status.
   */
  shared_ptr<StreamHandle> build(shared_ptr<BodySource> context,
                                 const BuildOptions& options,
                                 shared_ptr<StreamCallback> callback);

  /** @brief Builds and returns the full log along with the image id. */
  BuildResult buildWithLogs(shared_ptr<BodySource> context,
                            const BuildOptions& options);

  /** @brief The POST /build request for a context and options. */
  static HttpRequest buildRequest(shared_ptr<BodySource> context,
                                  const BuildOptions& options);

  /**
   * @brief Finds the image id in a build log: the "aux" ID when the daemon
   * sent one, otherwise the last "Successfully built <id>" line.
   * @return "" when neither is present.
   */
  static string extractImageId(const vector<StreamEvent>& log);

  static json eventsToJson(const vector<StreamEvent>& events);

 protected:
  shared_ptr<TransportResolver> resolver;
  string apiPathPrefix;
  HttpRequestEngine engine;

  /** @brief Blocking build; fills log and returns the image id. */
  string runBuild(shared_ptr<BodySource> context, const BuildOptions& options,
                  vector<StreamEvent>* log);
};
}  // namespace dw

#endif  // __DW_DOCKER_CLIENT__
