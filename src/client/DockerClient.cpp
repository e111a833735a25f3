#include "DockerClient.hpp"

namespace dw {
namespace {
const string BUILD_FAILED = "docker build failed";
const string SUCCESSFULLY_BUILT = "Successfully built ";

string errorMessageOf(const json& content) {
  if (content.is_object() && content.contains("message") &&
      content["message"].is_string()) {
    return content["message"].get<string>();
  }
  if (content.is_string()) {
    return content.get<string>();
  }
  return content.dump();
}

const char* boolParam(bool value) { return value ? "true" : "false"; }
}  // namespace

DockerClient::DockerClient(const DockerConfig& config)
    : resolver(new TransportResolver(config.toDaemonAddress(),
                                     config.connectTimeoutSec)),
      apiPathPrefix(config.apiPathPrefix()) {
  if (config.verboseLevel) {
    el::Loggers::setVerboseLevel(config.verboseLevel);
  }
}

DockerClient::DockerClient(shared_ptr<TransportResolver> _resolver,
                           const string& _apiPathPrefix)
    : resolver(_resolver), apiPathPrefix(_apiPathPrefix) {}

shared_ptr<HttpResponse> DockerClient::send(HttpRequest request) {
  request.setPathPrefix(apiPathPrefix);
  auto connection = resolver->resolve();
  return engine.send(connection, request);
}

DockerResponse DockerClient::ping() {
  return request(HttpRequest::get("/_ping"));
}

json DockerClient::eventsToJson(const vector<StreamEvent>& events) {
  json content = json::array();
  for (const auto& event : events) {
    content.push_back(event.toJson());
  }
  return content;
}

DockerResponse DockerClient::request(const HttpRequest& request) {
  auto response = send(request);
  if (!response->isStreaming()) {
    return DockerResponse(response->getStatus(), response->getHeaders(),
                          response->getContent());
  }

  vector<StreamEvent> events;
  CompletionSignal signal = AsyncDispatcher::collect(response, &events);
  if (signal.isFailed()) {
    auto error = signal.getError();
    if (error->kind() == ErrorKind::PROTOCOL_ERROR) {
      throw DockerClientException(
          request.getMethod() + " " + request.getPath() + " failed",
          error->what(), response->getStatus(), eventsToJson(events));
    }
    signal.rethrow();
  }
  return DockerResponse(response->getStatus(), response->getHeaders(),
                        eventsToJson(events));
}

shared_ptr<StreamHandle> DockerClient::stream(
    const HttpRequest& request, shared_ptr<StreamCallback> callback) {
  auto response = send(request);
  if (!response->isSuccess()) {
    throw DockerClientException(
        request.getMethod() + " " + request.getPath() + " failed",
        errorMessageOf(response->getContent()), response->getStatus(),
        response->getContent());
  }
  shared_ptr<StreamHandle> handle(new StreamHandle(response, callback));
  handle->start();
  return handle;
}

HttpRequest DockerClient::buildRequest(shared_ptr<BodySource> context,
                                       const BuildOptions& options) {
  HttpRequest request = HttpRequest::post("/build");
  if (!options.tag.empty()) {
    request.setQuery("t", options.tag);
  }
  if (!options.dockerfile.empty()) {
    request.setQuery("dockerfile", options.dockerfile);
  }
  request.setQuery("rm", boolParam(options.rm));
  if (options.noCache) {
    request.setQuery("nocache", boolParam(true));
  }
  if (options.pull) {
    request.setQuery("pull", boolParam(true));
  }
  if (!options.buildArgs.empty()) {
    request.setJsonQuery("buildargs", json(options.buildArgs));
  }
  for (const auto& it : options.extraQuery) {
    request.setQuery(it.first, it.second);
  }
  request.setTarBody(context);
  return request;
}

string DockerClient::extractImageId(const vector<StreamEvent>& log) {
  for (auto it = log.rbegin(); it != log.rend(); ++it) {
    const json& value = it->getValue();
    if (it->getType() == StreamEvent::JSON_VALUE && value.is_object() &&
        value.contains("aux") && value["aux"].is_object() &&
        value["aux"].contains("ID") && value["aux"]["ID"].is_string()) {
      return value["aux"]["ID"].get<string>();
    }
  }
  for (auto it = log.rbegin(); it != log.rend(); ++it) {
    const json& value = it->getValue();
    if (it->getType() != StreamEvent::JSON_VALUE || !value.is_object() ||
        !value.contains("stream") || !value["stream"].is_string()) {
      continue;
    }
    string line = trim(value["stream"].get<string>());
    if (startsWith(line, SUCCESSFULLY_BUILT)) {
      return trim(line.substr(SUCCESSFULLY_BUILT.length()));
    }
  }
  return "";
}

string DockerClient::runBuild(shared_ptr<BodySource> context,
                              const BuildOptions& options,
                              vector<StreamEvent>* log) {
  auto response = send(buildRequest(context, options));
  if (!response->isSuccess()) {
    throw DockerClientException(BUILD_FAILED,
                                errorMessageOf(response->getContent()),
                                response->getStatus(), response->getContent());
  }
  // A SIMPLE 200 body becomes a one event log
  CompletionSignal signal = AsyncDispatcher::collect(response, log);
  if (signal.isFailed()) {
    auto error = signal.getError();
    if (error->kind() == ErrorKind::PROTOCOL_ERROR) {
      throw DockerClientException(BUILD_FAILED, error->what(),
                                  response->getStatus(), eventsToJson(*log));
    }
    signal.rethrow();
  }

  string imageId = extractImageId(*log);
  if (imageId.empty()) {
    throw DockerClientException(BUILD_FAILED,
                                "Build output did not name an image",
                                response->getStatus(), eventsToJson(*log));
  }
  LOG(INFO) << "Built image " << imageId;
  return imageId;
}

string DockerClient::build(shared_ptr<BodySource> context,
                           const BuildOptions& options) {
  vector<StreamEvent> log;
  return runBuild(context, options, &log);
}

BuildResult DockerClient::buildWithLogs(shared_ptr<BodySource> context,
                                        const BuildOptions& options) {
  BuildResult result;
  result.imageId = runBuild(context, options, &result.log);
  return result;
}

shared_ptr<StreamHandle> DockerClient::build(
    shared_ptr<BodySource> context, const BuildOptions& options,
    shared_ptr<StreamCallback> callback) {
  auto response = send(buildRequest(context, options));
  if (!response->isSuccess()) {
    throw DockerClientException(BUILD_FAILED,
                                errorMessageOf(response->getContent()),
                                response->getStatus(), response->getContent());
  }
  shared_ptr<StreamHandle> handle(new StreamHandle(response, callback));
  handle->start();
  return handle;
}
}  // namespace dw
