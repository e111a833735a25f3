#include "AsyncDispatcher.hpp"

namespace dw {
CompletionSignal CompletionSignal::failed(const DockerError& error) {
  CompletionSignal signal;
  signal.status = FAILED;
  switch (error.kind()) {
    case ErrorKind::TRANSPORT_UNAVAILABLE:
      signal.error.reset(new TransportUnavailable(error.what()));
      break;
    case ErrorKind::CONNECTION_ERROR:
      signal.error.reset(new ConnectionError(error.what()));
      break;
    case ErrorKind::DECODE_ERROR:
      signal.error.reset(new DecodeError(error.what()));
      break;
    case ErrorKind::PROTOCOL_ERROR:
      signal.error.reset(
          new ProtocolError(static_cast<const ProtocolError&>(error)));
      break;
  }
  return signal;
}

void CompletionSignal::rethrow() const {
  if (status != FAILED) {
    return;
  }
  switch (error->kind()) {
    case ErrorKind::TRANSPORT_UNAVAILABLE:
      throw *static_pointer_cast<TransportUnavailable>(error);
    case ErrorKind::CONNECTION_ERROR:
      throw *static_pointer_cast<ConnectionError>(error);
    case ErrorKind::DECODE_ERROR:
      throw *static_pointer_cast<DecodeError>(error);
    case ErrorKind::PROTOCOL_ERROR:
      throw *static_pointer_cast<ProtocolError>(error);
  }
}

namespace {
/** @brief Hands every event of response to callback. */
void deliverEvents(shared_ptr<HttpResponse> response, StreamCallback* callback,
                   int64_t* delivered) {
  if (!response->isStreaming()) {
    if (!response->getContent().is_null()) {
      callback->onEvent(StreamEvent::fromJson(response->getContent()));
      (*delivered)++;
    }
    return;
  }

  auto decoder = response->getDecoder();
  StreamEvent event;
  bool sawErrorEvent = false;
  json lastErrorEvent;
  while (decoder->next(&event)) {
    if (response->isAborted()) {
      throw ConnectionError("Request aborted");
    }
    if (event.isErrorEvent()) {
      LOG(INFO) << "Daemon reported an error: " << event.getValue();
      sawErrorEvent = true;
      lastErrorEvent = event.getValue();
    }
    callback->onEvent(event);
    (*delivered)++;
  }
  if (sawErrorEvent) {
    throw ProtocolError(lastErrorEvent);
  }
}
}  // namespace

CompletionSignal AsyncDispatcher::dispatch(shared_ptr<HttpResponse> response,
                                           StreamCallback* callback) {
  if (callback == NULL) {
    throw std::invalid_argument(
        "AsyncDispatcher::dispatch needs a callback, use collect()");
  }

  CompletionSignal signal;
  int64_t delivered = 0;
  try {
    deliverEvents(response, callback, &delivered);
    signal = CompletionSignal::finished();
  } catch (const DockerError& e) {
    LOG(INFO) << "Stream failed after " << delivered << " events: "
              << errorKindName(e.kind()) << ": " << e.what();
    signal = CompletionSignal::failed(e);
  } catch (const std::exception& e) {
    // e.g. the callback itself threw
    LOG(ERROR) << "Stream failed after " << delivered << " events: "
               << e.what();
    signal = CompletionSignal::failed(ConnectionError(e.what()));
  }

  response->close();
  VLOG(1) << "Stream complete: " << delivered << " events, "
          << (signal.isFinished() ? "finished" : "failed");

  try {
    if (signal.isFinished()) {
      callback->onFinish();
    } else {
      callback->onFailure(*signal.getError());
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Terminal stream callback threw: " << e.what();
  }
  return signal;
}

CompletionSignal AsyncDispatcher::collect(shared_ptr<HttpResponse> response,
                                          vector<StreamEvent>* events) {
  EventCollector collector;
  CompletionSignal signal = dispatch(response, &collector);
  *events = collector.getEvents();
  return signal;
}
}  // namespace dw
