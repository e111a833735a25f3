#ifndef __DW_ASYNC_DISPATCHER__
#define __DW_ASYNC_DISPATCHER__

#include "Errors.hpp"
#include "Headers.hpp"
#include "HttpResponse.hpp"
#include "StreamEvent.hpp"

namespace dw {
/**
 * @brief Receives the events of one streaming response, then exactly one of
 * onFinish() or onFailure().
 *
 * All calls for a response come from the same thread, in stream order.
 */
class StreamCallback {
 public:
  virtual ~StreamCallback() {}

  virtual void onEvent(const StreamEvent& event) = 0;
  virtual void onFinish() = 0;
  virtual void onFailure(const DockerError& error) = 0;
};

/** @brief The terminal state of a streaming response. */
class CompletionSignal {
 public:
  enum Status { PENDING, FINISHED, FAILED };

  CompletionSignal() : status(PENDING) {}

  static CompletionSignal finished() {
    CompletionSignal signal;
    signal.status = FINISHED;
    return signal;
  }

  static CompletionSignal failed(const DockerError& error);

  Status getStatus() const { return status; }
  bool isPending() const { return status == PENDING; }
  bool isFinished() const { return status == FINISHED; }
  bool isFailed() const { return status == FAILED; }

  /** @brief The failure, NULL unless FAILED. */
  shared_ptr<DockerError> getError() const { return error; }

  /** @brief Throws the failure with its original type. No-op otherwise. */
  void rethrow() const;

 protected:
  Status status;
  shared_ptr<DockerError> error;
};

/** @brief Buffers events for the blocking collect-then-return mode. */
class EventCollector : public StreamCallback {
 public:
  virtual void onEvent(const StreamEvent& event) { events.push_back(event); }
  virtual void onFinish() {}
  virtual void onFailure(const DockerError& error) {}

  const vector<StreamEvent>& getEvents() const { return events; }

 protected:
  vector<StreamEvent> events;
};

/**
 * @brief Drives a streaming response's decoder and fans events out to a
 * callback.
 */
class AsyncDispatcher {
 public:
  /**
   * @brief Delivers every event, closes the response, then fires the
   * terminal callback once. Runs on the calling thread.
   *
   * A decoded event with an "error"/"errorDetail" key is still delivered;
   * once the stream ends the response fails with a ProtocolError carrying the
   * last such event. A SIMPLE response delivers its non-null content as a
   * single event, then finishes.
   *
   * @return The signal passed to the terminal callback.
   * @throws std::invalid_argument if callback is NULL; use collect() to
   * buffer events instead.
   */
  static CompletionSignal dispatch(shared_ptr<HttpResponse> response,
                                   StreamCallback* callback);

  /**
   * @brief Blocking collect mode: buffers all events in order.
   */
  static CompletionSignal collect(shared_ptr<HttpResponse> response,
                                  vector<StreamEvent>* events);
};
}  // namespace dw

#endif  // __DW_ASYNC_DISPATCHER__
