#ifndef __DW_STREAM_HANDLE__
#define __DW_STREAM_HANDLE__

#include "AsyncDispatcher.hpp"
#include "Headers.hpp"
#include "HttpResponse.hpp"

namespace dw {
/**
 * @brief Runs AsyncDispatcher::dispatch for one response on a worker thread
 * and exposes the completion signal as a one-shot latch.
 *
 * The latch opens after the terminal callback returns. Destroying an
 * unfinished handle aborts the request and joins the worker.
 *
 * Without a callback the handle buffers every event itself; getEvents()
 * returns them in stream order once the stream ends.
 */
class StreamHandle {
 public:
  StreamHandle(shared_ptr<HttpResponse> _response,
               shared_ptr<StreamCallback> _callback);
  virtual ~StreamHandle();

  StreamHandle(const StreamHandle&) = delete;
  StreamHandle& operator=(const StreamHandle&) = delete;

  /**
   * @brief Starts dispatching. A SIMPLE response is delivered on the calling
   * thread as one event followed by onFinish().
   */
  void start();

  /**
   * @brief Waits at most timeoutMs for the terminal signal.
   * @return false on timeout; the request keeps running.
   */
  bool waitFor(int64_t timeoutMs);

  /** @brief Waits for the terminal signal and returns it. */
  CompletionSignal wait();

  /**
   * @brief Closes the connection under the decoder. Delivery stops and the
   * callback gets onFailure unless the stream already finished.
   */
  void abort();

  bool isDone();

  /** @brief The terminal signal, PENDING until done. */
  CompletionSignal getSignal();

  shared_ptr<HttpResponse> getResponse() { return response; }

  /** @brief True when the handle buffers events instead of a caller sink. */
  bool isCollecting() const { return collector.get() != NULL; }

  /**
   * @brief Waits for the started stream to end and returns the buffered
   * events. Empty when a caller supplied callback received them instead.
   */
  vector<StreamEvent> getEvents();

 protected:
  shared_ptr<HttpResponse> response;
  shared_ptr<StreamCallback> callback;
  shared_ptr<EventCollector> collector;
  std::thread worker;
  std::mutex signalMutex;
  std::condition_variable signalCondition;
  CompletionSignal signal;
  bool done;

  void run();
};
}  // namespace dw

#endif  // __DW_STREAM_HANDLE__
