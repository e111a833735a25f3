#include "StreamHandle.hpp"

namespace dw {
StreamHandle::StreamHandle(shared_ptr<HttpResponse> _response,
                           shared_ptr<StreamCallback> _callback)
    : response(_response), callback(_callback), done(false) {
  if (!callback.get()) {
    collector.reset(new EventCollector());
    callback = collector;
  }
}

StreamHandle::~StreamHandle() {
  if (!worker.joinable()) {
    return;
  }
  if (!isDone()) {
    abort();
  }
  if (worker.get_id() == std::this_thread::get_id()) {
    STFATAL << "StreamHandle destroyed from inside its own callback";
  }
  worker.join();
}

void StreamHandle::start() {
  if (worker.joinable() || isDone()) {
    STFATAL << "StreamHandle started twice";
  }
  if (!response->isStreaming()) {
    run();
    return;
  }
  worker = std::thread(&StreamHandle::run, this);
}

void StreamHandle::run() {
  CompletionSignal result = AsyncDispatcher::dispatch(response, callback.get());
  {
    lock_guard<std::mutex> guard(signalMutex);
    signal = result;
    done = true;
  }
  signalCondition.notify_all();
}

bool StreamHandle::waitFor(int64_t timeoutMs) {
  unique_lock<std::mutex> lock(signalMutex);
  return signalCondition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                  [this] { return done; });
}

CompletionSignal StreamHandle::wait() {
  unique_lock<std::mutex> lock(signalMutex);
  signalCondition.wait(lock, [this] { return done; });
  return signal;
}

void StreamHandle::abort() {
  VLOG(1) << "Aborting stream";
  response->abort();
}

bool StreamHandle::isDone() {
  lock_guard<std::mutex> guard(signalMutex);
  return done;
}

CompletionSignal StreamHandle::getSignal() {
  lock_guard<std::mutex> guard(signalMutex);
  return signal;
}

vector<StreamEvent> StreamHandle::getEvents() {
  wait();
  if (!collector.get()) {
    return vector<StreamEvent>();
  }
  return collector->getEvents();
}
}  // namespace dw
