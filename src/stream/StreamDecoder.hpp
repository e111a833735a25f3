#ifndef __DW_STREAM_DECODER__
#define __DW_STREAM_DECODER__

#include "BodyReader.hpp"
#include "Errors.hpp"
#include "Headers.hpp"
#include "StreamEvent.hpp"

namespace dw {
/**
 * @brief Pulls discrete events out of a streaming response body.
 *
 * Non-reentrant: at most one next() call may be outstanding at a time.
 */
class StreamDecoder {
 public:
  explicit StreamDecoder(shared_ptr<BodyReader> _body)
      : body(_body), busy(false) {}
  virtual ~StreamDecoder() {}

  /**
   * @brief Decodes the next event.
   * @return false at the end of the stream.
   * @throws DecodeError for malformed or truncated input.
   * @throws ConnectionError if the connection fails or is aborted.
   */
  bool next(StreamEvent* event) {
    if (busy.exchange(true)) {
      STFATAL << "StreamDecoder::next called while another call is running";
    }
    BusyGuard guard(&busy);
    return decodeNext(event);
  }

 protected:
  class BusyGuard {
   public:
    explicit BusyGuard(std::atomic<bool>* _flag) : flag(_flag) {}
    ~BusyGuard() { *flag = false; }

   protected:
    std::atomic<bool>* flag;
  };

  virtual bool decodeNext(StreamEvent* event) = 0;

  shared_ptr<BodyReader> body;
  std::atomic<bool> busy;
};
}  // namespace dw

#endif  // __DW_STREAM_DECODER__
