#ifndef __DW_MULTIPLEXED_STREAM_DECODER__
#define __DW_MULTIPLEXED_STREAM_DECODER__

#include "StreamDecoder.hpp"

namespace dw {
/**
 * @brief The 8 byte frame header used by attach and logs:
 * [stream id][0][0][0][big endian uint32 length]
 */
class MultiplexedFrame {
 public:
  static const size_t HEADER_SIZE = 8;

  /** @brief Header plus payload, ready to be written to a stream. */
  static string encode(StreamId id, const string& payload);

  /**
   * @brief Parses a frame header.
   * @throws DecodeError for an unknown stream id.
   */
  static void decodeHeader(const unsigned char* header, StreamId* id,
                           uint32_t* length);
};

/** @brief Splits an attach/logs body into stdout/stderr/stdin frames. */
class MultiplexedStreamDecoder : public StreamDecoder {
 public:
  explicit MultiplexedStreamDecoder(
      shared_ptr<BodyReader> _body,
      int64_t _maxFrameSize = MAX_STREAM_EVENT_SIZE)
      : StreamDecoder(_body), maxFrameSize(_maxFrameSize) {}

 protected:
  virtual bool decodeNext(StreamEvent* event);

  /** @brief Reads until count bytes arrive or EOF. Returns bytes read. */
  size_t readUpTo(char* buf, size_t count);

  int64_t maxFrameSize;
};
}  // namespace dw

#endif  // __DW_MULTIPLEXED_STREAM_DECODER__
