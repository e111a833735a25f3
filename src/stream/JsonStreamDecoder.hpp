#ifndef __DW_JSON_STREAM_DECODER__
#define __DW_JSON_STREAM_DECODER__

#include "StreamDecoder.hpp"

namespace dw {
/**
 * @brief Finds the boundaries of whitespace separated JSON values in a byte
 * stream that arrives in arbitrary pieces.
 *
 * Objects and arrays end when their brackets balance (brackets inside string
 * literals are ignored, escapes honored). Top level strings end at the closing
 * quote. Bare tokens (numbers, true, false, null) end at whitespace, the start
 * of another value, or EOF.
 */
class JsonValueScanner {
 public:
  JsonValueScanner() { reset(); }

  /** @brief Appends bytes to the scan buffer. */
  void append(const char* buf, size_t count) { buffer.append(buf, count); }

  /**
   * @brief Extracts the next complete value's text.
   * @param atEof No more bytes will arrive; a pending bare token completes.
   * @return false if more bytes are needed (or, at EOF, nothing is left).
   * @throws DecodeError at EOF inside an unfinished value.
   */
  bool nextValue(string* text, bool atEof);

  /** @brief Bytes held for the value being assembled. */
  size_t pendingBytes() const { return buffer.length(); }

 protected:
  enum State { BETWEEN_VALUES, IN_CONTAINER, IN_TOP_LEVEL_STRING, IN_TOKEN };

  string buffer;
  size_t scanPos;
  State state;
  int depth;
  bool inString;
  bool escaped;

  void reset();
  void take(string* text, size_t end);
};

/** @brief Decodes a streamed JSON body (build, pull and push progress). */
class JsonStreamDecoder : public StreamDecoder {
 public:
  explicit JsonStreamDecoder(shared_ptr<BodyReader> _body,
                             int64_t _maxValueSize = MAX_STREAM_EVENT_SIZE)
      : StreamDecoder(_body), maxValueSize(_maxValueSize), eof(false) {}

 protected:
  virtual bool decodeNext(StreamEvent* event);

  JsonValueScanner scanner;
  int64_t maxValueSize;
  bool eof;
};
}  // namespace dw

#endif  // __DW_JSON_STREAM_DECODER__
