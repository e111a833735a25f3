#ifndef __DW_BODY_READER__
#define __DW_BODY_READER__

#include "Errors.hpp"
#include "Headers.hpp"

namespace dw {
/**
 * @brief The de-framed body of a response, whatever its transfer encoding.
 */
class BodyReader {
 public:
  virtual ~BodyReader() {}

  /**
   * @brief Reads up to count body bytes.
   * @return Bytes read, 0 at the end of the body.
   * @throws ConnectionError if the connection drops before the body ends.
   * @throws DecodeError on malformed chunk framing.
   */
  virtual size_t read(char* buf, size_t count) = 0;
};

/**
 * @brief Reads until the body is exhausted.
 * @throws DecodeError if more than maxLength bytes arrive.
 */
string readFully(BodyReader* reader, int64_t maxLength);
}  // namespace dw

#endif  // __DW_BODY_READER__
