#include "BodyReader.hpp"

namespace dw {
namespace {
const size_t READ_BUFFER_SIZE = 64 * 1024;
}  // namespace

string readFully(BodyReader* reader, int64_t maxLength) {
  string body;
  char buf[READ_BUFFER_SIZE];
  while (true) {
    size_t n = reader->read(buf, sizeof(buf));
    if (n == 0) {
      return body;
    }
    body.append(buf, n);
    if (int64_t(body.length()) > maxLength) {
      throw DecodeError("Response body exceeds " + to_string(maxLength) +
                        " bytes");
    }
  }
}
}  // namespace dw
