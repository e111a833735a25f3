#ifndef __DW_BODY_SOURCE__
#define __DW_BODY_SOURCE__

#include "Headers.hpp"

namespace dw {
/**
 * @brief Supplies request body bytes, e.g. a build context archive. The
 * engine never interprets the contents.
 */
class BodySource {
 public:
  virtual ~BodySource() {}

  /**
   * @brief Total size in bytes, or -1 when unknown (sent chunked).
   */
  virtual int64_t length() const = 0;

  /**
   * @brief Copies up to count bytes into buf.
   * @return Bytes copied, 0 once the body is exhausted.
   */
  virtual size_t read(char* buf, size_t count) = 0;
};

class StringBodySource : public BodySource {
 public:
  explicit StringBodySource(const string& _data) : data(_data), offset(0) {}

  virtual int64_t length() const { return data.length(); }
  virtual size_t read(char* buf, size_t count);

 protected:
  string data;
  size_t offset;
};

/**
 * @brief Streams a file from disk, such as a prepared tar archive.
 */
class FileBodySource : public BodySource {
 public:
  /** @throws std::runtime_error if the file cannot be opened. */
  explicit FileBodySource(const string& _path);

  virtual int64_t length() const { return fileSize; }
  virtual size_t read(char* buf, size_t count);

 protected:
  string path;
  std::ifstream file;
  int64_t fileSize;
};

/**
 * @brief Wraps a stream of unknown length; sent with chunked encoding.
 */
class StreamBodySource : public BodySource {
 public:
  explicit StreamBodySource(shared_ptr<std::istream> _stream)
      : stream(_stream) {}

  virtual int64_t length() const { return -1; }
  virtual size_t read(char* buf, size_t count);

 protected:
  shared_ptr<std::istream> stream;
};
}  // namespace dw

#endif  // __DW_BODY_SOURCE__
