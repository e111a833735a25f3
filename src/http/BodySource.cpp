#include "BodySource.hpp"

namespace dw {
size_t StringBodySource::read(char* buf, size_t count) {
  size_t n = std::min(count, data.length() - offset);
  memcpy(buf, data.data() + offset, n);
  offset += n;
  return n;
}

FileBodySource::FileBodySource(const string& _path)
    : path(_path), file(_path, std::ios::in | std::ios::binary), fileSize(0) {
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open request body " + path);
  }
  fileSize = fs::file_size(path);
}

size_t FileBodySource::read(char* buf, size_t count) {
  file.read(buf, count);
  if (file.bad()) {
    throw std::runtime_error("Error reading request body " + path);
  }
  return file.gcount();
}

size_t StreamBodySource::read(char* buf, size_t count) {
  stream->read(buf, count);
  if (stream->bad()) {
    throw std::runtime_error("Error reading request body stream");
  }
  return stream->gcount();
}
}  // namespace dw
