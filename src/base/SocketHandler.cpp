#include "SocketHandler.hpp"

#include "Errors.hpp"

namespace dw {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw ConnectionError("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = GetErrno();
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(4) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw ConnectionError(string("Failed a call to writeAll: ") +
                              strerror(localErrno));
      }
    } else if (bytesWritten == 0) {
      throw ConnectionError("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}
}  // namespace dw
