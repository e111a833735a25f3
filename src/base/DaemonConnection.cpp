#include "DaemonConnection.hpp"

namespace dw {
DaemonConnection::DaemonConnection(shared_ptr<SocketHandler> _socketHandler,
                                   int _socketFd, const string& _hostHeader)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      hostHeader(_hostHeader),
      aborted(false) {}

DaemonConnection::~DaemonConnection() { close(); }

void DaemonConnection::write(const char* buf, size_t count) {
  int fd = getSocketFd();
  if (aborted || fd < 0) {
    throw ConnectionError("Connection is closed");
  }
  socketHandler->writeAllOrThrow(fd, buf, count, true);
}

size_t DaemonConnection::readSome(char* buf, size_t count) {
  while (true) {
    int fd = getSocketFd();
    if (aborted) {
      throw ConnectionError("Request aborted");
    }
    if (fd < 0) {
      throw ConnectionError("Connection is closed");
    }
    if (!socketHandler->waitForData(fd, SOCKET_POLL_INTERVAL, 0)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, buf, count);
    if (aborted) {
      throw ConnectionError("Request aborted");
    }
    if (bytesRead > 0) {
      VLOG(4) << "Read " << bytesRead << " bytes from " << fd;
      return bytesRead;
    }
    if (bytesRead == 0) {
      VLOG(1) << "Daemon closed connection " << fd;
      return 0;
    }
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      continue;
    }
    throw ConnectionError(string("Error reading from daemon: ") +
                          strerror(localErrno));
  }
}

void DaemonConnection::abort() {
  if (aborted.exchange(true)) {
    return;
  }
  lock_guard<std::mutex> guard(connectionMutex);
  if (socketFd >= 0) {
    LOG(INFO) << "Aborting connection " << socketFd;
    socketHandler->shutdown(socketFd);
  }
}

void DaemonConnection::close() {
  lock_guard<std::mutex> guard(connectionMutex);
  if (socketFd < 0) {
    return;
  }
  socketHandler->close(socketFd);
  socketFd = -1;
}
}  // namespace dw
