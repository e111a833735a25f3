#include "PipeSocketHandler.hpp"

namespace dw {
PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const DaemonAddress& address) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = address.getPath();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(sockaddr_un));
  if (pipePath.length() >= sizeof(remote.sun_path)) {
    LOG(ERROR) << "Socket path is too long: " << pipePath;
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << address << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
#ifdef _MSC_VER
    FATAL_FAIL(::closesocket(sockFd));
#else
    FATAL_FAIL(::close(sockFd));
#endif
    SetErrno(localErrno);
    return -1;
  }

  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = 3; /* 3 second timeout */
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (FD_ISSET(sockFd, &fdset)) {
    VLOG(4) << "sockFd " << sockFd << " is selected";
    int so_error;
    socklen_t len = sizeof so_error;

    FATAL_FAIL(
        ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));

    if (so_error == 0) {
      LOG(INFO) << "Connected to endpoint " << address;
    } else {
      LOG(INFO) << "Error connecting to " << address << ": " << so_error << " "
                << strerror(so_error);
#ifdef _MSC_VER
      FATAL_FAIL(::closesocket(sockFd));
#else
      FATAL_FAIL(::close(sockFd));
#endif
      SetErrno(so_error);
      sockFd = -1;
    }
  } else {
    LOG(INFO) << "Timed out connecting to " << address;
#ifdef _MSC_VER
    FATAL_FAIL(::closesocket(sockFd));
#else
    FATAL_FAIL(::close(sockFd));
#endif
    SetErrno(ETIMEDOUT);
    sockFd = -1;
  }

  if (sockFd >= 0) {
    addToActiveSockets(sockFd);
  }
  return sockFd;
}
}  // namespace dw
