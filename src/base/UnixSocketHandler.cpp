#include "UnixSocketHandler.hpp"

namespace dw {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    // Let the caller's read() report what went wrong with the descriptor
    VLOG(4) << "socket select failed: " << strerror(GetErrno());
    return GetErrno() != EINTR;
  } else if (n == 0)
    return false;
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return NULL;
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
#ifdef WIN32
  ssize_t readBytes = ::recv(fd, (char *)buf, count, 0);
#else
  ssize_t readBytes = ::read(fd, buf, count);
#endif
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd < 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t w;
#ifdef WIN32
  w = ::send(fd, (const char *)buf, count, 0);
#else
#ifdef MSG_NOSIGNAL
  w = ::send(fd, (const char *)buf, count, MSG_NOSIGNAL);
#else
  w = ::write(fd, buf, count);
#endif
#endif
  return w;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int UnixSocketHandler::adopt(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  initSocket(fd);
  addToActiveSockets(fd);
  VLOG(1) << "Adopted socket " << fd;
  return fd;
}

void UnixSocketHandler::shutdown(int fd) {
  if (fd < 0) {
    return;
  }
  VLOG(1) << "Shutting down connection: " << fd;
  // No per-socket lock: this must be able to interrupt a blocked reader.
#ifdef WIN32
  ::shutdown(fd, SD_BOTH);
#else
  ::shutdown(fd, SHUT_RDWR);
#endif
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL) && !defined(WIN32)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      // On Debian + ARM processors, this can fail.  if so, just ignore SIGPIPE
      // globally
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
#ifdef WIN32
  {
    u_long iMode = 1;
    auto result = ioctlsocket(fd, FIONBIO, &iMode);
    if (result != NO_ERROR) {
      STFATAL << result;
    }
  }
#else
  {
    int opts;
    opts = fcntl(fd, F_GETFL);
    FATAL_FAIL_UNLESS_EINVAL(opts);
    opts |= O_NONBLOCK;
    FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  }
#endif
}
}  // namespace dw
