#include "TcpSocketHandler.hpp"

namespace dw {
TcpSocketHandler::TcpSocketHandler(int _connectTimeoutSec)
    : connectTimeoutSec(_connectTimeoutSec) {}

int TcpSocketHandler::connect(const DaemonAddress &address) {
  int sockFd = -1;
  int lastErrno = ECONNREFUSED;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
#if __NetBSD__
  hints.ai_flags = (AI_CANONNAME | AI_ADDRCONFIG);
#else
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG | AI_ALL);
#endif
  std::string portname = std::to_string(address.getPort());
  std::string hostname = address.getHost();

#ifndef WIN32
  {
    // (re)initialize the DNS system
    lock_guard<std::recursive_mutex> guard(mutex);
    ::res_init();
  }
#endif
  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);

  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << address << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    SetErrno(EHOSTUNREACH);
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      lastErrno = GetErrno();
      LOG(INFO) << "Error creating socket: " << lastErrno << " "
                << strerror(lastErrno);
      continue;
    }

    initSocket(sockFd);
    VLOG(4) << "Set nonblocking";
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        GetErrno() != EINPROGRESS) {
      lastErrno = GetErrno();
      LOG(INFO) << "Error connecting to " << address << ": " << lastErrno
                << " " << strerror(lastErrno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = connectTimeoutSec;
    tv.tv_usec = 0;
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    if (FD_ISSET(sockFd, &fdset)) {
      VLOG(4) << "sockFd " << sockFd << " is selected";
      int so_error;
      socklen_t len = sizeof so_error;

      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char *)&so_error,
                              &len));

      if (so_error == 0) {
        if (p->ai_canonname) {
          LOG(INFO) << "Connected to daemon: " << p->ai_canonname
                    << " using fd " << sockFd;
        } else {
          LOG(INFO) << "Connected to daemon " << address << " using fd "
                    << sockFd;
        }
        break;  // if we get here, we must have connected successfully
      } else {
        lastErrno = so_error;
        LOG(INFO) << "Error connecting to " << address << ": " << so_error
                  << " " << strerror(so_error);
        ::close(sockFd);
        sockFd = -1;
        continue;
      }
    } else {
      lastErrno = ETIMEDOUT;
      LOG(INFO) << "Timed out connecting to " << address;
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
  }
  freeaddrinfo(results);
  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << address;
    SetErrno(lastErrno);
  } else {
    addToActiveSockets(sockFd);
  }
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace dw
