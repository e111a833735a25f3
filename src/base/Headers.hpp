#ifndef __DW_HEADERS__
#define __DW_HEADERS__

#if defined(_MSC_VER)
#include <WinSock2.h>
#include <Ws2tcpip.h>
#include <afunix.h>
#include <io.h>
#include <signal.h>
#include <windows.h>
#include <winerror.h>

inline int close(int fd) { return ::closesocket(fd); }
#else
#include <signal.h>
#endif

#ifdef WIN32
#else
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "JsonLib.hpp"
#include "easylogging++.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

#if defined(_MSC_VER)
/* ssize_t is not defined on Windows */
#include <BaseTsd.h>
#define ssize_t SSIZE_T
#endif

using namespace std;

// API version prefixed to request paths unless the config overrides it
const string DEFAULT_DOCKER_API_VERSION = "1.41";

// Default daemon ports
const int DOCKER_TCP_PORT = 2375;
const int DOCKER_TLS_PORT = 2376;

// Synthetic Host header for transports without a real host
const string LOCAL_TRANSPORT_HOST = "localhost";

// Upper bound for a single multiplexed frame or JSON event
const int64_t MAX_STREAM_EVENT_SIZE = 128 * 1024 * 1024;

// Seconds a socket read may wait before re-checking for an abort
const int SOCKET_POLL_INTERVAL = 1;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() {
#ifdef WIN32
  auto retval = WSAGetLastError();
  if (retval >= 10000) {
    switch (retval) {
      case WSAEWOULDBLOCK:
        return EWOULDBLOCK;
      case WSAEINPROGRESS:
        return EINPROGRESS;
      case WSAENOTSOCK:
        return ENOTSOCK;
      case WSAECONNRESET:
        return ECONNRESET;
      case WSAECONNABORTED:
        return ECONNABORTED;
      case WSAECONNREFUSED:
        return ECONNREFUSED;
      default:
        STFATAL << "Unmapped WSA error: " << retval;
    }
  }
  return retval;
#else
  return errno;
#endif
}

inline void SetErrno(int e) {
#ifdef WIN32
  WSASetLastError(e);
#else
  errno = e;
#endif
}

#ifdef WIN32
inline string WinErrnoToString() {
  const int BUFSIZE = 4096;
  char buf[BUFSIZE];
  auto charsWritten = FormatMessageA(
      FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL,
      GetLastError(), MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), buf, BUFSIZE,
      NULL);
  if (charsWritten) {
    string s(buf, charsWritten + 1);
    return s;
  }
  return "Unknown Error";
}

#define FATAL_FAIL(X)                             \
  if (((X) == -1))                                \
    LOG(FATAL) << "Error: (" << WSAGetLastError() \
               << "): " << WinErrnoToString();

#define FATAL_FAIL_UNLESS_EINVAL(X) FATAL_FAIL(X)
#else
#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());
#endif

#ifndef DW_VERSION
#define DW_VERSION "unknown"
#endif

namespace dw {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline bool startsWith(const string &s, const string &prefix) {
  return s.compare(0, prefix.length(), prefix) == 0;
}

/**
 * @brief Waits up to `sec` seconds for fd to become readable.
 * @return true when data (or EOF) is ready to be read.
 */
inline bool waitOnSocketData(int fd, int sec) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = sec;
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  int n = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (n == -1) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      return false;
    }
    // A closed descriptor is reported as readable so the following read
    // surfaces the error.
    VLOG(4) << "select failed on " << fd << ": " << strerror(localErrno);
    return true;
  }
  return n > 0 && FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
#ifdef WIN32
  char buf[MAX_PATH + 1];
  auto retval = GetTempPathA(MAX_PATH + 1, buf);
  return string(buf, retval);
#else
  string tmpDir = _PATH_TMP;
  return tmpDir;
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace dw

#endif  // __DW_HEADERS__
