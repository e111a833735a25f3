#ifndef __DW_NAMED_PIPE_SOCKET_HANDLER__
#define __DW_NAMED_PIPE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace dw {
/**
 * @brief Byte-stream access to a Windows named pipe (\\.\pipe\docker_engine).
 *
 * On other platforms connect() throws TransportUnavailable.
 */
class NamedPipeSocketHandler : public SocketHandler {
 public:
  NamedPipeSocketHandler();
  virtual ~NamedPipeSocketHandler() {}

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Opens the pipe, waiting for a free instance if the daemon is busy.
   * @throws TransportUnavailable when named pipes are not supported.
   */
  virtual int connect(const DaemonAddress& address);
  virtual void shutdown(int fd);
  virtual void close(int fd);

 protected:
  recursive_mutex globalMutex;
#ifdef WIN32
  /** @brief CRT descriptor -> pipe handle for every open pipe. */
  map<int, HANDLE> pipeHandles;
  /** @brief Descriptors whose pipe was shut down but not yet closed. */
  set<int> shutdownPipes;

  HANDLE getHandle(int fd);
#endif
};
}  // namespace dw

#endif  // __DW_NAMED_PIPE_SOCKET_HANDLER__
