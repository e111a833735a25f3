#ifndef __DW_SOCKET_HANDLER__
#define __DW_SOCKET_HANDLER__

#include "DaemonAddress.hpp"
#include "Headers.hpp"

namespace dw {
/**
 * @brief Provides an abstract API for byte-stream reads/writes and lifecycle
 * management, independent of the transport underneath.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most sec/usec until fd has bytes (or EOF) to read.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   * @return Bytes read, 0 on EOF, -1 with errno set on failure (EAGAIN when
   * nothing was available yet).
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   * @return Bytes written or -1 with errno set.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing ConnectionError if the
   * operation stalls or fails.
   * @param timeout Whether to give up after the transfer timeout without
   * progress.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Opens a connection to the daemon address.
   * @return File descriptor representing the stream (or -1 on failure, with
   * errno describing the cause).
   */
  virtual int connect(const DaemonAddress& address) = 0;
  /**
   * @brief Interrupts pending and future reads/writes on fd without releasing
   * the descriptor. Safe to call from another thread.
   */
  virtual void shutdown(int fd) = 0;
  /** @brief Closes the supplied descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace dw

#endif  // __DW_SOCKET_HANDLER__
