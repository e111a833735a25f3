#ifndef __DW_DAEMON_CONNECTION__
#define __DW_DAEMON_CONNECTION__

#include "Errors.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace dw {
/**
 * @brief One connected byte stream to the daemon, used for exactly one
 * request and closed afterwards.
 *
 * Reads and writes come from a single thread at a time. abort() may be called
 * from any thread: it interrupts the stream so the next read fails with
 * ConnectionError.
 */
class DaemonConnection {
 public:
  DaemonConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                   const string& _hostHeader);

  virtual ~DaemonConnection();

  /** @brief Value of the Host header for requests on this connection. */
  const string& getHostHeader() const { return hostHeader; }

  inline int getSocketFd() {
    lock_guard<std::mutex> guard(connectionMutex);
    return socketFd;
  }

  /**
   * @brief Writes every byte or throws ConnectionError.
   */
  void write(const char* buf, size_t count);
  inline void write(const string& s) { write(s.data(), s.length()); }

  /**
   * @brief Blocks until at least one byte is available.
   * @return Bytes read into buf, or 0 once the daemon closed the stream.
   * @throws ConnectionError on a socket error or after abort().
   */
  size_t readSome(char* buf, size_t count);

  /**
   * @brief Interrupts the connection. Pending and future reads fail.
   */
  void abort();

  inline bool isAborted() const { return aborted; }

  /** @brief Releases the descriptor. Safe to call more than once. */
  void close();

  inline bool isClosed() {
    lock_guard<std::mutex> guard(connectionMutex);
    return socketFd == -1;
  }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string hostHeader;
  std::atomic<bool> aborted;
  std::mutex connectionMutex;
};
}  // namespace dw

#endif  // __DW_DAEMON_CONNECTION__
