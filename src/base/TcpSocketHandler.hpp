#ifndef __DW_TCP_SOCKET_HANDLER__
#define __DW_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace dw {
/**
 * @brief Implements IPv4/IPv6 client connections built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int _connectTimeoutSec = 3);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * daemon.
   */
  virtual int connect(const DaemonAddress& address);

 protected:
  /** @brief Guards resolver reinitialization. Connects run concurrently. */
  recursive_mutex mutex;
  /** @brief Seconds to wait for each candidate address to accept. */
  int connectTimeoutSec;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace dw

#endif  // __DW_TCP_SOCKET_HANDLER__
