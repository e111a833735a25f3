#ifndef __DW_PIPE_SOCKET_HANDLER__
#define __DW_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace dw {
/**
 * @brief Connects to a daemon listening on a UNIX domain socket such as
 * /var/run/docker.sock.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket path named by the address.
   */
  virtual int connect(const DaemonAddress& address);
};
}  // namespace dw

#endif  // __DW_PIPE_SOCKET_HANDLER__
