#ifndef __DW_TRANSPORT_RESOLVER__
#define __DW_TRANSPORT_RESOLVER__

#include "DaemonAddress.hpp"
#include "DaemonConnection.hpp"
#include "SocketHandler.hpp"

namespace dw {
/**
 * @brief Turns a DaemonAddress into connected byte streams.
 *
 * The socket handler is chosen once from the address kind. Each resolve()
 * opens a fresh connection that is owned by the returned DaemonConnection.
 */
class TransportResolver {
 public:
  /**
   * @throws ConnectionError if TLS material for a TCP+TLS address cannot be
   * loaded.
   */
  explicit TransportResolver(const DaemonAddress& _address,
                             int connectTimeoutSec = 3);

  /**
   * @brief Uses a caller supplied handler instead of the default for the
   * address kind.
   */
  TransportResolver(const DaemonAddress& _address,
                    shared_ptr<SocketHandler> _socketHandler);

  /**
   * @brief Connects to the daemon.
   * @throws TransportUnavailable if the platform lacks the transport kind.
   * @throws ConnectionError if the daemon cannot be reached.
   */
  shared_ptr<DaemonConnection> resolve();

  const DaemonAddress& getAddress() const { return address; }

  /** @brief Picks the handler implementation for an address kind. */
  static shared_ptr<SocketHandler> createSocketHandler(
      const DaemonAddress& address, int connectTimeoutSec);

 protected:
  DaemonAddress address;
  shared_ptr<SocketHandler> socketHandler;
};
}  // namespace dw

#endif  // __DW_TRANSPORT_RESOLVER__
