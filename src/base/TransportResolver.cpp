#include "TransportResolver.hpp"

#include "NamedPipeSocketHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "TlsSocketHandler.hpp"

namespace dw {
TransportResolver::TransportResolver(const DaemonAddress& _address,
                                     int connectTimeoutSec)
    : address(_address),
      socketHandler(createSocketHandler(_address, connectTimeoutSec)) {}

TransportResolver::TransportResolver(const DaemonAddress& _address,
                                     shared_ptr<SocketHandler> _socketHandler)
    : address(_address), socketHandler(_socketHandler) {}

shared_ptr<SocketHandler> TransportResolver::createSocketHandler(
    const DaemonAddress& address, int connectTimeoutSec) {
  switch (address.getKind()) {
    case DaemonAddress::TCP:
      if (address.usesTls()) {
        return shared_ptr<SocketHandler>(
            new TlsSocketHandler(address.getTlsConfig(), connectTimeoutSec));
      }
      return shared_ptr<SocketHandler>(
          new TcpSocketHandler(connectTimeoutSec));
    case DaemonAddress::UNIX_SOCKET:
      return shared_ptr<SocketHandler>(new PipeSocketHandler());
    case DaemonAddress::NAMED_PIPE:
      return shared_ptr<SocketHandler>(new NamedPipeSocketHandler());
  }
  STFATAL << "Unknown daemon address kind: " << address.getKind();
  return NULL;
}

shared_ptr<DaemonConnection> TransportResolver::resolve() {
  VLOG(1) << "Connecting to " << address;
  int fd = socketHandler->connect(address);
  if (fd < 0) {
    auto localErrno = GetErrno();
    throw ConnectionError("Cannot connect to the Docker daemon at " +
                          address.toString() + ": " + strerror(localErrno));
  }
  return shared_ptr<DaemonConnection>(
      new DaemonConnection(socketHandler, fd, address.hostHeader()));
}
}  // namespace dw
