#ifndef __DW_TLS_SOCKET_HANDLER__
#define __DW_TLS_SOCKET_HANDLER__

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "TcpSocketHandler.hpp"

namespace dw {
/**
 * @brief TCP connections wrapped in a TLS session (client certificate, CA
 * verification and SNI configured from a TlsConfig).
 *
 * The descriptor returned by connect() is still the TCP socket; every
 * read/write on it goes through the SSL session bound to it.
 */
class TlsSocketHandler : public TcpSocketHandler {
 public:
  /**
   * @throws ConnectionError if the certificate material cannot be loaded.
   */
  explicit TlsSocketHandler(const TlsConfig& _tlsConfig,
                            int _connectTimeoutSec = 3);
  virtual ~TlsSocketHandler();

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Connects over TCP, then performs the TLS handshake.
   * @throws ConnectionError when the handshake or verification fails.
   */
  virtual int connect(const DaemonAddress& address);
  virtual void close(int fd);

 protected:
  TlsConfig tlsConfig;
  SSL_CTX* sslContext;
  /** @brief Guards the fd -> session map. */
  recursive_mutex sessionMutex;
  map<int, SSL*> sessions;

  SSL* getSession(int fd);
  /**
   * @brief Drives SSL_connect on the non-blocking socket until it completes.
   */
  void handshake(SSL* ssl, int fd, const DaemonAddress& address);
};
}  // namespace dw

#endif  // __DW_TLS_SOCKET_HANDLER__
