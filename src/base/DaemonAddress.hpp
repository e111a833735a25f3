#ifndef __DW_DAEMON_ADDRESS__
#define __DW_DAEMON_ADDRESS__

#include "Headers.hpp"

namespace dw {
/**
 * @brief Certificate material for a TLS protected TCP daemon.
 *
 * Empty paths are skipped: a config with only a CA file verifies the daemon
 * without presenting a client certificate.
 */
struct TlsConfig {
  string caFile;
  string certFile;
  string keyFile;
  bool verifyPeer = true;
};

/**
 * @brief Where the daemon listens: TCP (optionally TLS), a Unix domain socket
 * or a Windows named pipe.
 */
class DaemonAddress {
 public:
  enum Kind { TCP, UNIX_SOCKET, NAMED_PIPE };

  DaemonAddress() : kind(UNIX_SOCKET), port(-1), tls(false) {}

  static DaemonAddress tcp(const string& host, int port);
  static DaemonAddress tcpWithTls(const string& host, int port,
                                  const TlsConfig& tlsConfig);
  static DaemonAddress unixSocket(const string& path);
  static DaemonAddress namedPipe(const string& path);

  /**
   * @brief Parses tcp://, http://, https://, unix:// and npipe:// addresses.
   * @param tlsConfig Applied to tcp:// addresses when non-null; https://
   * always uses TLS.
   * @throws std::invalid_argument for an unknown scheme or a bad port.
   */
  static DaemonAddress parse(const string& address,
                             const TlsConfig* tlsConfig = NULL);

  Kind getKind() const { return kind; }
  const string& getHost() const { return host; }
  int getPort() const { return port; }
  const string& getPath() const { return path; }
  bool usesTls() const { return tls; }
  const TlsConfig& getTlsConfig() const { return tlsConfig; }

  /** @brief Value of the Host header for requests sent over this address. */
  string hostHeader() const;

  string toString() const;

 protected:
  Kind kind;
  string host;
  int port;
  string path;
  bool tls;
  TlsConfig tlsConfig;
};

inline ostream& operator<<(ostream& os, const DaemonAddress& self) {
  return os << self.toString(), os;
}
}  // namespace dw

#endif  // __DW_DAEMON_ADDRESS__
