#include "TlsSocketHandler.hpp"

#include "Errors.hpp"

namespace dw {
namespace {
void initializeOpenSSL() {
  static std::once_flag initFlag;
  std::call_once(initFlag, []() {
    SSL_library_init();
    SSL_load_error_strings();
    OpenSSL_add_all_algorithms();
#ifndef WIN32
    // The socket BIO writes without MSG_NOSIGNAL
    ::signal(SIGPIPE, SIG_IGN);
#endif
  });
}

string getOpenSSLError() {
  auto error = ERR_get_error();
  if (error == 0) {
    return "unknown TLS error";
  }
  char buf[256];
  ERR_error_string_n(error, buf, sizeof(buf));
  return string(buf);
}

bool isIpLiteral(const string& host) {
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
         inet_pton(AF_INET6, host.c_str(), buf) == 1;
}
}  // namespace

TlsSocketHandler::TlsSocketHandler(const TlsConfig& _tlsConfig,
                                   int _connectTimeoutSec)
    : TcpSocketHandler(_connectTimeoutSec),
      tlsConfig(_tlsConfig),
      sslContext(NULL) {
  initializeOpenSSL();
  sslContext = SSL_CTX_new(TLS_client_method());
  if (!sslContext) {
    throw ConnectionError("Failed to create TLS context: " +
                          getOpenSSLError());
  }
  SSL_CTX_set_min_proto_version(sslContext, TLS1_2_VERSION);
  // Retried writes may hand over a different buffer address
  SSL_CTX_set_mode(sslContext, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER |
                                   SSL_MODE_ENABLE_PARTIAL_WRITE);

  string error;
  if (!tlsConfig.certFile.empty() &&
      SSL_CTX_use_certificate_chain_file(sslContext,
                                         tlsConfig.certFile.c_str()) != 1) {
    error = "Failed to load client certificate " + tlsConfig.certFile;
  } else if (!tlsConfig.keyFile.empty() &&
             SSL_CTX_use_PrivateKey_file(sslContext, tlsConfig.keyFile.c_str(),
                                         SSL_FILETYPE_PEM) != 1) {
    error = "Failed to load client key " + tlsConfig.keyFile;
  } else if (!tlsConfig.certFile.empty() && !tlsConfig.keyFile.empty() &&
             SSL_CTX_check_private_key(sslContext) != 1) {
    error = "Client key does not match certificate " + tlsConfig.certFile;
  } else if (!tlsConfig.caFile.empty() &&
             SSL_CTX_load_verify_locations(sslContext,
                                           tlsConfig.caFile.c_str(),
                                           NULL) != 1) {
    error = "Failed to load CA certificates " + tlsConfig.caFile;
  }
  if (!error.empty()) {
    error += ": " + getOpenSSLError();
    SSL_CTX_free(sslContext);
    sslContext = NULL;
    LOG(ERROR) << error;
    throw ConnectionError(error);
  }
  if (tlsConfig.caFile.empty() && tlsConfig.verifyPeer) {
    SSL_CTX_set_default_verify_paths(sslContext);
  }
  SSL_CTX_set_verify(sslContext,
                     tlsConfig.verifyPeer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE,
                     NULL);
}

TlsSocketHandler::~TlsSocketHandler() {
  {
    lock_guard<std::recursive_mutex> guard(sessionMutex);
    for (auto it : sessions) {
      SSL_free(it.second);
    }
    sessions.clear();
  }
  if (sslContext) {
    SSL_CTX_free(sslContext);
  }
}

SSL* TlsSocketHandler::getSession(int fd) {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  auto it = sessions.find(fd);
  if (it == sessions.end()) {
    return NULL;
  }
  return it->second;
}

bool TlsSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  SSL* ssl = getSession(fd);
  if (ssl && SSL_pending(ssl) > 0) {
    return true;
  }
  return TcpSocketHandler::waitForData(fd, sec, usec);
}

ssize_t TlsSocketHandler::read(int fd, void* buf, size_t count) {
  SSL* ssl = getSession(fd);
  auto socketMutex = getSocketMutex(fd);
  if (!ssl || !socketMutex) {
    LOG(INFO) << "Tried to read from a TLS socket that has been closed: "
              << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ERR_clear_error();
  int rc = SSL_read(ssl, buf, (int)count);
  if (rc > 0) {
    return rc;
  }
  int sslError = SSL_get_error(ssl, rc);
  switch (sslError) {
    case SSL_ERROR_ZERO_RETURN:
      return 0;
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      SetErrno(EAGAIN);
      return -1;
    case SSL_ERROR_SYSCALL:
      if (ERR_peek_error() == 0 && (rc == 0 || GetErrno() == 0)) {
        // Daemon closed the socket without a close_notify
        return 0;
      }
      LOG(WARNING) << "TLS read failed on " << fd << ": "
                   << strerror(GetErrno());
      return -1;
    default:
      LOG(WARNING) << "TLS read failed on " << fd << ": " << getOpenSSLError();
      SetErrno(ECONNRESET);
      return -1;
  }
}

ssize_t TlsSocketHandler::write(int fd, const void* buf, size_t count) {
  SSL* ssl = getSession(fd);
  auto socketMutex = getSocketMutex(fd);
  if (!ssl || !socketMutex) {
    LOG(INFO) << "Tried to write to a TLS socket that has been closed: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ERR_clear_error();
  int rc = SSL_write(ssl, buf, (int)count);
  if (rc > 0) {
    return rc;
  }
  int sslError = SSL_get_error(ssl, rc);
  if (sslError == SSL_ERROR_WANT_READ || sslError == SSL_ERROR_WANT_WRITE) {
    SetErrno(EAGAIN);
    return -1;
  }
  LOG(WARNING) << "TLS write failed on " << fd << ": " << getOpenSSLError();
  SetErrno(EPIPE);
  return -1;
}

void TlsSocketHandler::handshake(SSL* ssl, int fd,
                                 const DaemonAddress& address) {
  time_t startTime = time(NULL);
  while (true) {
    ERR_clear_error();
    int rc = SSL_connect(ssl);
    if (rc == 1) {
      break;
    }
    int sslError = SSL_get_error(ssl, rc);
    if (sslError != SSL_ERROR_WANT_READ && sslError != SSL_ERROR_WANT_WRITE) {
      string reason = getOpenSSLError();
      long verifyResult = SSL_get_verify_result(ssl);
      if (verifyResult != X509_V_OK) {
        reason = X509_verify_cert_error_string(verifyResult);
      }
      throw ConnectionError("TLS handshake with " + address.toString() +
                            " failed: " + reason);
    }
    if (time(NULL) > startTime + connectTimeoutSec) {
      throw ConnectionError("TLS handshake with " + address.toString() +
                            " timed out");
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(fd, &fdset);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    if (sslError == SSL_ERROR_WANT_READ) {
      select(fd + 1, &fdset, NULL, NULL, &tv);
    } else {
      select(fd + 1, NULL, &fdset, NULL, &tv);
    }
  }
  VLOG(1) << "TLS session established with " << address << " using "
          << SSL_get_version(ssl);
}

int TlsSocketHandler::connect(const DaemonAddress& address) {
  int fd = TcpSocketHandler::connect(address);
  if (fd < 0) {
    return fd;
  }
  SSL* ssl = SSL_new(sslContext);
  if (!ssl) {
    TcpSocketHandler::close(fd);
    throw ConnectionError("Failed to create TLS session: " +
                          getOpenSSLError());
  }
  const string& host = address.getHost();
  if (isIpLiteral(host)) {
    X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str());
  } else {
    SSL_set_tlsext_host_name(ssl, host.c_str());
    if (tlsConfig.verifyPeer) {
      SSL_set1_host(ssl, host.c_str());
    }
  }
  SSL_set_fd(ssl, fd);
  try {
    handshake(ssl, fd, address);
  } catch (const ConnectionError& e) {
    LOG(ERROR) << e.what();
    SSL_free(ssl);
    TcpSocketHandler::close(fd);
    throw;
  }
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  sessions[fd] = ssl;
  return fd;
}

void TlsSocketHandler::close(int fd) {
  {
    lock_guard<std::recursive_mutex> guard(sessionMutex);
    auto it = sessions.find(fd);
    if (it != sessions.end()) {
      // Best effort close_notify; the socket may already be shut down
      SSL_shutdown(it->second);
      SSL_free(it->second);
      sessions.erase(it);
    }
  }
  TcpSocketHandler::close(fd);
}
}  // namespace dw
