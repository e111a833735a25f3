#ifndef __DW_DOCKER_CONFIG__
#define __DW_DOCKER_CONFIG__

#include "DaemonAddress.hpp"
#include "Headers.hpp"

namespace dw {
/**
 * @brief Client settings: which daemon to talk to and how.
 *
 * Layered as defaults < config file < environment. The file is INI:
 *
 *   [Daemon]
 *   host = tcp://127.0.0.1:2376
 *   tls_verify = 1
 *   cert_path = /home/me/.docker
 *   api_version = 1.41
 *   connect_timeout = 3
 *
 *   [Debug]
 *   verbose = 0
 */
class DockerConfig {
 public:
  DockerConfig();

  /** @brief Defaults overridden by DOCKER_* environment variables. */
  static DockerConfig fromEnvironment();

  /**
   * @brief Defaults, then the INI file, then the environment.
   * @throws std::runtime_error if the file exists but cannot be parsed.
   */
  static DockerConfig fromFile(const string& filename);

  /**
   * @brief Reads [Daemon] and [Debug] keys, leaving absent keys untouched.
   * @return false when the file is missing or malformed.
   */
  bool loadFile(const string& filename);

  /** @brief Applies DOCKER_HOST, DOCKER_TLS_VERIFY, DOCKER_CERT_PATH and
   * DOCKER_API_VERSION when set. */
  void loadEnvironment();

  /**
   * @brief Builds the daemon address, attaching ca.pem/cert.pem/key.pem from
   * certPath when TLS verification is on.
   * @throws std::invalid_argument for an unparseable dockerHost.
   */
  DaemonAddress toDaemonAddress() const;

  /** @brief "/v1.41" style prefix, or "" when apiVersion is empty. */
  string apiPathPrefix() const;

  static string defaultDockerHost();
  static string defaultCertPath();

  string dockerHost;
  bool tlsVerify;
  string certPath;
  string apiVersion;
  int connectTimeoutSec;
  int verboseLevel;
};
}  // namespace dw

#endif  // __DW_DOCKER_CONFIG__
