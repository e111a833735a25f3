#include "DockerConfig.hpp"

#include "SimpleIni.h"

namespace dw {
namespace {
const char* getEnv(const char* name) {
  const char* value = ::getenv(name);
  if (value == NULL || value[0] == '\0') {
    return NULL;
  }
  return value;
}

bool parseBool(const string& value) {
  string lower = toLower(trim(value));
  return !(lower.empty() || lower == "0" || lower == "false" || lower == "no");
}
}  // namespace

DockerConfig::DockerConfig()
    : dockerHost(defaultDockerHost()),
      tlsVerify(false),
      certPath(defaultCertPath()),
      apiVersion(DEFAULT_DOCKER_API_VERSION),
      connectTimeoutSec(3),
      verboseLevel(0) {}

string DockerConfig::defaultDockerHost() {
#ifdef WIN32
  return "npipe:////./pipe/docker_engine";
#else
  return "unix:///var/run/docker.sock";
#endif
}

string DockerConfig::defaultCertPath() {
#ifdef WIN32
  const char* home = getEnv("USERPROFILE");
#else
  const char* home = getEnv("HOME");
#endif
  if (home == NULL) {
    return ".docker";
  }
  return string(home) + "/.docker";
}

DockerConfig DockerConfig::fromEnvironment() {
  DockerConfig config;
  config.loadEnvironment();
  return config;
}

DockerConfig DockerConfig::fromFile(const string& filename) {
  DockerConfig config;
  if (fs::exists(filename) && !config.loadFile(filename)) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  config.loadEnvironment();
  return config;
}

bool DockerConfig::loadFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << filename << ": " << rc;
    return false;
  }

  const char* host = ini.GetValue("Daemon", "host", NULL);
  if (host) {
    dockerHost = trim(host);
  }
  const char* verify = ini.GetValue("Daemon", "tls_verify", NULL);
  if (verify) {
    tlsVerify = parseBool(verify);
  }
  const char* certs = ini.GetValue("Daemon", "cert_path", NULL);
  if (certs) {
    certPath = trim(certs);
  }
  const char* version = ini.GetValue("Daemon", "api_version", NULL);
  if (version) {
    apiVersion = trim(version);
  }
  const char* timeout = ini.GetValue("Daemon", "connect_timeout", NULL);
  if (timeout && atoi(timeout) > 0) {
    connectTimeoutSec = atoi(timeout);
  }
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verboseLevel = atoi(vlevel);
  }
  VLOG(1) << "Loaded config file " << filename << ": host=" << dockerHost;
  return true;
}

void DockerConfig::loadEnvironment() {
  const char* host = getEnv("DOCKER_HOST");
  if (host) {
    dockerHost = host;
  }
  // Docker treats any non-empty DOCKER_TLS_VERIFY as enabled
  if (getEnv("DOCKER_TLS_VERIFY")) {
    tlsVerify = true;
  }
  const char* certs = getEnv("DOCKER_CERT_PATH");
  if (certs) {
    certPath = certs;
  }
  const char* version = getEnv("DOCKER_API_VERSION");
  if (version) {
    apiVersion = version;
  }
}

DaemonAddress DockerConfig::toDaemonAddress() const {
  if (tlsVerify || startsWith(dockerHost, "https://")) {
    TlsConfig tlsConfig;
    tlsConfig.verifyPeer = tlsVerify;
    string ca = certPath + "/ca.pem";
    string cert = certPath + "/cert.pem";
    string key = certPath + "/key.pem";
    if (fs::exists(ca)) {
      tlsConfig.caFile = ca;
    }
    if (fs::exists(cert) && fs::exists(key)) {
      tlsConfig.certFile = cert;
      tlsConfig.keyFile = key;
    }
    return DaemonAddress::parse(dockerHost, &tlsConfig);
  }
  return DaemonAddress::parse(dockerHost);
}

string DockerConfig::apiPathPrefix() const {
  if (apiVersion.empty()) {
    return "";
  }
  return "/v" + apiVersion;
}
}  // namespace dw
