#include "DockerConfig.hpp"

#include "TestHeaders.hpp"

using namespace dw;

namespace {
class ScopedEnv {
 public:
  ScopedEnv(const string& _name, const string& value) : name(_name) {
    const char* old = ::getenv(name.c_str());
    hadValue = old != NULL;
    if (hadValue) {
      oldValue = old;
    }
    ::setenv(name.c_str(), value.c_str(), 1);
  }
  ~ScopedEnv() {
    if (hadValue) {
      ::setenv(name.c_str(), oldValue.c_str(), 1);
    } else {
      ::unsetenv(name.c_str());
    }
  }

 protected:
  string name;
  string oldValue;
  bool hadValue;
};

string writeTempFile(const string& contents) {
  string pattern = GetTempDirectory() + string("dockwire_config_XXXXXXXX");
  int fd = mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  FATAL_FAIL(::write(fd, contents.data(), contents.length()));
  ::close(fd);
  return pattern;
}
}  // namespace

TEST_CASE("DockerConfig defaults", "[DockerConfig]") {
  DockerConfig config;
  REQUIRE(config.dockerHost == "unix:///var/run/docker.sock");
  REQUIRE_FALSE(config.tlsVerify);
  REQUIRE(config.apiVersion == "1.41");
  REQUIRE(config.apiPathPrefix() == "/v1.41");
  REQUIRE(config.connectTimeoutSec == 3);

  auto address = config.toDaemonAddress();
  REQUIRE(address.getKind() == DaemonAddress::UNIX_SOCKET);
  REQUIRE(address.getPath() == "/var/run/docker.sock");

  config.apiVersion = "";
  REQUIRE(config.apiPathPrefix() == "");
}

TEST_CASE("DockerConfig reads an ini file", "[DockerConfig]") {
  string filename = writeTempFile(
      "[Daemon]\n"
      "host = tcp://build-box:2376\n"
      "tls_verify = 1\n"
      "cert_path = /nonexistent/certs\n"
      "api_version = 1.40\n"
      "connect_timeout = 7\n"
      "\n"
      "[Debug]\n"
      "verbose = 3\n");

  DockerConfig config;
  REQUIRE(config.loadFile(filename));
  REQUIRE(config.dockerHost == "tcp://build-box:2376");
  REQUIRE(config.tlsVerify);
  REQUIRE(config.certPath == "/nonexistent/certs");
  REQUIRE(config.apiPathPrefix() == "/v1.40");
  REQUIRE(config.connectTimeoutSec == 7);
  REQUIRE(config.verboseLevel == 3);

  auto address = config.toDaemonAddress();
  REQUIRE(address.getKind() == DaemonAddress::TCP);
  REQUIRE(address.usesTls());
  REQUIRE(address.getPort() == 2376);
  // Missing files are not attached
  REQUIRE(address.getTlsConfig().caFile.empty());

  ::unlink(filename.c_str());
}

TEST_CASE("DockerConfig environment overrides the file", "[DockerConfig]") {
  string filename = writeTempFile(
      "[Daemon]\n"
      "host = tcp://from-file:2375\n"
      "api_version = 1.39\n");

  ScopedEnv host("DOCKER_HOST", "unix:///tmp/other.sock");
  ScopedEnv version("DOCKER_API_VERSION", "1.43");

  auto config = DockerConfig::fromFile(filename);
  REQUIRE(config.dockerHost == "unix:///tmp/other.sock");
  REQUIRE(config.apiVersion == "1.43");

  ::unlink(filename.c_str());
}

TEST_CASE("DockerConfig tolerates a missing file", "[DockerConfig]") {
  DockerConfig config;
  REQUIRE_FALSE(config.loadFile("/nonexistent/dockwire.ini"));
  REQUIRE(config.dockerHost == DockerConfig::defaultDockerHost());
}
