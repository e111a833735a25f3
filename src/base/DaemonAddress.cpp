#include "DaemonAddress.hpp"

namespace dw {
namespace {
const string TCP_SCHEME = "tcp://";
const string HTTP_SCHEME = "http://";
const string HTTPS_SCHEME = "https://";
const string UNIX_SCHEME = "unix://";
const string NPIPE_SCHEME = "npipe://";

int parsePort(const string& portString, const string& address) {
  if (portString.empty() || portString.length() > 5 ||
      portString.find_first_not_of("0123456789") != string::npos) {
    throw std::invalid_argument("Invalid port in daemon address: " + address);
  }
  int port = stoi(portString);
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in daemon address: " +
                                address);
  }
  return port;
}
}  // namespace

DaemonAddress DaemonAddress::tcp(const string& host, int port) {
  DaemonAddress address;
  address.kind = TCP;
  address.host = host;
  address.port = port;
  return address;
}

DaemonAddress DaemonAddress::tcpWithTls(const string& host, int port,
                                        const TlsConfig& tlsConfig) {
  DaemonAddress address = tcp(host, port);
  address.tls = true;
  address.tlsConfig = tlsConfig;
  return address;
}

DaemonAddress DaemonAddress::unixSocket(const string& path) {
  DaemonAddress address;
  address.kind = UNIX_SOCKET;
  address.path = path;
  return address;
}

DaemonAddress DaemonAddress::namedPipe(const string& path) {
  DaemonAddress address;
  address.kind = NAMED_PIPE;
  address.path = path;
  return address;
}

DaemonAddress DaemonAddress::parse(const string& address,
                                   const TlsConfig* tlsConfig) {
  if (startsWith(address, UNIX_SCHEME)) {
    string path = address.substr(UNIX_SCHEME.length());
    if (path.empty()) {
      throw std::invalid_argument("Missing socket path in daemon address: " +
                                  address);
    }
    return unixSocket(path);
  }

  if (startsWith(address, NPIPE_SCHEME)) {
    // npipe:////./pipe/docker_engine and npipe://\\.\pipe\docker_engine both
    // name \\.\pipe\docker_engine
    string path = address.substr(NPIPE_SCHEME.length());
    std::replace(path.begin(), path.end(), '/', '\\');
    if (path.empty()) {
      throw std::invalid_argument("Missing pipe path in daemon address: " +
                                  address);
    }
    return namedPipe(path);
  }

  bool useTls = false;
  string remaining;
  if (startsWith(address, TCP_SCHEME)) {
    remaining = address.substr(TCP_SCHEME.length());
    useTls = tlsConfig != NULL;
  } else if (startsWith(address, HTTP_SCHEME)) {
    remaining = address.substr(HTTP_SCHEME.length());
  } else if (startsWith(address, HTTPS_SCHEME)) {
    remaining = address.substr(HTTPS_SCHEME.length());
    useTls = true;
  } else {
    throw std::invalid_argument("Unsupported daemon address: " + address);
  }

  // Drop any path suffix, e.g. tcp://host:2375/
  auto slash = remaining.find('/');
  if (slash != string::npos) {
    remaining = remaining.substr(0, slash);
  }

  string host;
  string portString;
  if (!remaining.empty() && remaining[0] == '[') {
    // IPv6 in bracket notation: [::1]:2375
    auto closeBracket = remaining.find(']');
    if (closeBracket == string::npos) {
      throw std::invalid_argument("Malformed IPv6 daemon address: " + address);
    }
    host = remaining.substr(1, closeBracket - 1);
    if (closeBracket + 1 < remaining.length()) {
      if (remaining[closeBracket + 1] != ':') {
        throw std::invalid_argument("Malformed IPv6 daemon address: " +
                                    address);
      }
      portString = remaining.substr(closeBracket + 2);
    }
  } else {
    auto colon = remaining.find(':');
    if (colon != string::npos) {
      host = remaining.substr(0, colon);
      portString = remaining.substr(colon + 1);
    } else {
      host = remaining;
    }
  }
  if (host.empty()) {
    throw std::invalid_argument("Missing host in daemon address: " + address);
  }

  int port = portString.empty() ? (useTls ? DOCKER_TLS_PORT : DOCKER_TCP_PORT)
                                : parsePort(portString, address);
  if (useTls) {
    return tcpWithTls(host, port, tlsConfig ? *tlsConfig : TlsConfig());
  }
  return tcp(host, port);
}

string DaemonAddress::hostHeader() const {
  if (kind != TCP) {
    return LOCAL_TRANSPORT_HOST;
  }
  if (host.find(':') != string::npos) {
    return "[" + host + "]:" + to_string(port);
  }
  return host + ":" + to_string(port);
}

string DaemonAddress::toString() const {
  switch (kind) {
    case TCP:
      return string(tls ? "https://" : "tcp://") + hostHeader();
    case UNIX_SOCKET:
      return UNIX_SCHEME + path;
    case NAMED_PIPE:
      return NPIPE_SCHEME + path;
  }
  return "";
}
}  // namespace dw
