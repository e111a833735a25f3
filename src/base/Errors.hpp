#ifndef __DW_ERRORS__
#define __DW_ERRORS__

#include "Headers.hpp"

namespace dw {
enum class ErrorKind {
  TRANSPORT_UNAVAILABLE,
  CONNECTION_ERROR,
  DECODE_ERROR,
  PROTOCOL_ERROR,
};

inline const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TRANSPORT_UNAVAILABLE:
      return "TransportUnavailable";
    case ErrorKind::CONNECTION_ERROR:
      return "ConnectionError";
    case ErrorKind::DECODE_ERROR:
      return "DecodeError";
    case ErrorKind::PROTOCOL_ERROR:
      return "ProtocolError";
  }
  return "Unknown";
}

/**
 * @brief Base class for every failure raised by the transport and streaming
 * core.
 *
 * Only the subclasses below construct it, so kind() always names the dynamic
 * type.
 */
class DockerError : public std::runtime_error {
 public:
  ErrorKind kind() const { return errorKind; }

 protected:
  DockerError(ErrorKind _kind, const string& message)
      : std::runtime_error(message), errorKind(_kind) {}

  ErrorKind errorKind;
};

/** @brief The requested transport does not exist on this platform. */
class TransportUnavailable : public DockerError {
 public:
  explicit TransportUnavailable(const string& message)
      : DockerError(ErrorKind::TRANSPORT_UNAVAILABLE, message) {}
};

/**
 * @brief The daemon could not be reached, the handshake failed, or the
 * connection dropped while a response was being read.
 */
class ConnectionError : public DockerError {
 public:
  explicit ConnectionError(const string& message)
      : DockerError(ErrorKind::CONNECTION_ERROR, message) {}
};

/** @brief Malformed chunk framing or a truncated JSON value / frame. */
class DecodeError : public DockerError {
 public:
  explicit DecodeError(const string& message)
      : DockerError(ErrorKind::DECODE_ERROR, message) {}
};

/**
 * @brief The daemon embedded an error object in an otherwise successful
 * streamed response.
 */
class ProtocolError : public DockerError {
 public:
  explicit ProtocolError(const json& _detail)
      : DockerError(ErrorKind::PROTOCOL_ERROR, messageFor(_detail)),
        errorDetail(_detail) {}

  /** @brief The decoded error event, e.g. {"error":..., "errorDetail":...}. */
  const json& detail() const { return errorDetail; }

  static string messageFor(const json& event) {
    if (event.is_object()) {
      auto it = event.find("errorDetail");
      if (it != event.end() && it->is_object() && it->contains("message") &&
          (*it)["message"].is_string()) {
        return (*it)["message"].get<string>();
      }
      it = event.find("error");
      if (it != event.end() && it->is_string()) {
        return it->get<string>();
      }
    }
    return event.dump();
  }

 protected:
  json errorDetail;
};
}  // namespace dw

#endif  // __DW_ERRORS__
