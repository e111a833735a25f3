#ifndef __DW_DOCKER_CLIENT_EXCEPTION__
#define __DW_DOCKER_CLIENT_EXCEPTION__

#include "Headers.hpp"

namespace dw {
/**
 * @brief A failed daemon operation as seen by callers of DockerClient.
 *
 * what() names the operation ("docker build failed"); getCauseMessage() is the
 * daemon's own message. getContent() holds the response content: the error
 * document, or for streamed responses the array of events received, whose
 * last element is the daemon's error event.
 */
class DockerClientException : public std::runtime_error {
 public:
  DockerClientException(const string& message, const string& _causeMessage,
                        int _status, const json& _content)
      : std::runtime_error(message),
        causeMessage(_causeMessage),
        status(_status),
        content(_content) {}

  const string& getCauseMessage() const { return causeMessage; }
  int getStatus() const { return status; }
  const json& getContent() const { return content; }

 protected:
  string causeMessage;
  int status;
  json content;
};
}  // namespace dw

#endif  // __DW_DOCKER_CLIENT_EXCEPTION__
