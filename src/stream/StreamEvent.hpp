#ifndef __DW_STREAM_EVENT__
#define __DW_STREAM_EVENT__

#include "Headers.hpp"

namespace dw {
/** @brief Stream selector in byte 0 of a multiplexed frame header. */
enum class StreamId : uint8_t {
  STDIN = 0,
  STDOUT = 1,
  STDERR = 2,
};

inline const char* streamIdName(StreamId id) {
  switch (id) {
    case StreamId::STDIN:
      return "stdin";
    case StreamId::STDOUT:
      return "stdout";
    case StreamId::STDERR:
      return "stderr";
  }
  return "unknown";
}

/**
 * @brief One decoded unit of a streaming response: a JSON progress value or a
 * multiplexed frame.
 */
class StreamEvent {
 public:
  enum Type { JSON_VALUE, FRAME };

  StreamEvent() : type(JSON_VALUE), streamId(StreamId::STDOUT) {}

  static StreamEvent fromJson(const json& value) {
    StreamEvent event;
    event.type = JSON_VALUE;
    event.value = value;
    return event;
  }

  static StreamEvent fromFrame(StreamId id, const string& payload) {
    StreamEvent event;
    event.type = FRAME;
    event.streamId = id;
    event.payload = payload;
    return event;
  }

  Type getType() const { return type; }
  const json& getValue() const { return value; }
  StreamId getStreamId() const { return streamId; }
  const string& getPayload() const { return payload; }

  /**
   * @brief True for a daemon-reported failure: a JSON object carrying an
   * "error" or "errorDetail" key.
   */
  bool isErrorEvent() const {
    return type == JSON_VALUE && value.is_object() &&
           (value.contains("error") || value.contains("errorDetail"));
  }

  /**
   * @brief JSON view of the event. Frames become
   * {"stream": "stdout", "payload": "..."}.
   */
  json toJson() const {
    if (type == JSON_VALUE) {
      return value;
    }
    json frame;
    frame["stream"] = streamIdName(streamId);
    frame["payload"] = payload;
    return frame;
  }

  bool operator==(const StreamEvent& other) const {
    if (type != other.type) {
      return false;
    }
    if (type == JSON_VALUE) {
      return value == other.value;
    }
    return streamId == other.streamId && payload == other.payload;
  }

 protected:
  Type type;
  json value;
  StreamId streamId;
  string payload;
};
}  // namespace dw

#endif  // __DW_STREAM_EVENT__
