#include "MultiplexedStreamDecoder.hpp"

namespace dw {
const size_t MultiplexedFrame::HEADER_SIZE;

string MultiplexedFrame::encode(StreamId id, const string& payload) {
  if (payload.length() > 0xFFFFFFFFULL) {
    throw std::invalid_argument("Frame payload too large");
  }
  uint32_t length = payload.length();
  string frame(HEADER_SIZE, '\0');
  frame[0] = char(id);
  frame[4] = char((length >> 24) & 0xFF);
  frame[5] = char((length >> 16) & 0xFF);
  frame[6] = char((length >> 8) & 0xFF);
  frame[7] = char(length & 0xFF);
  frame.append(payload);
  return frame;
}

void MultiplexedFrame::decodeHeader(const unsigned char* header, StreamId* id,
                                    uint32_t* length) {
  if (header[0] > uint8_t(StreamId::STDERR)) {
    throw DecodeError("Unknown stream id in frame header: " +
                      to_string(int(header[0])));
  }
  *id = StreamId(header[0]);
  *length = (uint32_t(header[4]) << 24) | (uint32_t(header[5]) << 16) |
            (uint32_t(header[6]) << 8) | uint32_t(header[7]);
}

size_t MultiplexedStreamDecoder::readUpTo(char* buf, size_t count) {
  size_t total = 0;
  while (total < count) {
    size_t bytesRead = body->read(buf + total, count - total);
    if (bytesRead == 0) {
      break;
    }
    total += bytesRead;
  }
  return total;
}

bool MultiplexedStreamDecoder::decodeNext(StreamEvent* event) {
  unsigned char header[MultiplexedFrame::HEADER_SIZE];
  size_t headerBytes =
      readUpTo((char*)header, MultiplexedFrame::HEADER_SIZE);
  if (headerBytes == 0) {
    VLOG(3) << "End of multiplexed stream";
    return false;
  }
  if (headerBytes < MultiplexedFrame::HEADER_SIZE) {
    throw DecodeError("Stream ended inside a frame header (" +
                      to_string(headerBytes) + " of 8 bytes)");
  }

  StreamId id;
  uint32_t length;
  MultiplexedFrame::decodeHeader(header, &id, &length);
  if (int64_t(length) > maxFrameSize) {
    throw DecodeError("Frame of " + to_string(length) + " bytes exceeds " +
                      to_string(maxFrameSize));
  }

  string payload(length, '\0');
  if (length > 0) {
    size_t payloadBytes = readUpTo(&payload[0], length);
    if (payloadBytes < length) {
      throw DecodeError("Stream ended inside a frame payload (" +
                        to_string(payloadBytes) + " of " + to_string(length) +
                        " bytes)");
    }
  }
  VLOG(3) << "Decoded " << streamIdName(id) << " frame of " << length
          << " bytes";
  *event = StreamEvent::fromFrame(id, payload);
  return true;
}
}  // namespace dw
