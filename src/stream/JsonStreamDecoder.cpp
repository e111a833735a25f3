#include "JsonStreamDecoder.hpp"

namespace dw {
namespace {
const size_t DECODE_READ_SIZE = 16 * 1024;

inline bool isJsonWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}
}  // namespace

void JsonValueScanner::reset() {
  scanPos = 0;
  state = BETWEEN_VALUES;
  depth = 0;
  inString = false;
  escaped = false;
}

void JsonValueScanner::take(string* text, size_t end) {
  *text = buffer.substr(0, end);
  buffer.erase(0, end);
  reset();
}

bool JsonValueScanner::nextValue(string* text, bool atEof) {
  while (scanPos < buffer.length()) {
    char c = buffer[scanPos];
    switch (state) {
      case BETWEEN_VALUES:
        if (isJsonWhitespace(c)) {
          scanPos++;
          break;
        }
        // Drop the separator so the value starts at offset 0
        buffer.erase(0, scanPos);
        if (c == '{' || c == '[') {
          state = IN_CONTAINER;
          depth = 1;
        } else if (c == '"') {
          state = IN_TOP_LEVEL_STRING;
        } else {
          state = IN_TOKEN;
        }
        scanPos = 1;
        break;
      case IN_CONTAINER:
        if (inString) {
          if (escaped) {
            escaped = false;
          } else if (c == '\\') {
            escaped = true;
          } else if (c == '"') {
            inString = false;
          }
        } else if (c == '"') {
          inString = true;
        } else if (c == '{' || c == '[') {
          depth++;
        } else if (c == '}' || c == ']') {
          depth--;
          if (depth == 0) {
            take(text, scanPos + 1);
            return true;
          }
        }
        scanPos++;
        break;
      case IN_TOP_LEVEL_STRING:
        if (escaped) {
          escaped = false;
        } else if (c == '\\') {
          escaped = true;
        } else if (c == '"') {
          take(text, scanPos + 1);
          return true;
        }
        scanPos++;
        break;
      case IN_TOKEN:
        if (isJsonWhitespace(c) || c == '{' || c == '[' || c == '"') {
          take(text, scanPos);
          return true;
        }
        scanPos++;
        break;
    }
  }

  if (state == BETWEEN_VALUES) {
    buffer.clear();
    scanPos = 0;
    return false;
  }
  if (!atEof) {
    return false;
  }
  if (state == IN_TOKEN) {
    take(text, buffer.length());
    return true;
  }
  throw DecodeError("Stream ended inside a JSON value (" +
                    to_string(buffer.length()) + " bytes pending)");
}

bool JsonStreamDecoder::decodeNext(StreamEvent* event) {
  string text;
  char buf[DECODE_READ_SIZE];
  while (!scanner.nextValue(&text, eof)) {
    if (eof) {
      return false;
    }
    if (int64_t(scanner.pendingBytes()) > maxValueSize) {
      throw DecodeError("JSON event exceeds " + to_string(maxValueSize) +
                        " bytes");
    }
    size_t bytesRead = body->read(buf, sizeof(buf));
    if (bytesRead == 0) {
      VLOG(3) << "End of JSON stream";
      eof = true;
      continue;
    }
    scanner.append(buf, bytesRead);
  }

  try {
    *event = StreamEvent::fromJson(json::parse(text));
  } catch (const json::parse_error& e) {
    throw DecodeError(string("Malformed JSON event: ") + e.what());
  }
  VLOG(3) << "Decoded JSON event: " << text;
  return true;
}
}  // namespace dw
