#include "HttpRequest.hpp"

namespace dw {
string HttpRequest::urlEncode(const string& s) {
  static const char hex[] = "0123456789ABCDEF";
  string encoded;
  encoded.reserve(s.length());
  for (unsigned char c : s) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += c;
    } else {
      encoded += '%';
      encoded += hex[c >> 4];
      encoded += hex[c & 0xF];
    }
  }
  return encoded;
}

string HttpRequest::target() const {
  if (query.empty()) {
    return path;
  }
  string s = path;
  char separator = '?';
  for (auto& it : query) {
    s += separator;
    s += urlEncode(it.first) + "=" + urlEncode(it.second);
    separator = '&';
  }
  return s;
}
}  // namespace dw
