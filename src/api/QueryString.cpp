#include "api/QueryString.h"

#include <stdint.h>

namespace QueryString {

static bool unreserved(char c) {
  return (c >= 'A' && c <= 'Z') ||
         (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '~';
}

std::string encode(const std::string& s) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (size_t i = 0; i < s.size(); ++i) {
    const uint8_t c = static_cast<uint8_t>(s[i]);
    if (unreserved((char)c)) {
      out += (char)c;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string build(const std::string& url, const QueryParams& params) {
  if (params.empty()) return url;

  std::string out = url;
  out += (url.find('?') == std::string::npos) ? '?' : '&';
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) out += '&';
    out += encode(params[i].key);
    out += '=';
    out += encode(params[i].value);
  }
  return out;
}

} // namespace QueryString
