#pragma once

#include <stdint.h>

#include <string>
#include <vector>

enum class HttpMethod : uint8_t {
  get,
  post
};

static inline const char* toString(HttpMethod m) {
  return m == HttpMethod::post ? "POST" : "GET";
}

struct QueryParam {
  std::string key;
  std::string value;
};

using QueryParams = std::vector<QueryParam>;

struct HttpResponse {
  int code = 0;
  std::string body;
};

// Request executor used by StokerClient. Implementations must be safe to call
// from several tasks at once and must bound every call with a timeout.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  // Returns false on a transport-level failure (DNS, TLS, connect, timeout)
  // and describes it in `error`. Any HTTP status code counts as delivered.
  virtual bool execute(HttpMethod method,
                       const std::string& url,
                       const QueryParams& params,
                       HttpResponse& out,
                       std::string& error) = 0;
};
