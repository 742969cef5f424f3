#pragma once

#include <Arduino.h>

#include "api/HttpTransport.h"

// HTTPClient over WiFiClientSecure. A fresh client per request keeps the
// transport reentrant for the two poll tasks.
class ArduinoHttpTransport : public HttpTransport {
public:
  explicit ArduinoHttpTransport(uint32_t timeoutMs);

  bool execute(HttpMethod method,
               const std::string& url,
               const QueryParams& params,
               HttpResponse& out,
               std::string& error) override;

private:
  uint32_t timeoutMs_;
};
