#pragma once

#include <stdint.h>

#include <string>

#include <ArduinoJson.h>

#include "api/ApiResult.h"
#include "api/HttpTransport.h"
#include "api/StokerTypes.h"

// Shared status check run on every decoded response before the operation
// specific checks. Objects whose `status` is neither absent, 0 nor "0" fail:
// 401/403 or a "token ... expired/invalid/reject" message is an auth error,
// anything else a protocol error carrying the server message.
ApiResult classifyResponse(JsonVariantConst payload);

// Stateless mapping of the StokerCloud endpoints. Holds no token; see
// TokenGuard for the session lifecycle. Safe to share between tasks as long
// as the transport is.
class StokerClient {
public:
  StokerClient(HttpTransport& transport,
               const std::string& apiBase,
               const std::string& translationBase);

  ApiResult login(const std::string& username, LoginResult& out);

  // `out` receives the full controller payload (the snapshot).
  ApiResult fetchControllerData(const std::string& token, JsonDocument& out);

  // Fills out.events with the extracted event objects, shrunk to fit, and
  // stamps count/offset. The raw payload is parsed into a temporary document
  // of out.events' capacity.
  ApiResult fetchEventData(const std::string& token, uint16_t count, uint32_t offset, EventBatch& out);

  ApiResult fetchTranslations(const std::string& language, JsonDocument& scratch, TranslationTable& out);

private:
  HttpTransport& transport_;
  std::string apiBase_;
  std::string translationBase_;

  std::string apiUrl(const char* path) const;
  ApiResult requestJson(HttpMethod method, const std::string& url, const QueryParams& params, JsonDocument& out);
};
