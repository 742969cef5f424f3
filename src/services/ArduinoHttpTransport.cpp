#include "services/ArduinoHttpTransport.h"

#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>

#include "api/QueryString.h"
#include "services/Log.h"

ArduinoHttpTransport::ArduinoHttpTransport(uint32_t timeoutMs)
: timeoutMs_(timeoutMs) {}

bool ArduinoHttpTransport::execute(HttpMethod method,
                                   const std::string& url,
                                   const QueryParams& params,
                                   HttpResponse& out,
                                   std::string& error) {
  if (WiFi.status() != WL_CONNECTED) {
    error = "WiFi not connected";
    return false;
  }

  const std::string full = QueryString::build(url, params);
  const bool secure = full.compare(0, 8, "https://") == 0;

  WiFiClient plain;
  WiFiClientSecure tls;
  if (secure) {
#if defined(STOKER_CA_CERT)
    tls.setCACert(STOKER_CA_CERT);
#else
    static bool warned = false;
    if (!warned) {
      Log::warn("NET", "TLS server certificate not verified, build with STOKER_CA_CERT to pin one");
      warned = true;
    }
    tls.setInsecure();
#endif
  }
  WiFiClient& client = secure ? static_cast<WiFiClient&>(tls) : plain;

  HTTPClient http;
  http.setReuse(false);
  http.setConnectTimeout((int32_t)timeoutMs_);
  http.setTimeout((uint16_t)min<uint32_t>(timeoutMs_, 0xFFFFu));

  if (!http.begin(client, full.c_str())) {
    error = "Invalid URL";
    return false;
  }

  const uint32_t start = millis();
  const int code = (method == HttpMethod::post) ? http.POST(String()) : http.GET();
  if (code < 0) {
    error = HTTPClient::errorToString(code).c_str();
    http.end();
    Log::debug("NET", "%s %s -> %s (%lu ms)", toString(method), url.c_str(), error.c_str(),
               (unsigned long)(millis() - start));
    return false;
  }

  const String body = http.getString();
  http.end();

  out.code = code;
  out.body.assign(body.c_str(), body.length());
  Log::debug("NET", "%s %s -> %d, %u bytes (%lu ms)", toString(method), url.c_str(), code,
             (unsigned)out.body.size(), (unsigned long)(millis() - start));
  return true;
}
