#include "api/StokerClient.h"

#include <algorithm>
#include <cctype>

#include "api/EventExtraction.h"
#include "api/StokerEndpoints.h"
#include "services/Log.h"

namespace {
constexpr size_t kLoginDocBytes = 1024;

// status absent/null, 0 or "0". JSON false compares equal to 0 upstream too.
bool statusIsSuccess(JsonVariantConst status) {
  if (status.isNull()) return true;
  if (status.is<bool>()) return !status.as<bool>();
  if (status.is<double>()) return status.as<double>() == 0.0;
  if (status.is<const char*>()) return std::string(status.as<const char*>()) == "0";
  return false;
}

bool statusIsAuth(JsonVariantConst status) {
  if (status.is<bool>()) return false;
  if (status.is<double>()) {
    const double v = status.as<double>();
    return v == 401.0 || v == 403.0;
  }
  if (status.is<const char*>()) {
    const std::string s = status.as<const char*>();
    return s == "401" || s == "403";
  }
  return false;
}

bool isNumericZero(JsonVariantConst v) {
  if (v.is<bool>()) return !v.as<bool>();
  return v.is<double>() && v.as<double>() == 0.0;
}

std::string valueText(JsonVariantConst v, const char* fallback) {
  if (v.isNull()) return fallback;
  if (v.is<const char*>()) return v.as<const char*>();
  std::string out;
  serializeJson(v, out);
  return out;
}

std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return (char)std::tolower(c);
  });
  return s;
}

bool looksLikeTokenRejection(const std::string& message) {
  const std::string m = lowered(message);
  if (m.find("token") == std::string::npos) return false;
  return m.find("expired") != std::string::npos ||
         m.find("invalid") != std::string::npos ||
         m.find("reject") != std::string::npos;
}
} // namespace

ApiResult classifyResponse(JsonVariantConst payload) {
  if (!payload.is<JsonObjectConst>()) return ApiResult::success();

  JsonObjectConst obj = payload.as<JsonObjectConst>();
  JsonVariantConst status = obj["status"];
  if (statusIsSuccess(status)) return ApiResult::success();

  const std::string message = valueText(obj["message"], "Request failed");
  if (statusIsAuth(status)) return ApiResult::authError(message);
  if (looksLikeTokenRejection(message)) return ApiResult::authError(message);
  return ApiResult::protocolError(message);
}

StokerClient::StokerClient(HttpTransport& transport,
                           const std::string& apiBase,
                           const std::string& translationBase)
: transport_(transport),
  apiBase_(apiBase),
  translationBase_(translationBase) {}

std::string StokerClient::apiUrl(const char* path) const {
  return apiBase_ + "/" + path;
}

ApiResult StokerClient::requestJson(HttpMethod method,
                                    const std::string& url,
                                    const QueryParams& params,
                                    JsonDocument& out) {
  HttpResponse resp;
  std::string transportError;
  if (!transport_.execute(method, url, params, resp, transportError)) {
    Log::debug("API", "%s %s failed: %s", toString(method), url.c_str(), transportError.c_str());
    return ApiResult::protocolError(transportError.empty() ? "Transport failure" : transportError);
  }

  // The vendor does not use HTTP status codes consistently and sometimes
  // serves JSON as text/html, so only the body decides.
  const DeserializationError err = deserializeJson(out, resp.body);
  if (err == DeserializationError::NoMemory) {
    Log::warn("API", "%s response (%u bytes) exceeds buffer", url.c_str(), (unsigned)resp.body.size());
    return ApiResult::protocolError("Response exceeds buffer");
  }
  if (err) {
    Log::debug("API", "%s code=%d invalid JSON: %s", url.c_str(), resp.code, err.c_str());
    return ApiResult::protocolError("Invalid JSON response");
  }

  JsonVariantConst root = out.as<JsonVariantConst>();
  if (!root.is<JsonObjectConst>() && !root.is<JsonArrayConst>()) {
    return ApiResult::protocolError("Unexpected response type");
  }
  return classifyResponse(root);
}

ApiResult StokerClient::login(const std::string& username, LoginResult& out) {
  DynamicJsonDocument doc(kLoginDocBytes);
  const QueryParams params = {{"user", username}};
  ApiResult r = requestJson(HttpMethod::post, apiUrl(StokerEndpoints::kLoginPath), params, doc);
  if (!r.ok()) return r;

  if (!doc.is<JsonObject>()) return ApiResult::protocolError("Unexpected login payload");
  JsonObjectConst obj = doc.as<JsonObjectConst>();

  // Past the shared check; login additionally wants a numeric 0 and a token.
  JsonVariantConst token = obj["token"];
  if (!isNumericZero(obj["status"]) || token.isNull()) {
    return ApiResult::authError(valueText(obj["message"], "Login failed"));
  }

  LoginResult result;
  result.token = valueText(token, "");
  if (obj["credentials"].is<const char*>()) {
    result.hasCredentials = true;
    result.credentials = obj["credentials"].as<const char*>();
  }
  if (obj["master"].is<long>()) {
    result.hasMaster = true;
    result.master = obj["master"].as<long>();
  }
  out = result;
  return ApiResult::success();
}

ApiResult StokerClient::fetchControllerData(const std::string& token, JsonDocument& out) {
  const QueryParams params = {
    {"screen", StokerEndpoints::kScreen},
    {"token", token},
  };
  ApiResult r = requestJson(HttpMethod::get, apiUrl(StokerEndpoints::kControllerDataPath), params, out);
  if (!r.ok()) return r;

  if (!out.is<JsonObject>()) return ApiResult::protocolError("Unexpected controller data payload");
  if (!out.containsKey(StokerEndpoints::kControllerMarker)) {
    return ApiResult::protocolError("Unexpected controller data payload");
  }
  return ApiResult::success();
}

ApiResult StokerClient::fetchEventData(const std::string& token,
                                       uint16_t count,
                                       uint32_t offset,
                                       EventBatch& out) {
  const QueryParams params = {
    {"count", std::to_string(count)},
    {"offset", std::to_string(offset)},
    {"token", token},
  };
  // The raw payload only lives until the events are copied out of it.
  DynamicJsonDocument raw(out.events.capacity());
  ApiResult r = requestJson(HttpMethod::get, apiUrl(StokerEndpoints::kEventDataPath), params, raw);
  if (!r.ok()) return r;

  out.events.clear();
  JsonArray events = out.events.to<JsonArray>();
  if (!EventExtraction::extract(raw.as<JsonVariantConst>(), events) || out.events.overflowed()) {
    return ApiResult::protocolError("Event list exceeds buffer");
  }
  out.events.shrinkToFit();
  out.count = count;
  out.offset = offset;
  return ApiResult::success();
}

ApiResult StokerClient::fetchTranslations(const std::string& language,
                                          JsonDocument& scratch,
                                          TranslationTable& out) {
  const std::string url = translationBase_ + "/" + language + ".json";
  ApiResult r = requestJson(HttpMethod::get, url, QueryParams(), scratch);
  if (!r.ok()) return r;

  if (!scratch.is<JsonObject>()) return ApiResult::protocolError("Unexpected translation payload");

  TranslationTable table;
  for (JsonPairConst kv : scratch.as<JsonObjectConst>()) {
    if (!kv.value().is<const char*>()) continue;
    table[kv.key().c_str()] = kv.value().as<const char*>();
  }
  out.swap(table);
  return ApiResult::success();
}
