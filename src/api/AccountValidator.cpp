#include "api/AccountValidator.h"

#include <cctype>

#include "services/Log.h"

namespace AccountValidator {

static std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) ++b;
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string textField(JsonObjectConst obj, const char* key) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return "";
  if (v.is<const char*>()) return v.as<const char*>();
  std::string out;
  serializeJson(v, out);
  return out;
}

ApiResult validate(StokerClient& client, const std::string& username, size_t docBytes, AccountInfo& out) {
  const std::string user = trim(username);
  if (user.empty()) return ApiResult::authError("Empty username");

  LoginResult login;
  ApiResult r = client.login(user, login);
  if (!r.ok()) return r;

  DynamicJsonDocument doc(docBytes);
  r = client.fetchControllerData(login.token, doc);
  if (!r.ok()) return r;

  JsonObjectConst data = doc.as<JsonObjectConst>();
  AccountInfo info;
  info.username = user;
  info.serial = textField(data, "serial");
  info.alias = textField(data, "alias");
  info.uniqueId = info.serial.empty() ? user : info.serial;
  info.title = (!info.serial.empty() && !info.alias.empty()) ? info.serial + " / " + info.alias : user;

  Log::info("AUTH", "account '%s' validated as %s", user.c_str(), info.title.c_str());
  out = info;
  return ApiResult::success();
}

} // namespace AccountValidator
