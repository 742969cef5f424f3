#include "api/TokenGuard.h"

#include "services/Log.h"

TokenGuard::TokenGuard(StokerClient& client, const std::string& username)
: client_(client),
  username_(username) {}

bool TokenGuard::hasToken() const {
  std::lock_guard<std::mutex> lock(mu_);
  return hasToken_;
}

// Caller holds mu_.
ApiResult TokenGuard::loginLocked() {
  LoginResult login;
  ++logins_;
  ApiResult r = client_.login(username_, login);
  if (!r.ok()) {
    Log::warn("AUTH", "login for '%s' failed (%s): %s", username_.c_str(), toString(r.error), r.message.c_str());
    return r;
  }
  token_ = login.token;
  hasToken_ = true;
  Log::debug("AUTH", "session token refreshed");
  return r;
}

ApiResult TokenGuard::currentToken(std::string& out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!hasToken_) {
    ApiResult r = loginLocked();
    if (!r.ok()) return r;
  }
  out = token_;
  return ApiResult::success();
}

ApiResult TokenGuard::forceLogin(std::string& out) {
  std::lock_guard<std::mutex> lock(mu_);
  // Overwrite unconditionally: a rejection may not mean the token was stale.
  hasToken_ = false;
  token_.clear();
  ApiResult r = loginLocked();
  if (!r.ok()) return r;
  out = token_;
  return r;
}

ApiResult TokenGuard::withToken(const Operation& op) {
  std::string token;
  ApiResult r = currentToken(token);
  if (!r.ok()) return r;

  r = op(token);
  if (!r.isAuth()) return r;

  Log::info("AUTH", "token rejected (%s), logging in again", r.message.c_str());
  r = forceLogin(token);
  if (r.isAuth()) return ApiResult::exhausted(r.message);
  if (!r.ok()) return r;

  r = op(token);
  if (r.isAuth()) {
    Log::warn("AUTH", "still rejected after re-login: %s", r.message.c_str());
    return ApiResult::exhausted(r.message);
  }
  return r;
}
