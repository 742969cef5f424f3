#pragma once

#include <stdint.h>

#include <string>

enum class ApiError : uint8_t {
  none,
  auth,            // token or account rejected by the server
  auth_exhausted,  // still rejected after one forced re-login
  protocol         // transport failure, bad JSON, unexpected shape
};

static inline const char* toString(ApiError e) {
  switch (e) {
    case ApiError::none:           return "none";
    case ApiError::auth:           return "auth";
    case ApiError::auth_exhausted: return "auth_exhausted";
    case ApiError::protocol:       return "protocol";
    default:                       return "unknown";
  }
}

struct ApiResult {
  ApiError error = ApiError::none;
  std::string message;

  bool ok() const { return error == ApiError::none; }
  bool isAuth() const { return error == ApiError::auth; }

  static ApiResult success() { return ApiResult{}; }

  static ApiResult authError(const std::string& msg) {
    ApiResult r;
    r.error = ApiError::auth;
    r.message = msg;
    return r;
  }

  static ApiResult exhausted(const std::string& msg) {
    ApiResult r;
    r.error = ApiError::auth_exhausted;
    r.message = msg;
    return r;
  }

  static ApiResult protocolError(const std::string& msg) {
    ApiResult r;
    r.error = ApiError::protocol;
    r.message = msg;
    return r;
  }
};
