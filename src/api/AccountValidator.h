#pragma once

#include <stddef.h>

#include <string>

#include "api/ApiResult.h"
#include "api/StokerClient.h"

struct AccountInfo {
  std::string username;
  std::string serial;
  std::string alias;
  std::string uniqueId;  // serial, else username
  std::string title;     // "serial / alias" when both are known, else username
};

// Error class reported back to whoever asked for the account change.
static inline const char* accountErrorText(const ApiResult& r) {
  switch (r.error) {
    case ApiError::none:           return "ok";
    case ApiError::auth:
    case ApiError::auth_exhausted: return "auth";
    case ApiError::protocol:       return "cannot_connect";
    default:                       return "unknown";
  }
}

namespace AccountValidator {

// Logs in with the (trimmed) username and fetches controller data once.
ApiResult validate(StokerClient& client, const std::string& username, size_t docBytes, AccountInfo& out);

} // namespace AccountValidator
