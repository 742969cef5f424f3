#pragma once

#include <stdint.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "api/ApiResult.h"
#include "api/StokerClient.h"

// Owns the single cached session token.
//
// withToken() logs in lazily, runs the operation outside the lock and, if the
// server rejects the token, forces one fresh login and retries once. A second
// rejection is reported as ApiError::auth_exhausted. The lock covers only the
// read-or-login and forced-login phases, so a slow data request never blocks
// other callers that already have a token, and racing callers with no token
// issue a single login between them.
class TokenGuard {
public:
  using Operation = std::function<ApiResult(const std::string& token)>;

  TokenGuard(StokerClient& client, const std::string& username);

  ApiResult withToken(const Operation& op);

  bool hasToken() const;
  uint32_t loginCount() const { return logins_.load(); }

private:
  StokerClient& client_;
  const std::string username_;

  mutable std::mutex mu_;
  bool hasToken_ = false;
  std::string token_;

  std::atomic<uint32_t> logins_{0};

  ApiResult currentToken(std::string& out);
  ApiResult forceLogin(std::string& out);
  ApiResult loginLocked();
};
