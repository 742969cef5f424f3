#pragma once

#include <stdint.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "api/ApiResult.h"
#include "services/Log.h"

enum class CycleOutcome : uint8_t {
  published,
  failed,
  skipped,  // already running, or shut down
};

// One periodically refreshed value. A successful cycle swaps in a whole new
// snapshot; a failed one keeps the last good snapshot and records the error.
// Cycles of one coordinator never overlap. The scheduler (a task per
// coordinator on the device, the test itself natively) decides when to call
// refresh().
template <typename T>
class PollCoordinator {
public:
  using Fetcher = std::function<ApiResult(std::shared_ptr<T>& out)>;

  PollCoordinator(const char* name, uint32_t intervalMs, Fetcher fetch)
  : name_(name), intervalMs_(intervalMs), fetch_(fetch) {}

  CycleOutcome refresh() {
    if (stopped_.load()) return CycleOutcome::skipped;
    if (running_.exchange(true)) {
      Log::debug("POLL", "%s: previous cycle still running, tick skipped", name_);
      return CycleOutcome::skipped;
    }

    std::shared_ptr<T> next;
    const ApiResult r = fetch_(next);

    CycleOutcome outcome = CycleOutcome::skipped;
    if (stopped_.load()) {
      Log::debug("POLL", "%s: shut down during cycle, result dropped", name_);
    } else if (r.ok() && next) {
      std::lock_guard<std::mutex> lock(mu_);
      data_ = next;
      lastError_ = ApiResult::success();
      ++generation_;
      outcome = CycleOutcome::published;
    } else {
      std::lock_guard<std::mutex> lock(mu_);
      lastError_ = r.ok() ? ApiResult::protocolError("Empty result") : r;
      ++failures_;
      outcome = CycleOutcome::failed;
      Log::warn("POLL", "%s refresh failed (%s): %s", name_, toString(lastError_.error), lastError_.message.c_str());
      if (lastError_.error == ApiError::auth_exhausted) {
        // Rejected even with a fresh login: stays stopped until the account changes.
        stopped_.store(true);
        Log::error("POLL", "%s stopped, account needs new credentials", name_);
      }
    }

    running_.store(false);
    return outcome;
  }

  // Stops further cycles; an in-flight cycle finishes but is not published.
  // A cycle ending in auth_exhausted stops the coordinator the same way.
  void shutdown() { stopped_.store(true); }
  bool stopped() const { return stopped_.load(); }

  bool credentialsRejected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lastError_.error == ApiError::auth_exhausted;
  }

  std::shared_ptr<const T> data() const {
    std::lock_guard<std::mutex> lock(mu_);
    return data_;
  }

  bool hasData() const {
    std::lock_guard<std::mutex> lock(mu_);
    return data_ != nullptr;
  }

  ApiResult lastError() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lastError_;
  }

  // Bumped on every published snapshot.
  uint32_t generation() const {
    std::lock_guard<std::mutex> lock(mu_);
    return generation_;
  }

  uint32_t failures() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failures_;
  }

  uint32_t intervalMs() const { return intervalMs_; }
  const char* name() const { return name_; }

private:
  const char* name_;
  const uint32_t intervalMs_;
  Fetcher fetch_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};

  mutable std::mutex mu_;
  std::shared_ptr<const T> data_;
  ApiResult lastError_;
  uint32_t generation_ = 0;
  uint32_t failures_ = 0;
};
