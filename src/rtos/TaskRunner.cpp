#include "rtos/TaskRunner.h"

#include "services/Log.h"

namespace TaskRunner {

namespace {
constexpr uint32_t POLL_STACK = 8192;
constexpr UBaseType_t POLL_PRIORITY = 1;

void pollTask(void* arg) {
  PollJob* job = static_cast<PollJob*>(arg);
  const TickType_t period = pdMS_TO_TICKS(job->intervalMs);

  // The first cycle ran during setup, so start by waiting one interval.
  for (;;) {
    ulTaskNotifyTake(pdTRUE, period);
    if (!job->cycle()) break;
  }

  Log::info("POLL", "%s task stopped", job->name);
  job->handle = nullptr;
  vTaskDelete(nullptr);
}
} // namespace

bool start(PollJob& job, BaseType_t core) {
  if (job.handle) return true;
  if (xTaskCreatePinnedToCore(pollTask, job.name, POLL_STACK, &job, POLL_PRIORITY, &job.handle, core) != pdPASS) {
    Log::error("POLL", "could not start %s task", job.name);
    job.handle = nullptr;
    return false;
  }
  Log::info("POLL", "%s task every %lu ms on core %d", job.name, (unsigned long)job.intervalMs, (int)core);
  return true;
}

void wake(PollJob& job) {
  if (job.handle) xTaskNotifyGive(job.handle);
}

} // namespace TaskRunner
