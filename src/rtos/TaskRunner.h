#pragma once

#include <Arduino.h>

#include <functional>

namespace TaskRunner {

// One periodic poll loop. `cycle` runs a single refresh and returns false
// once the feed has been shut down, which ends the task.
struct PollJob {
  const char* name = "";
  uint32_t intervalMs = 0;
  std::function<bool()> cycle;
  TaskHandle_t handle = nullptr;
};

bool start(PollJob& job, BaseType_t core);

// Runs the next cycle now instead of at the end of the interval.
void wake(PollJob& job);

} // namespace TaskRunner
