#include <Arduino.h>

#include "app/BridgeRuntime.h"
#include "services/Log.h"

static BridgeRuntime runtime;

static void serialSink(Log::Level level, const char* line) {
  (void)level;
  Serial.println(line);
}

void setup() {
  Serial.begin(115200);
  delay(200);

  Log::setSink(serialSink);
#if STOKER_VERBOSE_LOG
  Log::setLevel(Log::Level::debug);
#endif

  runtime.begin();
}

void loop() {
  runtime.tick(millis());
  delay(10);
}
