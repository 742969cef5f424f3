#pragma once

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>

#include <ArduinoJson.h>

struct LoginResult {
  std::string token;
  bool hasCredentials = false;
  std::string credentials;
  bool hasMaster = false;
  long master = 0;
};

// Vendor code -> readable text. Empty when the fetch failed.
using TranslationTable = std::map<std::string, std::string>;

// One event-log fetch. `events` holds a JSON array of event objects in server
// order; count/offset/language echo the request, they are not confirmed by
// the server. `capacity` also bounds the raw response during the fetch.
struct EventBatch {
  explicit EventBatch(size_t capacity)
  : events(capacity) {}

  DynamicJsonDocument events;
  uint16_t count = 0;
  uint32_t offset = 0;
  std::string translationLanguage;
  bool translationsLoaded = false;

  JsonArrayConst eventList() const { return events.as<JsonArrayConst>(); }
};
