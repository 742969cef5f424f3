#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#ifndef STOKER_USERNAME
#define STOKER_USERNAME ""
#endif

#ifndef STOKER_API_BASE
#define STOKER_API_BASE "https://stokercloud.dk/v2/dataout2"
#endif

#ifndef STOKER_TRANSLATION_BASE
#define STOKER_TRANSLATION_BASE "https://stokercloud.dk/v3/assets/json/translation"
#endif

#ifndef STOKER_TRANSLATION_LANGUAGE
#define STOKER_TRANSLATION_LANGUAGE "uk"
#endif

#ifndef STOKER_DEVICE_INTERVAL_MS
#define STOKER_DEVICE_INTERVAL_MS 30000
#endif

#ifndef STOKER_EVENT_INTERVAL_MS
#define STOKER_EVENT_INTERVAL_MS 300000
#endif

#ifndef STOKER_EVENT_COUNT
#define STOKER_EVENT_COUNT 100
#endif

#ifndef STOKER_EVENT_OFFSET
#define STOKER_EVENT_OFFSET 0
#endif

#ifndef STOKER_ATTR_BYTE_BUDGET
#define STOKER_ATTR_BYTE_BUDGET 16000
#endif

#ifndef STOKER_HTTP_TIMEOUT_MS
#define STOKER_HTTP_TIMEOUT_MS 10000
#endif

// STOKER_CA_CERT: optional PEM root certificate for the API host. Left
// undefined, HTTPS runs unverified (see ArduinoHttpTransport).

// ArduinoJson pool sizes. Strings are copied into the pool, so these bound
// the raw payload size the bridge accepts.
#ifndef STOKER_CONTROLLER_DOC_BYTES
#define STOKER_CONTROLLER_DOC_BYTES 24576
#endif

#ifndef STOKER_EVENT_DOC_BYTES
#define STOKER_EVENT_DOC_BYTES 32768
#endif

#ifndef STOKER_TRANSLATION_DOC_BYTES
#define STOKER_TRANSLATION_DOC_BYTES 49152
#endif

struct Config {
  std::string username = STOKER_USERNAME;
  std::string api_base = STOKER_API_BASE;
  std::string translation_base = STOKER_TRANSLATION_BASE;
  std::string translation_language = STOKER_TRANSLATION_LANGUAGE;

  uint32_t device_interval_ms = STOKER_DEVICE_INTERVAL_MS;
  uint32_t event_interval_ms = STOKER_EVENT_INTERVAL_MS;
  uint16_t event_count = STOKER_EVENT_COUNT;
  uint32_t event_offset = STOKER_EVENT_OFFSET;

  // Ceiling for the serialized event list published as attributes.
  size_t attribute_byte_budget = STOKER_ATTR_BYTE_BUDGET;
  uint32_t http_timeout_ms = STOKER_HTTP_TIMEOUT_MS;

  size_t controller_doc_bytes = STOKER_CONTROLLER_DOC_BYTES;
  size_t event_doc_bytes = STOKER_EVENT_DOC_BYTES;
  size_t translation_doc_bytes = STOKER_TRANSLATION_DOC_BYTES;
};
