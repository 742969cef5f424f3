#pragma once

#include <stddef.h>

#include <string>

#include <ArduinoJson.h>

#include "api/StokerTypes.h"

namespace EventShaping {

// Copies every event object into `out`; for each string field whose value is
// a translation key, the copy also gets "<field>_translated". Records are
// copied unchanged when the table is empty. Returns false when `out` ran out
// of memory.
bool annotate(JsonArrayConst events, const TranslationTable& table, JsonArray out);

struct Truncation {
  size_t kept = 0;
  bool truncated = false;
};

// Compact JSON size of records[0:count].
size_t encodedPrefixSize(JsonArrayConst records, size_t count);

// Longest prefix whose compact JSON encoding fits in `budget` bytes, found by
// binary search over [1, size]. Never drops below one record: a lone record
// that is already too big is kept and reported as truncated.
Truncation truncateToBudget(JsonArrayConst records, size_t budget);

// Serialized attributes of the event-log sensor: events (byte-bounded),
// events_total, events_truncated, count, offset, translation_language and
// translations_loaded. The kept records are written straight from the batch,
// so no second document of record size is needed.
bool buildAttributes(const EventBatch& batch, size_t budget, std::string& out);

} // namespace EventShaping
