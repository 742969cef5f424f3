#pragma once

#include <stddef.h>

#include <ArduinoJson.h>

// Locates the event list inside a loosely structured geteventdata payload.
// Strategies are tried in order; the first one that yields an array wins.
namespace EventExtraction {

using Strategy = bool (*)(JsonVariantConst payload, JsonArrayConst& out);

// The payload itself is an array.
bool fromTopLevelArray(JsonVariantConst payload, JsonArrayConst& out);
// First of events/eventdata/data/items/rows/log whose value is an array.
bool fromCandidateField(JsonVariantConst payload, JsonArrayConst& out);
// First object value that is an array holding at least one object.
bool fromFirstObjectArray(JsonVariantConst payload, JsonArrayConst& out);

const Strategy* strategies(size_t& count);

// Copies the object elements of the selected array into `out` and drops
// everything else. Leaves `out` empty when no strategy matches.
// Returns false only when `out` ran out of memory.
bool extract(JsonVariantConst payload, JsonArray out);

} // namespace EventExtraction
