#include "api/EventExtraction.h"

namespace EventExtraction {

namespace {
const char* const kCandidateFields[] = {"events", "eventdata", "data", "items", "rows", "log"};

bool hasObjectElement(JsonArrayConst arr) {
  for (JsonVariantConst item : arr) {
    if (item.is<JsonObjectConst>()) return true;
  }
  return false;
}

const Strategy kStrategies[] = {
  fromTopLevelArray,
  fromCandidateField,
  fromFirstObjectArray,
};
} // namespace

bool fromTopLevelArray(JsonVariantConst payload, JsonArrayConst& out) {
  if (!payload.is<JsonArrayConst>()) return false;
  out = payload.as<JsonArrayConst>();
  return true;
}

bool fromCandidateField(JsonVariantConst payload, JsonArrayConst& out) {
  if (!payload.is<JsonObjectConst>()) return false;
  JsonObjectConst obj = payload.as<JsonObjectConst>();
  for (const char* field : kCandidateFields) {
    JsonVariantConst value = obj[field];
    if (value.is<JsonArrayConst>()) {
      out = value.as<JsonArrayConst>();
      return true;
    }
  }
  return false;
}

bool fromFirstObjectArray(JsonVariantConst payload, JsonArrayConst& out) {
  if (!payload.is<JsonObjectConst>()) return false;
  for (JsonPairConst kv : payload.as<JsonObjectConst>()) {
    JsonVariantConst value = kv.value();
    if (!value.is<JsonArrayConst>()) continue;
    if (!hasObjectElement(value.as<JsonArrayConst>())) continue;
    out = value.as<JsonArrayConst>();
    return true;
  }
  return false;
}

const Strategy* strategies(size_t& count) {
  count = sizeof(kStrategies) / sizeof(kStrategies[0]);
  return kStrategies;
}

bool extract(JsonVariantConst payload, JsonArray out) {
  JsonArrayConst selected;
  bool found = false;
  for (Strategy s : kStrategies) {
    if (s(payload, selected)) {
      found = true;
      break;
    }
  }
  if (!found) return true;

  for (JsonVariantConst item : selected) {
    if (!item.is<JsonObjectConst>()) continue;
    if (!out.add(item)) return false;
  }
  return true;
}

} // namespace EventExtraction
