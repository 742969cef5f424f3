#pragma once

#include <stddef.h>

#include <string>

#include <ArduinoJson.h>

// Value of one display sensor. `present == false` means "unknown".
struct SensorReading {
  bool present = false;
  bool numeric = false;
  double number = 0.0;
  std::string text;

  static SensorReading none() { return SensorReading(); }
  static SensorReading fromNumber(double v) {
    SensorReading r;
    r.present = true;
    r.numeric = true;
    r.number = v;
    return r;
  }
  static SensorReading fromText(const std::string& v) {
    SensorReading r;
    r.present = true;
    r.text = v;
    return r;
  }
};

using SensorExtractor = SensorReading (*)(JsonObjectConst data);

struct SensorDef {
  const char* key;
  const char* name;
  const char* unit;          // nullptr: no unit
  const char* device_class;  // nullptr: none
  const char* state_class;   // nullptr: not a statistic
  const char* icon;          // nullptr: default
  SensorExtractor value;
};

struct DeviceIdentity {
  std::string id;
  std::string name;
  std::string manufacturer;
  std::string model;
};

namespace SensorTable {

const SensorDef* defs(size_t& count);
const SensorDef* find(const char* key);

// Text for a state topic: "" when not present, shortest round-trip-ish
// decimal for numbers.
std::string format(const SensorReading& r);

// (serial, alias) when both are set, else whichever is set. Returns false
// when the snapshot has neither.
bool deriveIdentity(JsonObjectConst data, DeviceIdentity& out);

// Lookup helpers shared by the table rows.
JsonObjectConst findId(JsonVariantConst items, const char* wantedId);
JsonVariantConst listValue(JsonObjectConst data, const char* section, const char* wantedId);
JsonVariantConst frontValue(JsonObjectConst data, const char* frontId);
JsonVariantConst leftOutputValue(JsonObjectConst data, const char* outputId);
SensorReading asFloat(JsonVariantConst v);
SensorReading asRaw(JsonVariantConst v);

} // namespace SensorTable
