#include "sensors/SensorTable.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace SensorTable {

namespace {
constexpr const char* kCelsius = "\xC2\xB0" "C";
constexpr const char* kPercent = "%";
constexpr const char* kKiloWatt = "kW";
constexpr const char* kKilogram = "kg";
constexpr const char* kGram = "g";
constexpr const char* kMetersPerSecond = "m/s";

constexpr const char* kMeasurement = "measurement";
constexpr const char* kTotalIncreasing = "total_increasing";

std::string idText(JsonVariantConst v) {
  if (v.is<const char*>()) return v.as<const char*>();
  std::string out;
  serializeJson(v, out);
  return out;
}

// Python-style truthiness for the identity fields.
bool truthyText(JsonVariantConst v, std::string& out) {
  if (v.isNull()) return false;
  if (v.is<bool>()) {
    if (!v.as<bool>()) return false;
    out = "True";
    return true;
  }
  if (v.is<const char*>()) {
    out = v.as<const char*>();
    return !out.empty();
  }
  if (v.is<double>() && v.as<double>() == 0.0) return false;
  out.clear();
  serializeJson(v, out);
  return true;
}

const SensorDef kSensors[] = {
  // Weather panel
  {"weather_city", "Weather city", nullptr, nullptr, nullptr, "mdi:city",
   [](JsonObjectConst d) { return asRaw(listValue(d, "weatherdata", "weather-city")); }},
  {"outdoor_temperature", "Outdoor temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "weatherdata", "1")); }},
  {"wind_speed", "Wind speed", kMetersPerSecond, "wind_speed", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "weatherdata", "2")); }},
  {"wind_direction", "Wind direction", nullptr, nullptr, nullptr, "mdi:compass",
   [](JsonObjectConst d) { return asRaw(listValue(d, "weatherdata", "3")); }},
  {"clouds", "Clouds", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "weatherdata", "9")); }},

  // Boiler panel
  {"chimney_smoke_temperature", "Chimney/smoke temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "3")); }},
  {"power_output", "Power output", kKiloWatt, "power", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "5")); }},
  {"power_percentage", "Power (%)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "4")); }},
  {"photo_sensor_light", "Photo sensor (light)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "6")); }},
  {"oxygen", "Oxygen (%)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "12")); }},
  {"oxygen_reference", "Oxygen reference", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "refoxygen")); }},
  {"o2_low_regulation", "O2 low regulation (%)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "14")); }},
  {"o2_mid_regulation", "O2 mid regulation (%)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "15")); }},
  {"o2_high_regulation", "O2 high regulation (%)", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "16")); }},
  {"online_time", "Online time", kPercent, nullptr, kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "boilerdata", "9")); }},

  // Front readout
  {"boiler_temperature", "Boiler temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "boilertemp")); }},
  {"wanted_boiler_temperature", "Wanted boiler temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "-wantedboilertemp")); }},

  // Output icons
  {"pump_output", "Pump output", nullptr, nullptr, nullptr, "mdi:pump",
   [](JsonObjectConst d) { return asRaw(leftOutputValue(d, "output-2")); }},
  {"compressor", "Compressor", nullptr, nullptr, kMeasurement, "mdi:air-compressor",
   [](JsonObjectConst d) { return asFloat(leftOutputValue(d, "output-7")); }},

  // Hopper panel
  {"hopper_content", "Hopper content", kKilogram, "weight", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "hoppercontent")); }},
  {"auger_capacity", "Auger capacity", kGram, "weight", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "hopperdata", "2")); }},
  {"consumption_last_24h", "Consumption last 24 h", kKilogram, "weight", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "hopperdata", "3")); }},
  {"consumption_total", "Consumption total", kKilogram, "weight", kTotalIncreasing, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "hopperdata", "4")); }},
  {"power_10pct", "Power 10%", kKiloWatt, "power", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "hopperdata", "7")); }},
  {"power_100pct", "Power 100%", kKiloWatt, "power", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "hopperdata", "8")); }},

  // DHW panel
  {"dhw_temperature", "DHW temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "dhw")); }},
  {"wanted_dhw_temperature", "Wanted DHW temperature", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(frontValue(d, "dhwwanted")); }},
  {"dhw_difference", "DHW difference", kCelsius, "temperature", kMeasurement, nullptr,
   [](JsonObjectConst d) { return asFloat(listValue(d, "dhwdata", "3")); }},
};
} // namespace

const SensorDef* defs(size_t& count) {
  count = sizeof(kSensors) / sizeof(kSensors[0]);
  return kSensors;
}

const SensorDef* find(const char* key) {
  if (!key) return nullptr;
  for (const SensorDef& s : kSensors) {
    if (std::strcmp(s.key, key) == 0) return &s;
  }
  return nullptr;
}

JsonObjectConst findId(JsonVariantConst items, const char* wantedId) {
  if (!items.is<JsonArrayConst>()) return JsonObjectConst();
  for (JsonVariantConst item : items.as<JsonArrayConst>()) {
    if (!item.is<JsonObjectConst>()) continue;
    if (idText(item["id"]) == wantedId) return item.as<JsonObjectConst>();
  }
  return JsonObjectConst();
}

JsonVariantConst listValue(JsonObjectConst data, const char* section, const char* wantedId) {
  JsonObjectConst item = findId(data[section], wantedId);
  if (item.isNull() || item.size() == 0) return JsonVariantConst();
  return item["value"];
}

JsonVariantConst frontValue(JsonObjectConst data, const char* frontId) {
  return listValue(data, "frontdata", frontId);
}

JsonVariantConst leftOutputValue(JsonObjectConst data, const char* outputId) {
  JsonVariantConst left = data["leftoutput"];
  if (!left.is<JsonObjectConst>()) return JsonVariantConst();
  JsonVariantConst output = left[outputId];
  if (!output.is<JsonObjectConst>()) return JsonVariantConst();
  return output["val"];
}

SensorReading asFloat(JsonVariantConst v) {
  if (v.isNull()) return SensorReading::none();
  if (v.is<bool>()) return SensorReading::fromNumber(v.as<bool>() ? 1.0 : 0.0);
  if (v.is<double>()) return SensorReading::fromNumber(v.as<double>());
  if (!v.is<const char*>()) return SensorReading::none();

  const char* s = v.as<const char*>();
  if (*s == '\0' || std::strcmp(s, "N/A") == 0) return SensorReading::none();

  char* end = nullptr;
  const double parsed = std::strtod(s, &end);
  if (end == s) return SensorReading::none();
  while (*end && std::isspace((unsigned char)*end)) ++end;
  if (*end != '\0') return SensorReading::none();
  return SensorReading::fromNumber(parsed);
}

SensorReading asRaw(JsonVariantConst v) {
  if (v.isNull()) return SensorReading::none();
  if (v.is<bool>()) return SensorReading::fromText(v.as<bool>() ? "True" : "False");
  if (v.is<double>()) return SensorReading::fromNumber(v.as<double>());
  if (v.is<const char*>()) return SensorReading::fromText(v.as<const char*>());
  std::string text;
  serializeJson(v, text);
  return SensorReading::fromText(text);
}

std::string format(const SensorReading& r) {
  if (!r.present) return "";
  if (!r.numeric) return r.text;
  if (std::isnan(r.number) || std::isinf(r.number)) return "";

  char buf[32];
  if (r.number == std::floor(r.number) && std::fabs(r.number) < 1e15) {
    std::snprintf(buf, sizeof(buf), "%.0f", r.number);
    return buf;
  }

  std::snprintf(buf, sizeof(buf), "%.6f", r.number);
  size_t len = std::strlen(buf);
  while (len > 0 && buf[len - 1] == '0') buf[--len] = '\0';
  if (len > 0 && buf[len - 1] == '.') buf[--len] = '\0';
  return buf;
}

bool deriveIdentity(JsonObjectConst data, DeviceIdentity& out) {
  if (data.isNull()) return false;

  std::string serial;
  std::string alias;
  const bool hasSerial = truthyText(data["serial"], serial);
  const bool hasAlias = truthyText(data["alias"], alias);
  if (!hasSerial && !hasAlias) return false;

  DeviceIdentity id;
  id.id = hasSerial ? serial : alias;
  id.name = (hasSerial && hasAlias) ? serial + " / " + alias : id.id;
  id.manufacturer = "StokerCloud";
  std::string model;
  id.model = truthyText(data["model"], model) ? model : "pellet furnace";
  out = id;
  return true;
}

} // namespace SensorTable
