#include "services/MqttPublisher.h"

#include <cctype>
#include <cstring>

#include "app/NetConfig.h"
#include "pipelines/EventShaping.h"
#include "services/Log.h"

MqttPublisher* MqttPublisher::self_ = nullptr;

namespace {
inline bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

const char* wlStatusText(wl_status_t st) {
  switch (st) {
    case WL_NO_SHIELD:       return "NO_SHIELD";
    case WL_IDLE_STATUS:     return "IDLE";
    case WL_NO_SSID_AVAIL:   return "NO_SSID";
    case WL_SCAN_COMPLETED:  return "SCAN_COMPLETED";
    case WL_CONNECTED:       return "CONNECTED";
    case WL_CONNECT_FAILED:  return "CONNECT_FAILED";
    case WL_CONNECTION_LOST: return "CONNECTION_LOST";
    case WL_DISCONNECTED:    return "DISCONNECTED";
    default:                 return "UNKNOWN";
  }
}

std::string baseTopic(const char* suffix) {
  std::string t = MQTT_TOPIC_BASE;
  t += '/';
  t += suffix;
  return t;
}

// Discovery object ids only allow [a-zA-Z0-9_-].
std::string objectId(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out += (std::isalnum((unsigned char)c) || c == '_' || c == '-') ? c : '_';
  }
  return out;
}

const char* kOfflinePayload = "{\"state\":\"offline\"}";
} // namespace

MqttPublisher::MqttPublisher()
: mqtt_(wifiClient_) {}

void MqttPublisher::begin(size_t attributeBudget, CommandCallback cb) {
  cmdCb_ = cb;
  self_ = this;
  attributeBudget_ = attributeBudget;

  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(true);
  WiFi.persistent(false);

  mqtt_.setServer(MQTT_BROKER, MQTT_PORT);
  mqtt_.setKeepAlive(MQTT_KEEPALIVE_S);
  mqtt_.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);
  mqtt_.setCallback(onMqttMessage);
  if (!mqtt_.setBufferSize((uint16_t)(attributeBudget + MQTT_EXTRA_BUFFER))) {
    Log::error("MQTT", "could not allocate %u byte buffer", (unsigned)(attributeBudget + MQTT_EXTRA_BUFFER));
  }
}

void MqttPublisher::connectWifi(uint32_t nowMs) {
  const wl_status_t st = WiFi.status();
  if (st != lastWifiStatus_) {
    Log::info("NET", "wifi %s", wlStatusText(st));
    lastWifiStatus_ = st;
  }

  if (st == WL_CONNECTED) return;
  if (!reached(nowMs, nextWifiRetryMs_)) return;

  nextWifiRetryMs_ = nowMs + WIFI_RECONNECT_MS;

  if (strlen(WIFI_SSID) == 0) {
    return;
  }
  WiFi.begin(WIFI_SSID, WIFI_PASSWORD);
}

void MqttPublisher::connectMqtt(uint32_t nowMs) {
  if (WiFi.status() != WL_CONNECTED) return;
  if (mqtt_.connected()) return;
  if (!reached(nowMs, nextMqttRetryMs_)) return;

  nextMqttRetryMs_ = nowMs + MQTT_RECONNECT_MS;

  const std::string statusTopic = baseTopic("status");
  const bool hasAuth = strlen(MQTT_USERNAME) > 0;
  bool connected = false;

  if (hasAuth) {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      MQTT_USERNAME,
      MQTT_PASSWORD,
      statusTopic.c_str(),
      1,
      true,
      kOfflinePayload
    );
  } else {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      statusTopic.c_str(),
      1,
      true,
      kOfflinePayload
    );
  }

  if (!connected) {
    Log::warn("MQTT", "connect failed rc=%d", mqtt_.state());
    return;
  }

  mqtt_.subscribe(baseTopic("cmd").c_str());

  lastConnected_ = true;
  connectedEdge_ = true;
  Log::info("MQTT", "connected to %s:%d", MQTT_BROKER, MQTT_PORT);
}

void MqttPublisher::update(uint32_t nowMs) {
  if (lastConnected_ && !mqtt_.connected()) {
    lastConnected_ = false;
    Log::warn("MQTT", "disconnected");
  }

  connectWifi(nowMs);
  connectMqtt(nowMs);

  if (mqtt_.connected()) {
    mqtt_.loop();
  }
}

bool MqttPublisher::ready() {
  return mqtt_.connected();
}

// True once per (re)connect, so the caller can republish retained state.
bool MqttPublisher::justConnected() {
  const bool edge = connectedEdge_;
  connectedEdge_ = false;
  return edge;
}

bool MqttPublisher::publishText(const std::string& topic, const std::string& payload, bool retained) {
  if (!ready()) return false;
  const bool ok = mqtt_.publish(topic.c_str(),
                                reinterpret_cast<const uint8_t*>(payload.data()),
                                (unsigned int)payload.size(),
                                retained);
  if (!ok) {
    Log::warn("MQTT", "publish to %s failed (%u bytes)", topic.c_str(), (unsigned)payload.size());
  }
  return ok;
}

bool MqttPublisher::publishStatus(SetupStatus setup, const ApiResult& lastError) {
  DynamicJsonDocument doc(512);
  doc["state"] = "online";
  doc["setup"] = toString(setup);
  doc["error"] = toString(lastError.error);
  if (!lastError.ok()) doc["detail"] = lastError.message;
  doc["uptime_ms"] = millis();

  std::string payload;
  serializeJson(doc, payload);
  return publishText(baseTopic("status"), payload, true);
}

bool MqttPublisher::publishSensorConfig(const DeviceIdentity& id,
                                        const char* key,
                                        const char* name,
                                        const char* unit,
                                        const char* deviceClass,
                                        const char* stateClass,
                                        const char* icon,
                                        const std::string& stateTopic,
                                        const std::string& attributesTopic) {
  const std::string node = objectId(std::string(MQTT_TOPIC_BASE) + "_" + id.id);
  const std::string uniqueId = node + "_" + key;

  DynamicJsonDocument doc(1024);
  doc["name"] = name;
  doc["unique_id"] = uniqueId;
  doc["state_topic"] = stateTopic;
  doc["availability_topic"] = baseTopic("status");
  doc["availability_template"] = "{{ value_json.state }}";
  if (unit) doc["unit_of_measurement"] = unit;
  if (deviceClass) doc["device_class"] = deviceClass;
  if (stateClass) doc["state_class"] = stateClass;
  if (icon) doc["icon"] = icon;
  if (!attributesTopic.empty()) doc["json_attributes_topic"] = attributesTopic;

  JsonObject device = doc.createNestedObject("device");
  device["identifiers"][0] = node;
  device["name"] = id.name;
  device["manufacturer"] = id.manufacturer;
  device["model"] = id.model;

  std::string payload;
  serializeJson(doc, payload);

  std::string topic = MQTT_DISCOVERY_PREFIX;
  topic += "/sensor/" + node + "/" + key + "/config";
  return publishText(topic, payload, true);
}

bool MqttPublisher::publishDiscovery(const DeviceIdentity& id) {
  size_t count = 0;
  const SensorDef* defs = SensorTable::defs(count);

  bool ok = true;
  for (size_t i = 0; i < count; ++i) {
    const SensorDef& s = defs[i];
    ok &= publishSensorConfig(id, s.key, s.name, s.unit, s.device_class, s.state_class, s.icon,
                              baseTopic("sensor/") + s.key, std::string());
  }
  ok &= publishSensorConfig(id, "event_log", "Event log", nullptr, nullptr, nullptr, "mdi:clipboard-text-clock",
                            baseTopic("event_log/state"), baseTopic("event_log/attributes"));
  if (ok) Log::info("MQTT", "discovery published for %s", id.name.c_str());
  return ok;
}

bool MqttPublisher::publishSensors(JsonObjectConst snapshot) {
  size_t count = 0;
  const SensorDef* defs = SensorTable::defs(count);

  bool ok = true;
  for (size_t i = 0; i < count; ++i) {
    const SensorReading r = defs[i].value(snapshot);
    ok &= publishText(baseTopic("sensor/") + defs[i].key, SensorTable::format(r), true);
  }
  return ok;
}

bool MqttPublisher::publishEventLog(const EventBatch& batch) {
  std::string payload;
  if (!EventShaping::buildAttributes(batch, attributeBudget_, payload)) {
    Log::warn("MQTT", "event log attributes could not be built");
    return false;
  }

  const std::string count = std::to_string(batch.eventList().size());
  bool ok = publishText(baseTopic("event_log/state"), count, true);
  ok &= publishText(baseTopic("event_log/attributes"), payload, true);
  return ok;
}

bool MqttPublisher::publishAck(const char* cmd, bool ok, const char* detail) {
  DynamicJsonDocument doc(256);
  doc["cmd"] = cmd ? cmd : "";
  doc["ok"] = ok;
  doc["detail"] = detail ? detail : "";
  doc["uptime_ms"] = millis();

  std::string payload;
  serializeJson(doc, payload);
  return publishText(baseTopic("ack"), payload, false);
}

void MqttPublisher::onMqttMessage(char* topic, uint8_t* payload, unsigned int length) {
  if (!self_ || !self_->cmdCb_) return;

  String t = topic ? String(topic) : String("");
  String p;
  p.reserve(length);
  for (unsigned int i = 0; i < length; ++i) {
    p += (char)payload[i];
  }

  self_->cmdCb_(t, p);
}
