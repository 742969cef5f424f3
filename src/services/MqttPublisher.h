#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <PubSubClient.h>

#include <string>

#include <ArduinoJson.h>

#include "api/ApiResult.h"
#include "api/StokerTypes.h"
#include "pipelines/PollFeeds.h"
#include "sensors/SensorTable.h"

// Presentation side of the bridge: Wi-Fi station, MQTT session and the
// topics under MQTT_TOPIC_BASE (status, sensor/<key>, event_log/*, ack) plus
// Home Assistant discovery configs. Used from the Arduino loop only.
class MqttPublisher {
public:
  using CommandCallback = void (*)(const String& topic, const String& payload);

  MqttPublisher();

  void begin(size_t attributeBudget, CommandCallback cb = nullptr);
  void update(uint32_t nowMs);

  bool ready();
  bool justConnected();

  bool publishStatus(SetupStatus setup, const ApiResult& lastError);
  bool publishDiscovery(const DeviceIdentity& id);
  bool publishSensors(JsonObjectConst snapshot);
  bool publishEventLog(const EventBatch& batch);
  bool publishAck(const char* cmd, bool ok, const char* detail);

private:
  static MqttPublisher* self_;

  WiFiClient wifiClient_;
  PubSubClient mqtt_;
  CommandCallback cmdCb_ = nullptr;
  size_t attributeBudget_ = 0;
  bool lastConnected_ = false;
  bool connectedEdge_ = false;
  wl_status_t lastWifiStatus_ = WL_IDLE_STATUS;

  uint32_t nextWifiRetryMs_ = 0;
  uint32_t nextMqttRetryMs_ = 0;

  static void onMqttMessage(char* topic, uint8_t* payload, unsigned int length);
  void connectWifi(uint32_t nowMs);
  void connectMqtt(uint32_t nowMs);

  bool publishText(const std::string& topic, const std::string& payload, bool retained);
  bool publishSensorConfig(const DeviceIdentity& id,
                           const char* key,
                           const char* name,
                           const char* unit,
                           const char* deviceClass,
                           const char* stateClass,
                           const char* icon,
                           const std::string& stateTopic,
                           const std::string& attributesTopic);
};
