#pragma once

#include <Arduino.h>
#include <Preferences.h>

#include <memory>
#include <string>

#include "api/ApiResult.h"
#include "api/StokerClient.h"
#include "api/StokerTypes.h"
#include "api/TokenGuard.h"
#include "app/BridgeConfig.h"
#include "pipelines/PollFeeds.h"
#include "rtos/TaskRunner.h"
#include "sensors/SensorTable.h"
#include "services/ArduinoHttpTransport.h"
#include "services/MqttPublisher.h"

// Owns one configured account: the HTTP client, its token guard, both poll
// feeds and their tasks. The Arduino loop drives setup, publishing and the
// MQTT command channel; the poll tasks only ever touch the coordinators.
class BridgeRuntime {
public:
  void begin();
  void tick(uint32_t nowMs);

private:
  Config cfg_;
  Preferences prefs_;
  bool prefsReady_ = false;

  std::unique_ptr<ArduinoHttpTransport> transport_;
  std::unique_ptr<StokerClient> client_;
  std::unique_ptr<TokenGuard> guard_;
  TranslationTable translations_;
  bool translationsTried_ = false;

  std::unique_ptr<DeviceCoordinator> device_;
  std::unique_ptr<EventCoordinator> events_;
  TaskRunner::PollJob deviceJob_;
  TaskRunner::PollJob eventJob_;

  MqttPublisher mqtt_;

  SetupStatus setup_ = SetupStatus::pending;
  ApiResult setupError_;
  uint32_t nextSetupMs_ = 0;
  uint32_t nextStatusMs_ = 0;

  DeviceIdentity identity_;
  bool identityKnown_ = false;
  bool discoveryPublished_ = false;
  uint32_t publishedDeviceGen_ = 0;
  uint32_t publishedEventGen_ = 0;

  static BridgeRuntime* self_;
  String pendingCmd_;
  bool hasPendingCmd_ = false;

  static void onCommand(const String& topic, const String& payload);

  void loadAccount();
  void trySetup(uint32_t nowMs);
  void startPolling();
  void stopPolling();
  void publishFresh();
  void checkCredentials();
  void publishStatus();
  void processCommand(const String& payload);
  void changeAccount(const std::string& username);
};
