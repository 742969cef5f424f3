#include "app/BridgeRuntime.h"

#include <WiFi.h>

#include "api/AccountValidator.h"
#include "app/NetConfig.h"
#include "services/Log.h"

BridgeRuntime* BridgeRuntime::self_ = nullptr;

namespace {
inline bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

constexpr const char* NVS_KEY_USER = "user";
constexpr uint32_t RESTART_DELAY_MS = 500;
} // namespace

void BridgeRuntime::begin() {
  self_ = this;

  prefsReady_ = prefs_.begin(NVS_NAMESPACE, false);
  if (!prefsReady_) Log::warn("APP", "NVS namespace '%s' unavailable", NVS_NAMESPACE);
  loadAccount();

  transport_.reset(new ArduinoHttpTransport(cfg_.http_timeout_ms));
  client_.reset(new StokerClient(*transport_, cfg_.api_base, cfg_.translation_base));

  mqtt_.begin(cfg_.attribute_byte_budget, onCommand);

  if (cfg_.username.empty()) {
    setup_ = SetupStatus::unconfigured;
    Log::warn("APP", "no account configured, send 'account <name>' to %s/cmd", MQTT_TOPIC_BASE);
  }

  Log::info("APP", "bridge ready, device every %lu ms, events every %lu ms",
            (unsigned long)cfg_.device_interval_ms, (unsigned long)cfg_.event_interval_ms);
}

void BridgeRuntime::loadAccount() {
  if (!prefsReady_) return;
  const String stored = prefs_.getString(NVS_KEY_USER, "");
  if (stored.length() > 0) {
    cfg_.username = stored.c_str();
  }
}

void BridgeRuntime::onCommand(const String& topic, const String& payload) {
  (void)topic;
  if (!self_) return;
  // Handled from tick(); the MQTT buffer is reused by the acks.
  self_->pendingCmd_ = payload;
  self_->hasPendingCmd_ = true;
}

void BridgeRuntime::trySetup(uint32_t nowMs) {
  if (setup_ != SetupStatus::pending && setup_ != SetupStatus::unreachable) return;
  if (!reached(nowMs, nextSetupMs_)) return;
  if (WiFi.status() != WL_CONNECTED) return;

  nextSetupMs_ = nowMs + SETUP_RETRY_MS;

  if (!guard_) {
    guard_.reset(new TokenGuard(*client_, cfg_.username));
  }

  if (!translationsTried_) {
    PollFeeds::loadTranslations(*client_, cfg_, translations_);
    translationsTried_ = true;
  }

  if (!device_) {
    device_.reset(new DeviceCoordinator("device", cfg_.device_interval_ms,
                                        PollFeeds::deviceFetcher(*client_, *guard_, cfg_)));
  }

  setup_ = PollFeeds::startDevice(*device_);
  setupError_ = device_->lastError();

  if (setup_ == SetupStatus::unreachable) {
    Log::warn("APP", "service unreachable, retrying in %lu ms", (unsigned long)SETUP_RETRY_MS);
    publishStatus();
    return;
  }
  if (setup_ != SetupStatus::ready) {
    // need_credentials: the account stays stopped until a new one is sent.
    device_->shutdown();
    publishStatus();
    return;
  }

  events_.reset(new EventCoordinator("events", cfg_.event_interval_ms,
                                     PollFeeds::eventFetcher(*client_, *guard_, cfg_, translations_)));
  PollFeeds::startEvents(*events_);

  startPolling();
  publishStatus();
}

void BridgeRuntime::startPolling() {
  DeviceCoordinator* device = device_.get();
  deviceJob_.name = "poll_device";
  deviceJob_.intervalMs = device->intervalMs();
  deviceJob_.cycle = [device]() {
    device->refresh();
    return !device->stopped();
  };

  EventCoordinator* events = events_.get();
  eventJob_.name = "poll_events";
  eventJob_.intervalMs = events->intervalMs();
  eventJob_.cycle = [events]() {
    events->refresh();
    return !events->stopped();
  };

  // Both on core 0 beside the Wi-Fi stack; loop() stays on core 1.
  TaskRunner::start(deviceJob_, 0);
  TaskRunner::start(eventJob_, 0);
}

void BridgeRuntime::stopPolling() {
  if (device_) device_->shutdown();
  if (events_) events_->shutdown();
  TaskRunner::wake(deviceJob_);
  TaskRunner::wake(eventJob_);
}

// A feed that stays rejected after a fresh login ends polling for the
// account; only an `account` command brings it back.
void BridgeRuntime::checkCredentials() {
  if (setup_ != SetupStatus::ready) return;

  ApiResult err;
  if (device_ && device_->credentialsRejected()) {
    err = device_->lastError();
  } else if (events_ && events_->credentialsRejected()) {
    err = events_->lastError();
  } else {
    return;
  }

  Log::error("APP", "credentials rejected (%s), polling stopped", err.message.c_str());
  stopPolling();
  setup_ = SetupStatus::need_credentials;
  setupError_ = err;
  publishStatus();
}

void BridgeRuntime::publishStatus() {
  ApiResult err = setupError_;
  if (setup_ == SetupStatus::ready && device_) err = device_->lastError();
  mqtt_.publishStatus(setup_, err);
}

void BridgeRuntime::publishFresh() {
  if (!mqtt_.ready()) return;

  if (device_ && device_->hasData() && device_->generation() != publishedDeviceGen_) {
    std::shared_ptr<const DynamicJsonDocument> snapshot = device_->data();
    publishedDeviceGen_ = device_->generation();
    const JsonObjectConst data = snapshot->as<JsonObjectConst>();

    if (!identityKnown_) {
      identityKnown_ = SensorTable::deriveIdentity(data, identity_);
      if (!identityKnown_) {
        identity_.id = cfg_.username;
        identity_.name = cfg_.username;
        identity_.manufacturer = "StokerCloud";
        identity_.model = "pellet furnace";
      }
    }
    if (!discoveryPublished_) {
      discoveryPublished_ = mqtt_.publishDiscovery(identity_);
    }
    mqtt_.publishSensors(data);
  }

  if (events_ && events_->hasData() && events_->generation() != publishedEventGen_) {
    std::shared_ptr<const EventBatch> batch = events_->data();
    publishedEventGen_ = events_->generation();
    mqtt_.publishEventLog(*batch);
  }
}

void BridgeRuntime::changeAccount(const std::string& username) {
  AccountInfo info;
  const ApiResult r = AccountValidator::validate(*client_, username, cfg_.controller_doc_bytes, info);
  if (!r.ok()) {
    Log::warn("AUTH", "account rejected (%s): %s", accountErrorText(r), r.message.c_str());
    mqtt_.publishAck("account", false, accountErrorText(r));
    return;
  }

  if (!prefsReady_ || prefs_.putString(NVS_KEY_USER, info.username.c_str()) == 0) {
    Log::error("APP", "could not persist account '%s'", info.username.c_str());
    mqtt_.publishAck("account", false, "storage");
    return;
  }

  mqtt_.publishAck("account", true, info.title.c_str());
  Log::info("APP", "account set to %s, restarting", info.title.c_str());
  stopPolling();
  delay(RESTART_DELAY_MS);
  ESP.restart();
}

void BridgeRuntime::processCommand(const String& payload) {
  String raw = payload;
  raw.trim();

  const int space = raw.indexOf(' ');
  String verb = space < 0 ? raw : raw.substring(0, space);
  String arg = space < 0 ? String("") : raw.substring(space + 1);
  verb.toLowerCase();
  arg.trim();

  if (verb == "account") {
    changeAccount(arg.c_str());
    return;
  }

  if (verb == "refresh") {
    if (setup_ != SetupStatus::ready) {
      mqtt_.publishAck("refresh", false, toString(setup_));
      return;
    }
    TaskRunner::wake(deviceJob_);
    TaskRunner::wake(eventJob_);
    mqtt_.publishAck("refresh", true, "ok");
    return;
  }

  if (verb == "status") {
    publishStatus();
    mqtt_.publishAck("status", true, toString(setup_));
    return;
  }

  Log::warn("MQTT", "unknown command '%s'", raw.c_str());
  mqtt_.publishAck(raw.c_str(), false, "unknown command");
}

void BridgeRuntime::tick(uint32_t nowMs) {
  mqtt_.update(nowMs);

  if (hasPendingCmd_) {
    hasPendingCmd_ = false;
    processCommand(pendingCmd_);
  }

  trySetup(nowMs);

  if (mqtt_.justConnected()) {
    // Retained topics may have been cleared by the broker.
    discoveryPublished_ = false;
    publishedDeviceGen_ = 0;
    publishedEventGen_ = 0;
    publishStatus();
    nextStatusMs_ = nowMs + STATUS_HEARTBEAT_MS;
  }

  publishFresh();
  checkCredentials();

  if (reached(nowMs, nextStatusMs_)) {
    nextStatusMs_ = nowMs + STATUS_HEARTBEAT_MS;
    publishStatus();
  }
}
