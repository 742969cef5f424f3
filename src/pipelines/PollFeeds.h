#pragma once

#include <stdint.h>

#include <ArduinoJson.h>

#include "api/ApiResult.h"
#include "api/StokerClient.h"
#include "api/StokerTypes.h"
#include "api/TokenGuard.h"
#include "app/BridgeConfig.h"
#include "pipelines/PollCoordinator.h"

using DeviceCoordinator = PollCoordinator<DynamicJsonDocument>;
using EventCoordinator = PollCoordinator<EventBatch>;

enum class SetupStatus : uint8_t {
  pending,
  ready,
  need_credentials,  // account rejected, needs a new username
  unreachable,       // service or network failure, retry later
  unconfigured,      // no username yet
};

static inline const char* toString(SetupStatus s) {
  switch (s) {
    case SetupStatus::pending:          return "pending";
    case SetupStatus::ready:            return "ready";
    case SetupStatus::need_credentials: return "need_credentials";
    case SetupStatus::unreachable:      return "unreachable";
    case SetupStatus::unconfigured:     return "unconfigured";
    default:                            return "unknown";
  }
}

// Maps a failed first device cycle to what the operator has to do about it.
SetupStatus setupStatusFor(const ApiResult& r);

namespace PollFeeds {

// Device state: withToken(fetchControllerData) into a fresh document.
DeviceCoordinator::Fetcher deviceFetcher(StokerClient& client, TokenGuard& guard, const Config& cfg);

// Event log: withToken(fetchEventData), translation annotation, request
// echoes. `translations` must outlive the coordinator and stay unchanged
// once polling has started.
EventCoordinator::Fetcher eventFetcher(StokerClient& client,
                                       TokenGuard& guard,
                                       const Config& cfg,
                                       const TranslationTable& translations);

// Best effort: on failure logs at debug level and leaves `out` empty.
bool loadTranslations(StokerClient& client, const Config& cfg, TranslationTable& out);

// First device cycle. Anything but `ready` means nothing can be served yet.
SetupStatus startDevice(DeviceCoordinator& device);

// First event cycle. A failure only means "no event data yet".
bool startEvents(EventCoordinator& events);

} // namespace PollFeeds
