#include "pipelines/PollFeeds.h"

#include <memory>
#include <utility>

#include "pipelines/EventShaping.h"
#include "services/Log.h"

SetupStatus setupStatusFor(const ApiResult& r) {
  switch (r.error) {
    case ApiError::none:           return SetupStatus::ready;
    case ApiError::auth:
    case ApiError::auth_exhausted: return SetupStatus::need_credentials;
    case ApiError::protocol:
    default:                       return SetupStatus::unreachable;
  }
}

namespace PollFeeds {

DeviceCoordinator::Fetcher deviceFetcher(StokerClient& client, TokenGuard& guard, const Config& cfg) {
  const size_t docBytes = cfg.controller_doc_bytes;
  return [&client, &guard, docBytes](std::shared_ptr<DynamicJsonDocument>& out) -> ApiResult {
    std::shared_ptr<DynamicJsonDocument> doc = std::make_shared<DynamicJsonDocument>(docBytes);
    ApiResult r = guard.withToken([&client, &doc](const std::string& token) {
      return client.fetchControllerData(token, *doc);
    });
    if (!r.ok()) return r;
    // The snapshot is held until the next cycle, release the unused pool.
    doc->shrinkToFit();
    out = doc;
    return r;
  };
}

EventCoordinator::Fetcher eventFetcher(StokerClient& client,
                                       TokenGuard& guard,
                                       const Config& cfg,
                                       const TranslationTable& translations) {
  const Config c = cfg;
  return [&client, &guard, &translations, c](std::shared_ptr<EventBatch>& out) -> ApiResult {
    std::shared_ptr<EventBatch> batch = std::make_shared<EventBatch>(c.event_doc_bytes);
    ApiResult r = guard.withToken([&client, &batch, &c](const std::string& token) {
      return client.fetchEventData(token, c.event_count, c.event_offset, *batch);
    });
    if (!r.ok()) return r;

    if (!translations.empty()) {
      // Annotation adds keys, leave room for them.
      DynamicJsonDocument translated(c.event_doc_bytes + c.event_doc_bytes / 2);
      if (!EventShaping::annotate(batch->eventList(), translations, translated.to<JsonArray>()) ||
          translated.overflowed()) {
        return ApiResult::protocolError("Translated event list exceeds buffer");
      }
      translated.shrinkToFit();
      batch->events = std::move(translated);
    }

    batch->translationLanguage = c.translation_language;
    batch->translationsLoaded = !translations.empty();
    out = batch;
    return r;
  };
}

bool loadTranslations(StokerClient& client, const Config& cfg, TranslationTable& out) {
  DynamicJsonDocument scratch(cfg.translation_doc_bytes);
  TranslationTable table;
  const ApiResult r = client.fetchTranslations(cfg.translation_language, scratch, table);
  if (!r.ok()) {
    Log::debug("APP", "translations '%s' unavailable: %s", cfg.translation_language.c_str(), r.message.c_str());
    out.clear();
    return false;
  }
  Log::info("APP", "loaded %u translations (%s)", (unsigned)table.size(), cfg.translation_language.c_str());
  out.swap(table);
  return true;
}

SetupStatus startDevice(DeviceCoordinator& device) {
  const CycleOutcome outcome = device.refresh();
  if (outcome == CycleOutcome::published) return SetupStatus::ready;
  if (outcome == CycleOutcome::skipped) return SetupStatus::pending;

  const ApiResult err = device.lastError();
  const SetupStatus status = setupStatusFor(err);
  Log::error("APP", "setup failed (%s): %s", toString(status), err.message.c_str());
  return status;
}

bool startEvents(EventCoordinator& events) {
  if (events.refresh() == CycleOutcome::published) return true;
  Log::warn("APP", "event log unavailable at startup: %s", events.lastError().message.c_str());
  return false;
}

} // namespace PollFeeds
