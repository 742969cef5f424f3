#include "pipelines/EventShaping.h"

#include <string>
#include <vector>

namespace EventShaping {

namespace {
// Size of "[" + r0 + "," + ... + r(k-1) + "]" for every k, from one pass of
// per-record measurements.
std::vector<size_t> prefixSizes(JsonArrayConst records) {
  std::vector<size_t> sizes;
  sizes.reserve(records.size() + 1);
  size_t total = 2;
  sizes.push_back(total);
  for (JsonVariantConst r : records) {
    if (sizes.size() > 1) total += 1;
    total += measureJson(r);
    sizes.push_back(total);
  }
  return sizes;
}
} // namespace

bool annotate(JsonArrayConst events, const TranslationTable& table, JsonArray out) {
  for (JsonVariantConst item : events) {
    if (!item.is<JsonObjectConst>()) continue;
    JsonObjectConst src = item.as<JsonObjectConst>();

    JsonObject dst = out.createNestedObject();
    if (dst.isNull() || !dst.set(src)) return false;
    if (table.empty()) continue;

    for (JsonPairConst kv : src) {
      JsonVariantConst v = kv.value();
      if (!v.is<const char*>()) continue;
      TranslationTable::const_iterator it = table.find(v.as<const char*>());
      if (it == table.end()) continue;
      const std::string key = std::string(kv.key().c_str()) + "_translated";
      if (!dst[key].set(it->second)) return false;
    }
  }
  return true;
}

size_t encodedPrefixSize(JsonArrayConst records, size_t count) {
  const std::vector<size_t> sizes = prefixSizes(records);
  if (count >= sizes.size()) count = sizes.size() - 1;
  return sizes[count];
}

Truncation truncateToBudget(JsonArrayConst records, size_t budget) {
  Truncation t;
  const size_t n = records.size();
  if (n == 0) return t;

  const std::vector<size_t> sizes = prefixSizes(records);
  if (sizes[n] <= budget) {
    t.kept = n;
    return t;
  }

  size_t low = 1;
  size_t high = n;
  size_t best = 1;
  while (low <= high) {
    const size_t mid = low + (high - low) / 2;
    if (sizes[mid] <= budget) {
      best = mid;
      low = mid + 1;
    } else {
      high = mid - 1;
    }
  }

  t.kept = best;
  t.truncated = true;
  return t;
}

bool buildAttributes(const EventBatch& batch, size_t budget, std::string& out) {
  JsonArrayConst events = batch.eventList();
  const Truncation t = truncateToBudget(events, budget);

  StaticJsonDocument<384> meta;
  meta["events_total"] = events.size();
  meta["events_truncated"] = t.truncated;
  meta["count"] = batch.count;
  meta["offset"] = batch.offset;
  meta["translation_language"] = batch.translationLanguage;
  meta["translations_loaded"] = batch.translationsLoaded;
  if (meta.overflowed()) return false;

  std::string tail;
  serializeJson(meta, tail);

  out.clear();
  out.reserve(encodedPrefixSize(events, t.kept) + tail.size() + 12);
  out += "{\"events\":[";
  size_t i = 0;
  for (JsonVariantConst r : events) {
    if (i >= t.kept) break;
    if (i++ > 0) out += ',';
    serializeJson(r, out);
  }
  out += "],";
  // tail is "{...}", drop its opening brace.
  out.append(tail, 1, std::string::npos);
  return true;
}

} // namespace EventShaping
