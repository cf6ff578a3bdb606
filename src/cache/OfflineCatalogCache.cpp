#include "OfflineCatalogCache.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include "../util/json/JsonValidation.h"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace Marquee {
namespace Cache {

// ==============================================================================
OfflineCatalogCache::Config OfflineCatalogCache::Config::inDirectory(const juce::File &directory) {
  Config cfg;
  cfg.storageFile = directory.getChildFile(Constants::Cache::CACHE_FILE_NAME);
  cfg.maxEntries = Constants::Cache::MAX_ENTRIES;
  cfg.maxCategories = Constants::Cache::MAX_CATEGORIES;
  cfg.maxPersistedAge = juce::RelativeTime::seconds(Constants::Cache::MAX_PERSISTED_AGE_SECONDS);
  return cfg;
}

OfflineCatalogCache::Config OfflineCatalogCache::Config::defaultLocation() {
  auto appDataDir = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory);
  return inDirectory(appDataDir.getChildFile("Marquee").getChildFile("cache"));
}

OfflineCatalogCache::Config OfflineCatalogCache::Config::inMemory() {
  Config cfg = inDirectory({});
  cfg.storageFile = juce::File();
  return cfg;
}

// ==============================================================================
OfflineCatalogCache::OfflineCatalogCache(const Config &cfg, const Util::Clock &timeSource)
    : config(cfg), clock(timeSource) {
  loadFromDisk();
}

// ==============================================================================
void OfflineCatalogCache::put(const CatalogItem &item, juce::RelativeTime ttl) {
  if (ttl <= juce::RelativeTime()) {
    Log::warn("OfflineCatalogCache: ignoring put of item " + juce::String(item.id) + " with non-positive ttl");
    return;
  }

  juce::ScopedWriteLock sl(lock);
  putLocked(item, clock.now(), ttl);
  trimToCapacityLocked();
  commitLocked();
}

std::optional<CatalogItem> OfflineCatalogCache::get(int itemId) const {
  juce::ScopedReadLock sl(lock);

  auto found = entries.find(itemId);
  if (found == entries.end() || !found->second.isValidAt(clock.now()))
    return std::nullopt;

  return found->second.item;
}

void OfflineCatalogCache::putCategory(const juce::String &name, const std::vector<CatalogItem> &items,
                                      juce::RelativeTime ttl) {
  if (ttl <= juce::RelativeTime()) {
    Log::warn("OfflineCatalogCache: ignoring category '" + name + "' with non-positive ttl");
    return;
  }

  juce::ScopedWriteLock sl(lock);
  const auto now = clock.now();

  std::vector<int> ids;
  ids.reserve(items.size());

  for (const auto &item : items) {
    putLocked(item, now, ttl);
    if (std::find(ids.begin(), ids.end(), item.id) == ids.end())
      ids.push_back(item.id);
  }

  if (ids.empty()) {
    categories.erase(name);
  } else {
    auto &index = categories[name];
    index.ids = std::move(ids);
    index.updatedAt = now;
  }

  trimToCapacityLocked();
  trimCategoriesLocked(name);

  Log::debug("OfflineCatalogCache: stored " + juce::String(static_cast<int>(items.size())) + " items under '" +
             name + "'");

  commitLocked();
}

std::vector<CatalogItem> OfflineCatalogCache::getCategory(const juce::String &name) const {
  juce::ScopedReadLock sl(lock);

  std::vector<CatalogItem> items;
  auto index = categories.find(name);
  if (index == categories.end())
    return items;

  const auto now = clock.now();
  items.reserve(index->second.ids.size());

  for (int id : index->second.ids) {
    auto found = entries.find(id);
    if (found != entries.end() && found->second.isValidAt(now))
      items.push_back(found->second.item);
  }

  return items;
}

bool OfflineCatalogCache::hasValid(const juce::String &name) const {
  juce::ScopedReadLock sl(lock);

  auto index = categories.find(name);
  if (index == categories.end() || index->second.ids.empty())
    return false;

  const auto now = clock.now();
  size_t validCount = 0;

  for (int id : index->second.ids) {
    auto found = entries.find(id);
    if (found != entries.end() && found->second.isValidAt(now))
      ++validCount;
  }

  return validCount * 2 > index->second.ids.size();
}

int OfflineCatalogCache::evictExpired() {
  juce::ScopedWriteLock sl(lock);
  const auto now = clock.now();

  int removed = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    if (!it->second.isValidAt(now)) {
      it = entries.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  bool indicesChanged = false;
  for (auto &category : categories) {
    auto &ids = category.second.ids;
    auto dangling = std::remove_if(ids.begin(), ids.end(), [this](int id) { return entries.count(id) == 0; });
    if (dangling != ids.end()) {
      ids.erase(dangling, ids.end());
      indicesChanged = true;
    }
  }
  dropEmptyIndicesLocked();

  if (removed > 0 || indicesChanged) {
    Log::info("OfflineCatalogCache: evicted " + juce::String(removed) + " expired entries");
    commitLocked();
  }

  return removed;
}

void OfflineCatalogCache::remove(int itemId) {
  juce::ScopedWriteLock sl(lock);

  if (entries.erase(itemId) == 0)
    return;

  removeFromIndicesLocked(itemId);
  commitLocked();
}

void OfflineCatalogCache::clear() {
  juce::ScopedWriteLock sl(lock);

  entries.clear();
  categories.clear();

  Log::info("OfflineCatalogCache: cleared");
  commitLocked();
}

// ==============================================================================
OfflineCatalogCache::Stats OfflineCatalogCache::getStats() const {
  juce::ScopedReadLock sl(lock);
  const auto now = clock.now();

  Stats stats;
  stats.totalItems = entries.size();

  for (const auto &entry : entries) {
    if (entry.second.isValidAt(now))
      ++stats.validItems;
  }
  stats.expiredItems = stats.totalItems - stats.validItems;

  for (const auto &category : categories)
    stats.categorySizes[category.first] = category.second.ids.size();

  stats.revision = revision;
  return stats;
}

juce::StringArray OfflineCatalogCache::getCategoryNames() const {
  juce::ScopedReadLock sl(lock);

  juce::StringArray names;
  for (const auto &category : categories)
    names.add(category.first);
  return names;
}

// ==============================================================================
void OfflineCatalogCache::putLocked(const CatalogItem &item, juce::Time now, juce::RelativeTime ttl) {
  CachedEntry entry;
  entry.item = item;
  entry.cachedAt = now;
  entry.expiresAt = now + ttl;
  entries[item.id] = std::move(entry);
}

void OfflineCatalogCache::removeFromIndicesLocked(int itemId) {
  for (auto &category : categories) {
    auto &ids = category.second.ids;
    ids.erase(std::remove(ids.begin(), ids.end(), itemId), ids.end());
  }
  dropEmptyIndicesLocked();
}

void OfflineCatalogCache::dropEmptyIndicesLocked() {
  for (auto it = categories.begin(); it != categories.end();) {
    if (it->second.ids.empty())
      it = categories.erase(it);
    else
      ++it;
  }
}

void OfflineCatalogCache::trimCategoriesLocked(const juce::String &keep) {
  if (config.maxCategories == 0)
    return;

  while (categories.size() > config.maxCategories) {
    auto oldest = categories.end();
    for (auto it = categories.begin(); it != categories.end(); ++it) {
      if (it->first != keep && (oldest == categories.end() || it->second.updatedAt < oldest->second.updatedAt))
        oldest = it;
    }

    if (oldest == categories.end())
      return;

    Log::debug("OfflineCatalogCache: dropping least recently written index '" + oldest->first + "'");
    categories.erase(oldest);
  }
}

void OfflineCatalogCache::commitLocked() {
  ++revision;
  persistLocked().logIfError("OfflineCatalogCache: write-through failed");
}

void OfflineCatalogCache::trimToCapacityLocked() {
  if (config.maxEntries == 0 || entries.size() <= config.maxEntries)
    return;

  std::vector<std::pair<juce::Time, int>> byAge;
  byAge.reserve(entries.size());
  for (const auto &entry : entries)
    byAge.emplace_back(entry.second.cachedAt, entry.first);

  std::sort(byAge.begin(), byAge.end());

  const auto excess = entries.size() - config.maxEntries;
  for (size_t i = 0; i < excess; ++i) {
    entries.erase(byAge[i].second);
    removeFromIndicesLocked(byAge[i].second);
  }

  Log::debug("OfflineCatalogCache: trimmed " + juce::String(static_cast<int>(excess)) + " oldest entries");
}

// ==============================================================================
// Persistence
//
// {
//   "version": 1,
//   "entries": [{"item": {...}, "cached_at": ms, "expires_at": ms}, ...],
//   "categories": [{"name": "popular", "updated_at": ms, "ids": [1, 2, 3]}, ...]
// }

Outcome<void> OfflineCatalogCache::persistLocked() const {
  if (config.storageFile == juce::File())
    return Outcome<void>::ok();

  nlohmann::json blob;
  blob["version"] = Constants::Cache::CACHE_FORMAT_VERSION;

  auto entryArray = nlohmann::json::array();
  for (const auto &entry : entries) {
    entryArray.push_back({
        {"item", entry.second.item},
        {"cached_at", Json::fromTime(entry.second.cachedAt)},
        {"expires_at", Json::fromTime(entry.second.expiresAt)},
    });
  }
  blob["entries"] = std::move(entryArray);

  auto categoryArray = nlohmann::json::array();
  for (const auto &category : categories) {
    categoryArray.push_back({{"name", Json::fromJuceString(category.first)},
                             {"updated_at", Json::fromTime(category.second.updatedAt)},
                             {"ids", category.second.ids}});
  }
  blob["categories"] = std::move(categoryArray);

  auto directory = config.storageFile.getParentDirectory();
  if (!directory.exists()) {
    auto created = directory.createDirectory();
    if (created.failed())
      return Outcome<void>::error("Cannot create " + directory.getFullPathName() + ": " + created.getErrorMessage());
  }

  juce::TemporaryFile temp(config.storageFile);
  if (!temp.getFile().replaceWithText(juce::String(blob.dump())))
    return Outcome<void>::error("Cannot write " + temp.getFile().getFullPathName());

  if (!temp.overwriteTargetFileWithTemporary())
    return Outcome<void>::error("Cannot replace " + config.storageFile.getFullPathName());

  return Outcome<void>::ok();
}

void OfflineCatalogCache::loadFromDisk() {
  if (config.storageFile == juce::File())
    return;

  if (!config.storageFile.existsAsFile()) {
    Log::info("OfflineCatalogCache: no cache file at " + config.storageFile.getFullPathName() + ", starting empty");
    return;
  }

  std::map<int, CachedEntry> loadedEntries;
  std::map<juce::String, CategoryIndex> loadedCategories;

  try {
    auto blob = nlohmann::json::parse(config.storageFile.loadFileAsString().toStdString());

    const auto version = Json::optional<int>(blob, "version", 0);
    if (version != Constants::Cache::CACHE_FORMAT_VERSION)
      throw Json::ValidationError("version", "unsupported cache format " + std::to_string(version));

    const auto cutoff = clock.now() - config.maxPersistedAge;

    for (const auto &element : Json::require<nlohmann::json>(blob, "entries")) {
      CachedEntry entry;
      entry.item = Json::require<CatalogItem>(element, "item");
      entry.cachedAt = Json::toTime(Json::require<juce::int64>(element, "cached_at"));
      entry.expiresAt = Json::toTime(Json::require<juce::int64>(element, "expires_at"));

      if (!entry.item.isValid() || entry.expiresAt <= entry.cachedAt || entry.cachedAt < cutoff)
        continue;

      loadedEntries[entry.item.id] = std::move(entry);
    }

    for (const auto &element : Json::require<nlohmann::json>(blob, "categories")) {
      auto name = Json::toJuceString(Json::require<std::string>(element, "name"));

      CategoryIndex index;
      index.updatedAt = Json::toTime(Json::optional<juce::int64>(element, "updated_at", 0));
      for (int id : Json::require<std::vector<int>>(element, "ids")) {
        if (loadedEntries.count(id) > 0)
          index.ids.push_back(id);
      }

      if (!index.ids.empty())
        loadedCategories[name] = std::move(index);
    }
  } catch (const std::exception &e) {
    Log::warn("OfflineCatalogCache: discarding unreadable cache file " + config.storageFile.getFullPathName() +
              " - " + juce::String(e.what()));
    return;
  }

  juce::ScopedWriteLock sl(lock);
  entries = std::move(loadedEntries);
  categories = std::move(loadedCategories);
  trimToCapacityLocked();
  trimCategoriesLocked({});

  Log::info("OfflineCatalogCache: loaded " + juce::String(static_cast<int>(entries.size())) + " entries in " +
            juce::String(static_cast<int>(categories.size())) + " categories");
}

} // namespace Cache
} // namespace Marquee
