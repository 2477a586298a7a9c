/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AreaMapManager.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <filesystem>
#include <format>

namespace Wayfarer {

namespace {
constexpr int RECORD_VERSION = 1;

std::string defaultDataDirectory() {
  char *prefPath = SDL_GetPrefPath("Wayfarer", WAYFARER_APP_NAME);
  if (prefPath == nullptr) {
    SAVE_ERROR(std::format("No writable preference path: {}", SDL_GetError()));
    return "";
  }
  std::string dir = (std::filesystem::path(prefPath) / "maps").string();
  SDL_free(prefPath);
  return dir;
}
} // namespace

AreaMapManager::AreaMapManager(const std::string &dataDirectory)
    : m_dataDirectory(dataDirectory.empty() ? defaultDataDirectory()
                                            : dataDirectory) {
  if (m_dataDirectory.empty()) {
    SAVE_WARN("Map persistence disabled, maps live for this session only");
  } else {
    SAVE_INFO("Map data directory: " + m_dataDirectory);
  }
}

std::string AreaMapManager::pathFor(const AreaId &id) const {
  return (std::filesystem::path(m_dataDirectory) / (id.toKey() + ".json"))
      .string();
}

bool AreaMapManager::ensureDataDirectoryExists() {
  if (m_dataDirectory.empty()) {
    return false;
  }
  try {
    if (!std::filesystem::exists(m_dataDirectory)) {
      if (!std::filesystem::create_directories(m_dataDirectory)) {
        SAVE_ERROR("Failed to create data directory: " + m_dataDirectory);
        return false;
      }
      SAVE_INFO("Created data directory: " + m_dataDirectory);
    }
    return true;
  } catch (const std::exception &e) {
    SAVE_ERROR("Error creating data directory: " + std::string(e.what()));
    return false;
  }
}

bool AreaMapManager::hasRecord(const AreaId &id) const {
  if (m_dataDirectory.empty()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(pathFor(id), ec);
}

AreaMap *AreaMapManager::find(const AreaId &id) {
  auto it = m_maps.find(id);
  return it != m_maps.end() ? it->second.get() : nullptr;
}

const AreaMap *AreaMapManager::find(const AreaId &id) const {
  auto it = m_maps.find(id);
  return it != m_maps.end() ? it->second.get() : nullptr;
}

std::unique_ptr<AreaMap> AreaMapManager::loadFromDisk(const AreaId &id) {
  if (!hasRecord(id)) {
    return nullptr;
  }
  const std::string path = pathFor(id);
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    SAVE_ERROR(std::format("Corrupt map record {}: {}", path,
                           reader.getLastError()));
    return nullptr;
  }

  std::string error;
  auto map = fromJson(reader.getRoot(), error);
  if (!map) {
    SAVE_ERROR(std::format("Unusable map record {}: {}", path, error));
    return nullptr;
  }
  if (!(map->id() == id)) {
    SAVE_ERROR(std::format("Map record {} holds {}, ignoring it", path,
                           map->id().toKey()));
    return nullptr;
  }
  return map;
}

AreaMap &AreaMapManager::loadOrCreate(const AreaId &id,
                                      const std::string &displayName) {
  if (AreaMap *existing = find(id)) {
    existing->setDisplayName(displayName);
    return *existing;
  }

  auto map = loadFromDisk(id);
  if (map) {
    SAVE_INFO(std::format("Loaded {} ({} visits)", id.toKey(),
                          map->visitCount()));
    map->setDisplayName(displayName);
  } else {
    SAVE_INFO(std::format("New area {} '{}'", id.toKey(), displayName));
    map = std::make_unique<AreaMap>(id, displayName);
  }

  AreaMap &ref = *map;
  m_maps.emplace(id, std::move(map));
  return ref;
}

bool AreaMapManager::save(const AreaMap &map) {
  if (!ensureDataDirectoryExists()) {
    return false;
  }
  std::string error;
  if (!JsonWriter::saveToFile(toJson(map), pathFor(map.id()), error)) {
    SAVE_ERROR(std::format("Saving {} failed: {}", map.id().toKey(), error));
    return false;
  }
  SAVE_DEBUG("Saved " + map.id().toKey());
  return true;
}

bool AreaMapManager::saveAll() {
  bool ok = true;
  for (const auto &[id, map] : m_maps) {
    ok = save(*map) && ok;
  }
  return ok;
}

bool AreaMapManager::loadGraph(ConnectivityGraph &graph) {
  if (m_dataDirectory.empty()) {
    return false;
  }
  const std::string path =
      (std::filesystem::path(m_dataDirectory) / CONNECTIONS_FILE).string();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }

  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    SAVE_ERROR(std::format("Corrupt connection file {}: {}", path,
                           reader.getLastError()));
    return false;
  }
  if (!graph.fromJson(reader.getRoot())) {
    SAVE_ERROR("Connection file has an unexpected layout: " + path);
    return false;
  }
  SAVE_INFO(std::format("Loaded {} connections across {} areas",
                        graph.connectionCount(), graph.areaCount()));
  return true;
}

bool AreaMapManager::saveGraph(const ConnectivityGraph &graph) {
  if (!ensureDataDirectoryExists()) {
    return false;
  }
  const std::string path =
      (std::filesystem::path(m_dataDirectory) / CONNECTIONS_FILE).string();
  std::string error;
  if (!JsonWriter::saveToFile(graph.toJson(), path, error)) {
    SAVE_ERROR("Saving connections failed: " + error);
    return false;
  }
  return true;
}

std::vector<AreaSummary> AreaMapManager::summaries() const {
  std::vector<AreaSummary> result;
  result.reserve(m_maps.size());
  for (const auto &[id, map] : m_maps) {
    result.push_back(map->summary());
  }
  return result;
}

JsonValue AreaMapManager::toJson(const AreaMap &map) {
  JsonValue root = JsonValue::object();
  root.set("version", JsonValue(RECORD_VERSION));
  root.set("area_key", JsonValue(map.id().toKey()));
  root.set("group", JsonValue(map.id().group));
  root.set("number", JsonValue(map.id().number));
  root.set("display_name", JsonValue(map.displayName()));
  root.set("visit_count", JsonValue(map.visitCount()));
  root.set("created_at", JsonValue(map.createdAt()));
  root.set("updated_at", JsonValue(map.updatedAt()));

  const GridBounds bounds = map.bounds();
  JsonValue box = JsonValue::object();
  box.set("empty", JsonValue(bounds.empty));
  box.set("min_x", JsonValue(bounds.minX));
  box.set("min_y", JsonValue(bounds.minY));
  box.set("max_x", JsonValue(bounds.maxX));
  box.set("max_y", JsonValue(bounds.maxY));
  root.set("bounds", std::move(box));

  JsonValue terrain = JsonValue::array();
  JsonValue traversal = JsonValue::array();
  if (!bounds.empty) {
    for (int y = bounds.minY; y <= bounds.maxY; ++y) {
      JsonValue labels = JsonValue::array();
      std::string statuses;
      statuses.reserve(static_cast<size_t>(bounds.width()));
      for (int x = bounds.minX; x <= bounds.maxX; ++x) {
        labels.push(JsonValue(map.labelAt({x, y})));
        statuses += toChar(map.statusAt({x, y}));
      }
      terrain.push(std::move(labels));
      traversal.push(JsonValue(std::move(statuses)));
    }
  }
  root.set("terrain", std::move(terrain));
  root.set("traversal", std::move(traversal));
  return root;
}

std::unique_ptr<AreaMap> AreaMapManager::fromJson(const JsonValue &json,
                                                  std::string &error) {
  if (!json.isObject()) {
    error = "record is not an object";
    return nullptr;
  }
  if (json.getInt("version", 0) > RECORD_VERSION) {
    error = std::format("record version {} is newer than supported",
                        json.getInt("version", 0));
    return nullptr;
  }
  if (!json["group"].isNumber() || !json["number"].isNumber()) {
    error = "missing group/number";
    return nullptr;
  }

  AreaId id{json.getInt("group", 0), json.getInt("number", 0)};
  auto map = std::make_unique<AreaMap>(id, json.getString("display_name", ""));

  const JsonValue &box = json["bounds"];
  if (!box.getBool("empty", true)) {
    const auto minX = box["min_x"].tryAsInt();
    const auto minY = box["min_y"].tryAsInt();
    const auto maxX = box["max_x"].tryAsInt();
    const auto maxY = box["max_y"].tryAsInt();
    if (!minX || !minY || !maxX || !maxY) {
      error = "bounds are missing or out of range";
      return nullptr;
    }
    const int64_t wideWidth = int64_t{*maxX} - *minX + 1;
    const int64_t wideHeight = int64_t{*maxY} - *minY + 1;

    const JsonValue &terrain = json["terrain"];
    const JsonValue &traversal = json["traversal"];
    if (wideWidth <= 0 || wideHeight <= 0 ||
        static_cast<uint64_t>(wideHeight) != terrain.size() ||
        static_cast<uint64_t>(wideHeight) != traversal.size() ||
        static_cast<uint64_t>(wideWidth) != terrain[size_t{0}].size()) {
      error = "grid rows do not match bounds";
      return nullptr;
    }
    // Both fit now: the stored rows are this large
    const int width = static_cast<int>(wideWidth);
    const int height = static_cast<int>(wideHeight);

    for (int row = 0; row < height; ++row) {
      const JsonValue &labels = terrain[static_cast<size_t>(row)];
      const std::string statuses =
          traversal[static_cast<size_t>(row)].tryAsString().value_or("");
      if (labels.size() != static_cast<size_t>(width) ||
          statuses.size() != static_cast<size_t>(width)) {
        error = std::format("row {} has the wrong width", row);
        return nullptr;
      }
      for (int col = 0; col < width; ++col) {
        const Coordinate c{*minX + col, *minY + row};
        map->setLabel(c, labels[static_cast<size_t>(col)]
                             .tryAsString()
                             .value_or(UNKNOWN_LABEL));
        TraversalStatus status = traversalFromChar(statuses[static_cast<size_t>(col)]);
        // A saved player marker is stale by definition
        if (status == TraversalStatus::Player) {
          status = TraversalStatus::Walkable;
        }
        if (status != TraversalStatus::Unknown) {
          map->markTraversal(c, status);
        }
      }
    }
  }

  map->restoreMetadata(json.getInt64("created_at", AreaMap::nowSeconds()),
                       json.getInt64("updated_at", AreaMap::nowSeconds()),
                       json.getInt("visit_count", 0));
  return map;
}

} // namespace Wayfarer
