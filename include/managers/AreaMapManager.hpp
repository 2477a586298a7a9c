/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AREA_MAP_MANAGER_HPP
#define AREA_MAP_MANAGER_HPP

#include "utils/JsonReader.hpp"
#include "world/AreaMap.hpp"
#include "world/ConnectivityGraph.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Wayfarer {

/**
 * @brief Owns every AreaMap of the session and mirrors them to disk.
 *
 * Maps are created lazily on first visit and never dropped while the
 * session runs, so references returned by loadOrCreate() stay valid.
 * Each area is stored as area_<group>_<number>.json in the data directory,
 * the connection graph as area_connections.json. All I/O failures are
 * logged and reported through the return value; the in-memory maps stay
 * authoritative.
 */
class AreaMapManager {
public:
  /**
   * @param dataDirectory where map files live; empty selects the per-user
   *        preference directory reported by SDL
   */
  explicit AreaMapManager(const std::string &dataDirectory = "");

  AreaMapManager(const AreaMapManager &) = delete;
  AreaMapManager &operator=(const AreaMapManager &) = delete;

  /**
   * @brief Returns the map for an area, loading it from disk or creating an
   *        empty one the first time the area is requested.
   */
  AreaMap &loadOrCreate(const AreaId &id, const std::string &displayName);

  AreaMap *find(const AreaId &id);
  const AreaMap *find(const AreaId &id) const;

  // True when a saved record for the area exists on disk
  bool hasRecord(const AreaId &id) const;

  bool save(const AreaMap &map);
  bool saveAll();

  bool loadGraph(ConnectivityGraph &graph);
  bool saveGraph(const ConnectivityGraph &graph);

  size_t loadedCount() const { return m_maps.size(); }
  std::vector<AreaSummary> summaries() const;

  const std::string &dataDirectory() const { return m_dataDirectory; }
  bool isPersistenceEnabled() const { return !m_dataDirectory.empty(); }

  static JsonValue toJson(const AreaMap &map);
  static std::unique_ptr<AreaMap> fromJson(const JsonValue &json,
                                           std::string &error);

  static constexpr const char *CONNECTIONS_FILE = "area_connections.json";

private:
  std::string pathFor(const AreaId &id) const;
  bool ensureDataDirectoryExists();
  std::unique_ptr<AreaMap> loadFromDisk(const AreaId &id);

  std::string m_dataDirectory;
  boost::container::flat_map<AreaId, std::unique_ptr<AreaMap>> m_maps;
};

} // namespace Wayfarer

#endif // AREA_MAP_MANAGER_HPP
