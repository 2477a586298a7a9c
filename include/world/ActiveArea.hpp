/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTIVE_AREA_HPP
#define ACTIVE_AREA_HPP

#include "world/AreaMap.hpp"

namespace Wayfarer {

class TraversalUpdater;

/**
 * @brief Non-owning handle to the map of the area the agent is in.
 *
 * Owned by the navigation loop. Only the TraversalUpdater re-points it,
 * which keeps "which map is current" in one place.
 */
class ActiveArea {
public:
    bool isSet() const { return m_map != nullptr; }
    AreaMap* get() const { return m_map; }
    AreaMap& operator*() const { return *m_map; }
    AreaMap* operator->() const { return m_map; }

    AreaId id() const { return m_map ? m_map->id() : AreaId{}; }

private:
    friend class TraversalUpdater;
    void switchTo(AreaMap& map) { m_map = &map; }

    AreaMap* m_map{nullptr};
};

} // namespace Wayfarer

#endif // ACTIVE_AREA_HPP
