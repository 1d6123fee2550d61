/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/ColliderRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace DinerEngine {

bool ColliderRegistry::add(EntityID id) {
    if (full()) {
        COLLISION_CRITICAL(std::string("Collider registry '") + maskToString(m_mask) +
                           "' is full, cannot add entity " + std::to_string(id));
        return false;
    }

    m_ids[m_size] = id;
    ++m_size;
    return true;
}

bool ColliderRegistry::remove(EntityID id) {
    const auto begin = m_ids.begin();
    const auto end = begin + static_cast<std::ptrdiff_t>(m_size);
    const auto it = std::find(begin, end, id);
    if (it == end) {
        COLLISION_WARN(std::string("Failed to remove entity ") + std::to_string(id) +
                       " from collider registry '" + maskToString(m_mask) + "'");
        return false;
    }

    *it = m_ids[m_size - 1];
    --m_size;
    return true;
}

bool ColliderRegistry::contains(EntityID id) const {
    const auto begin = m_ids.begin();
    const auto end = begin + static_cast<std::ptrdiff_t>(m_size);
    return std::find(begin, end, id) != end;
}

} // namespace DinerEngine
