/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_INFO_HPP
#define COLLISION_INFO_HPP

#include "utils/Vector2D.hpp"

namespace DinerEngine {

/**
 * @brief Narrow-phase result for an ordered pair (a, b).
 *
 * `normal` is a unit vector pointing from b toward a; moving a by
 * normal * penetration separates the pair.
 */
struct Contact {
    Vector2D normal{0.0f, 0.0f};
    float penetration{0.0f};
};

} // namespace DinerEngine

#endif // COLLISION_INFO_HPP
