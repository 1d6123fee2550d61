/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_BODY_HPP
#define COLLISION_BODY_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <variant>

namespace DinerEngine {

// Registry a collider is tracked in
enum class CollisionMask : uint8_t {
    Player = 0,
    Terrain = 1,
    Projectile = 2,
    COUNT
};

constexpr const char* maskToString(CollisionMask mask) noexcept {
    switch (mask) {
        case CollisionMask::Player:     return "Player";
        case CollisionMask::Terrain:    return "Terrain";
        case CollisionMask::Projectile: return "Projectile";
        default:                        return "Unknown";
    }
}

struct CircleShape {
    float radius{0.0f};
};

// Axis-aligned box, centered on the owning entity
struct BoxShape {
    Vector2D halfExtents;
};

using ColliderShape = std::variant<CircleShape, BoxShape>;

/**
 * @brief Collision volume carried by an entity.
 *
 * The shape is centered on the entity position. The mask selects the
 * registry list the owning entity is tracked in while it is active.
 */
struct Collider {
    ColliderShape shape{CircleShape{}};
    CollisionMask mask{CollisionMask::Terrain};

    static Collider circle(float radius, CollisionMask mask) {
        return Collider{CircleShape{radius}, mask};
    }

    static Collider box(const Vector2D& halfExtents, CollisionMask mask) {
        return Collider{BoxShape{halfExtents}, mask};
    }

    bool isCircle() const { return std::holds_alternative<CircleShape>(shape); }
    bool isBox() const { return std::holds_alternative<BoxShape>(shape); }
};

} // namespace DinerEngine

#endif // COLLISION_BODY_HPP
