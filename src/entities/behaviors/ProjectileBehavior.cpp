/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/behaviors/ProjectileBehavior.hpp"
#include "collisions/NarrowPhase.hpp"
#include "core/GameWorld.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <array>
#include <string>

namespace DinerEngine {
namespace ProjectileBehavior {

namespace {

constexpr std::array<CollisionMask, 2> TARGET_MASKS{CollisionMask::Player, CollisionMask::Terrain};

bool isOutOfBounds(const Entity& projectile, const GameWorld& world) {
    const float margin = world.getTuning().projectileMargin;
    const float x = projectile.position.getX();
    const float y = projectile.position.getY();
    return x < -margin || x > world.getWidth() + margin ||
           y < -margin || y > world.getHeight() + margin;
}

} // namespace

void update(Entity& entity, GameWorld& world, float delta) {
    ProjectileData& projectile = *entity.projectile;
    EntityDataManager& entities = world.getEntities();

    projectile.lifetime += delta;
    entity.position += entity.velocity * delta;

    if (isOutOfBounds(entity, world) ||
        projectile.lifetime > world.getTuning().projectileMaxLifetime) {
        PROJECTILE_DEBUG("Projectile " + std::to_string(entity.id) + " expired");
        entities.destroyEntity(entity.id);
        return;
    }

    for (CollisionMask mask : TARGET_MASKS) {
        for (EntityID targetId : world.getCollisions().getColliders(mask)) {
            if (targetId == projectile.owner) {
                continue;
            }

            Entity* target = entities.get(targetId);
            if (!target) {
                PROJECTILE_WARN("Registered collider " + std::to_string(targetId) + " is dead");
                continue;
            }

            if (!NarrowPhase::testCollision(entity, *target)) {
                continue;
            }

            if (target->health > 0) {
                --target->health;
                world.playSound(SoundCue::Hit);
                PROJECTILE_DEBUG(std::string("Hit ") + EntityTraits::kindToString(target->kind) +
                                 " " + std::to_string(targetId) + ", health now " +
                                 std::to_string(target->health));
            }
            entities.destroyEntity(entity.id);
            return;
        }
    }
}

} // namespace ProjectileBehavior
} // namespace DinerEngine
