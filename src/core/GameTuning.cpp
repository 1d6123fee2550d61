/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameTuning.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>

namespace DinerEngine {

namespace {

void readFloat(const SettingsManager& s, const char* category, const char* key, float& field) {
    field = s.get<float>(category, key, field);
}

void readCount(const SettingsManager& s, const char* category, const char* key, uint32_t& field) {
    const int value = s.get<int>(category, key, static_cast<int>(field));
    field = static_cast<uint32_t>(std::max(value, 0));
}

void readFrames(const SettingsManager& s, const char* category, const char* key, uint8_t& field) {
    const int value = s.get<int>(category, key, field);
    field = static_cast<uint8_t>(std::clamp(value, 0, 255));
}

} // namespace

GameTuning GameTuning::fromSettings(const SettingsManager& settings) {
    GameTuning t;

    readFloat(settings, "player", "acceleration", t.playerAcceleration);
    readFloat(settings, "player", "speed", t.playerSpeed);
    readFloat(settings, "player", "size", t.playerSize);
    readFloat(settings, "player", "start_x", t.playerStartX);
    readCount(settings, "player", "health", t.playerHealth);
    readFloat(settings, "player", "hands_speed", t.handsSpeed);
    readFloat(settings, "player", "hands_reach", t.handsReach);
    readFloat(settings, "player", "hands_size", t.handsSize);

    readFloat(settings, "items", "dropped_expiration", t.droppedExpiration);
    readFloat(settings, "items", "ingredient_size", t.ingredientSize);
    readFloat(settings, "items", "dish_size", t.dishSize);

    readFloat(settings, "stove", "size", t.stoveSize);
    readFloat(settings, "stove", "cook_time", t.cookTime);
    readFloat(settings, "stove", "ingredient_spin_speed", t.ingredientSpinSpeed);
    readFloat(settings, "stove", "flicker_speed", t.flickerSpeed);

    readFloat(settings, "customer", "spawn_time", t.customerSpawnTime);
    readFloat(settings, "customer", "size", t.customerSize);
    readFloat(settings, "customer", "dialog_offset", t.customerDialogOffset);
    readFloat(settings, "customer", "wait_time", t.waitTime);
    readFloat(settings, "customer", "eat_time", t.eatTime);
    readFloat(settings, "customer", "fire_time", t.fireTime);
    readFloat(settings, "customer", "safe_radius", t.safeRadius);
    readFloat(settings, "customer", "spread_angle_degrees", t.spreadAngleDegrees);
    readCount(settings, "customer", "barrage_count", t.barrageCount);
    readFloat(settings, "customer", "barrage_phase_step", t.barragePhaseStep);

    readFloat(settings, "projectile", "speed", t.projectileSpeed);
    readFloat(settings, "projectile", "size", t.projectileSize);
    readFloat(settings, "projectile", "margin", t.projectileMargin);
    readFloat(settings, "projectile", "max_lifetime", t.projectileMaxLifetime);

    readFloat(settings, "seat", "size", t.seatSize);
    readFloat(settings, "seat", "offset_x", t.seatOffsetX);
    readFloat(settings, "seat", "offset_y", t.seatOffsetY);
    readFloat(settings, "seat", "dish_target_offset", t.seatDishTargetOffset);
    readFloat(settings, "seat", "dish_target_size", t.seatDishTargetSize);

    readFrames(settings, "input", "click_latch_frames", t.clickLatchFrames);
    readFrames(settings, "input", "mouse_moving_frames", t.mouseMovingFrames);

    readFloat(settings, "frame", "max_delta", t.maxFrameDelta);

    return t;
}

} // namespace DinerEngine
