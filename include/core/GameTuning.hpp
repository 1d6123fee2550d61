/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_TUNING_HPP
#define GAME_TUNING_HPP

#include <cstdint>

namespace DinerEngine {

class SettingsManager;

/**
 * @brief Gameplay constants
 *
 * Defaults are the shipped values. fromSettings() overrides any field present
 * in the SettingsManager, keyed by category ("player", "stove", ...) and the
 * snake_case field name.
 */
struct GameTuning {
    // Player
    float playerAcceleration{2000.0f};
    float playerSpeed{400.0f};
    float playerSize{128.0f};
    float playerStartX{100.0f};       // Start y is the vertical center
    uint32_t playerHealth{3};
    float handsSpeed{1200.0f};
    float handsReach{100.0f};
    float handsSize{16.0f};

    // Carried items
    float droppedExpiration{5.0f};
    float ingredientSize{24.0f};
    float dishSize{32.0f};

    // Stoves
    float stoveSize{64.0f};
    float cookTime{5.0f};
    float ingredientSpinSpeed{0.5f};  // Revolutions per second
    float flickerSpeed{12.0f};        // Radians per second

    // Customers
    float customerSpawnTime{10.0f};
    float customerSize{48.0f};
    float customerDialogOffset{40.0f};
    float waitTime{10.0f};
    float eatTime{15.0f};
    float fireTime{3.0f};
    float safeRadius{160.0f};
    float spreadAngleDegrees{15.0f};
    uint32_t barrageCount{8};
    float barragePhaseStep{0.2f};     // Radians added per ring volley

    // Projectiles
    float projectileSpeed{200.0f};
    float projectileSize{12.0f};
    float projectileMargin{64.0f};
    float projectileMaxLifetime{20.0f};

    // Seating
    float seatSize{32.0f};
    float seatOffsetX{16.0f};
    float seatOffsetY{30.0f};
    float seatDishTargetOffset{32.0f};
    float seatDishTargetSize{32.0f};

    // Input
    uint8_t clickLatchFrames{5};
    uint8_t mouseMovingFrames{5};

    // Frame driver
    float maxFrameDelta{0.25f};

    static GameTuning fromSettings(const SettingsManager& settings);
};

} // namespace DinerEngine

#endif // GAME_TUNING_HPP
