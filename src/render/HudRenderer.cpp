/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/HudRenderer.hpp"
#include "core/GameWorld.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityFactory.hpp"
#include "render/RenderCommand.hpp"
#include "render/RenderQueue.hpp"
#include <numbers>

namespace DinerEngine {
namespace HudRenderer {

namespace {
constexpr float HEALTH_OFFSET = 48.0f;
constexpr float HEALTH_SPACING = 8.0f;
constexpr float HEART_SIZE = 48.0f;
constexpr float HEART_TILT = -0.125f * std::numbers::pi_v<float>;
constexpr float OVERLAY_ALPHA = 0.5f;
}

void drawHud(GameWorld& world, IRenderBackend& backend) {
    const Entity* player = world.getPlayer();
    const Vector2D topRight(world.getWidth(), world.getHeight());
    const Vector2D heartSize = Vector2D::splat(HEART_SIZE);
    const auto heart = world.getSprites().heart;

    const uint32_t health = player ? player->health : 0;
    for (uint32_t i = 0; i < health; ++i) {
        const Vector2D pos = topRight - Vector2D::splat(HEALTH_OFFSET) -
                             Vector2D(static_cast<float>(i) * (HEALTH_SPACING + HEART_SIZE), 0.0f);
        const RenderCommand command =
            heart ? RenderCommand::sprite(pos, heartSize, EntityFactory::Z_HUD, *heart, HEART_TILT)
                  : RenderCommand::circle(pos, heartSize, EntityFactory::Z_HUD, Colors::Red);
        RenderQueue::executeImmediate(command, backend);
    }

    if (world.isPaused() || world.isGameOver()) {
        RenderQueue::executeImmediate(
            RenderCommand::rect(topRight * 0.5f, topRight, EntityFactory::Z_HUD,
                                Colors::DarkGrey.withAlpha(OVERLAY_ALPHA)),
            backend);
    }
}

} // namespace HudRenderer
} // namespace DinerEngine
