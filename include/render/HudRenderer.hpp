/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef HUD_RENDERER_HPP
#define HUD_RENDERER_HPP

namespace DinerEngine {

class GameWorld;
class IRenderBackend;

namespace HudRenderer {

/**
 * @brief Draws the health hearts in the top right corner, and a dimming
 *        overlay while paused or after game over
 *
 * Goes straight to the backend, after the queued scene has been drawn.
 * Score digits are left to the platform layer.
 */
void drawHud(GameWorld& world, IRenderBackend& backend);

} // namespace HudRenderer

} // namespace DinerEngine

#endif // HUD_RENDERER_HPP
