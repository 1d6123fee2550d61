/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RENDER_COMMAND_HPP
#define RENDER_COMMAND_HPP

#include "render/IRenderBackend.hpp"
#include "utils/Color.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <variant>

namespace DinerEngine {

struct SpriteDraw {
    TextureHandle texture{0};
    float rotation{0.0f};
};

struct RectDraw {};

struct BorderRectDraw {
    float border{1.0f};
};

struct CircleDraw {};

using DrawPrimitive = std::variant<SpriteDraw, RectDraw, BorderRectDraw, CircleDraw>;

/**
 * @brief One deferred draw call
 *
 * Position is the center of the quad, size the full width/height. For
 * sprites only the alpha channel of `color` is used. Commands live for one
 * frame inside the RenderQueue arena.
 */
struct RenderCommand {
    Vector2D position;
    Vector2D size;
    int8_t zIndex{0};
    Color color;
    DrawPrimitive primitive{RectDraw{}};

    static RenderCommand sprite(const Vector2D& pos, const Vector2D& size, int8_t z,
                                TextureHandle texture, float rotation = 0.0f,
                                float alpha = 1.0f);
    static RenderCommand rect(const Vector2D& pos, const Vector2D& size, int8_t z,
                              const Color& color);
    static RenderCommand borderRect(const Vector2D& pos, const Vector2D& size, int8_t z,
                                    float border, const Color& color);
    static RenderCommand circle(const Vector2D& pos, const Vector2D& size, int8_t z,
                                const Color& color);

    // Issues the call against the backend using top-left coordinates
    void execute(IRenderBackend& backend) const;
};

} // namespace DinerEngine

#endif // RENDER_COMMAND_HPP
