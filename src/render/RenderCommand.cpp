/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/RenderCommand.hpp"
#include <type_traits>

namespace DinerEngine {

RenderCommand RenderCommand::sprite(const Vector2D& pos, const Vector2D& size, int8_t z,
                                    TextureHandle texture, float rotation, float alpha) {
    return RenderCommand{pos, size, z, Colors::White.withAlpha(alpha),
                         SpriteDraw{texture, rotation}};
}

RenderCommand RenderCommand::rect(const Vector2D& pos, const Vector2D& size, int8_t z,
                                  const Color& color) {
    return RenderCommand{pos, size, z, color, RectDraw{}};
}

RenderCommand RenderCommand::borderRect(const Vector2D& pos, const Vector2D& size, int8_t z,
                                        float border, const Color& color) {
    return RenderCommand{pos, size, z, color, BorderRectDraw{border}};
}

RenderCommand RenderCommand::circle(const Vector2D& pos, const Vector2D& size, int8_t z,
                                    const Color& color) {
    return RenderCommand{pos, size, z, color, CircleDraw{}};
}

void RenderCommand::execute(IRenderBackend& backend) const {
    const float x = position.getX() - size.getX() * 0.5f;
    const float y = position.getY() - size.getY() * 0.5f;
    const float w = size.getX();
    const float h = size.getY();

    std::visit([&](const auto& draw) {
        using T = std::decay_t<decltype(draw)>;
        if constexpr (std::is_same_v<T, SpriteDraw>) {
            backend.drawTexturedQuad(x, y, draw.rotation, w, h, color.a, draw.texture);
        } else if constexpr (std::is_same_v<T, RectDraw>) {
            backend.drawColoredQuad(x, y, w, h, color);
        } else if constexpr (std::is_same_v<T, BorderRectDraw>) {
            backend.drawBorderedQuad(x, y, w, h, draw.border, color);
        } else if constexpr (std::is_same_v<T, CircleDraw>) {
            backend.drawFilledCircle(x, y, w, h, color);
        }
    }, primitive);
}

} // namespace DinerEngine
