/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IRENDER_BACKEND_HPP
#define IRENDER_BACKEND_HPP

/**
 * @file IRenderBackend.hpp
 * @brief Draw and asset interfaces the simulation core renders through
 *
 * The core never talks to a graphics API directly. Render commands are
 * replayed against an IRenderBackend at the end of the frame, and sprite
 * handles are obtained once from an ITextureLoader. The SDL3 application
 * implements both; tests use recording mocks.
 *
 * All draw calls take top-left pixel coordinates and full sizes.
 */

#include "utils/Color.hpp"
#include <cstdint>
#include <string>

namespace DinerEngine {

/// Opaque texture id handed out by the loader
using TextureHandle = uint32_t;

/// Returned by loaders that could not produce a texture
inline constexpr TextureHandle INVALID_TEXTURE = 0;

class IRenderBackend {
public:
    virtual ~IRenderBackend() = default;

    virtual void clearFrame() = 0;

    /**
     * @brief Draws a texture stretched over a rect
     * @param rotation Counter-clockwise rotation in radians, about the rect center
     * @param alpha Opacity multiplier (0.0 - 1.0)
     */
    virtual void drawTexturedQuad(float x, float y, float rotation,
                                  float w, float h, float alpha,
                                  TextureHandle texture) = 0;

    virtual void drawColoredQuad(float x, float y, float w, float h,
                                 const Color& color) = 0;

    /**
     * @brief Draws a rect outline
     * @param border Outline thickness in pixels, drawn inside the rect
     */
    virtual void drawBorderedQuad(float x, float y, float w, float h,
                                  float border, const Color& color) = 0;

    // Ellipse inscribed in the rect
    virtual void drawFilledCircle(float x, float y, float w, float h,
                                  const Color& color) = 0;
};

class ITextureLoader {
public:
    virtual ~ITextureLoader() = default;

    /**
     * @brief Loads (or returns the cached handle of) the texture at path
     * @return Stable handle; repeated calls with the same path return it again
     */
    virtual TextureHandle loadTexture(const std::string& path) = 0;
};

} // namespace DinerEngine

#endif // IRENDER_BACKEND_HPP
