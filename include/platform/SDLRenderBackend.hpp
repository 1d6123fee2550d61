/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SDL_RENDER_BACKEND_HPP
#define SDL_RENDER_BACKEND_HPP

#include "render/IRenderBackend.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <unordered_map>

namespace DinerEngine {

/**
 * @brief SDL_Renderer implementation of the draw backend and texture loader
 *
 * Incoming rectangles are in world space with y up, anchored at their
 * lower-left corner; they are flipped into SDL's y-down screen space using
 * the output height.
 */
class SDLRenderBackend final : public IRenderBackend, public ITextureLoader {
public:
    SDLRenderBackend(SDL_Renderer* p_renderer, float outputHeight);
    ~SDLRenderBackend() override;

    SDLRenderBackend(const SDLRenderBackend&) = delete;
    SDLRenderBackend& operator=(const SDLRenderBackend&) = delete;

    // IRenderBackend
    void clearFrame() override;
    void drawTexturedQuad(float x, float y, float rotation, float w, float h, float alpha,
                          TextureHandle texture) override;
    void drawColoredQuad(float x, float y, float w, float h, const Color& color) override;
    void drawBorderedQuad(float x, float y, float w, float h, float border,
                          const Color& color) override;
    void drawFilledCircle(float x, float y, float w, float h, const Color& color) override;

    // ITextureLoader
    TextureHandle loadTexture(const std::string& path) override;

    void present();
    void clean();

private:
    using TexturePtr = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>;

    SDL_FRect toScreen(float x, float y, float w, float h) const;
    void setDrawColor(const Color& color);

    SDL_Renderer* mp_renderer;   // Not owned
    float m_outputHeight;
    std::unordered_map<TextureHandle, TexturePtr> m_textures;
    std::unordered_map<std::string, TextureHandle> m_pathHandles;
    TextureHandle m_nextHandle{1};
};

} // namespace DinerEngine

#endif // SDL_RENDER_BACKEND_HPP
