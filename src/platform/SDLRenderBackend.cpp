/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "platform/SDLRenderBackend.hpp"
#include "core/Logger.hpp"
#include <SDL3_image/SDL_image.h>
#include <array>
#include <cmath>
#include <numbers>
#include <string>

namespace DinerEngine {

namespace {
constexpr int CIRCLE_SEGMENTS = 32;
constexpr Color CLEAR_COLOR = Color::fromHex(0x2b2a26);
}

SDLRenderBackend::SDLRenderBackend(SDL_Renderer* p_renderer, float outputHeight)
    : mp_renderer(p_renderer), m_outputHeight(outputHeight) {}

SDLRenderBackend::~SDLRenderBackend() {
    clean();
}

SDL_FRect SDLRenderBackend::toScreen(float x, float y, float w, float h) const {
    return SDL_FRect{x, m_outputHeight - (y + h), w, h};
}

void SDLRenderBackend::setDrawColor(const Color& color) {
    SDL_SetRenderDrawBlendMode(mp_renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColorFloat(mp_renderer, color.r, color.g, color.b, color.a);
}

void SDLRenderBackend::clearFrame() {
    SDL_SetRenderDrawColorFloat(mp_renderer, CLEAR_COLOR.r, CLEAR_COLOR.g, CLEAR_COLOR.b, 1.0f);
    SDL_RenderClear(mp_renderer);
}

void SDLRenderBackend::drawTexturedQuad(float x, float y, float rotation, float w, float h,
                                        float alpha, TextureHandle texture) {
    auto it = m_textures.find(texture);
    if (it == m_textures.end()) {
        TEXTURE_WARN("Unknown texture handle " + std::to_string(texture));
        return;
    }

    const SDL_FRect dest = toScreen(x, y, w, h);
    SDL_SetTextureAlphaModFloat(it->second.get(), alpha);
    // World rotation is counter-clockwise radians, SDL wants clockwise degrees
    const double angle = -static_cast<double>(rotation) * 180.0 / std::numbers::pi;
    SDL_RenderTextureRotated(mp_renderer, it->second.get(), nullptr, &dest, angle, nullptr,
                             SDL_FLIP_NONE);
}

void SDLRenderBackend::drawColoredQuad(float x, float y, float w, float h, const Color& color) {
    const SDL_FRect rect = toScreen(x, y, w, h);
    setDrawColor(color);
    SDL_RenderFillRect(mp_renderer, &rect);
}

void SDLRenderBackend::drawBorderedQuad(float x, float y, float w, float h, float border,
                                        const Color& color) {
    setDrawColor(color);
    const std::array<SDL_FRect, 4> edges{{
        toScreen(x, y, w, border),                  // bottom
        toScreen(x, y + h - border, w, border),     // top
        toScreen(x, y, border, h),                  // left
        toScreen(x + w - border, y, border, h),     // right
    }};
    SDL_RenderFillRects(mp_renderer, edges.data(), static_cast<int>(edges.size()));
}

void SDLRenderBackend::drawFilledCircle(float x, float y, float w, float h, const Color& color) {
    const SDL_FRect bounds = toScreen(x, y, w, h);
    const float cx = bounds.x + w * 0.5f;
    const float cy = bounds.y + h * 0.5f;
    const SDL_FColor fcolor{color.r, color.g, color.b, color.a};

    // Triangle fan around the center
    std::array<SDL_Vertex, CIRCLE_SEGMENTS + 2> vertices{};
    vertices[0] = SDL_Vertex{SDL_FPoint{cx, cy}, fcolor, SDL_FPoint{0.0f, 0.0f}};
    for (int i = 0; i <= CIRCLE_SEGMENTS; ++i) {
        const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) / CIRCLE_SEGMENTS;
        vertices[static_cast<size_t>(i) + 1] =
            SDL_Vertex{SDL_FPoint{cx + std::cos(angle) * w * 0.5f, cy + std::sin(angle) * h * 0.5f},
                       fcolor, SDL_FPoint{0.0f, 0.0f}};
    }

    std::array<int, CIRCLE_SEGMENTS * 3> indices{};
    for (int i = 0; i < CIRCLE_SEGMENTS; ++i) {
        indices[static_cast<size_t>(i) * 3] = 0;
        indices[static_cast<size_t>(i) * 3 + 1] = i + 1;
        indices[static_cast<size_t>(i) * 3 + 2] = i + 2;
    }

    SDL_RenderGeometry(mp_renderer, nullptr, vertices.data(), static_cast<int>(vertices.size()),
                       indices.data(), static_cast<int>(indices.size()));
}

TextureHandle SDLRenderBackend::loadTexture(const std::string& path) {
    if (auto cached = m_pathHandles.find(path); cached != m_pathHandles.end()) {
        return cached->second;
    }

    auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
        IMG_Load(path.c_str()), SDL_DestroySurface);
    if (!surface) {
        TEXTURE_ERROR("Could not load image: " + path + " - " + SDL_GetError());
        return INVALID_TEXTURE;
    }

    TexturePtr texture(SDL_CreateTextureFromSurface(mp_renderer, surface.get()), SDL_DestroyTexture);
    if (!texture) {
        TEXTURE_ERROR("Could not create texture from surface: " + path + " - " + SDL_GetError());
        return INVALID_TEXTURE;
    }

    const TextureHandle handle = m_nextHandle++;
    m_textures.emplace(handle, std::move(texture));
    m_pathHandles.emplace(path, handle);
    TEXTURE_DEBUG("Loaded texture: " + path);
    return handle;
}

void SDLRenderBackend::present() {
    SDL_RenderPresent(mp_renderer);
}

void SDLRenderBackend::clean() {
    m_textures.clear();
    m_pathHandles.clear();
}

} // namespace DinerEngine
