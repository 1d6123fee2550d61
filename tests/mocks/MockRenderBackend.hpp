/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_RENDER_BACKEND_HPP
#define MOCK_RENDER_BACKEND_HPP

#include "render/IRenderBackend.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace DinerEngine {

/**
 * Records every draw call so tests can inspect what reached the backend
 * and in which order.
 */
class MockRenderBackend : public IRenderBackend {
public:
    enum class CallType { TexturedQuad, ColoredQuad, BorderedQuad, FilledCircle };

    struct DrawCall {
        CallType type;
        float x, y, w, h;
        float rotation{0.0f};
        float alpha{1.0f};
        float border{0.0f};
        TextureHandle texture{INVALID_TEXTURE};
        Color color;
    };

    void clearFrame() override {
        ++clearCount;
        calls.clear();
    }

    void drawTexturedQuad(float x, float y, float rotation, float w, float h, float alpha,
                          TextureHandle texture) override {
        DrawCall call{CallType::TexturedQuad, x, y, w, h};
        call.rotation = rotation;
        call.alpha = alpha;
        call.texture = texture;
        calls.push_back(call);
    }

    void drawColoredQuad(float x, float y, float w, float h, const Color& color) override {
        DrawCall call{CallType::ColoredQuad, x, y, w, h};
        call.color = color;
        calls.push_back(call);
    }

    void drawBorderedQuad(float x, float y, float w, float h, float border,
                          const Color& color) override {
        DrawCall call{CallType::BorderedQuad, x, y, w, h};
        call.border = border;
        call.color = color;
        calls.push_back(call);
    }

    void drawFilledCircle(float x, float y, float w, float h, const Color& color) override {
        DrawCall call{CallType::FilledCircle, x, y, w, h};
        call.color = color;
        calls.push_back(call);
    }

    size_t countOf(CallType type) const {
        size_t count = 0;
        for (const auto& call : calls) {
            if (call.type == type) ++count;
        }
        return count;
    }

    std::vector<DrawCall> calls;
    int clearCount{0};
};

/**
 * Hands out sequential handles per distinct path. Paths listed in
 * `missing` fail with INVALID_TEXTURE.
 */
class MockTextureLoader : public ITextureLoader {
public:
    TextureHandle loadTexture(const std::string& path) override {
        ++loadCount;
        for (const auto& miss : missing) {
            if (miss == path) return INVALID_TEXTURE;
        }
        auto it = handles.find(path);
        if (it != handles.end()) return it->second;
        const TextureHandle handle = nextHandle++;
        handles.emplace(path, handle);
        return handle;
    }

    std::unordered_map<std::string, TextureHandle> handles;
    std::vector<std::string> missing;
    TextureHandle nextHandle{1};
    int loadCount{0};
};

} // namespace DinerEngine

#endif // MOCK_RENDER_BACKEND_HPP
