/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/SpriteTable.hpp"
#include "core/Logger.hpp"
#include <array>
#include <string>

namespace DinerEngine {

namespace {

constexpr const char* ASSET_DIR = "assets/";

// Indexed by CustomerArchetype
constexpr std::array<const char*, CUSTOMER_ARCHETYPE_COUNT> CUSTOMER_FILES{
    "customer_sniper.png",
    "customer_spreader.png",
    "customer_barrager.png",
};

std::optional<TextureHandle> loadOne(ITextureLoader& loader, const std::string& file,
                                     size_t& failures) {
    const std::string path = std::string(ASSET_DIR) + file;
    const TextureHandle handle = loader.loadTexture(path);
    if (handle == INVALID_TEXTURE) {
        TEXTURE_WARN("Could not load " + path + ", using shape fallback");
        ++failures;
        return std::nullopt;
    }
    return handle;
}

} // namespace

size_t SpriteTable::load(ITextureLoader& loader) {
    size_t failures = 0;
    player = loadOne(loader, "Little_Guy.png", failures);
    heart = loadOne(loader, "heart.png", failures);
    stove = loadOne(loader, "stove.png", failures);
    for (size_t i = 0; i < CUSTOMER_ARCHETYPE_COUNT; ++i) {
        customers[i] = loadOne(loader, CUSTOMER_FILES[i], failures);
    }

    for (size_t i = 0; i < DISH_TYPE_COUNT; ++i) {
        const auto type = static_cast<DishType>(i);
        dishes[i] = loadOne(loader, std::string("dish_") + Recipes::dishName(type) + ".png",
                            failures);
    }

    TEXTURE_INFO("Sprite table loaded, " + std::to_string(failures) + " missing");
    return failures;
}

void SpriteTable::clear() {
    player.reset();
    heart.reset();
    stove.reset();
    customers.fill(std::nullopt);
    dishes.fill(std::nullopt);
}

} // namespace DinerEngine
