/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SPRITE_TABLE_HPP
#define SPRITE_TABLE_HPP

#include "entities/Entity.hpp"
#include "entities/Recipes.hpp"
#include "render/IRenderBackend.hpp"
#include <array>
#include <optional>

namespace DinerEngine {

/**
 * @brief Texture handles used by the simulation, loaded eagerly
 *
 * A texture that failed to load is left empty; entities then fall back to
 * their shape and color.
 */
struct SpriteTable {
    std::optional<TextureHandle> player;
    std::optional<TextureHandle> heart;
    std::optional<TextureHandle> stove;
    std::array<std::optional<TextureHandle>, CUSTOMER_ARCHETYPE_COUNT> customers{};
    std::array<std::optional<TextureHandle>, DISH_TYPE_COUNT> dishes{};

    std::optional<TextureHandle> customer(CustomerArchetype archetype) const {
        return customers[static_cast<size_t>(archetype)];
    }

    std::optional<TextureHandle> dish(DishType type) const {
        return dishes[static_cast<size_t>(type)];
    }

    /**
     * @brief Loads every texture through the loader
     * @return Number of textures that failed to load
     */
    size_t load(ITextureLoader& loader);

    void clear();
};

} // namespace DinerEngine

#endif // SPRITE_TABLE_HPP
