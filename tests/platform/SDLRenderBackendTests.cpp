/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SDLRenderBackendTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "platform/SDLRenderBackend.hpp"
#include <SDL3/SDL.h>
#include <cstdio>
#include <memory>
#include <string>

using namespace DinerEngine;

namespace {
const std::string RED_IMAGE{"sdl_backend_red.bmp"};
const std::string BLUE_IMAGE{"sdl_backend_blue.bmp"};
}

// Software renderer drawing into an offscreen surface, no window needed
struct SoftwareRendererFixture {
    SoftwareRendererFixture() {
        DINER_ENABLE_QUIET_MODE();
        mp_target = SDL_CreateSurface(64, 64, SDL_PIXELFORMAT_RGBA32);
        BOOST_REQUIRE(mp_target != nullptr);
        mp_renderer = SDL_CreateSoftwareRenderer(mp_target);
        BOOST_REQUIRE(mp_renderer != nullptr);
        backend = std::make_unique<SDLRenderBackend>(mp_renderer, 64.0f);

        writeImage(RED_IMAGE, 255, 0, 0);
        writeImage(BLUE_IMAGE, 0, 0, 255);
    }

    ~SoftwareRendererFixture() {
        backend.reset();
        SDL_DestroyRenderer(mp_renderer);
        SDL_DestroySurface(mp_target);
        std::remove(RED_IMAGE.c_str());
        std::remove(BLUE_IMAGE.c_str());
        DINER_DISABLE_QUIET_MODE();
    }

    static void writeImage(const std::string& path, Uint8 r, Uint8 g, Uint8 b) {
        SDL_Surface* image = SDL_CreateSurface(4, 4, SDL_PIXELFORMAT_RGBA32);
        BOOST_REQUIRE(image != nullptr);
        SDL_FillSurfaceRect(image, nullptr, SDL_MapSurfaceRGBA(image, r, g, b, 255));
        const bool saved = SDL_SaveBMP(image, path.c_str());
        SDL_DestroySurface(image);
        BOOST_REQUIRE(saved);
    }

    SDL_Surface* mp_target{nullptr};
    SDL_Renderer* mp_renderer{nullptr};
    std::unique_ptr<SDLRenderBackend> backend;
};

BOOST_FIXTURE_TEST_SUITE(TextureLoaderTests, SoftwareRendererFixture)

BOOST_AUTO_TEST_CASE(TestSamePathReturnsSameHandle) {
    const TextureHandle first = backend->loadTexture(RED_IMAGE);
    const TextureHandle second = backend->loadTexture(RED_IMAGE);
    BOOST_CHECK(first != INVALID_TEXTURE);
    BOOST_CHECK_EQUAL(first, second);
}

BOOST_AUTO_TEST_CASE(TestDifferentPathsGetDifferentHandles) {
    const TextureHandle red = backend->loadTexture(RED_IMAGE);
    const TextureHandle blue = backend->loadTexture(BLUE_IMAGE);
    BOOST_CHECK(red != INVALID_TEXTURE);
    BOOST_CHECK(blue != INVALID_TEXTURE);
    BOOST_CHECK(red != blue);
}

BOOST_AUTO_TEST_CASE(TestMissingFileIsInvalid) {
    BOOST_CHECK_EQUAL(backend->loadTexture("no_such_image.bmp"), INVALID_TEXTURE);
}

BOOST_AUTO_TEST_CASE(TestCleanForgetsHandles) {
    const TextureHandle before = backend->loadTexture(RED_IMAGE);
    backend->clean();
    const TextureHandle after = backend->loadTexture(RED_IMAGE);
    BOOST_CHECK(after != INVALID_TEXTURE);
    BOOST_CHECK(after != before);
}

BOOST_AUTO_TEST_SUITE_END()
