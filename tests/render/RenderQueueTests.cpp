/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE RenderQueueTests
#include <boost/test/unit_test.hpp>

#include "../mocks/MockRenderBackend.hpp"
#include "core/Logger.hpp"
#include "render/RenderCommand.hpp"
#include "render/RenderQueue.hpp"
#include <vector>

using namespace DinerEngine;

struct RenderQueueFixture {
    RenderQueueFixture() { DINER_ENABLE_QUIET_MODE(); }
    ~RenderQueueFixture() { DINER_DISABLE_QUIET_MODE(); }

    // Encodes the push index in the x position so order can be read back
    static RenderCommand tagged(int tag, int8_t z) {
        return RenderCommand::rect(Vector2D(static_cast<float>(tag), 0.0f),
                                   Vector2D(0.0f, 0.0f), z, Colors::White);
    }

    static std::vector<int> drainTags(RenderQueue& queue) {
        std::vector<int> tags;
        queue.drain([&tags](const RenderCommand& cmd) {
            tags.push_back(static_cast<int>(cmd.position.getX()));
        });
        return tags;
    }

    RenderQueue queue;
};

BOOST_FIXTURE_TEST_SUITE(RenderQueueOrderingTests, RenderQueueFixture)

BOOST_AUTO_TEST_CASE(TestAscendingZ) {
    BOOST_CHECK(queue.push(tagged(0, 50)));
    BOOST_CHECK(queue.push(tagged(1, -3)));
    BOOST_CHECK(queue.push(tagged(2, 10)));
    BOOST_CHECK(queue.push(tagged(3, 110)));
    BOOST_CHECK(queue.push(tagged(4, 0)));

    const std::vector<int> expected{1, 4, 2, 0, 3};
    const std::vector<int> tags = drainTags(queue);
    BOOST_CHECK_EQUAL_COLLECTIONS(tags.begin(), tags.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestEqualZKeepsPushOrder) {
    BOOST_CHECK(queue.push(tagged(0, 5)));
    BOOST_CHECK(queue.push(tagged(1, 1)));
    BOOST_CHECK(queue.push(tagged(2, 5)));
    BOOST_CHECK(queue.push(tagged(3, 1)));
    BOOST_CHECK(queue.push(tagged(4, 5)));
    BOOST_CHECK(queue.push(tagged(5, 3)));

    const std::vector<int> expected{1, 3, 5, 0, 2, 4};
    const std::vector<int> tags = drainTags(queue);
    BOOST_CHECK_EQUAL_COLLECTIONS(tags.begin(), tags.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestDrainEmptiesQueue) {
    BOOST_CHECK(queue.push(tagged(0, 1)));
    BOOST_CHECK(queue.push(tagged(1, 2)));
    BOOST_CHECK_EQUAL(queue.size(), 2u);

    drainTags(queue);
    BOOST_CHECK(queue.empty());
    BOOST_CHECK(drainTags(queue).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RenderQueueArenaTests, RenderQueueFixture)

BOOST_AUTO_TEST_CASE(TestExhaustedArenaDropsCommands) {
    RenderQueue small(256);
    int accepted = 0;
    for (int i = 0; i < 100; ++i) {
        if (small.push(tagged(i, 0))) {
            ++accepted;
        }
    }

    BOOST_CHECK_GT(accepted, 0);
    BOOST_CHECK_LT(accepted, 100);
    BOOST_CHECK_EQUAL(small.size(), static_cast<size_t>(accepted));
    BOOST_CHECK_EQUAL(small.getDroppedCount(), static_cast<size_t>(100 - accepted));

    // Whatever made it in is still drawn in order
    const std::vector<int> tags = drainTags(small);
    BOOST_REQUIRE_EQUAL(tags.size(), static_cast<size_t>(accepted));
    for (int i = 0; i < accepted; ++i) {
        BOOST_CHECK_EQUAL(tags[static_cast<size_t>(i)], i);
    }
}

BOOST_AUTO_TEST_CASE(TestResetReleasesArena) {
    RenderQueue small(256);
    while (small.push(tagged(0, 0))) {
    }
    BOOST_CHECK_GT(small.getDroppedCount(), 0u);

    small.reset();
    BOOST_CHECK(small.empty());
    BOOST_CHECK_EQUAL(small.getDroppedCount(), 0u);
    BOOST_CHECK(small.push(tagged(1, 0)));
}

BOOST_AUTO_TEST_CASE(TestDefaultArenaFitsABusyFrame) {
    for (int i = 0; i < 600; ++i) {
        BOOST_REQUIRE(queue.push(tagged(i, static_cast<int8_t>(i % 7))));
    }
    BOOST_CHECK_EQUAL(queue.getDroppedCount(), 0u);
    BOOST_CHECK_EQUAL(queue.getArenaCapacity(), RenderQueue::DEFAULT_ARENA_BYTES);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RenderCommandTests, RenderQueueFixture)

BOOST_AUTO_TEST_CASE(TestCenterIsConvertedToTopLeft) {
    MockRenderBackend backend;
    RenderCommand::rect(Vector2D(100.0f, 50.0f), Vector2D(40.0f, 20.0f), 0, Colors::Red)
        .execute(backend);

    BOOST_REQUIRE_EQUAL(backend.calls.size(), 1u);
    const auto& call = backend.calls[0];
    BOOST_CHECK(call.type == MockRenderBackend::CallType::ColoredQuad);
    BOOST_CHECK_EQUAL(call.x, 80.0f);
    BOOST_CHECK_EQUAL(call.y, 40.0f);
    BOOST_CHECK_EQUAL(call.w, 40.0f);
    BOOST_CHECK_EQUAL(call.h, 20.0f);
    BOOST_CHECK(call.color == Colors::Red);
}

BOOST_AUTO_TEST_CASE(TestEachPrimitiveReachesItsCall) {
    MockRenderBackend backend;
    BOOST_CHECK(queue.push(RenderCommand::sprite(Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f),
                                                 0, 7, 0.5f, 0.25f)));
    BOOST_CHECK(queue.push(RenderCommand::borderRect(Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f),
                                                     1, 2.0f, Colors::White)));
    BOOST_CHECK(queue.push(RenderCommand::circle(Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f),
                                                 2, Colors::Blue)));
    queue.drainTo(backend);

    BOOST_REQUIRE_EQUAL(backend.calls.size(), 3u);
    BOOST_CHECK(backend.calls[0].type == MockRenderBackend::CallType::TexturedQuad);
    BOOST_CHECK_EQUAL(backend.calls[0].texture, 7u);
    BOOST_CHECK_CLOSE(backend.calls[0].rotation, 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(backend.calls[0].alpha, 0.25f, 0.001f);
    BOOST_CHECK(backend.calls[1].type == MockRenderBackend::CallType::BorderedQuad);
    BOOST_CHECK_EQUAL(backend.calls[1].border, 2.0f);
    BOOST_CHECK(backend.calls[2].type == MockRenderBackend::CallType::FilledCircle);
}

BOOST_AUTO_TEST_SUITE_END()
