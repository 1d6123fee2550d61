/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RENDER_QUEUE_HPP
#define RENDER_QUEUE_HPP

/**
 * @file RenderQueue.hpp
 * @brief Per-frame z-ordered draw list
 *
 * Commands are linked nodes allocated from a monotonic arena over a fixed
 * buffer. The arena never grows: once the buffer is used up, push() drops
 * the command and logs an error. reset() releases everything at the end of
 * the frame.
 *
 * Ordering is ascending zIndex; commands with equal zIndex keep their push
 * order.
 */

#include "render/RenderCommand.hpp"
#include <cstddef>
#include <memory>
#include <memory_resource>

namespace DinerEngine {

class IRenderBackend;

class RenderQueue {
public:
    static constexpr size_t DEFAULT_ARENA_BYTES = 64 * 1024;

    explicit RenderQueue(size_t arenaBytes = DEFAULT_ARENA_BYTES);

    RenderQueue(const RenderQueue&) = delete;
    RenderQueue& operator=(const RenderQueue&) = delete;

    /**
     * @brief Inserts a command after the last queued command with an equal
     *        or lower zIndex
     * @return false if the arena is exhausted and the command was dropped
     */
    bool push(const RenderCommand& command);

    /**
     * @brief Visits every queued command once in z order and empties the
     *        queue. Arena memory is kept until reset().
     */
    template<typename Fn>
    void drain(Fn&& fn) {
        Node* node = mp_head;
        mp_head = nullptr;
        mp_tail = nullptr;
        m_size = 0;
        while (node) {
            Node* next = node->next;
            fn(static_cast<const RenderCommand&>(node->command));
            node = next;
        }
    }

    void drainTo(IRenderBackend& backend);

    // Drops all queued commands and releases the arena
    void reset();

    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    size_t getDroppedCount() const { return m_droppedCount; }
    size_t getArenaCapacity() const { return m_bufferSize; }

    // Bypasses the queue and draws right away
    static void executeImmediate(const RenderCommand& command, IRenderBackend& backend);

private:
    struct Node {
        RenderCommand command;
        Node* next;
    };

    std::unique_ptr<std::byte[]> mp_buffer;
    size_t m_bufferSize;
    std::pmr::monotonic_buffer_resource m_arena;

    Node* mp_head{nullptr};
    Node* mp_tail{nullptr};
    size_t m_size{0};
    size_t m_droppedCount{0};
};

} // namespace DinerEngine

#endif // RENDER_QUEUE_HPP
