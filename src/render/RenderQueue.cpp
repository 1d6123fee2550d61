/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/RenderQueue.hpp"
#include "core/Logger.hpp"
#include "render/IRenderBackend.hpp"
#include <new>
#include <string>
#include <type_traits>

namespace DinerEngine {

RenderQueue::RenderQueue(size_t arenaBytes)
    : mp_buffer(std::make_unique<std::byte[]>(arenaBytes)),
      m_bufferSize(arenaBytes),
      m_arena(mp_buffer.get(), arenaBytes, std::pmr::null_memory_resource()) {
    // Nodes are never destroyed individually; release() just forgets them
    static_assert(std::is_trivially_destructible_v<Node>);
}

bool RenderQueue::push(const RenderCommand& command) {
    void* storage = nullptr;
    try {
        storage = m_arena.allocate(sizeof(Node), alignof(Node));
    } catch (const std::bad_alloc&) {
        ++m_droppedCount;
        RENDER_ERROR("Frame arena exhausted (" + std::to_string(m_bufferSize) +
                     " bytes), dropping draw call at z " + std::to_string(command.zIndex));
        return false;
    }

    Node* node = ::new (storage) Node{command, nullptr};

    if (!mp_head) {
        mp_head = node;
        mp_tail = node;
    } else if (mp_tail->command.zIndex <= command.zIndex) {
        // Common case: pushes arrive roughly sorted
        mp_tail->next = node;
        mp_tail = node;
    } else if (command.zIndex < mp_head->command.zIndex) {
        node->next = mp_head;
        mp_head = node;
    } else {
        Node* prev = mp_head;
        while (prev->next && prev->next->command.zIndex <= command.zIndex) {
            prev = prev->next;
        }
        node->next = prev->next;
        prev->next = node;
        if (!node->next) {
            mp_tail = node;
        }
    }

    ++m_size;
    return true;
}

void RenderQueue::drainTo(IRenderBackend& backend) {
    drain([&backend](const RenderCommand& command) { command.execute(backend); });
}

void RenderQueue::reset() {
    mp_head = nullptr;
    mp_tail = nullptr;
    m_size = 0;
    m_droppedCount = 0;
    m_arena.release();
}

void RenderQueue::executeImmediate(const RenderCommand& command, IRenderBackend& backend) {
    command.execute(backend);
}

} // namespace DinerEngine
