#pragma once
// ============================================================================
// Keel - Core/Memory/DefaultAllocator.hpp
// ----------------------------------------------------------------------------
// Purpose : Process-wide heap allocator behind arena blocks and the buffers a
//           CharStream owns (copied byte spans, ring storage, unpack scratch).
// Contract: Thread-safe. Blocks come from ::operator new(std::nothrow) with a
//           small prefix that records the raw pointer; Deallocate validates the
//           prefix and logs instead of freeing foreign pointers.
//           KEEL_MEM_PARANOID_META additionally records (size, alignment) and
//           asserts the pair on release. Failures go through KEEL_MEM_CHECK_OOM.
// Notes   : GetDefaultAllocator() (Allocator.hpp) returns the shared instance.
//           The live-block counter lets tests spot leaked stream buffers.
// ============================================================================

#include "Core/Types.hpp"
#include "Core/Memory/Allocator.hpp"

#include <atomic>

namespace keel::core {

    class DefaultAllocator final : public IAllocator {
    public:
        [[nodiscard]] void* Allocate(usize size, usize alignment) noexcept override;
        void Deallocate(void* ptr, usize size, usize alignment) noexcept override;

        // Blocks handed out and not yet released.
        [[nodiscard]] usize LiveBlocks() const noexcept { return mLiveBlocks.load(std::memory_order_relaxed); }

    private:
        std::atomic<usize> mLiveBlocks{ 0 };
    };

    // Live-block count of the shared instance.
    [[nodiscard]] usize GetDefaultAllocatorLiveBlocks() noexcept;

} // namespace keel::core
