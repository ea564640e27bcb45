#include "Core/Memory/DefaultAllocator.hpp"

#include "Core/Memory/Alignment.hpp"
#include "Core/Memory/MemoryConfig.hpp"
#include "Core/Memory/OOM.hpp"

#include <cstdint>
#include <limits>
#include <new>

namespace keel::core {

    namespace {

        constexpr u32 kPrefixTag = 0x4B45454Cu; // "KEEL"

        // Sits immediately before every payload.
        struct alignas(alignof(std::max_align_t)) BlockPrefix {
            void* raw;
            u32   tag;
#if KEEL_MEM_PARANOID_META
            usize size;
            usize align;
#endif
        };

        static_assert(sizeof(BlockPrefix) % alignof(std::max_align_t) == 0,
            "payload after the prefix must stay max_align_t aligned");

        BlockPrefix* PrefixOf(void* payload) noexcept
        {
            return reinterpret_cast<BlockPrefix*>(static_cast<u8*>(payload) - sizeof(BlockPrefix));
        }

        DefaultAllocator& SharedInstance() noexcept
        {
            static DefaultAllocator instance;
            return instance;
        }

    } // namespace

    void* DefaultAllocator::Allocate(usize size, usize alignment) noexcept
    {
        if (size == 0)
            return nullptr;

        alignment = NormalizeAlignment(alignment);
        const usize slack = alignment - 1;
        const bool alignmentOk = alignment <= static_cast<usize>(KEEL_MAX_REASONABLE_ALIGNMENT);
        if (!alignmentOk || size > (std::numeric_limits<usize>::max)() - sizeof(BlockPrefix) - slack)
        {
            KEEL_MEM_CHECK_OOM(size, alignment, "DefaultAllocator::Allocate");
            return nullptr;
        }

        void* raw = ::operator new(sizeof(BlockPrefix) + size + slack, std::nothrow);
        if (!raw)
        {
            KEEL_MEM_CHECK_OOM(size, alignment, "DefaultAllocator::Allocate");
            return nullptr;
        }

        const auto firstPayload = reinterpret_cast<std::uintptr_t>(static_cast<u8*>(raw) + sizeof(BlockPrefix));
        void* payload = reinterpret_cast<void*>(AlignUp<std::uintptr_t>(firstPayload, alignment));

        BlockPrefix* prefix = PrefixOf(payload);
        prefix->raw = raw;
        prefix->tag = kPrefixTag;
#if KEEL_MEM_PARANOID_META
        prefix->size = size;
        prefix->align = alignment;
#endif
        mLiveBlocks.fetch_add(1, std::memory_order_relaxed);
        return payload;
    }

    void DefaultAllocator::Deallocate(void* ptr, usize size, usize alignment) noexcept
    {
        if (!ptr)
            return;

        BlockPrefix* prefix = PrefixOf(ptr);
        if (prefix->tag != kPrefixTag || prefix->raw == nullptr)
        {
            KEEL_LOG_ERROR(KEEL_MEM_LOG_CATEGORY,
                "DefaultAllocator::Deallocate: {} was not allocated here or its prefix is damaged", ptr);
            return;
        }

#if KEEL_MEM_PARANOID_META
        KEEL_ASSERT(prefix->size == size, "Deallocate size differs from the allocation");
        KEEL_ASSERT(prefix->align == NormalizeAlignment(alignment), "Deallocate alignment differs from the allocation");
#else
        (void)size;
        (void)alignment;
#endif
        prefix->tag = 0;
        ::operator delete(prefix->raw);
        mLiveBlocks.fetch_sub(1, std::memory_order_relaxed);
    }

    IAllocator& GetDefaultAllocator() noexcept
    {
        return SharedInstance();
    }

    usize GetDefaultAllocatorLiveBlocks() noexcept
    {
        return SharedInstance().LiveBlocks();
    }

} // namespace keel::core
