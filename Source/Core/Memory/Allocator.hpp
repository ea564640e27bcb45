#pragma once
// ============================================================================
// Keel - Core/Memory/Allocator.hpp
// ----------------------------------------------------------------------------
// Purpose : Declare the backing-allocator contract (`IAllocator`) used for
//           arena blocks and stream-owned buffers, and a lightweight
//           non-owning facade (`AllocatorRef`) with typed array helpers.
// Contract: Deallocate must receive the exact `(size, alignment)` pair that
//           was used when the block was acquired. Alignment parameters are
//           always normalized via `NormalizeAlignment`.
// Notes   : Arenas never hand individual blocks back; only the arena's own
//           backing block and CharStream heap buffers travel through here.
// ============================================================================

#include <cstddef>      // std::size_t
#include <limits>       // std::numeric_limits
#include <type_traits>  // std::is_trivially_default_constructible_v

#include "Core/Diagnostics/Check.hpp"
#include "Core/Memory/OOM.hpp"
#include "Core/Types.hpp"
#include "Core/Memory/Alignment.hpp" // NormalizeAlignment(...)

namespace keel::core
{
    // ------------------------------------------------------------------------
    // Memory Contracts
    // ------------------------------------------------------------------------
    //
    // Alignment normalization:
    // - All allocation APIs accept an arbitrary `alignment`; 0 means "default".
    // - NormalizeAlignment(alignment) yields a power-of-two >= alignof(max_align_t).
    //
    // Size/alignment contract:
    // - `Deallocate(ptr, size, alignment)` REQUIRES the same `(size, alignment)`
    //   used when `ptr` was allocated. Violations are undefined behavior; debug
    //   builds with KEEL_MEM_PARANOID_META assert.
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Contract for every backing store that hands out raw blocks.
    // Contract: Callers pair Allocate results with a matching (size, alignment) on free.
    // Notes   : Implementations must honour NormalizeAlignment and remain noexcept.
    // ---
    class IAllocator
    {
    public:
        virtual ~IAllocator() = default;

        // ---
        // Purpose : Acquire a raw byte buffer honouring the requested alignment.
        // Contract: `size` > 0; returns nullptr on failure; OOM policy handled by the caller.
        // ---
        [[nodiscard]] virtual void* Allocate(usize size, usize alignment) noexcept = 0;

        // ---
        // Purpose : Release a block previously obtained from this allocator.
        // Contract: `ptr` may be null; `(size, alignment)` must match the allocation request.
        // ---
        virtual void  Deallocate(void* ptr, usize size, usize alignment) noexcept = 0;
    };

    // ---
    // Purpose : Process-wide fallback allocator used when callers pass no backing allocator.
    // Contract: Returns a stateless DefaultAllocator instance with static storage duration.
    // Notes   : Defined in DefaultAllocator.cpp.
    // ---
    [[nodiscard]] IAllocator& GetDefaultAllocator() noexcept;

    // ------------------------------------------------------------------------
    // AllocatorRef - thin non-owning wrapper around IAllocator*
    // ------------------------------------------------------------------------
    // - Normalizes alignment before delegating.
    // - Typed array helpers respect the allocator's size/alignment contract.
    // - If `IsValid()` is false, helpers are no-ops (or return nullptr).
    // ------------------------------------------------------------------------
    class AllocatorRef
    {
    public:
        constexpr AllocatorRef() noexcept : m_Alloc(nullptr) {}
        explicit constexpr AllocatorRef(IAllocator* alloc) noexcept : m_Alloc(alloc) {}

        [[nodiscard]] constexpr bool        IsValid() const noexcept { return m_Alloc != nullptr; }
        [[nodiscard]] constexpr IAllocator* Get()     const noexcept { return m_Alloc; }

        // ---
        // Purpose : Allocate an untyped byte range through the wrapped allocator.
        // Contract: `size` > 0; returns nullptr when the wrapper is invalid or allocation
        //           fails (OOM policy invoked).
        // ---
        [[nodiscard]] void* AllocateBytes(usize size,
            usize alignment = alignof(std::max_align_t)) noexcept
        {
            if (!m_Alloc || size == 0)
                return nullptr;

            alignment = NormalizeAlignment(alignment);
            void* memory = m_Alloc->Allocate(size, alignment);
            if (!memory)
            {
                KEEL_MEM_CHECK_OOM(size, alignment, "AllocatorRef::AllocateBytes");
            }
            return memory;
        }

        void DeallocateBytes(void* ptr,
            usize size,
            usize alignment = alignof(std::max_align_t)) noexcept
        {
            if (!m_Alloc || !ptr)
                return;

            alignment = NormalizeAlignment(alignment);
            m_Alloc->Deallocate(ptr, size, alignment);
        }

        // ---
        // Purpose : Allocate an uninitialized array of trivially constructible elements.
        // Contract: `count` > 0; overflow in the byte count yields nullptr.
        // Notes   : Stream buffers (u8 / char16) are the intended payloads.
        // ---
        template <typename T>
        [[nodiscard]] T* NewArray(usize count) noexcept
        {
            static_assert(std::is_trivially_default_constructible_v<T>, "NewArray expects trivial elements");
            if (!m_Alloc || count == 0)
                return nullptr;

            constexpr usize kElemSize = static_cast<usize>(sizeof(T));
            if (count > (std::numeric_limits<usize>::max)() / kElemSize)
            {
                KEEL_ASSERT(false, "AllocatorRef::NewArray: size overflow (sizeof(T) * count)");
                return nullptr;
            }

            return static_cast<T*>(AllocateBytes(kElemSize * count, alignof(T)));
        }

        // ---
        // Purpose : Release an array obtained from NewArray with the same `count`.
        // Contract: Accepts null; wrong `count` is undefined behavior.
        // ---
        template <typename T>
        void DeleteArray(T* ptr, usize count) noexcept
        {
            static_assert(std::is_trivially_destructible_v<T>, "DeleteArray expects trivial elements");
            DeallocateBytes(static_cast<void*>(ptr), static_cast<usize>(sizeof(T)) * count, alignof(T));
        }

    private:
        IAllocator* m_Alloc;
    };

} // namespace keel::core
