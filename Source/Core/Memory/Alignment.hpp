#pragma once
// ============================================================================
// Keel - Core/Memory/Alignment.hpp
// ----------------------------------------------------------------------------
// Purpose : Power-of-two alignment math shared by the heap allocator and the
//           arena.
// Contract: Two normalization policies.
//             NormalizeAlignment      -> power of two, at least max_align_t
//                                        (heap blocks).
//             NormalizeArenaAlignment -> power of two, small values kept
//                                        (in-arena slices such as char16[]).
//           Both map 0 to alignof(std::max_align_t) and never return 0.
//           Rounding saturates instead of wrapping.
// ============================================================================

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "Core/Diagnostics/Check.hpp"
#include "Core/Logger.hpp"

#ifndef KEEL_LOGCAT_ALIGNMENT
#define KEEL_LOGCAT_ALIGNMENT "Memory.Alignment"
#endif

namespace keel::core
{
    using usize = std::size_t;

    [[nodiscard]] constexpr bool IsPowerOfTwo(usize value) noexcept
    {
        return value != 0 && (value & (value - 1)) == 0;
    }

    namespace detail
    {
        inline constexpr usize kLargestPow2 = usize{ 1 } << (std::numeric_limits<usize>::digits - 1);

        // Smallest power of two >= value; 0 -> 1; clamps at kLargestPow2.
        [[nodiscard]] constexpr usize CeilPow2(usize value) noexcept
        {
            if (value <= 1)
                return 1;
            if (value > kLargestPow2)
                return kLargestPow2;
            usize result = 1;
            while (result < value)
                result <<= 1;
            return result;
        }

        // value rounded up to `mask + 1`, or the type maximum if that would wrap.
        template <class T>
        [[nodiscard]] constexpr T RoundUpMasked(T value, T mask) noexcept
        {
            static_assert(std::is_unsigned_v<T>, "alignment math expects an unsigned type");
            if ((value & mask) == T{ 0 })
                return value;
            if (value > (std::numeric_limits<T>::max)() - mask)
                return (std::numeric_limits<T>::max)();
            return static_cast<T>((value + mask) & ~mask);
        }
    } // namespace detail

    [[nodiscard]] constexpr usize NormalizeAlignment(usize alignment) noexcept
    {
        constexpr usize kFloor = alignof(std::max_align_t);
        const usize rounded = detail::CeilPow2(alignment);
        return rounded < kFloor ? kFloor : rounded;
    }

    [[nodiscard]] constexpr usize NormalizeArenaAlignment(usize alignment) noexcept
    {
        return alignment == 0 ? alignof(std::max_align_t) : detail::CeilPow2(alignment);
    }

    // ---
    // Purpose : Round `value` up to a multiple of `pow2`, taken as-is.
    // Contract: `pow2` must already be a power of two (checked in debug builds).
    // Notes   : Arena sizing (block granule) and in-arena padding.
    // ---
    template <class T>
    [[nodiscard]] constexpr T AlignUpPow2(T value, usize pow2) noexcept
    {
        KEEL_CHECK(IsPowerOfTwo(pow2));
        return detail::RoundUpMasked<T>(value, static_cast<T>(pow2 - 1));
    }

    // Round `value` up under the heap policy (see NormalizeAlignment).
    template <class T>
    [[nodiscard]] constexpr T AlignUp(T value, usize alignment) noexcept
    {
        return detail::RoundUpMasked<T>(value, static_cast<T>(NormalizeAlignment(alignment) - 1));
    }

    // Checks against the arena policy, so IsAligned(p, 2) means 2-byte aligned.
    // A miss is reported as a warning.
    [[nodiscard]] inline bool IsAligned(const void* ptr, usize alignment) noexcept
    {
        const usize normalized = NormalizeArenaAlignment(alignment);
        const auto address = reinterpret_cast<std::uintptr_t>(ptr);
        if ((address & (normalized - 1)) == 0)
            return true;
        KEEL_LOG_WARNING(KEEL_LOGCAT_ALIGNMENT, "pointer {} is not aligned to {}", ptr, normalized);
        return false;
    }

    static_assert(!IsPowerOfTwo(0) && IsPowerOfTwo(1) && !IsPowerOfTwo(12));
    static_assert(NormalizeAlignment(0) == alignof(std::max_align_t));
    static_assert(NormalizeAlignment(1) == alignof(std::max_align_t));
    static_assert(NormalizeAlignment(64) == 64);
    static_assert(IsPowerOfTwo(NormalizeAlignment((std::numeric_limits<usize>::max)())));
    static_assert(NormalizeArenaAlignment(2) == 2);
    static_assert(NormalizeArenaAlignment(3) == 4);
    static_assert(AlignUpPow2<usize>(40, 32) == 64);
    static_assert(AlignUpPow2<usize>(64, 32) == 64);
    static_assert(AlignUp<usize>(13, 64) == 64);

} // namespace keel::core
