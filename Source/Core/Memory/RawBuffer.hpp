#pragma once
// ============================================================================
// Keel - Core/Memory/RawBuffer.hpp
// ----------------------------------------------------------------------------
// Purpose : Primitives over borrowed contiguous memory: untyped and typed
//           copies, cursor-advancing copies, zero fill, the two-segment copy
//           across a circular region, and an iterative in-place quicksort
//           with four interchangeable ordering strategies.
// Contract: Nothing here owns memory. Counts are signed element counts and a
//           count <= 0 is a no-op. Destination capacity is NOT validated in
//           Release; Debug builds check it through KEEL_CHECK_SPAN. Callers
//           that need safety must check capacity before copying.
// Notes   : Elements must be trivially copyable; copies are memcpy-based and
//           the sort swaps through a raw temporary. Header-only.
// ============================================================================

#include "Core/Types.hpp"
#include "Core/Diagnostics/Check.hpp"

#include <concepts>
#include <cstring>
#include <type_traits>

namespace keel::core
{
    // ------------------------------------------------------------------------
    // Untyped copies
    // ------------------------------------------------------------------------

    inline void Copy(const void* src, i32 srcSize, void* dst, i32 dstSize) noexcept
    {
        if (srcSize <= 0)
            return;
        KEEL_CHECK_SPAN(srcSize, dstSize);
        (void)dstSize;
        std::memcpy(dst, src, static_cast<usize>(srcSize));
    }

    // ---
    // Purpose : Copy `srcSize` bytes to `*ioDst`, then advance the cursor and shrink
    //           the caller's remaining-capacity counter by the same amount.
    // Contract: `ioRemaining` >= `srcSize` (Debug-checked only).
    // ---
    inline void CopyIncrement(const void* src, i32 srcSize, u8*& ioDst, i32& ioRemaining) noexcept
    {
        if (srcSize <= 0)
            return;
        KEEL_CHECK_SPAN(srcSize, ioRemaining);
        std::memcpy(ioDst, src, static_cast<usize>(srcSize));
        ioDst += srcSize;
        ioRemaining -= srcSize;
    }

    inline void Clear(void* dst, i32 size) noexcept
    {
        if (size <= 0)
            return;
        std::memset(dst, 0, static_cast<usize>(size));
    }

    // ------------------------------------------------------------------------
    // Typed copies
    // ------------------------------------------------------------------------

    template <class T>
    inline void CopyArray(const T* src, i32 srcCount, T* dst, i32 dstCount) noexcept
    {
        static_assert(std::is_trivially_copyable_v<T>, "CopyArray requires trivially copyable elements");
        if (srcCount <= 0)
            return;
        KEEL_CHECK_SPAN(srcCount, dstCount);
        (void)dstCount;
        std::memcpy(dst, src, static_cast<usize>(srcCount) * sizeof(T));
    }

    template <class T>
    inline void CopyArrayIncrement(const T* src, i32 srcCount, T*& ioDst, i32& ioRemaining) noexcept
    {
        static_assert(std::is_trivially_copyable_v<T>, "CopyArrayIncrement requires trivially copyable elements");
        if (srcCount <= 0)
            return;
        KEEL_CHECK_SPAN(srcCount, ioRemaining);
        std::memcpy(ioDst, src, static_cast<usize>(srcCount) * sizeof(T));
        ioDst += srcCount;
        ioRemaining -= srcCount;
    }

    // ------------------------------------------------------------------------
    // Circular regions
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Describe how `count` elements starting at `head` lie in a ring of
    //           `capacity` elements: one run up to the physical end, then the
    //           wrapped remainder from index 0.
    // Contract: 0 <= head < capacity and 0 <= count <= capacity.
    // ---
    struct RingSegments
    {
        i32 firstOffset = 0;
        i32 firstCount  = 0;
        i32 secondCount = 0;
    };

    [[nodiscard]] constexpr RingSegments SplitRing(i32 capacity, i32 head, i32 count) noexcept
    {
        RingSegments segments{};
        if (capacity <= 0 || count <= 0)
            return segments;

        const i32 untilEnd = capacity - head;
        segments.firstOffset = head;
        segments.firstCount = count < untilEnd ? count : untilEnd;
        segments.secondCount = count - segments.firstCount;
        return segments;
    }

    enum class RingCopyDirection : u8
    {
        IntoRing,
        OutOfRing
    };

    // ---
    // Purpose : Copy `count` elements between a linear buffer and a ring starting
    //           at ring index `head`, splitting the transfer at the physical end.
    // Contract: Same ranges as SplitRing; `linear` holds at least `count` elements.
    // ---
    template <class T>
    inline void SplitCopyRing(T* ring, i32 capacity, i32 head, T* linear, i32 count,
        RingCopyDirection direction) noexcept
    {
        const RingSegments seg = SplitRing(capacity, head, count);
        if (direction == RingCopyDirection::IntoRing)
        {
            CopyArray<T>(linear, seg.firstCount, ring + seg.firstOffset, capacity - seg.firstOffset);
            CopyArray<T>(linear + seg.firstCount, seg.secondCount, ring, capacity);
        }
        else
        {
            CopyArray<T>(ring + seg.firstOffset, seg.firstCount, linear, count);
            CopyArray<T>(ring, seg.secondCount, linear + seg.firstCount, count - seg.firstCount);
        }
    }

    template <class T>
    inline void SplitCopyToRing(const T* src, i32 count, T* ring, i32 capacity, i32 head) noexcept
    {
        SplitCopyRing<T>(ring, capacity, head, const_cast<T*>(src), count, RingCopyDirection::IntoRing);
    }

    template <class T>
    inline void SplitCopyFromRing(const T* ring, i32 capacity, i32 head, T* dst, i32 count) noexcept
    {
        SplitCopyRing<T>(const_cast<T*>(ring), capacity, head, dst, count, RingCopyDirection::OutOfRing);
    }

    // ------------------------------------------------------------------------
    // Ordering strategies
    // ------------------------------------------------------------------------
    //
    // 1. Comparer object   : `cmp.Compare(a, b)` -> int   (a, b are const T&)
    // 2. Comparison        : `cmp(a, b)` -> int           (a, b are const T&)
    // 3. Pointer comparison: `cmp(pa, pb)` -> int         (pa, pb are const T*)
    // 4. Sort key          : `key(p)` -> float            (p is const T*)
    //
    // Negative means "a orders before b", zero means equal.
    // ------------------------------------------------------------------------

    template <class C, class T>
    concept SortComparer = requires(const C& c, const T& a, const T& b) {
        { c.Compare(a, b) } -> std::convertible_to<int>;
    };

    template <class F, class T>
    concept SortComparison = !SortComparer<F, T> && requires(F& f, const T& a, const T& b) {
        { f(a, b) } -> std::convertible_to<int>;
    };

    template <class F, class T>
    concept SortPointerComparison = !SortComparer<F, T> && !SortComparison<F, T> &&
        requires(F& f, const T* a, const T* b) {
            { f(a, b) } -> std::convertible_to<int>;
        };

    template <class F, class T>
    concept SortKeyFunction = !SortComparer<F, T> && requires(F& f, const T* a) {
        { f(a) } -> std::convertible_to<float>;
    };

    template <class O, class T>
    concept SortOrdering = SortComparer<O, T> || SortComparison<O, T> ||
        SortPointerComparison<O, T> || SortKeyFunction<O, T>;

    inline constexpr i32 kQuicksortMaxPendingRanges = 64;

    namespace detail
    {
        // Hoare partition around the middle element of [lower, upper]. `makePivot`
        // snapshots the pivot once; `compareToPivot(elem, pivot)` returns <0/0/>0.
        template <class T, class MakePivot, class CompareToPivot>
        i32 QuicksortPartition(T* buffer, i32 lower, i32 upper,
            MakePivot& makePivot, CompareToPivot& compareToPivot)
        {
            const auto pivot = makePivot(buffer[lower + ((upper - lower) >> 1)]);

            i32 i = lower - 1;
            i32 j = upper + 1;
            for (;;)
            {
                do
                {
                    ++i;
                } while (compareToPivot(buffer[i], pivot) < 0);

                do
                {
                    --j;
                } while (compareToPivot(buffer[j], pivot) > 0);

                if (i >= j)
                    return j;

                T temp = buffer[i];
                buffer[i] = buffer[j];
                buffer[j] = temp;
            }
        }

        // Explicit range stack instead of recursion. The larger half is pushed
        // first so the smaller one is processed next, which caps pending ranges
        // at log2(span) + 1.
        template <class T, class MakePivot, class CompareToPivot>
        void QuicksortRange(T* buffer, i32 lower, i32 upper,
            MakePivot makePivot, CompareToPivot compareToPivot)
        {
            static_assert(std::is_trivially_copyable_v<T>, "Quicksort requires trivially copyable elements");
            if (!buffer || lower < 0 || lower >= upper)
                return;

            struct Range { i32 lower; i32 upper; };
            Range pending[kQuicksortMaxPendingRanges];
            i32 top = 0;
            pending[top++] = Range{ lower, upper };

            while (top > 0)
            {
                const Range range = pending[--top];
                const i32 split = QuicksortPartition(buffer, range.lower, range.upper, makePivot, compareToPivot);

                const Range left{ range.lower, split };
                const Range right{ split + 1, range.upper };
                const bool leftIsLarger = (left.upper - left.lower) >= (right.upper - right.lower);
                const Range& larger = leftIsLarger ? left : right;
                const Range& smaller = leftIsLarger ? right : left;

                KEEL_CHECK(top + 2 <= kQuicksortMaxPendingRanges);
                if (larger.lower < larger.upper)
                    pending[top++] = larger;
                if (smaller.lower < smaller.upper)
                    pending[top++] = smaller;
            }
        }

        template <class T>
        [[nodiscard]] constexpr int CompareByLess(const T& a, const T& b) noexcept
        {
            return (a < b) ? -1 : ((b < a) ? 1 : 0);
        }

        template <class T>
        struct CopyPivot
        {
            T operator()(const T& value) const noexcept { return value; }
        };
    } // namespace detail

    // ------------------------------------------------------------------------
    // Quicksort over [lower, upper] (inclusive indices)
    // ------------------------------------------------------------------------

    template <class T>
    void Quicksort(T* buffer, i32 lower, i32 upper)
    {
        detail::QuicksortRange(buffer, lower, upper, detail::CopyPivot<T>{},
            [](const T& value, const T& pivot) { return detail::CompareByLess(value, pivot); });
    }

    template <class T, class C>
        requires SortComparer<C, T>
    void Quicksort(T* buffer, i32 lower, i32 upper, const C& comparer)
    {
        detail::QuicksortRange(buffer, lower, upper, detail::CopyPivot<T>{},
            [&comparer](const T& value, const T& pivot) { return static_cast<int>(comparer.Compare(value, pivot)); });
    }

    template <class T, class F>
        requires SortComparison<F, T>
    void Quicksort(T* buffer, i32 lower, i32 upper, F comparison)
    {
        detail::QuicksortRange(buffer, lower, upper, detail::CopyPivot<T>{},
            [&comparison](const T& value, const T& pivot) { return static_cast<int>(comparison(value, pivot)); });
    }

    // ---
    // Purpose : Sort with a comparison that receives element addresses.
    // Notes   : The pivot is snapshotted into a local, so its address stays
    //           stable while elements are swapped underneath it.
    // ---
    template <class T, class F>
        requires SortPointerComparison<F, T>
    void Quicksort(T* buffer, i32 lower, i32 upper, F comparison)
    {
        detail::QuicksortRange(buffer, lower, upper, detail::CopyPivot<T>{},
            [&comparison](const T& value, const T& pivot) { return static_cast<int>(comparison(&value, &pivot)); });
    }

    // ---
    // Purpose : Sort by a numeric key extracted per element.
    // Notes   : The pivot key is derived once per partition pass.
    // ---
    template <class T, class F>
        requires SortKeyFunction<F, T>
    void Quicksort(T* buffer, i32 lower, i32 upper, F sortKey)
    {
        detail::QuicksortRange(buffer, lower, upper,
            [&sortKey](const T& value) { return static_cast<float>(sortKey(&value)); },
            [&sortKey](const T& value, float pivotKey) {
                const float key = static_cast<float>(sortKey(&value));
                return key < pivotKey ? -1 : (key > pivotKey ? 1 : 0);
            });
    }

    // ------------------------------------------------------------------------
    // Quicksort over the first `count` elements
    // ------------------------------------------------------------------------

    template <class T>
    void Quicksort(T* buffer, i32 count)
    {
        Quicksort(buffer, 0, count - 1);
    }

    template <class T, class Ordering>
        requires SortOrdering<std::remove_cvref_t<Ordering>, T>
    void Quicksort(T* buffer, i32 count, Ordering&& ordering)
    {
        Quicksort(buffer, 0, count - 1, static_cast<Ordering&&>(ordering));
    }

} // namespace keel::core
