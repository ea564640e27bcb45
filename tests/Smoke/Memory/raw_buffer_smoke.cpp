// ============================================================================
// Keel - tests/Smoke/Memory/raw_buffer_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Cover raw byte/array copies, ring splitting and every quicksort
//           ordering strategy on degenerate and ordinary inputs.
// Contract: No exceptions/RTTI; deterministic inputs only. Returns 0 on pass.
// Notes   : Sorted outputs are checked for order and for multiset preservation
//           (via a checksum and a histogram of the small value domain).
// ============================================================================

#include "Core/Memory/RawBuffer.hpp"

#include <cstring>

namespace
{
    using namespace keel;
    using namespace keel::core;

    struct Item
    {
        i32   id;
        float weight;
    };

    struct DescendingComparer
    {
        int Compare(const i32& a, const i32& b) const noexcept
        {
            return (a > b) ? -1 : ((a < b) ? 1 : 0);
        }
    };

    constexpr i32 kDomain = 16;

    void Histogram(const i32* values, i32 count, i32 (&out)[kDomain]) noexcept
    {
        for (i32 i = 0; i < kDomain; ++i)
            out[i] = 0;
        for (i32 i = 0; i < count; ++i)
            ++out[values[i]];
    }

    bool SameMultiset(const i32* a, const i32* b, i32 count) noexcept
    {
        i32 ha[kDomain];
        i32 hb[kDomain];
        Histogram(a, count, ha);
        Histogram(b, count, hb);
        for (i32 i = 0; i < kDomain; ++i)
            if (ha[i] != hb[i])
                return false;
        return true;
    }

    bool IsAscending(const i32* values, i32 count) noexcept
    {
        for (i32 i = 1; i < count; ++i)
            if (values[i - 1] > values[i])
                return false;
        return true;
    }

    bool IsDescending(const i32* values, i32 count) noexcept
    {
        for (i32 i = 1; i < count; ++i)
            if (values[i - 1] < values[i])
                return false;
        return true;
    }

    // Sorts copies of the degenerate shapes with `ordering`. Returns the index
    // of the first shape that comes back out of order or altered, else -1.
    template <class Ordering>
    i32 FirstBadDegenerateShape(Ordering ordering, bool descending) noexcept
    {
        constexpr i32 kLength = 10;
        const i32 shapes[4][kLength] = {
            {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
            {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
            {3, 3, 3, 3, 3, 3, 3, 3, 3, 3},
            {4, 4, 4, 4, 4, 1, 1, 1, 1, 1},
        };
        for (i32 s = 0; s < 4; ++s)
        {
            i32 values[kLength];
            std::memcpy(values, shapes[s], sizeof(values));
            Quicksort(values, kLength, ordering);
            const bool ordered = descending ? IsDescending(values, kLength) : IsAscending(values, kLength);
            if (!ordered || !SameMultiset(shapes[s], values, kLength))
                return s;
        }

        // Empty and single-element ranges are left untouched.
        i32 lone[2] = {7, 2};
        Quicksort(lone, 0, ordering);
        Quicksort(lone, 1, ordering);
        Quicksort(lone, 1, 0, ordering);
        if (lone[0] != 7 || lone[1] != 2)
            return 4;
        return -1;
    }

    int RunCopyChecks()
    {
        const u8 source[8] = {1, 2, 3, 4, 5, 6, 7, 8};
        u8 target[16] = {};

        u8* cursor = target;
        i32 remaining = 16;
        CopyIncrement(source, 3, cursor, remaining);
        CopyIncrement(source + 3, 5, cursor, remaining);
        if (cursor != target + 8 || remaining != 8) return 1;
        if (std::memcmp(source, target, 8) != 0) return 2;

        CopyIncrement(source, 0, cursor, remaining);
        CopyIncrement(source, -4, cursor, remaining);
        if (cursor != target + 8 || remaining != 8) return 3;

        Copy(source, 0, target, 0);
        Clear(target, 4);
        if (target[0] != 0 || target[3] != 0 || target[4] != 5) return 4;

        const i32 words[3] = {10, 20, 30};
        i32 wordTarget[5] = {};
        i32* wordCursor = wordTarget;
        i32 wordRemaining = 5;
        CopyArrayIncrement(words, 3, wordCursor, wordRemaining);
        if (wordCursor != wordTarget + 3 || wordRemaining != 2 || wordTarget[2] != 30) return 5;
        return 0;
    }

    int RunRingChecks()
    {
        constexpr RingSegments whole = SplitRing(8, 2, 4);
        static_assert(whole.firstOffset == 2 && whole.firstCount == 4 && whole.secondCount == 0);

        constexpr RingSegments wrapped = SplitRing(8, 6, 5);
        static_assert(wrapped.firstOffset == 6 && wrapped.firstCount == 2 && wrapped.secondCount == 3);

        char16 ring[8] = {};
        const char16 text[5] = {u'a', u'b', u'c', u'd', u'e'};
        SplitCopyToRing(text, 5, ring, 8, 6);
        if (ring[6] != u'a' || ring[7] != u'b' || ring[0] != u'c' || ring[2] != u'e') return 10;

        char16 back[5] = {};
        SplitCopyFromRing(static_cast<const char16*>(ring), 8, 6, back, 5);
        for (i32 i = 0; i < 5; ++i)
            if (back[i] != text[i]) return 11;
        return 0;
    }

    int RunSortChecks()
    {
        // Empty and single-element ranges are no-ops.
        i32 empty[1] = {7};
        Quicksort(empty, 0);
        Quicksort(empty, 0, -1);
        Quicksort(empty, 1);
        if (empty[0] != 7) return 20;

        i32 sorted[10] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        Quicksort(sorted, 10);
        if (!IsAscending(sorted, 10) || sorted[0] != 0 || sorted[9] != 9) return 21;

        i32 reversed[10] = {9, 8, 7, 6, 5, 4, 3, 2, 1, 0};
        Quicksort(reversed, 10);
        if (!IsAscending(reversed, 10) || reversed[0] != 0 || reversed[9] != 9) return 22;

        i32 equal[9] = {3, 3, 3, 3, 3, 3, 3, 3, 3};
        Quicksort(equal, 9);
        for (i32 v : equal)
            if (v != 3) return 23;

        // Mixed input with duplicates, sorted by each strategy.
        const i32 input[24] = {5, 1, 9, 1, 0, 15, 7, 7, 3, 12, 2, 8, 8, 8, 4, 11, 6, 14, 13, 10, 2, 0, 9, 5};
        constexpr i32 kCount = 24;

        i32 byDefault[kCount];
        std::memcpy(byDefault, input, sizeof(input));
        Quicksort(byDefault, kCount);
        if (!IsAscending(byDefault, kCount) || !SameMultiset(input, byDefault, kCount)) return 24;

        i32 byComparer[kCount];
        std::memcpy(byComparer, input, sizeof(input));
        Quicksort(byComparer, kCount, DescendingComparer{});
        if (!IsDescending(byComparer, kCount) || !SameMultiset(input, byComparer, kCount)) return 25;

        i32 byComparison[kCount];
        std::memcpy(byComparison, input, sizeof(input));
        Quicksort(byComparison, kCount, [](const i32& a, const i32& b) { return a - b; });
        if (!IsAscending(byComparison, kCount) || !SameMultiset(input, byComparison, kCount)) return 26;

        i32 byPointer[kCount];
        std::memcpy(byPointer, input, sizeof(input));
        Quicksort(byPointer, kCount, [](const i32* a, const i32* b) { return *b - *a; });
        if (!IsDescending(byPointer, kCount) || !SameMultiset(input, byPointer, kCount)) return 27;

        // Sub-range sort leaves the ends alone.
        i32 partial[8] = {9, 4, 3, 2, 1, 0, 8, 5};
        Quicksort(partial, 1, 5);
        if (partial[0] != 9 || partial[6] != 8 || partial[7] != 5) return 28;
        if (!IsAscending(partial + 1, 5)) return 29;

        // Sort key on a struct; ids travel with their weights.
        Item items[6] = {{0, 2.5f}, {1, -1.0f}, {2, 7.0f}, {3, 0.0f}, {4, 2.5f}, {5, -3.0f}};
        Quicksort(items, 6, [](const Item* item) { return item->weight; });
        for (i32 i = 1; i < 6; ++i)
            if (items[i - 1].weight > items[i].weight) return 30;
        if (items[0].id != 5 || items[5].id != 2) return 31;

        // Large reverse input stays within the pending range stack.
        static i32 big[4096];
        for (i32 i = 0; i < 4096; ++i)
            big[i] = (4095 - i) % kDomain;
        Quicksort(big, 4096);
        if (!IsAscending(big, 4096)) return 32;

        // Degenerate shapes through every ordering strategy.
        if (FirstBadDegenerateShape(DescendingComparer{}, true) != -1) return 33;
        if (FirstBadDegenerateShape([](const i32& a, const i32& b) { return a - b; }, false) != -1) return 34;
        if (FirstBadDegenerateShape([](const i32* a, const i32* b) { return *b - *a; }, true) != -1) return 35;
        if (FirstBadDegenerateShape([](const i32* v) { return static_cast<float>(*v); }, false) != -1) return 36;

        // A constant key makes every element equal to the pivot.
        Item flat[5] = {{0, 1.0f}, {1, 1.0f}, {2, 1.0f}, {3, 1.0f}, {4, 1.0f}};
        Quicksort(flat, 5, [](const Item*) { return 0.0f; });
        i32 idSum = 0;
        for (const Item& item : flat)
            idSum += item.id;
        if (idSum != 10) return 37;
        return 0;
    }
} // namespace

int RunRawBufferSmoke()
{
    if (const int code = RunCopyChecks(); code != 0) return code;
    if (const int code = RunRingChecks(); code != 0) return code;
    if (const int code = RunSortChecks(); code != 0) return code;
    return 0;
}
