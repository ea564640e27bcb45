// Compile-only self containment check for RawBuffer.hpp
#include "Core/Memory/RawBuffer.hpp"

namespace {
    struct ByKey
    {
        float key;
    };

    static_assert(::keel::core::SortKeyFunction<float (*)(const ByKey*), ByKey>,
        "Key extractors are recognised as sort keys");
    static_assert(!::keel::core::SortComparison<float (*)(const ByKey*), ByKey>,
        "Key extractors are not comparisons");

    constexpr ::keel::core::RingSegments kSplit = ::keel::core::SplitRing(4, 3, 2);
    static_assert(kSplit.firstCount == 1 && kSplit.secondCount == 1, "SplitRing wraps at capacity");
}

static_assert(true, "RawBuffer header-only TU compiles");
