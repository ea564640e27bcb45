// Compile-only self containment check for Diagnostics/HardFailure.hpp
#include "Core/Diagnostics/HardFailure.hpp"

namespace {
    constexpr bool kHardFailurePolicyDefault = (KEEL_FATAL_ON_HARD_FAILURE == 0) || (KEEL_FATAL_ON_HARD_FAILURE == 1);
    static_assert(kHardFailurePolicyDefault, "Hard failure policy macro defaults to binary switch");
}

static_assert(true, "HardFailure header-only TU compiles");
