// Compile-only self containment check for Hash.hpp
#include "Core/Hash.hpp"

static_assert(::keel::core::Hash32("") == ::keel::core::kFnv1a32Offset, "Empty input hashes to the offset basis");
static_assert(true, "Hash header-only TU compiles");
