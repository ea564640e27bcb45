// Compile-only self containment check for the memory policy headers
#include "Core/Memory/MemoryConfig.hpp"
#include "Core/Memory/OOM.hpp"

#include <type_traits>

static_assert(std::is_same_v<decltype(::keel::core::ShouldFatalOnOOM()), bool>, "OOM policy is a flag");
static_assert(std::is_same_v<decltype(::keel::core::GetOOMCount()), unsigned>, "OOM count is observable");
static_assert(std::is_same_v<decltype(::keel::core::MemoryConfig::GetGlobal()), ::keel::core::MemoryConfig&>,
    "One process-wide memory configuration");
static_assert(KEEL_ARENA_MAX_REWIND_DEPTH > 0 && KEEL_ARENA_BLOCK_GRANULE > 0, "Arena limits are positive");
