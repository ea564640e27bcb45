// Compile-only include-order check: stream headers pull in memory and logging on their own
#include "Core/Streaming/CharStream.hpp"
#include "Core/Streaming/FileByteStream.hpp"
#include "Core/Streaming/MemoryByteStream.hpp"
#include "Core/Memory/Arena.hpp"
#include "Core/Logger.hpp"

namespace {
    [[maybe_unused]] void LogFromEveryLayer() noexcept
    {
        KEEL_LOG_VERBOSE(KEEL_STREAM_LOG_CATEGORY, "stream {}", 1);
        KEEL_LOG_WARNING(KEEL_ARENA_LOG_CATEGORY, "arena");
        KEEL_ASSERT(true);
        KEEL_ASSERT(1 + 1 == 2, "arithmetic");
    }
}
