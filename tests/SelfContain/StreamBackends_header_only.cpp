// Compile-only self containment check for the byte-stream backends
#include "Core/Streaming/FileByteStream.hpp"
#include "Core/Streaming/MemoryByteStream.hpp"

namespace {
    void TouchStreamBackendsHeaderOnly() noexcept
    {
        (void)sizeof(::keel::stream::FileByteStream);
        (void)sizeof(::keel::stream::MemoryByteStream);
    }
}

static_assert(true, "Stream backend headers compile standalone");
