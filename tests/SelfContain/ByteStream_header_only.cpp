// Compile-only self containment check for Contracts/ByteStream.hpp
#include "Core/Contracts/ByteStream.hpp"

namespace {
    struct NullBackend
    {
        ::keel::stream::IoStatus Read(void*, ::keel::u64, ::keel::u64& outRead) noexcept
        {
            outRead = 0;
            return ::keel::stream::IoStatus::EndOfStream;
        }

        void Close() noexcept {}
    };

    static_assert(::keel::stream::ByteStreamBackend<NullBackend>, "Minimal backend satisfies the concept");
}

static_assert(true, "ByteStream contract header-only TU compiles");
