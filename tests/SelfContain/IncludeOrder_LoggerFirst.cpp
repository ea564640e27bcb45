// Compile-only include-order check: Logger.hpp and Check.hpp ahead of everything else
#include "Core/Logger.hpp"
#include "Core/Diagnostics/Check.hpp"
#include "Core/Memory/RawBuffer.hpp"
#include "Core/Text/Utf8.hpp"
#include "Core/Streaming/CharStream.hpp"

namespace {
    [[maybe_unused]] void CheckedCopy(const keel::u8* src, keel::u8* dst, keel::i32 count, keel::i32 capacity) noexcept
    {
        KEEL_CHECK_SPAN(count, capacity);
        keel::core::Copy(src, count, dst, capacity);
        KEEL_LOG_ERROR(KEEL_TEXT_LOG_CATEGORY, "copied {} of {}", count, capacity);
    }
}
