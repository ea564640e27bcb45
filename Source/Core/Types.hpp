#pragma once

// ============================================================================
// Keel - Types.hpp
// ----------------------------------------------------------------------------
// Purpose : Short fixed-width aliases shared by every Keel header.
// Notes   : Counts and capacities on the stream and raw-buffer APIs are i32;
//           arena sizes and addresses use usize/uptr. char16 is the unit a
//           CharStream hands out (one UTF-16 code unit).
// ============================================================================

#include <cstddef>
#include <cstdint>

namespace keel
{
    using i32 = std::int32_t;
    using i64 = std::int64_t;

    using u8  = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using usize = std::size_t;
    using uptr  = std::uintptr_t;

    using char16 = char16_t;

    static_assert(sizeof(char16) == 2, "char16 must be a 16-bit code unit");
    static_assert(sizeof(uptr) == sizeof(void*), "uptr must round-trip a pointer");
} // namespace keel
