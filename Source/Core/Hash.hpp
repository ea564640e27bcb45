#pragma once
// ============================================================================
// Keel - Core/Hash.hpp
// ----------------------------------------------------------------------------
// Purpose : FNV-1a hashing over raw bytes and C strings. Arenas use the 32-bit
//           variant to tag their header with a stable, human-traceable name.
// Contract: constexpr, noexcept, allocation-free. Null input hashes as empty.
// Notes   : Not a cryptographic hash; results are stable across platforms.
// ============================================================================

#include "Core/Types.hpp"

namespace keel::core
{
    inline constexpr u32 kFnv1a32Offset = 2166136261u;
    inline constexpr u32 kFnv1a32Prime  = 16777619u;
    inline constexpr u64 kFnv1a64Offset = 0xcbf29ce484222325ull;
    inline constexpr u64 kFnv1a64Prime  = 0x00000100000001b3ull;

    [[nodiscard]] constexpr u32 Hash32(const u8* data, usize size) noexcept
    {
        u32 hash = kFnv1a32Offset;
        for (usize i = 0; data && i < size; ++i)
        {
            hash ^= static_cast<u32>(data[i]);
            hash *= kFnv1a32Prime;
        }
        return hash;
    }

    [[nodiscard]] constexpr u64 Hash64(const u8* data, usize size) noexcept
    {
        u64 hash = kFnv1a64Offset;
        for (usize i = 0; data && i < size; ++i)
        {
            hash ^= static_cast<u64>(data[i]);
            hash *= kFnv1a64Prime;
        }
        return hash;
    }

    // ---
    // Purpose : Hash a NUL-terminated string without computing its length first.
    // Contract: `text` may be null (hashes as the empty string).
    // ---
    [[nodiscard]] constexpr u32 Hash32(const char* text) noexcept
    {
        u32 hash = kFnv1a32Offset;
        for (; text && *text; ++text)
        {
            hash ^= static_cast<u32>(static_cast<unsigned char>(*text));
            hash *= kFnv1a32Prime;
        }
        return hash;
    }

    [[nodiscard]] constexpr u64 Hash64(const char* text) noexcept
    {
        u64 hash = kFnv1a64Offset;
        for (; text && *text; ++text)
        {
            hash ^= static_cast<u64>(static_cast<unsigned char>(*text));
            hash *= kFnv1a64Prime;
        }
        return hash;
    }

    static_assert(Hash32("") == kFnv1a32Offset, "FNV-1a 32 of empty input is the offset basis");
    static_assert(Hash32("a") == 0xe40c292cu, "FNV-1a 32 reference value");
    static_assert(Hash64("a") == 0xaf63dc4c8601ec8cull, "FNV-1a 64 reference value");

} // namespace keel::core
