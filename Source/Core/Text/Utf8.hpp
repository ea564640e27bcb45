#pragma once
// ============================================================================
// Keel - Core/Text/Utf8.hpp
// ----------------------------------------------------------------------------
// Purpose : Stateful UTF-8 <-> UTF-16 transcoding for byte-backed and
//           char-backed streams that are read in the "other" unit.
// Contract: Both transcoders are resumable: a multi-byte sequence (decoder) or
//           a high surrogate (encoder) split across calls is carried in the
//           state object. A call never writes past `dstCapacity`; it stops
//           before the first input unit whose output would not fit and reports
//           how much input it consumed. Malformed input becomes U+FFFD.
// Notes   : State objects are trivially copyable so they can live inside a
//           flat CharStream value.
// ============================================================================

#include "Core/Types.hpp"

namespace keel::text
{
    inline constexpr char16 kReplacementChar = 0xFFFD;

    struct TranscodeResult
    {
        i32 consumed = 0; // input units read
        i32 produced = 0; // output units written
    };

    // --- Utf8Decoder --------------------------------------------------------
    // Purpose : Carries a partially decoded sequence between Decode() calls.
    struct Utf8Decoder
    {
        u32 codePoint = 0; // bits accumulated so far
        u32 minimum   = 0; // smallest code point the sequence length may encode
        u8  remaining = 0; // continuation bytes still expected

        [[nodiscard]] constexpr bool HasPending() const noexcept { return remaining != 0; }
        constexpr void Reset() noexcept { codePoint = 0; minimum = 0; remaining = 0; }
    };

    // ---
    // Purpose : Decode UTF-8 bytes into UTF-16 code units.
    // Contract: Consumes bytes until `srcCount` is reached or the next byte would
    //           overflow `dst`. Code points above U+FFFF become surrogate pairs.
    //           Overlong forms, encoded surrogates, values above U+10FFFF, stray
    //           continuation bytes and truncated sequences yield U+FFFD.
    // ---
    [[nodiscard]] TranscodeResult Decode(Utf8Decoder& state, const u8* src, i32 srcCount,
        char16* dst, i32 dstCapacity) noexcept;

    // ---
    // Purpose : Terminate decoding; a dangling partial sequence becomes U+FFFD.
    // Contract: Returns units written (0 or 1). Leaves the state untouched when
    //           `dstCapacity` is 0 and a replacement is pending.
    // ---
    [[nodiscard]] i32 Flush(Utf8Decoder& state, char16* dst, i32 dstCapacity) noexcept;

    // --- Utf8Encoder --------------------------------------------------------
    // Purpose : Carries a high surrogate waiting for its low half.
    struct Utf8Encoder
    {
        char16 pendingHigh = 0;

        [[nodiscard]] constexpr bool HasPending() const noexcept { return pendingHigh != 0; }
        constexpr void Reset() noexcept { pendingHigh = 0; }
    };

    // ---
    // Purpose : Encode UTF-16 code units as UTF-8 bytes.
    // Contract: Valid surrogate pairs become one 4-byte sequence; lone surrogates
    //           become U+FFFD (EF BF BD). Stops before the first unit whose bytes
    //           would overflow `dst`.
    // ---
    [[nodiscard]] TranscodeResult Encode(Utf8Encoder& state, const char16* src, i32 srcCount,
        u8* dst, i32 dstCapacity) noexcept;

    [[nodiscard]] i32 Flush(Utf8Encoder& state, u8* dst, i32 dstCapacity) noexcept;

    // Bytes needed to encode `codePoint` (1..4); out-of-range values count as U+FFFD.
    [[nodiscard]] constexpr i32 EncodedLength(u32 codePoint) noexcept
    {
        if (codePoint < 0x80u) return 1;
        if (codePoint < 0x800u) return 2;
        if (codePoint < 0x10000u) return 3;
        if (codePoint <= 0x10FFFFu) return 4;
        return 3;
    }

} // namespace keel::text
