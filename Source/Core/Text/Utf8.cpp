// ============================================================================
// Keel - Core/Text/Utf8.cpp
// ============================================================================

#include "Core/Text/Utf8.hpp"

namespace keel::text
{
    namespace
    {
        constexpr u32 kMaxCodePoint = 0x10FFFFu;

        [[nodiscard]] constexpr bool IsSurrogate(u32 cp) noexcept { return cp >= 0xD800u && cp <= 0xDFFFu; }
        [[nodiscard]] constexpr bool IsHighSurrogate(u32 cu) noexcept { return cu >= 0xD800u && cu <= 0xDBFFu; }
        [[nodiscard]] constexpr bool IsLowSurrogate(u32 cu) noexcept { return cu >= 0xDC00u && cu <= 0xDFFFu; }

        // Appends the UTF-16 form of a validated code point; returns units written.
        i32 EmitUtf16(u32 cp, char16* out) noexcept
        {
            if (cp < 0x10000u)
            {
                out[0] = static_cast<char16>(cp);
                return 1;
            }
            cp -= 0x10000u;
            out[0] = static_cast<char16>(0xD800u + (cp >> 10));
            out[1] = static_cast<char16>(0xDC00u + (cp & 0x3FFu));
            return 2;
        }

        i32 EmitUtf8(u32 cp, u8* out) noexcept
        {
            if (cp > kMaxCodePoint || IsSurrogate(cp))
                cp = kReplacementChar;

            if (cp < 0x80u)
            {
                out[0] = static_cast<u8>(cp);
                return 1;
            }
            if (cp < 0x800u)
            {
                out[0] = static_cast<u8>(0xC0u | (cp >> 6));
                out[1] = static_cast<u8>(0x80u | (cp & 0x3Fu));
                return 2;
            }
            if (cp < 0x10000u)
            {
                out[0] = static_cast<u8>(0xE0u | (cp >> 12));
                out[1] = static_cast<u8>(0x80u | ((cp >> 6) & 0x3Fu));
                out[2] = static_cast<u8>(0x80u | (cp & 0x3Fu));
                return 3;
            }
            out[0] = static_cast<u8>(0xF0u | (cp >> 18));
            out[1] = static_cast<u8>(0x80u | ((cp >> 12) & 0x3Fu));
            out[2] = static_cast<u8>(0x80u | ((cp >> 6) & 0x3Fu));
            out[3] = static_cast<u8>(0x80u | (cp & 0x3Fu));
            return 4;
        }

        // Starts a new sequence at `b`, writing at most one unit to `out`.
        i32 DecodeLead(Utf8Decoder& state, u8 b, char16* out) noexcept
        {
            if (b < 0x80u)
            {
                out[0] = static_cast<char16>(b);
                return 1;
            }
            if (b >= 0xC2u && b <= 0xDFu)
            {
                state.codePoint = b & 0x1Fu;
                state.minimum = 0x80u;
                state.remaining = 1;
                return 0;
            }
            if (b >= 0xE0u && b <= 0xEFu)
            {
                state.codePoint = b & 0x0Fu;
                state.minimum = 0x800u;
                state.remaining = 2;
                return 0;
            }
            if (b >= 0xF0u && b <= 0xF4u)
            {
                state.codePoint = b & 0x07u;
                state.minimum = 0x10000u;
                state.remaining = 3;
                return 0;
            }

            // Stray continuation byte, C0/C1 or F5..FF.
            out[0] = kReplacementChar;
            return 1;
        }

        // Feeds one byte; writes at most two units to `out`.
        i32 DecodeByte(Utf8Decoder& state, u8 b, char16* out) noexcept
        {
            if (!state.HasPending())
                return DecodeLead(state, b, out);

            if ((b & 0xC0u) != 0x80u)
            {
                // Sequence cut short: replace it, then restart at this byte.
                state.Reset();
                out[0] = kReplacementChar;
                return 1 + DecodeLead(state, b, out + 1);
            }

            state.codePoint = (state.codePoint << 6) | (b & 0x3Fu);
            if (--state.remaining != 0)
                return 0;

            const u32 cp = state.codePoint;
            const u32 minimum = state.minimum;
            state.Reset();

            if (cp < minimum || cp > kMaxCodePoint || IsSurrogate(cp))
            {
                out[0] = kReplacementChar;
                return 1;
            }
            return EmitUtf16(cp, out);
        }
    } // namespace

    TranscodeResult Decode(Utf8Decoder& state, const u8* src, i32 srcCount,
        char16* dst, i32 dstCapacity) noexcept
    {
        TranscodeResult result{};
        if (!src || !dst || srcCount <= 0 || dstCapacity <= 0)
            return result;

        char16 scratch[2];
        while (result.consumed < srcCount)
        {
            Utf8Decoder next = state;
            const i32 units = DecodeByte(next, src[result.consumed], scratch);
            if (units > dstCapacity - result.produced)
                break;

            state = next;
            for (i32 i = 0; i < units; ++i)
                dst[result.produced++] = scratch[i];
            ++result.consumed;
        }
        return result;
    }

    i32 Flush(Utf8Decoder& state, char16* dst, i32 dstCapacity) noexcept
    {
        if (!state.HasPending())
            return 0;
        if (!dst || dstCapacity <= 0)
            return 0;

        state.Reset();
        dst[0] = kReplacementChar;
        return 1;
    }

    TranscodeResult Encode(Utf8Encoder& state, const char16* src, i32 srcCount,
        u8* dst, i32 dstCapacity) noexcept
    {
        TranscodeResult result{};
        if (!src || !dst || srcCount <= 0 || dstCapacity <= 0)
            return result;

        u8 scratch[8];
        while (result.consumed < srcCount)
        {
            const u32 unit = src[result.consumed];
            char16 pending = state.pendingHigh;
            i32 bytes = 0;

            if (pending != 0)
            {
                if (IsLowSurrogate(unit))
                {
                    const u32 cp = 0x10000u + ((static_cast<u32>(pending) - 0xD800u) << 10) + (unit - 0xDC00u);
                    bytes = EmitUtf8(cp, scratch);
                    pending = 0;
                }
                else
                {
                    bytes = EmitUtf8(kReplacementChar, scratch);
                    pending = 0;
                    if (IsHighSurrogate(unit))
                        pending = static_cast<char16>(unit);
                    else
                        bytes += EmitUtf8(unit, scratch + bytes);
                }
            }
            else if (IsHighSurrogate(unit))
            {
                pending = static_cast<char16>(unit);
            }
            else
            {
                // Lone low surrogates are mapped to U+FFFD by EmitUtf8.
                bytes = EmitUtf8(unit, scratch);
            }

            if (bytes > dstCapacity - result.produced)
                break;

            state.pendingHigh = pending;
            for (i32 i = 0; i < bytes; ++i)
                dst[result.produced++] = scratch[i];
            ++result.consumed;
        }
        return result;
    }

    i32 Flush(Utf8Encoder& state, u8* dst, i32 dstCapacity) noexcept
    {
        if (!state.HasPending())
            return 0;
        if (!dst || dstCapacity < 3)
            return 0;

        state.Reset();
        return EmitUtf8(kReplacementChar, dst);
    }

} // namespace keel::text
