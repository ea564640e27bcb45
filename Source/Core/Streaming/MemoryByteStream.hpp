// ============================================================================
// Keel - Source/Core/Streaming/MemoryByteStream.hpp
// ----------------------------------------------------------------------------
// Purpose : Byte-stream backend over a borrowed, immutable byte span. Useful
//           for tests, tools and feeding in-memory payloads through the
//           Stream source kind of CharStream.
// Contract: Header-only, no exceptions/RTTI, no allocations. The span must
//           outlive the backend. Reads after Close() report Closed.
// Notes   : `maxChunk` (0 = unlimited) caps each Read so callers can exercise
//           short reads deterministically.
// ============================================================================

#pragma once

#include "Core/Contracts/ByteStream.hpp"

#include <cstring>

namespace keel::stream
{
    struct MemoryByteStream
    {
        const keel::u8* data = nullptr;
        keel::u64       size = 0;
        keel::u64       position = 0;
        keel::u64       maxChunk = 0;
        keel::u32       closeCount = 0;
        bool            closed = false;

        MemoryByteStream() noexcept = default;
        MemoryByteStream(const void* bytes, keel::u64 byteCount, keel::u64 chunkLimit = 0) noexcept
            : data(static_cast<const keel::u8*>(bytes))
            , size(bytes ? byteCount : 0)
            , maxChunk(chunkLimit)
        {
        }

        [[nodiscard]] IoStatus Read(void* dst, keel::u64 dstSize, keel::u64& outRead) noexcept
        {
            outRead = 0;
            if (closed)
                return IoStatus::Closed;
            if (!dst && dstSize != 0)
                return IoStatus::InvalidArg;
            if (position >= size)
                return IoStatus::EndOfStream;

            keel::u64 n = size - position;
            if (n > dstSize) n = dstSize;
            if (maxChunk != 0 && n > maxChunk) n = maxChunk;

            std::memcpy(dst, data + position, static_cast<keel::usize>(n));
            position += n;
            outRead = n;
            return IoStatus::Ok;
        }

        void Close() noexcept
        {
            closed = true;
            ++closeCount;
        }
    };

    static_assert(ByteStreamBackend<MemoryByteStream>, "MemoryByteStream must satisfy byte stream backend concept.");

    [[nodiscard]] inline ByteStreamInterface MakeMemoryByteStreamInterface(MemoryByteStream& backend) noexcept
    {
        return MakeByteStreamInterface(backend);
    }

} // namespace keel::stream
