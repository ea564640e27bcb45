// ============================================================================
// Keel - Source/Core/Streaming/CharStream.cpp
// ----------------------------------------------------------------------------
// Purpose : Load/read/queue/dispose for CharStream.
// Contract: See CharStream.hpp.
// Notes   : Reads and disposal go through tables indexed by SourceType and
//           Ownership. Slot 0 of the read tables is the "not loaded" state.
//           Ring segment arithmetic lives in Core/Memory/RawBuffer.hpp.
// ============================================================================

#include "Core/Streaming/CharStream.hpp"

#include "Core/Diagnostics/HardFailure.hpp"
#include "Core/Logger.hpp"
#include "Core/Memory/DefaultAllocator.hpp"
#include "Core/Memory/RawBuffer.hpp"

#include <algorithm> // std::min
#include <cstring>   // std::strlen
#include <iterator>  // std::size
#include <type_traits>

namespace keel::stream
{
    using keel::char16;
    using keel::i32;
    using keel::u8;
    using keel::core::HardFailureKind;
    using keel::core::ReportHardFailure;

    namespace
    {
        [[nodiscard]] const char* DisplayName(const CharStream& s) noexcept
        {
            return s.name ? s.name : "<unnamed>";
        }

        [[nodiscard]] constexpr i32 Min3(i32 a, i32 b, i32 c) noexcept
        {
            return std::min(a, std::min(b, c));
        }

        // --------------------------------------------------------------------
        // Transcoder plumbing: char16 output decodes, u8 output encodes.
        // --------------------------------------------------------------------

        template <class Dst>
        [[nodiscard]] auto& TranscoderFor(CharStream& s) noexcept
        {
            if constexpr (std::is_same_v<Dst, char16>)
                return s.decoder;
            else
                return s.encoder;
        }

        [[nodiscard]] text::TranscodeResult Transcode(text::Utf8Decoder& state, const u8* src, i32 count,
            char16* dst, i32 capacity) noexcept
        {
            return text::Decode(state, src, count, dst, capacity);
        }

        [[nodiscard]] text::TranscodeResult Transcode(text::Utf8Encoder& state, const char16* src, i32 count,
            u8* dst, i32 capacity) noexcept
        {
            return text::Encode(state, src, count, dst, capacity);
        }

        // --------------------------------------------------------------------
        // Ring bookkeeping
        // --------------------------------------------------------------------

        // The next character's output does not fit `capacity`. Retrying with the
        // same destination can never make progress, so this is an argument error.
        [[nodiscard]] StreamStatus RejectTightDestination(const CharStream& s, i32 capacity, i32& outCount) noexcept
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY,
                "CharStream '{}': destination of {} units cannot hold the next character", DisplayName(s), capacity);
            outCount = 0;
            return StreamStatus::InvalidArg;
        }

        // Emits what the transcoder still holds once the input is gone. Returns
        // false with `status` set when that output does not fit `capacity`.
        template <class State, class Dst>
        [[nodiscard]] bool FlushPending(const CharStream& s, State& state, Dst* dst, i32 capacity,
            i32& flushed, StreamStatus& status) noexcept
        {
            flushed = text::Flush(state, dst, capacity);
            if (flushed == 0 && state.HasPending())
            {
                status = RejectTightDestination(s, capacity, flushed);
                return false;
            }
            return true;
        }

        // False when the caller must return `status`/`outCount` as is (pending,
        // flushed, exhausted or a tight destination); true when a unit is live.
        template <class Dst>
        [[nodiscard]] bool RingReady(CharStream& s, Dst* dst, i32 capacity, i32& outCount, StreamStatus& status) noexcept
        {
            status = StreamStatus::Ok;
            if (s.ringState == RingState::Exhausted)
            {
                outCount = kEndOfStream;
                return false;
            }
            if (s.length > 0)
                return true;

            if (s.finished)
            {
                i32 flushed = 0;
                if (!FlushPending(s, TranscoderFor<Dst>(s), dst, capacity, flushed, status))
                {
                    outCount = 0;
                    return false;
                }
                if (flushed > 0)
                {
                    outCount = flushed;
                    return false;
                }
                s.ringState = RingState::Exhausted;
                outCount = kEndOfStream;
                return false;
            }

            s.ringState = RingState::EmptyPending;
            outCount = 0;
            return false;
        }

        void RingConsume(CharStream& s, i32 consumed) noexcept
        {
            s.length -= consumed;
            if (s.length == 0)
            {
                s.offset = 0;
                const bool pending = s.decoder.HasPending() || s.encoder.HasPending();
                s.ringState = (s.finished && !pending) ? RingState::Exhausted : RingState::EmptyPending;
            }
            else
            {
                s.offset = (s.offset + consumed) % s.capacity;
                s.ringState = RingState::HasData;
            }
        }

        // --------------------------------------------------------------------
        // Read handlers
        // --------------------------------------------------------------------

        template <class Dst>
        using ReadHandler = StreamStatus(*)(CharStream&, i32 blockSize, Dst* dst, i32 capacity, i32& outCount) noexcept;

        // Refills the unpack buffer. Sets `finished` when the source is drained or fails.
        [[nodiscard]] StreamStatus PullFromSource(CharStream& s, i32 blockSize) noexcept
        {
            const i32 want = std::min(blockSize, s.unpackSize);
            keel::u64 got = 0;
            const IoStatus io = Read(s.source, s.unpackBuffer, static_cast<keel::u64>(want), got);
            if (io == IoStatus::Ok && got > 0)
            {
                s.unpackOffset = 0;
                s.unpackCount = static_cast<i32>(got);
                return StreamStatus::Ok;
            }

            s.finished = true;
            if (io == IoStatus::Ok || io == IoStatus::EndOfStream)
                return StreamStatus::Ok;

            KEEL_LOG_WARNING(KEEL_STREAM_LOG_CATEGORY, "CharStream '{}': byte stream read failed ({})",
                DisplayName(s), ToString(io));
            return StreamStatus::IoError;
        }

        StreamStatus ReadCharsFromStream(CharStream& s, i32 blockSize, char16* dst, i32 capacity, i32& outCount) noexcept
        {
            for (;;)
            {
                if (s.unpackCount > 0)
                {
                    const auto res = text::Decode(s.decoder, s.unpackBuffer + s.unpackOffset, s.unpackCount, dst, capacity);
                    if (res.consumed == 0 && res.produced == 0)
                        return RejectTightDestination(s, capacity, outCount);
                    s.unpackOffset += res.consumed;
                    s.unpackCount -= res.consumed;
                    if (res.produced > 0)
                    {
                        outCount = res.produced;
                        return StreamStatus::Ok;
                    }
                    continue; // only part of a sequence arrived; pull more
                }

                if (s.finished)
                {
                    i32 flushed = 0;
                    StreamStatus status = StreamStatus::Ok;
                    if (!FlushPending(s, s.decoder, dst, capacity, flushed, status))
                    {
                        outCount = 0;
                        return status;
                    }
                    outCount = flushed > 0 ? flushed : kEndOfStream;
                    return StreamStatus::Ok;
                }

                const StreamStatus status = PullFromSource(s, blockSize);
                if (status != StreamStatus::Ok)
                {
                    outCount = kEndOfStream;
                    return status;
                }
            }
        }

        StreamStatus ReadBytesFromStream(CharStream& s, i32 blockSize, u8* dst, i32 capacity, i32& outCount) noexcept
        {
            if (s.unpackCount > 0)
            {
                // Leftovers from an earlier char-mode read come first.
                const i32 n = Min3(s.unpackCount, blockSize, capacity);
                keel::core::CopyArray<u8>(s.unpackBuffer + s.unpackOffset, n, dst, capacity);
                s.unpackOffset += n;
                s.unpackCount -= n;
                outCount = n;
                return StreamStatus::Ok;
            }

            if (s.finished)
            {
                outCount = kEndOfStream;
                return StreamStatus::Ok;
            }

            keel::u64 got = 0;
            const IoStatus io = Read(s.source, dst, static_cast<keel::u64>(std::min(blockSize, capacity)), got);
            if (io == IoStatus::Ok && got > 0)
            {
                outCount = static_cast<i32>(got);
                return StreamStatus::Ok;
            }

            s.finished = true;
            outCount = kEndOfStream;
            if (io == IoStatus::Ok || io == IoStatus::EndOfStream)
                return StreamStatus::Ok;

            KEEL_LOG_WARNING(KEEL_STREAM_LOG_CATEGORY, "CharStream '{}': byte stream read failed ({})",
                DisplayName(s), ToString(io));
            return StreamStatus::IoError;
        }

        template <class T>
        StreamStatus ReadLinearCopy(CharStream& s, i32 blockSize, T* dst, i32 capacity, i32& outCount) noexcept
        {
            if (s.length == 0)
            {
                s.finished = true;
                outCount = kEndOfStream;
                return StreamStatus::Ok;
            }

            const i32 n = Min3(s.length, blockSize, capacity);
            keel::core::CopyArray<T>(static_cast<const T*>(s.data) + s.offset, n, dst, capacity);
            s.offset += n;
            s.length -= n;
            outCount = n;
            return StreamStatus::Ok;
        }

        template <class Src, class Dst>
        StreamStatus ReadLinearTranscode(CharStream& s, i32 blockSize, Dst* dst, i32 capacity, i32& outCount) noexcept
        {
            auto& state = TranscoderFor<Dst>(s);
            const Src* base = static_cast<const Src*>(s.data);
            for (;;)
            {
                if (s.length == 0)
                {
                    i32 flushed = 0;
                    StreamStatus status = StreamStatus::Ok;
                    if (!FlushPending(s, state, dst, capacity, flushed, status))
                    {
                        outCount = 0;
                        return status;
                    }
                    if (flushed > 0)
                    {
                        outCount = flushed;
                        return StreamStatus::Ok;
                    }
                    s.finished = true;
                    outCount = kEndOfStream;
                    return StreamStatus::Ok;
                }

                const auto res = Transcode(state, base + s.offset, std::min(s.length, blockSize), dst, capacity);
                if (res.consumed == 0 && res.produced == 0)
                    return RejectTightDestination(s, capacity, outCount);
                s.offset += res.consumed;
                s.length -= res.consumed;
                if (res.produced > 0)
                {
                    outCount = res.produced;
                    return StreamStatus::Ok;
                }
            }
        }

        template <class T>
        StreamStatus ReadRingCopy(CharStream& s, i32 blockSize, T* dst, i32 capacity, i32& outCount) noexcept
        {
            StreamStatus status = StreamStatus::Ok;
            if (!RingReady(s, dst, capacity, outCount, status))
                return status;

            const i32 n = Min3(s.length, blockSize, capacity);
            keel::core::SplitCopyFromRing<T>(static_cast<const T*>(s.data), s.capacity, s.offset, dst, n);
            RingConsume(s, n);
            outCount = n;
            return StreamStatus::Ok;
        }

        // Transcodes the live region segment by segment; the second segment's
        // output starts where the first one's output ended.
        template <class Src, class Dst>
        StreamStatus ReadRingTranscode(CharStream& s, i32 blockSize, Dst* dst, i32 capacity, i32& outCount) noexcept
        {
            auto& state = TranscoderFor<Dst>(s);
            for (;;)
            {
                StreamStatus status = StreamStatus::Ok;
                if (!RingReady(s, dst, capacity, outCount, status))
                    return status;

                const Src* ring = static_cast<const Src*>(s.data);
                const keel::core::RingSegments seg = keel::core::SplitRing(s.capacity, s.offset, std::min(s.length, blockSize));

                const auto first = Transcode(state, ring + seg.firstOffset, seg.firstCount, dst, capacity);
                i32 consumed = first.consumed;
                i32 produced = first.produced;
                if (first.consumed == seg.firstCount && seg.secondCount > 0)
                {
                    const auto second = Transcode(state, ring, seg.secondCount, dst + produced, capacity - produced);
                    consumed += second.consumed;
                    produced += second.produced;
                }

                if (consumed == 0 && produced == 0)
                    return RejectTightDestination(s, capacity, outCount);

                RingConsume(s, consumed);
                if (produced > 0)
                {
                    outCount = produced;
                    return StreamStatus::Ok;
                }
            }
        }

        constexpr ReadHandler<char16> kReadCharHandlers[] = {
            nullptr,
            &ReadCharsFromStream,
            &ReadLinearCopy<char16>,
            &ReadRingCopy<char16>,
            &ReadLinearTranscode<u8, char16>,
            &ReadRingTranscode<u8, char16>,
        };

        constexpr ReadHandler<u8> kReadByteHandlers[] = {
            nullptr,
            &ReadBytesFromStream,
            &ReadLinearTranscode<char16, u8>,
            &ReadRingTranscode<char16, u8>,
            &ReadLinearCopy<u8>,
            &ReadRingCopy<u8>,
        };

        static_assert(std::size(kReadCharHandlers) == static_cast<std::size_t>(SourceType::Count));
        static_assert(std::size(kReadByteHandlers) == static_cast<std::size_t>(SourceType::Count));

        template <class Dst>
        [[nodiscard]] StreamStatus DispatchRead(const ReadHandler<Dst>* table, const char* op, CharStream& s,
            i32 blockSize, Dst* dst, i32 capacity, i32& outCount) noexcept
        {
            outCount = 0;
            const auto index = static_cast<std::size_t>(s.type);
            if (index == 0 || index >= static_cast<std::size_t>(SourceType::Count))
            {
                ReportHardFailure(KEEL_STREAM_LOG_CATEGORY, HardFailureKind::NotInitialized,
                    "{}: CharStream '{}' has no source loaded", op, DisplayName(s));
                return StreamStatus::NotInitialized;
            }

            if (blockSize <= 0 || !dst || capacity <= 0)
            {
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "{}: invalid arguments (blockSize={} dst={} capacity={})",
                    op, blockSize, static_cast<const void*>(dst), capacity);
                return StreamStatus::InvalidArg;
            }

            return table[index](s, blockSize, dst, capacity, outCount);
        }

        // --------------------------------------------------------------------
        // Ring writes
        // --------------------------------------------------------------------

        enum class RingEnd : u8 { Tail, Head };

        template <class T>
        [[nodiscard]] StreamStatus WriteRing(CharStream& s, SourceType expected, const T* src, i32 count,
            RingEnd end, const char* op) noexcept
        {
            if (s.type == SourceType::None)
            {
                ReportHardFailure(KEEL_STREAM_LOG_CATEGORY, HardFailureKind::NotInitialized,
                    "{}: CharStream '{}' has no source loaded", op, DisplayName(s));
                return StreamStatus::NotInitialized;
            }
            if (s.type != expected)
            {
                ReportHardFailure(KEEL_STREAM_LOG_CATEGORY, HardFailureKind::InvalidOperation,
                    "{}: cannot write to a buffer of type {}", op, ToString(s.type));
                return StreamStatus::InvalidOperation;
            }
            if (s.ringState == RingState::Exhausted)
            {
                ReportHardFailure(KEEL_STREAM_LOG_CATEGORY, HardFailureKind::InvalidOperation,
                    "{}: CharStream '{}' is finished and drained", op, DisplayName(s));
                return StreamStatus::InvalidOperation;
            }
            if (count > s.capacity - s.length)
            {
                ReportHardFailure(KEEL_STREAM_LOG_CATEGORY, HardFailureKind::CapacityOverflow,
                    "{}: no more room in buffer - attempting to add {} when only {} are available",
                    op, count, s.capacity - s.length);
                return StreamStatus::CapacityOverflow;
            }
            if (count <= 0)
                return StreamStatus::Ok;
            if (!src)
            {
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "{}: null source for {} units", op, count);
                return StreamStatus::InvalidArg;
            }

            const i32 head = (end == RingEnd::Tail)
                ? (s.offset + s.length) % s.capacity
                : (s.offset + s.capacity - count) % s.capacity;

            keel::core::SplitCopyToRing<T>(src, count, static_cast<T*>(s.data), s.capacity, head);
            if (end == RingEnd::Head)
                s.offset = head;
            s.length += count;
            s.ringState = RingState::HasData;
            return StreamStatus::Ok;
        }

        // --------------------------------------------------------------------
        // Dispose handlers
        // --------------------------------------------------------------------

        using DisposeHandler = void(*)(CharStream&) noexcept;

        void DisposeStreamSource(CharStream& s) noexcept
        {
            Close(s.source);
        }

        void DisposeUnpin(CharStream& s) noexcept
        {
            if (s.pin.release)
                s.pin.release(s.pin.userData, s.data);
        }

        void DisposeHeap(CharStream& s) noexcept
        {
            keel::core::AllocatorRef(s.heapAllocator).DeallocateBytes(s.data, s.heapBytes, s.heapAlignment);
        }

        void DisposePinnedAsset(CharStream& s) noexcept
        {
            Release(s.asset, static_cast<const u8*>(s.data));
        }

        constexpr DisposeHandler kDisposeHandlers[] = {
            nullptr,
            &DisposeStreamSource,
            &DisposeUnpin,
            &DisposeHeap,
            &DisposePinnedAsset,
        };

        static_assert(std::size(kDisposeHandlers) == static_cast<std::size_t>(Ownership::Count));

        // --------------------------------------------------------------------
        // Load helpers
        // --------------------------------------------------------------------

        [[nodiscard]] StreamStatus LoadBorrowed(CharStream& s, SourceType type, void* data,
            i32 length, i32 capacity, PinHandle pin, const char* op) noexcept
        {
            Dispose(s);

            const bool ring = (type == SourceType::CharRing || type == SourceType::ByteRing);
            const bool invalid = ring ? (!data || capacity <= 0) : (length < 0 || (!data && length > 0));
            if (invalid)
            {
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "{}: invalid source (data={} length={} capacity={})",
                    op, static_cast<const void*>(data), length, capacity);
                return StreamStatus::InvalidArg;
            }

            s.type = type;
            s.data = data;
            s.offset = 0;
            s.length = length;
            s.capacity = capacity;
            s.pin = pin;
            s.ownership = pin.release ? Ownership::UnpinData : Ownership::None;
            s.ringState = length > 0 ? RingState::HasData : RingState::EmptyPending;
            return StreamStatus::Ok;
        }

        template <class T>
        [[nodiscard]] StreamStatus LoadOwnedRing(CharStream& s, SourceType type, i32 capacity,
            keel::core::IAllocator* allocator, const char* op) noexcept
        {
            Dispose(s);

            if (capacity <= 0)
            {
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "{}: capacity must be positive (got {})", op, capacity);
                return StreamStatus::InvalidArg;
            }

            keel::core::IAllocator* backing = allocator ? allocator : &keel::core::GetDefaultAllocator();
            T* buffer = keel::core::AllocatorRef(backing).NewArray<T>(static_cast<keel::usize>(capacity));
            if (!buffer)
            {
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "{}: unable to allocate {} units", op, capacity);
                return StreamStatus::OutOfMemory;
            }

            s.type = type;
            s.data = buffer;
            s.capacity = capacity;
            s.ownership = Ownership::FreeHeap;
            s.heapAllocator = backing;
            s.heapBytes = sizeof(T) * static_cast<keel::usize>(capacity);
            s.heapAlignment = alignof(T);
            s.ringState = RingState::EmptyPending;
            return StreamStatus::Ok;
        }

        template <class T>
        [[nodiscard]] i32 TerminatedLength(const T* text) noexcept
        {
            i32 length = 0;
            while (text[length] != T{})
                ++length;
            return length;
        }

        template <class LoadFn>
        [[nodiscard]] CharStream MakeLoaded(const char* op, LoadFn&& load) noexcept
        {
            CharStream stream{};
            const StreamStatus status = load(stream);
            if (status != StreamStatus::Ok)
            {
                KEEL_LOG_VERBOSE(KEEL_STREAM_LOG_CATEGORY, "{}: returning an unloaded stream ({})", op, ToString(status));
            }
            return stream;
        }
    } // namespace

    // ------------------------------------------------------------------------
    // ToString
    // ------------------------------------------------------------------------

    const char* ToString(SourceType type) noexcept
    {
        switch (type)
        {
        case SourceType::None:       return "None";
        case SourceType::Stream:     return "Stream";
        case SourceType::CharLinear: return "CharLinear";
        case SourceType::CharRing:   return "CharRing";
        case SourceType::ByteLinear: return "ByteLinear";
        case SourceType::ByteRing:   return "ByteRing";
        default:                     return "Unknown";
        }
    }

    const char* ToString(Ownership ownership) noexcept
    {
        switch (ownership)
        {
        case Ownership::None:               return "None";
        case Ownership::DisposeStream:      return "DisposeStream";
        case Ownership::UnpinData:          return "UnpinData";
        case Ownership::FreeHeap:           return "FreeHeap";
        case Ownership::ReleasePinnedAsset: return "ReleasePinnedAsset";
        default:                            return "Unknown";
        }
    }

    const char* ToString(RingState state) noexcept
    {
        switch (state)
        {
        case RingState::HasData:      return "HasData";
        case RingState::EmptyPending: return "EmptyPending";
        case RingState::Exhausted:    return "Exhausted";
        default:                      return "Unknown";
        }
    }

    const char* ToString(StreamStatus status) noexcept
    {
        switch (status)
        {
        case StreamStatus::Ok:               return "Ok";
        case StreamStatus::NotInitialized:   return "NotInitialized";
        case StreamStatus::InvalidOperation: return "InvalidOperation";
        case StreamStatus::CapacityOverflow: return "CapacityOverflow";
        case StreamStatus::InvalidArg:       return "InvalidArg";
        case StreamStatus::OutOfMemory:      return "OutOfMemory";
        case StreamStatus::IoError:          return "IoError";
        default:                             return "Unknown";
        }
    }

    // ------------------------------------------------------------------------
    // Loading
    // ------------------------------------------------------------------------

    StreamStatus LoadStream(CharStream& stream, ByteStreamInterface source,
        u8* unpackBuffer, i32 unpackSize, bool disposeStream) noexcept
    {
        Dispose(stream);

        if (!IsBound(source) || !unpackBuffer || unpackSize <= 0)
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadStream: unbound stream or missing unpack buffer (size {})", unpackSize);
            return StreamStatus::InvalidArg;
        }

        stream.type = SourceType::Stream;
        stream.ownership = disposeStream ? Ownership::DisposeStream : Ownership::None;
        stream.source = source;
        stream.unpackBuffer = unpackBuffer;
        stream.unpackSize = unpackSize;
        stream.ringState = RingState::HasData;
        return StreamStatus::Ok;
    }

    StreamStatus LoadString(CharStream& stream, const char16* text, i32 length, PinHandle pin) noexcept
    {
        if (text && length < 0)
            length = TerminatedLength(text);
        return LoadBorrowed(stream, SourceType::CharLinear, const_cast<char16*>(text), length, length, pin, "LoadString");
    }

    StreamStatus LoadUtf8String(CharStream& stream, const char* text, i32 length, PinHandle pin) noexcept
    {
        if (text && length < 0)
            length = static_cast<i32>(std::strlen(text));
        return LoadBorrowed(stream, SourceType::ByteLinear,
            const_cast<char*>(text), length, length, pin, "LoadUtf8String");
    }

    StreamStatus LoadChars(CharStream& stream, const char16* chars, i32 count, PinHandle pin) noexcept
    {
        return LoadBorrowed(stream, SourceType::CharLinear, const_cast<char16*>(chars), count, count, pin, "LoadChars");
    }

    StreamStatus LoadBytes(CharStream& stream, const u8* bytes, i32 count, PinHandle pin) noexcept
    {
        return LoadBorrowed(stream, SourceType::ByteLinear, const_cast<u8*>(bytes), count, count, pin, "LoadBytes");
    }

    StreamStatus LoadCharBuffer(CharStream& stream, char16* buffer, i32 capacity, PinHandle pin) noexcept
    {
        return LoadBorrowed(stream, SourceType::CharRing, buffer, 0, capacity, pin, "LoadCharBuffer");
    }

    StreamStatus LoadByteBuffer(CharStream& stream, u8* buffer, i32 capacity, PinHandle pin) noexcept
    {
        return LoadBorrowed(stream, SourceType::ByteRing, buffer, 0, capacity, pin, "LoadByteBuffer");
    }

    StreamStatus LoadOwnedCharBuffer(CharStream& stream, i32 capacity, keel::core::IAllocator* allocator) noexcept
    {
        return LoadOwnedRing<char16>(stream, SourceType::CharRing, capacity, allocator, "LoadOwnedCharBuffer");
    }

    StreamStatus LoadOwnedByteBuffer(CharStream& stream, i32 capacity, keel::core::IAllocator* allocator) noexcept
    {
        return LoadOwnedRing<u8>(stream, SourceType::ByteRing, capacity, allocator, "LoadOwnedByteBuffer");
    }

    StreamStatus LoadCopiedBytes(CharStream& stream, const u8* bytes, i32 count, keel::core::IAllocator* allocator) noexcept
    {
        Dispose(stream);

        if (count < 0 || (!bytes && count > 0))
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadCopiedBytes: invalid source (bytes={} count={})",
                static_cast<const void*>(bytes), count);
            return StreamStatus::InvalidArg;
        }
        if (count == 0)
            return LoadBorrowed(stream, SourceType::ByteLinear, nullptr, 0, 0, PinHandle{}, "LoadCopiedBytes");

        keel::core::IAllocator* backing = allocator ? allocator : &keel::core::GetDefaultAllocator();
        u8* copy = keel::core::AllocatorRef(backing).NewArray<u8>(static_cast<keel::usize>(count));
        if (!copy)
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadCopiedBytes: unable to allocate {} bytes", count);
            return StreamStatus::OutOfMemory;
        }
        keel::core::CopyArray<u8>(bytes, count, copy, count);

        stream.type = SourceType::ByteLinear;
        stream.data = copy;
        stream.length = count;
        stream.capacity = count;
        stream.ownership = Ownership::FreeHeap;
        stream.heapAllocator = backing;
        stream.heapBytes = static_cast<keel::usize>(count);
        stream.heapAlignment = alignof(u8);
        stream.ringState = RingState::HasData;
        return StreamStatus::Ok;
    }

    StreamStatus LoadPinnedAsset(CharStream& stream, PinnedAssetInterface asset) noexcept
    {
        Dispose(stream);

        if (!IsBound(asset))
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadPinnedAsset: asset interface is not bound");
            return StreamStatus::InvalidArg;
        }

        const u8* bytes = nullptr;
        i32 size = 0;
        const IoStatus io = Pin(asset, bytes, size);
        if (io != IoStatus::Ok)
        {
            KEEL_LOG_WARNING(KEEL_STREAM_LOG_CATEGORY, "LoadPinnedAsset: pin failed ({})", ToString(io));
            return StreamStatus::IoError;
        }
        if (size < 0 || (!bytes && size > 0))
        {
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadPinnedAsset: asset returned an invalid span (size {})", size);
            Release(asset, bytes);
            return StreamStatus::InvalidArg;
        }

        stream.type = SourceType::ByteLinear;
        stream.data = const_cast<u8*>(bytes);
        stream.length = size;
        stream.capacity = size;
        stream.asset = asset;
        stream.ownership = Ownership::ReleasePinnedAsset;
        stream.ringState = size > 0 ? RingState::HasData : RingState::EmptyPending;
        return StreamStatus::Ok;
    }

    // ------------------------------------------------------------------------
    // Load descriptions
    // ------------------------------------------------------------------------

    CharStreamParams CharStreamParams::FromStream(ByteStreamInterface source, u8* unpackBuffer,
        i32 unpackSize, bool disposeStream, const char* name) noexcept
    {
        CharStreamParams params{};
        params.kind = CharStreamSourceKind::Stream;
        params.stream = source;
        params.unpackBuffer = unpackBuffer;
        params.unpackSize = unpackSize;
        params.disposeStream = disposeStream;
        params.name = name;
        return params;
    }

    CharStreamParams CharStreamParams::FromString(const char16* text, i32 length, const char* name) noexcept
    {
        CharStreamParams params{};
        params.kind = CharStreamSourceKind::String;
        params.data = text;
        params.length = length;
        params.name = name;
        return params;
    }

    CharStreamParams CharStreamParams::FromBytes(const u8* bytes, i32 count, const char* name) noexcept
    {
        CharStreamParams params{};
        params.kind = CharStreamSourceKind::Bytes;
        params.data = bytes;
        params.length = count;
        params.name = name;
        return params;
    }

    CharStreamParams CharStreamParams::FromChars(const char16* chars, i32 count, const char* name) noexcept
    {
        CharStreamParams params{};
        params.kind = CharStreamSourceKind::Chars;
        params.data = chars;
        params.length = count;
        params.name = name;
        return params;
    }

    CharStreamParams CharStreamParams::FromPinnedAsset(PinnedAssetInterface asset, const char* name) noexcept
    {
        CharStreamParams params{};
        params.kind = CharStreamSourceKind::PinnedAsset;
        params.asset = asset;
        params.name = name;
        return params;
    }

    StreamStatus LoadParams(CharStream& stream, const CharStreamParams& params,
        u8* unpackOverride, i32 unpackOverrideSize) noexcept
    {
        StreamStatus status = StreamStatus::InvalidArg;
        switch (params.kind)
        {
        case CharStreamSourceKind::Stream:
        {
            u8* buffer = unpackOverride ? unpackOverride : params.unpackBuffer;
            i32 size = unpackOverride ? unpackOverrideSize : params.unpackSize;
            if (buffer)
            {
                status = LoadStream(stream, params.stream, buffer, size, params.disposeStream);
                break;
            }

            keel::core::IAllocator& backing = keel::core::GetDefaultAllocator();
            size = KEEL_STREAM_DEFAULT_BLOCK_SIZE;
            buffer = keel::core::AllocatorRef(&backing).NewArray<u8>(static_cast<keel::usize>(size));
            if (!buffer)
            {
                Dispose(stream);
                KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadParams: unable to allocate {} byte unpack buffer", size);
                return StreamStatus::OutOfMemory;
            }

            status = LoadStream(stream, params.stream, buffer, size, params.disposeStream);
            if (status != StreamStatus::Ok)
            {
                keel::core::AllocatorRef(&backing).DeleteArray(buffer, static_cast<keel::usize>(size));
                return status;
            }
            stream.ownsUnpackBuffer = true;
            stream.heapAllocator = &backing;
            break;
        }
        case CharStreamSourceKind::String:
            status = LoadString(stream, static_cast<const char16*>(params.data), params.length);
            break;
        case CharStreamSourceKind::Bytes:
            status = LoadBytes(stream, static_cast<const u8*>(params.data), params.length);
            break;
        case CharStreamSourceKind::Chars:
            status = LoadChars(stream, static_cast<const char16*>(params.data), params.length);
            break;
        case CharStreamSourceKind::PinnedAsset:
            status = LoadPinnedAsset(stream, params.asset);
            break;
        case CharStreamSourceKind::None:
        default:
            Dispose(stream);
            KEEL_LOG_ERROR(KEEL_STREAM_LOG_CATEGORY, "LoadParams: params '{}' describe no source",
                params.name ? params.name : "<unnamed>");
            return StreamStatus::InvalidArg;
        }

        if (status == StreamStatus::Ok)
            stream.name = params.name;
        return status;
    }

    CharStream MakeCharStreamFromStream(ByteStreamInterface source, u8* unpackBuffer, i32 unpackSize, bool disposeStream) noexcept
    {
        return MakeLoaded("MakeCharStreamFromStream", [&](CharStream& s) noexcept {
            return LoadStream(s, source, unpackBuffer, unpackSize, disposeStream);
        });
    }

    CharStream MakeCharStreamFromString(const char16* text, i32 length) noexcept
    {
        return MakeLoaded("MakeCharStreamFromString", [&](CharStream& s) noexcept {
            return LoadString(s, text, length);
        });
    }

    CharStream MakeCharStreamFromBytes(const u8* bytes, i32 count) noexcept
    {
        return MakeLoaded("MakeCharStreamFromBytes", [&](CharStream& s) noexcept {
            return LoadBytes(s, bytes, count);
        });
    }

    CharStream MakeCharStreamFromChars(const char16* chars, i32 count) noexcept
    {
        return MakeLoaded("MakeCharStreamFromChars", [&](CharStream& s) noexcept {
            return LoadChars(s, chars, count);
        });
    }

    CharStream MakeCharStreamFromPinnedAsset(PinnedAssetInterface asset) noexcept
    {
        return MakeLoaded("MakeCharStreamFromPinnedAsset", [&](CharStream& s) noexcept {
            return LoadPinnedAsset(s, asset);
        });
    }

    CharStream MakeCharStreamFromParams(const CharStreamParams& params) noexcept
    {
        return MakeLoaded("MakeCharStreamFromParams", [&](CharStream& s) noexcept {
            return LoadParams(s, params);
        });
    }

    // ------------------------------------------------------------------------
    // Reading
    // ------------------------------------------------------------------------

    StreamStatus ReadChars(CharStream& stream, i32 blockSize, char16* dst, i32 dstCapacity, i32& outCount) noexcept
    {
        return DispatchRead<char16>(kReadCharHandlers, "ReadChars", stream, blockSize, dst, dstCapacity, outCount);
    }

    StreamStatus ReadBytes(CharStream& stream, i32 blockSize, u8* dst, i32 dstCapacity, i32& outCount) noexcept
    {
        return DispatchRead<u8>(kReadByteHandlers, "ReadBytes", stream, blockSize, dst, dstCapacity, outCount);
    }

    // ------------------------------------------------------------------------
    // Ring producers
    // ------------------------------------------------------------------------

    StreamStatus QueueChars(CharStream& stream, const char16* chars, i32 count) noexcept
    {
        return WriteRing<char16>(stream, SourceType::CharRing, chars, count, RingEnd::Tail, "QueueChars");
    }

    StreamStatus InsertChars(CharStream& stream, const char16* chars, i32 count) noexcept
    {
        return WriteRing<char16>(stream, SourceType::CharRing, chars, count, RingEnd::Head, "InsertChars");
    }

    StreamStatus QueueBytes(CharStream& stream, const u8* bytes, i32 count) noexcept
    {
        return WriteRing<u8>(stream, SourceType::ByteRing, bytes, count, RingEnd::Tail, "QueueBytes");
    }

    StreamStatus InsertBytes(CharStream& stream, const u8* bytes, i32 count) noexcept
    {
        return WriteRing<u8>(stream, SourceType::ByteRing, bytes, count, RingEnd::Head, "InsertBytes");
    }

    void MarkFinished(CharStream& stream) noexcept
    {
        stream.finished = true;
    }

    // ------------------------------------------------------------------------
    // Lifetime and queries
    // ------------------------------------------------------------------------

    void Dispose(CharStream& stream) noexcept
    {
        if (stream.type == SourceType::None)
            return;

        const auto index = static_cast<std::size_t>(stream.ownership);
        if (index != 0 && index < static_cast<std::size_t>(Ownership::Count))
            kDisposeHandlers[index](stream);

        if (stream.ownsUnpackBuffer)
        {
            keel::core::AllocatorRef(stream.heapAllocator)
                .DeleteArray(stream.unpackBuffer, static_cast<keel::usize>(stream.unpackSize));
        }

        stream = CharStream{};
    }

    bool IsLoaded(const CharStream& stream) noexcept
    {
        return stream.type != SourceType::None;
    }

    bool IsRing(const CharStream& stream) noexcept
    {
        return stream.type == SourceType::CharRing || stream.type == SourceType::ByteRing;
    }

    SourceType GetSourceType(const CharStream& stream) noexcept
    {
        return stream.type;
    }

    RingState GetRingState(const CharStream& stream) noexcept
    {
        if (IsRing(stream))
            return stream.ringState;
        if (stream.type == SourceType::None || stream.finished)
            return RingState::Exhausted;
        // A drained linear source answers its next read with the transcoder's
        // leftovers if any, else with the end-of-stream sentinel.
        if (stream.type != SourceType::Stream && stream.length == 0)
        {
            const bool pending = stream.decoder.HasPending() || stream.encoder.HasPending();
            return pending ? RingState::HasData : RingState::Exhausted;
        }
        return RingState::HasData;
    }

    i32 GetAvailable(const CharStream& stream) noexcept
    {
        switch (stream.type)
        {
        case SourceType::Stream:     return stream.unpackCount;
        case SourceType::CharLinear:
        case SourceType::CharRing:
        case SourceType::ByteLinear:
        case SourceType::ByteRing:   return stream.length;
        default:                     return 0;
        }
    }

    i32 GetCapacity(const CharStream& stream) noexcept
    {
        return stream.type == SourceType::Stream ? stream.unpackSize : stream.capacity;
    }

    i32 GetFree(const CharStream& stream) noexcept
    {
        return IsRing(stream) ? stream.capacity - stream.length : 0;
    }

} // namespace keel::stream
