// ============================================================================
// Keel - Source/Core/Streaming/CharStream.hpp
// ----------------------------------------------------------------------------
// Purpose : One flat value that reads UTF-16 characters or bytes from any of
//           six backing stores: a blocking byte stream, a linear char span, a
//           char ring, a linear byte span, a byte ring, or (as a linear byte
//           span) a pinned asset. Byte-backed sources read in char mode go
//           through a stateful UTF-8 decoder; char-backed sources read in byte
//           mode go through a stateful UTF-8 encoder.
// Contract: Trivially copyable, no exceptions/RTTI. Reads report a count
//           through `outCount`: > 0 units written, 0 = ring temporarily empty
//           (retry after the producer queues more), kEndOfStream (-1) = no more
//           data ever; once a source reports kEndOfStream it keeps doing so.
//           Every Load* disposes the previous resource first. Dispose releases
//           exactly the owned resource (see Ownership), is idempotent, and
//           resets the value. Reading an unloaded stream, queueing into the
//           wrong kind, queueing into an exhausted ring and overflowing a ring
//           are hard failures (ReportHardFailure) that return a StreamStatus.
// Notes   : Not thread-safe; one logical owner at a time. Copies alias the same
//           resources, so only one copy may be disposed.
// ============================================================================

#pragma once

#include "Core/Contracts/ByteStream.hpp"
#include "Core/Contracts/PinnedAsset.hpp"
#include "Core/Memory/Allocator.hpp"
#include "Core/Streaming/StreamConfig.hpp"
#include "Core/Text/Utf8.hpp"
#include "Core/Types.hpp"

#include <type_traits>

namespace keel::stream
{
    inline constexpr keel::i32 kEndOfStream = -1;

    enum class SourceType : keel::u8
    {
        None = 0,
        Stream,
        CharLinear,
        CharRing,
        ByteLinear,
        ByteRing,
        Count
    };

    // What Dispose must release.
    enum class Ownership : keel::u8
    {
        None = 0,
        DisposeStream,      // close the byte stream
        UnpinData,          // invoke the PinHandle release callback
        FreeHeap,           // return the data block to its allocator
        ReleasePinnedAsset, // release the asset pin
        Count
    };

    enum class RingState : keel::u8
    {
        HasData = 0,
        EmptyPending, // empty; the producer may still queue more
        Exhausted     // empty and finished; terminal
    };

    enum class StreamStatus : keel::u8
    {
        Ok = 0,
        NotInitialized,
        InvalidOperation,
        CapacityOverflow,
        InvalidArg,
        OutOfMemory,
        IoError
    };

    [[nodiscard]] const char* ToString(SourceType type) noexcept;
    [[nodiscard]] const char* ToString(Ownership ownership) noexcept;
    [[nodiscard]] const char* ToString(RingState state) noexcept;
    [[nodiscard]] const char* ToString(StreamStatus status) noexcept;

    // ---
    // Purpose : Optional release hook for borrowed memory the caller pinned on our behalf.
    // Contract: `release(userData, data)` runs exactly once, on Dispose or reload.
    // ---
    struct PinHandle
    {
        using ReleaseFunc = void(*)(void* userData, const void* data) noexcept;

        ReleaseFunc release  = nullptr;
        void*       userData = nullptr;
    };

    // --- CharStream ---------------------------------------------------------
    // Fields are public for inspection in tests and debuggers; mutate them only
    // through the free functions below.
    struct CharStream
    {
        SourceType  type      = SourceType::None;
        Ownership   ownership = Ownership::None;
        RingState   ringState = RingState::EmptyPending;
        bool        finished  = false;

        void*       data     = nullptr; // char16* or u8* depending on `type`
        keel::i32   offset   = 0;       // linear: read cursor, ring: read head
        keel::i32   length   = 0;       // units left (linear) or live units (ring)
        keel::i32   capacity = 0;       // ring size; span size for linear sources

        keel::text::Utf8Decoder decoder{};
        keel::text::Utf8Encoder encoder{};

        // Stream sources: scratch for raw bytes, with undecoded leftovers kept
        // between reads.
        keel::u8*   unpackBuffer = nullptr;
        keel::i32   unpackSize   = 0;
        keel::i32   unpackOffset = 0;
        keel::i32   unpackCount  = 0;
        bool        ownsUnpackBuffer = false;

        ByteStreamInterface  source{};
        PinHandle            pin{};
        PinnedAssetInterface asset{};

        keel::core::IAllocator* heapAllocator = nullptr; // FreeHeap blocks and owned scratch
        keel::usize             heapBytes     = 0;
        keel::usize             heapAlignment = 0;

        const char* name = nullptr; // borrowed, diagnostics only
    };

    static_assert(std::is_trivially_copyable_v<CharStream>, "CharStream must stay a flat value.");

    // ------------------------------------------------------------------------
    // Loading
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Read from a blocking byte stream through caller-provided scratch.
    // Contract: `unpackBuffer` must outlive the load. `disposeStream` closes the
    //           stream on Dispose. Each read pulls at most min(blockSize, unpackSize)
    //           bytes from the stream.
    // ---
    [[nodiscard]] StreamStatus LoadStream(CharStream& stream, ByteStreamInterface source,
        keel::u8* unpackBuffer, keel::i32 unpackSize, bool disposeStream = true) noexcept;

    // ---
    // Purpose : Read a UTF-16 string (length < 0 means NUL-terminated).
    // Contract: Borrowed; `pin.release` (if any) runs on Dispose.
    // ---
    [[nodiscard]] StreamStatus LoadString(CharStream& stream, const keel::char16* text,
        keel::i32 length = -1, PinHandle pin = {}) noexcept;

    // Reads UTF-8 text (length < 0 means NUL-terminated) as a byte source.
    [[nodiscard]] StreamStatus LoadUtf8String(CharStream& stream, const char* text,
        keel::i32 length = -1, PinHandle pin = {}) noexcept;

    [[nodiscard]] StreamStatus LoadChars(CharStream& stream, const keel::char16* chars,
        keel::i32 count, PinHandle pin = {}) noexcept;

    [[nodiscard]] StreamStatus LoadBytes(CharStream& stream, const keel::u8* bytes,
        keel::i32 count, PinHandle pin = {}) noexcept;

    // ---
    // Purpose : Use `buffer` as an initially empty char ring of `capacity` units.
    // ---
    [[nodiscard]] StreamStatus LoadCharBuffer(CharStream& stream, keel::char16* buffer,
        keel::i32 capacity, PinHandle pin = {}) noexcept;

    [[nodiscard]] StreamStatus LoadByteBuffer(CharStream& stream, keel::u8* buffer,
        keel::i32 capacity, PinHandle pin = {}) noexcept;

    // ---
    // Purpose : Allocate an empty ring owned by the stream.
    // Contract: `allocator` null selects GetDefaultAllocator(). OutOfMemory leaves
    //           the stream unloaded.
    // ---
    [[nodiscard]] StreamStatus LoadOwnedCharBuffer(CharStream& stream, keel::i32 capacity,
        keel::core::IAllocator* allocator = nullptr) noexcept;

    [[nodiscard]] StreamStatus LoadOwnedByteBuffer(CharStream& stream, keel::i32 capacity,
        keel::core::IAllocator* allocator = nullptr) noexcept;

    // Takes a private heap copy of `bytes`, so the caller's span may go away.
    [[nodiscard]] StreamStatus LoadCopiedBytes(CharStream& stream, const keel::u8* bytes,
        keel::i32 count, keel::core::IAllocator* allocator = nullptr) noexcept;

    // ---
    // Purpose : Pin an asset's UTF-8 bytes and read them as a linear byte source.
    // Contract: A failed pin leaves the stream unloaded and returns IoError.
    // ---
    [[nodiscard]] StreamStatus LoadPinnedAsset(CharStream& stream, PinnedAssetInterface asset) noexcept;

    // ------------------------------------------------------------------------
    // Load descriptions
    // ------------------------------------------------------------------------

    enum class CharStreamSourceKind : keel::u8
    {
        None = 0,
        Stream,
        String,
        Bytes,
        Chars,
        PinnedAsset
    };

    struct CharStreamParams
    {
        CharStreamSourceKind kind = CharStreamSourceKind::None;
        const void*          data = nullptr;
        keel::i32            length = 0;
        ByteStreamInterface  stream{};
        keel::u8*            unpackBuffer = nullptr;
        keel::i32            unpackSize = 0;
        bool                 disposeStream = true;
        PinnedAssetInterface asset{};
        const char*          name = nullptr;

        [[nodiscard]] static CharStreamParams FromStream(ByteStreamInterface source, keel::u8* unpackBuffer,
            keel::i32 unpackSize, bool disposeStream = true, const char* name = nullptr) noexcept;
        [[nodiscard]] static CharStreamParams FromString(const keel::char16* text, keel::i32 length = -1,
            const char* name = nullptr) noexcept;
        [[nodiscard]] static CharStreamParams FromBytes(const keel::u8* bytes, keel::i32 count,
            const char* name = nullptr) noexcept;
        [[nodiscard]] static CharStreamParams FromChars(const keel::char16* chars, keel::i32 count,
            const char* name = nullptr) noexcept;
        [[nodiscard]] static CharStreamParams FromPinnedAsset(PinnedAssetInterface asset,
            const char* name = nullptr) noexcept;
    };

    // ---
    // Purpose : Load from a description.
    // Contract: For Stream sources the override buffer wins over the params buffer;
    //           with neither, an owned scratch of KEEL_STREAM_DEFAULT_BLOCK_SIZE bytes
    //           is allocated and freed on Dispose. `params.name` is kept for logs.
    // ---
    [[nodiscard]] StreamStatus LoadParams(CharStream& stream, const CharStreamParams& params,
        keel::u8* unpackOverride = nullptr, keel::i32 unpackOverrideSize = 0) noexcept;

    // Factory helpers; a failed load yields an unloaded value (IsLoaded() == false).
    [[nodiscard]] CharStream MakeCharStreamFromStream(ByteStreamInterface source, keel::u8* unpackBuffer,
        keel::i32 unpackSize, bool disposeStream = true) noexcept;
    [[nodiscard]] CharStream MakeCharStreamFromString(const keel::char16* text, keel::i32 length = -1) noexcept;
    [[nodiscard]] CharStream MakeCharStreamFromBytes(const keel::u8* bytes, keel::i32 count) noexcept;
    [[nodiscard]] CharStream MakeCharStreamFromChars(const keel::char16* chars, keel::i32 count) noexcept;
    [[nodiscard]] CharStream MakeCharStreamFromPinnedAsset(PinnedAssetInterface asset) noexcept;
    [[nodiscard]] CharStream MakeCharStreamFromParams(const CharStreamParams& params) noexcept;

    // ------------------------------------------------------------------------
    // Reading
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Read up to `blockSize` source units as UTF-16 into `dst`.
    // Contract: Never writes more than `dstCapacity` units. `outCount` receives
    //           the units written, 0 (ring empty, pending) or kEndOfStream.
    //           blockSize <= 0, null dst or dstCapacity <= 0 -> InvalidArg.
    // Notes   : For byte-backed sources `blockSize` counts bytes, so the number of
    //           chars produced can differ from the bytes consumed.
    // ---
    [[nodiscard]] StreamStatus ReadChars(CharStream& stream, keel::i32 blockSize,
        keel::char16* dst, keel::i32 dstCapacity, keel::i32& outCount) noexcept;

    // Byte-mode counterpart; char-backed sources are encoded to UTF-8.
    [[nodiscard]] StreamStatus ReadBytes(CharStream& stream, keel::i32 blockSize,
        keel::u8* dst, keel::i32 dstCapacity, keel::i32& outCount) noexcept;

    // ------------------------------------------------------------------------
    // Ring producers
    // ------------------------------------------------------------------------

    // ---
    // Purpose : Append at the tail (Queue) or push back in front of the head (Insert).
    // Contract: Only valid on the matching ring kind. length + count must not
    //           exceed capacity; callers own backpressure and check GetFree first.
    //           count <= 0 is a no-op returning Ok.
    // ---
    [[nodiscard]] StreamStatus QueueChars(CharStream& stream, const keel::char16* chars, keel::i32 count) noexcept;
    [[nodiscard]] StreamStatus InsertChars(CharStream& stream, const keel::char16* chars, keel::i32 count) noexcept;
    [[nodiscard]] StreamStatus QueueBytes(CharStream& stream, const keel::u8* bytes, keel::i32 count) noexcept;
    [[nodiscard]] StreamStatus InsertBytes(CharStream& stream, const keel::u8* bytes, keel::i32 count) noexcept;

    // ---
    // Purpose : Producer-side completion signal.
    // Contract: Once the ring drains, reads report kEndOfStream for good.
    // ---
    void MarkFinished(CharStream& stream) noexcept;

    // ------------------------------------------------------------------------
    // Lifetime and queries
    // ------------------------------------------------------------------------

    void Dispose(CharStream& stream) noexcept;

    [[nodiscard]] bool       IsLoaded(const CharStream& stream) noexcept;
    [[nodiscard]] bool       IsRing(const CharStream& stream) noexcept;
    [[nodiscard]] SourceType GetSourceType(const CharStream& stream) noexcept;
    [[nodiscard]] RingState  GetRingState(const CharStream& stream) noexcept;
    [[nodiscard]] keel::i32  GetAvailable(const CharStream& stream) noexcept; // units readable right now
    [[nodiscard]] keel::i32  GetCapacity(const CharStream& stream) noexcept;
    [[nodiscard]] keel::i32  GetFree(const CharStream& stream) noexcept;      // ring room left

} // namespace keel::stream
