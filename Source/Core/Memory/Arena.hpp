#pragma once
// ============================================================================
// Keel - Core/Memory/Arena.hpp
// ----------------------------------------------------------------------------
// Purpose : Single-block bump allocator addressed through a small value handle.
//           The arena's bookkeeping header lives at the front of its own block,
//           followed by the payload and (guarded arenas) a boundary word that
//           always sits right after the bump cursor.
// Contract: Out-of-space is soft: Alloc* logs at Error and returns nullptr,
//           leaving the cursor untouched. Header-magic or boundary-word
//           mismatches are hard failures reported through ReportHardFailure;
//           the failing call then returns nullptr / MemoryStatus::Corruption.
//           Queries (Owns, IsValid, Size, FreeBytes, UsedBytes) never report:
//           an invalid handle yields false / 0. Not thread-safe; one logical
//           owner at a time.
// Notes   : Guard mode is sampled from MemoryConfig when the arena is created.
//           The header magic is checked in every build; the boundary word only
//           exists when KEEL_MEM_GUARDS is compiled in and enabled.
// ============================================================================

#include "Core/Types.hpp"
#include "Core/Memory/Allocator.hpp"
#include "Core/Memory/MemoryConfig.hpp"

#include <utility> // std::exchange

namespace keel::core {

    // --- ArenaFlags ---------------------------------------------------------
    enum class ArenaFlags : u32
    {
        None             = 0,
        ZeroOnAllocate   = 1u << 0, // clear every allocation before returning it
        DoesNotOwnMemory = 1u << 1, // destroy never frees the block
        Guarded          = 1u << 2  // boundary word active (set internally at creation)
    };

    [[nodiscard]] constexpr ArenaFlags operator|(ArenaFlags a, ArenaFlags b) noexcept
    {
        return static_cast<ArenaFlags>(static_cast<u32>(a) | static_cast<u32>(b));
    }

    [[nodiscard]] constexpr ArenaFlags operator&(ArenaFlags a, ArenaFlags b) noexcept
    {
        return static_cast<ArenaFlags>(static_cast<u32>(a) & static_cast<u32>(b));
    }

    [[nodiscard]] constexpr ArenaFlags operator~(ArenaFlags a) noexcept
    {
        return static_cast<ArenaFlags>(~static_cast<u32>(a));
    }

    [[nodiscard]] constexpr bool HasFlag(ArenaFlags value, ArenaFlags flag) noexcept
    {
        return (static_cast<u32>(value) & static_cast<u32>(flag)) != 0;
    }

    // --- MemoryStatus -------------------------------------------------------
    enum class MemoryStatus : u8
    {
        Ok = 0,
        Corruption,       // header magic or boundary word mismatch
        InvalidHandle,    // null handle
        InvalidOperation  // rewind stack overflow / underflow
    };

    [[nodiscard]] constexpr const char* ToString(MemoryStatus status) noexcept
    {
        switch (status)
        {
        case MemoryStatus::Ok:               return "Ok";
        case MemoryStatus::Corruption:       return "Corruption";
        case MemoryStatus::InvalidHandle:    return "InvalidHandle";
        case MemoryStatus::InvalidOperation: return "InvalidOperation";
        default:                             return "Unknown";
        }
    }

    inline constexpr u32   kArenaHeaderMagic   = 0xBEAA110Cu;
    inline constexpr u32   kArenaBoundaryValue = 0xBAD0F00Du;
    inline constexpr usize kArenaNameCapacity  = 16;
    inline constexpr usize kArenaMinimumInBufferPayload = 32;

    // --- ArenaHeader --------------------------------------------------------
    // Purpose : Bookkeeping record stored at the front of the arena block.
    // Contract: start <= current <= start + size and
    //           sizeRemaining == size - (current - start) at all times.
    // Notes   : `name` is a truncated copy for diagnostics; `nameHash` is the
    //           FNV-1a hash of the full name.
    struct ArenaHeader
    {
        u32         magic;
        u32         nameHash;
        ArenaFlags  flags;
        u16         rewindDepth;
        char        name[kArenaNameCapacity];
        u8*         start;
        u8*         current;
        usize       size;
        usize       sizeRemaining;
        IAllocator* backing;    // null when the arena does not own its block
        usize       blockSize;  // bytes handed to `backing`
        usize       rewindStack[KEEL_ARENA_MAX_REWIND_DEPTH];
    };

    // ---
    // Purpose : Bytes reserved at the front of every arena block for its header.
    // Contract: Rounded to KEEL_ARENA_BLOCK_GRANULE so the payload keeps that alignment.
    // ---
    [[nodiscard]] usize ArenaHeaderSize() noexcept;

    // --- ArenaHandle --------------------------------------------------------
    // Purpose : Copyable, non-owning view of an arena header.
    // Contract: Copies alias the same arena. After DestroyArena/TryDestroyArena
    //           through one copy, the others dangle and must not be used.
    class ArenaHandle
    {
    public:
        constexpr ArenaHandle() noexcept = default;
        explicit constexpr ArenaHandle(ArenaHeader* header) noexcept : m_header(header) {}

        // ---
        // Purpose : Bump-allocate `length` bytes with no alignment padding.
        // Contract: Returns nullptr for length 0, for an invalid or corrupted arena,
        //           and when fewer than `length` bytes remain (logged, cursor unchanged).
        // ---
        [[nodiscard]] void* Alloc(usize length) noexcept;

        // ---
        // Purpose : Bump-allocate after padding the cursor up to `alignment`.
        // Contract: The space check covers padding + length. Alignment 0 means
        //           max_align_t; other values round up to a power of two.
        // ---
        [[nodiscard]] void* AllocAligned(usize length, usize alignment) noexcept;

        template <class T>
        [[nodiscard]] T* Alloc() noexcept
        {
            return static_cast<T*>(AllocAligned(sizeof(T), alignof(T)));
        }

        template <class T>
        [[nodiscard]] T* AllocArray(usize count) noexcept
        {
            if (count == 0 || count > static_cast<usize>(-1) / sizeof(T))
                return nullptr;
            return static_cast<T*>(AllocAligned(sizeof(T) * count, alignof(T)));
        }

        // ---
        // Purpose : Rewind the cursor to the start and drop every rewind record.
        // Contract: Does not zero memory. No-op on a null handle.
        // ---
        void Reset() noexcept;

        // ---
        // Purpose : Record the current used offset so Pop() can return to it.
        // Contract: At most KEEL_ARENA_MAX_REWIND_DEPTH outstanding records;
        //           overflow is a hard failure (InvalidOperation).
        // ---
        [[nodiscard]] MemoryStatus Push() noexcept;

        // ---
        // Purpose : Restore the most recent Push() offset.
        // Contract: Underflow is a hard failure (InvalidOperation).
        // ---
        [[nodiscard]] MemoryStatus Pop() noexcept;

        [[nodiscard]] bool Owns(const void* ptr) const noexcept;    // inside [start, start + size)
        [[nodiscard]] bool IsValid(const void* ptr) const noexcept; // inside [start, current)

        [[nodiscard]] usize Size() const noexcept;
        [[nodiscard]] usize FreeBytes() const noexcept;
        [[nodiscard]] usize UsedBytes() const noexcept;

        [[nodiscard]] const char* Name() const noexcept;
        [[nodiscard]] u32         NameHash() const noexcept;
        [[nodiscard]] ArenaFlags  Flags() const noexcept;
        [[nodiscard]] u32         RewindDepth() const noexcept;

        // Non-null and carrying the header magic. Never reports.
        [[nodiscard]] bool IsAlive() const noexcept;
        [[nodiscard]] constexpr bool IsInitialized() const noexcept { return m_header != nullptr; }
        [[nodiscard]] constexpr ArenaHeader* GetHeader() const noexcept { return m_header; }

        friend constexpr bool operator==(ArenaHandle a, ArenaHandle b) noexcept { return a.m_header == b.m_header; }

    private:
        ArenaHeader* m_header = nullptr;
    };

    // ---
    // Purpose : Create an arena whose block (header + payload + boundary word) comes
    //           from `backing`, or from GetDefaultAllocator() when `backing` is null.
    // Contract: Payload size is `size` rounded up to KEEL_ARENA_BLOCK_GRANULE.
    //           Returns a null handle when `size` is 0 or the block cannot be
    //           allocated (OOM policy invoked). DoesNotOwnMemory is stripped.
    // ---
    [[nodiscard]] ArenaHandle CreateArena(usize size, const char* name = nullptr,
        ArenaFlags flags = ArenaFlags::None, IAllocator* backing = nullptr) noexcept;

    // ---
    // Purpose : Lay an arena over caller-provided memory.
    // Contract: `buffer` must outlive the arena. The header is aligned inside the
    //           buffer; whatever is left after the header (and boundary word) becomes
    //           the payload, which must exceed kArenaMinimumInBufferPayload bytes or
    //           a null handle is returned (logged). DoesNotOwnMemory is forced on.
    // ---
    [[nodiscard]] ArenaHandle CreateArenaInBuffer(void* buffer, usize bufferSize,
        const char* name = nullptr, ArenaFlags flags = ArenaFlags::None) noexcept;

    // ---
    // Purpose : Carve a child arena out of `parent`.
    // Contract: Consumes header + payload (+ boundary word) from the parent; a null
    //           handle is returned when the parent cannot satisfy it. The child is
    //           DoesNotOwnMemory and is reclaimed by the parent's Reset/Pop.
    // ---
    [[nodiscard]] ArenaHandle CreateSubArena(ArenaHandle parent, usize size,
        const char* name = nullptr, ArenaFlags flags = ArenaFlags::None) noexcept;

    // ---
    // Purpose : Validate and tear down an arena, then null the handle.
    // Contract: Null handle -> InvalidHandle (no report). Magic or boundary
    //           mismatch -> hard failure, Corruption, block left untouched.
    //           Otherwise the magic is cleared and the block is freed unless
    //           DoesNotOwnMemory is set.
    // ---
    [[nodiscard]] MemoryStatus DestroyArena(ArenaHandle& ioArena) noexcept;

    // ---
    // Purpose : Destroy when the handle still refers to a live arena.
    // Contract: Null or already-destroyed handles return false without
    //           reporting. A live arena with a broken boundary word is still a
    //           hard failure (false). True means the arena was torn down.
    // ---
    [[nodiscard]] bool TryDestroyArena(ArenaHandle& ioArena) noexcept;

    // --- ScopedArenaRewind --------------------------------------------------
    // Purpose : Pair Push() on construction with Pop() on scope exit.
    // Contract: The arena must outlive the scope. When Push() fails the scope is
    //           inactive and nothing is popped. Moves transfer the pending Pop.
    class ScopedArenaRewind
    {
    public:
        explicit ScopedArenaRewind(ArenaHandle arena) noexcept
            : m_arena(arena)
            , m_active(arena.Push() == MemoryStatus::Ok)
        {
        }

        ScopedArenaRewind(const ScopedArenaRewind&) = delete;
        ScopedArenaRewind& operator=(const ScopedArenaRewind&) = delete;

        ScopedArenaRewind(ScopedArenaRewind&& other) noexcept
            : m_arena(other.m_arena)
            , m_active(std::exchange(other.m_active, false))
        {
        }

        ScopedArenaRewind& operator=(ScopedArenaRewind&&) = delete;

        ~ScopedArenaRewind() noexcept
        {
            Release();
        }

        // Pops now; later calls are no-ops.
        void Release() noexcept
        {
            if (m_active)
            {
                m_active = false;
                const MemoryStatus status = m_arena.Pop();
                if (status != MemoryStatus::Ok)
                {
                    KEEL_LOG_WARNING(KEEL_ARENA_LOG_CATEGORY,
                        "ScopedArenaRewind: Pop returned {}", ToString(status));
                }
            }
        }

        [[nodiscard]] bool IsActive() const noexcept { return m_active; }

    private:
        ArenaHandle m_arena;
        bool        m_active;
    };

} // namespace keel::core
