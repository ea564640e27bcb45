// ============================================================================
// Keel - Core/Memory/Arena.cpp
// ----------------------------------------------------------------------------
// Purpose : Arena lifecycle, bump allocation, rewind stack and validation.
// Contract: See Arena.hpp. Every mutating entry point validates the header
//           magic and (guarded arenas) the boundary word before touching state,
//           and rewrites the boundary word after moving the cursor.
// Notes   : The boundary word may land on an unaligned address, so it is
//           always accessed through memcpy.
// ============================================================================

#include "Core/Memory/Arena.hpp"

#include "Core/Diagnostics/HardFailure.hpp"
#include "Core/Hash.hpp"
#include "Core/Memory/Alignment.hpp"
#include "Core/Memory/DefaultAllocator.hpp"

#include <cstring>

namespace keel::core {

    namespace
    {
        constexpr usize kBoundarySize = sizeof(u32);

        [[nodiscard]] constexpr usize ComputeHeaderSize() noexcept
        {
            return AlignUpPow2<usize>(sizeof(ArenaHeader), KEEL_ARENA_BLOCK_GRANULE);
        }

        [[nodiscard]] const char* DisplayName(const ArenaHeader* header) noexcept
        {
            return header->name[0] != '\0' ? header->name : "<unnamed>";
        }

        [[nodiscard]] bool IsGuarded(const ArenaHeader* header) noexcept
        {
            return HasFlag(header->flags, ArenaFlags::Guarded);
        }

        void WriteBoundary(ArenaHeader* header) noexcept
        {
            if (IsGuarded(header))
            {
                const u32 value = kArenaBoundaryValue;
                std::memcpy(header->current, &value, kBoundarySize);
            }
        }

        // Reports MemoryCorruption when the header magic is wrong.
        [[nodiscard]] bool CheckMagic(const ArenaHeader* header, const char* where) noexcept
        {
            if (header->magic == kArenaHeaderMagic)
                return true;

            ReportHardFailure(KEEL_ARENA_LOG_CATEGORY, HardFailureKind::MemoryCorruption,
                "{}: memory corruption at address '{}': arena header magic was {:#010x} but expected {:#010x}",
                where, static_cast<const void*>(&header->magic), header->magic, kArenaHeaderMagic);
            return false;
        }

        // Reports MemoryCorruption when the word after the cursor was overwritten.
        [[nodiscard]] bool CheckBoundary(const ArenaHeader* header, const char* where) noexcept
        {
            if (!IsGuarded(header))
                return true;

            u32 value = 0;
            std::memcpy(&value, header->current, kBoundarySize);
            if (value == kArenaBoundaryValue)
                return true;

            ReportHardFailure(KEEL_ARENA_LOG_CATEGORY, HardFailureKind::MemoryCorruption,
                "{}: memory corruption at address '{}': arena '{}' boundary word was {:#010x} but expected {:#010x}",
                where, static_cast<const void*>(header->current), DisplayName(header), value, kArenaBoundaryValue);
            return false;
        }

        [[nodiscard]] bool ValidateForMutation(const ArenaHeader* header, const char* where) noexcept
        {
            return header && CheckMagic(header, where) && CheckBoundary(header, where);
        }

        [[nodiscard]] bool IsLive(const ArenaHeader* header) noexcept
        {
            return header && header->magic == kArenaHeaderMagic;
        }

        void CopyName(ArenaHeader& header, const char* name) noexcept
        {
            std::memset(header.name, 0, sizeof(header.name));
            if (!name)
                return;
            const usize length = std::strlen(name);
            const usize copied = length < (kArenaNameCapacity - 1) ? length : (kArenaNameCapacity - 1);
            std::memcpy(header.name, name, copied);
        }

        // Builds the header in-place at `block`; the payload follows the header.
        ArenaHandle InitializeArena(void* block, usize payloadSize, const char* name,
            ArenaFlags flags, IAllocator* backing, usize blockSize) noexcept
        {
            auto* header = static_cast<ArenaHeader*>(block);
            std::memset(header, 0, sizeof(ArenaHeader));

            header->magic = kArenaHeaderMagic;
            header->nameHash = Hash32(name);
            CopyName(*header, name);
            header->flags = flags;
            header->rewindDepth = 0;
            header->start = static_cast<u8*>(block) + ComputeHeaderSize();
            header->current = header->start;
            header->size = payloadSize;
            header->sizeRemaining = payloadSize;
            header->backing = backing;
            header->blockSize = blockSize;

            WriteBoundary(header);

#if KEEL_MEM_LOG_VERBOSITY >= 2
            KEEL_LOG_VERBOSE(KEEL_ARENA_LOG_CATEGORY, "Arena '{}' created: size={} flags={:#x} start={}",
                DisplayName(header), payloadSize, static_cast<u32>(flags), static_cast<const void*>(header->start));
#endif
            return ArenaHandle(header);
        }

        [[nodiscard]] ArenaFlags ResolveGuardFlag(ArenaFlags flags) noexcept
        {
            flags = flags & ~ArenaFlags::Guarded;
            if (MemoryConfig::GetGlobal().GuardsActive())
                flags = flags | ArenaFlags::Guarded;
            return flags;
        }

        void TearDown(ArenaHeader* header) noexcept
        {
            header->magic = 0;
            if (!HasFlag(header->flags, ArenaFlags::DoesNotOwnMemory) && header->backing)
            {
                IAllocator* backing = header->backing;
                const usize blockSize = header->blockSize;
                backing->Deallocate(header, blockSize, KEEL_ARENA_BLOCK_GRANULE);
            }
        }
    } // namespace

    usize ArenaHeaderSize() noexcept
    {
        return ComputeHeaderSize();
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    ArenaHandle CreateArena(usize size, const char* name, ArenaFlags flags, IAllocator* backing) noexcept
    {
        if (size == 0)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY, "CreateArena('{}'): size must be non-zero", name ? name : "<unnamed>");
            return ArenaHandle();
        }

        flags = ResolveGuardFlag(flags & ~ArenaFlags::DoesNotOwnMemory);

        const usize payloadSize = AlignUpPow2<usize>(size, KEEL_ARENA_BLOCK_GRANULE);
        const usize boundary = HasFlag(flags, ArenaFlags::Guarded) ? kBoundarySize : 0;
        if (payloadSize < size || payloadSize > static_cast<usize>(-1) - ComputeHeaderSize() - boundary)
        {
            KEEL_MEM_CHECK_OOM(size, KEEL_ARENA_BLOCK_GRANULE, "CreateArena");
            return ArenaHandle();
        }
        const usize blockSize = ComputeHeaderSize() + payloadSize + boundary;

        IAllocator* allocator = backing ? backing : &GetDefaultAllocator();
        AllocatorRef ref(allocator);
        void* block = ref.AllocateBytes(blockSize, KEEL_ARENA_BLOCK_GRANULE);
        if (!block)
            return ArenaHandle();

        return InitializeArena(block, payloadSize, name, flags, allocator, blockSize);
    }

    ArenaHandle CreateArenaInBuffer(void* buffer, usize bufferSize, const char* name, ArenaFlags flags) noexcept
    {
        if (!buffer)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY, "CreateArenaInBuffer('{}'): null buffer", name ? name : "<unnamed>");
            return ArenaHandle();
        }

        flags = ResolveGuardFlag(flags | ArenaFlags::DoesNotOwnMemory);

        const uptr raw = reinterpret_cast<uptr>(buffer);
        // Header on the granule so the payload after it keeps the granule too.
        const uptr aligned = AlignUpPow2<uptr>(raw, KEEL_ARENA_BLOCK_GRANULE);
        const usize padding = static_cast<usize>(aligned - raw);
        const usize required = ComputeHeaderSize() + (HasFlag(flags, ArenaFlags::Guarded) ? kBoundarySize : 0);

        const usize usable = bufferSize > padding ? bufferSize - padding : 0;
        const usize payloadSize = usable > required ? usable - required : 0;
        if (payloadSize <= kArenaMinimumInBufferPayload)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY,
                "CreateArenaInBuffer('{}'): buffer of {} bytes leaves {} payload bytes; more than {} required (header {} bytes)",
                name ? name : "<unnamed>", bufferSize, payloadSize, kArenaMinimumInBufferPayload, required);
            return ArenaHandle();
        }

        return InitializeArena(reinterpret_cast<void*>(aligned), payloadSize, name, flags, nullptr, 0);
    }

    ArenaHandle CreateSubArena(ArenaHandle parent, usize size, const char* name, ArenaFlags flags) noexcept
    {
        if (!parent.IsInitialized() || size == 0)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY, "CreateSubArena('{}'): invalid parent or zero size", name ? name : "<unnamed>");
            return ArenaHandle();
        }

        flags = ResolveGuardFlag(flags | ArenaFlags::DoesNotOwnMemory);

        const usize payloadSize = AlignUpPow2<usize>(size, KEEL_ARENA_BLOCK_GRANULE);
        const usize blockSize = ComputeHeaderSize() + payloadSize + (HasFlag(flags, ArenaFlags::Guarded) ? kBoundarySize : 0);

        void* block = parent.AllocAligned(blockSize, KEEL_ARENA_BLOCK_GRANULE);
        if (!block)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY,
                "CreateSubArena('{}'): parent '{}' cannot provide {} bytes ({} free)",
                name ? name : "<unnamed>", parent.Name(), blockSize, parent.FreeBytes());
            return ArenaHandle();
        }

        return InitializeArena(block, payloadSize, name, flags, nullptr, 0);
    }

    MemoryStatus DestroyArena(ArenaHandle& ioArena) noexcept
    {
        ArenaHeader* header = ioArena.GetHeader();
        if (!header)
            return MemoryStatus::InvalidHandle;

        if (!CheckMagic(header, "DestroyArena") || !CheckBoundary(header, "DestroyArena"))
            return MemoryStatus::Corruption;

        TearDown(header);
        ioArena = ArenaHandle();
        return MemoryStatus::Ok;
    }

    bool TryDestroyArena(ArenaHandle& ioArena) noexcept
    {
        ArenaHeader* header = ioArena.GetHeader();
        if (!IsLive(header))
            return false;

        if (!CheckBoundary(header, "TryDestroyArena"))
            return false;

        TearDown(header);
        ioArena = ArenaHandle();
        return true;
    }

    // ------------------------------------------------------------------------
    // Allocation
    // ------------------------------------------------------------------------

    void* ArenaHandle::Alloc(usize length) noexcept
    {
        if (length == 0 || !ValidateForMutation(m_header, "Arena::Alloc"))
            return nullptr;

        if (m_header->sizeRemaining < length)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY,
                "Unable to allocate region of size {} in arena '{}' (size remaining {})",
                length, DisplayName(m_header), m_header->sizeRemaining);
            return nullptr;
        }

        u8* address = m_header->current;
        m_header->current += length;
        m_header->sizeRemaining -= length;

        if (HasFlag(m_header->flags, ArenaFlags::ZeroOnAllocate))
            std::memset(address, 0, length);

        WriteBoundary(m_header);
        return address;
    }

    void* ArenaHandle::AllocAligned(usize length, usize alignment) noexcept
    {
        if (length == 0 || !ValidateForMutation(m_header, "Arena::AllocAligned"))
            return nullptr;

        alignment = NormalizeArenaAlignment(alignment);
        if (alignment > static_cast<usize>(KEEL_MAX_REASONABLE_ALIGNMENT))
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY,
                "Arena '{}': alignment {} exceeds KEEL_MAX_REASONABLE_ALIGNMENT", DisplayName(m_header), alignment);
            return nullptr;
        }

        const uptr cursor = reinterpret_cast<uptr>(m_header->current);
        const usize padding = static_cast<usize>(AlignUpPow2<uptr>(cursor, alignment) - cursor);
        if (padding > m_header->sizeRemaining || length > m_header->sizeRemaining - padding)
        {
            KEEL_LOG_ERROR(KEEL_ARENA_LOG_CATEGORY,
                "Unable to allocate region of size {} and alignment {} in arena '{}' (size remaining {})",
                length, alignment, DisplayName(m_header), m_header->sizeRemaining);
            return nullptr;
        }

        u8* address = m_header->current + padding;
        m_header->current = address + length;
        m_header->sizeRemaining -= padding + length;

        if (HasFlag(m_header->flags, ArenaFlags::ZeroOnAllocate))
            std::memset(address, 0, length);

        WriteBoundary(m_header);
        return address;
    }

    void ArenaHandle::Reset() noexcept
    {
        if (!ValidateForMutation(m_header, "Arena::Reset"))
            return;

        m_header->current = m_header->start;
        m_header->sizeRemaining = m_header->size;
        m_header->rewindDepth = 0;
        WriteBoundary(m_header);
    }

    // ------------------------------------------------------------------------
    // Rewind stack
    // ------------------------------------------------------------------------

    MemoryStatus ArenaHandle::Push() noexcept
    {
        if (!m_header)
            return MemoryStatus::InvalidHandle;
        if (!ValidateForMutation(m_header, "Arena::Push"))
            return MemoryStatus::Corruption;

        if (m_header->rewindDepth >= KEEL_ARENA_MAX_REWIND_DEPTH)
        {
            ReportHardFailure(KEEL_ARENA_LOG_CATEGORY, HardFailureKind::InvalidOperation,
                "Arena '{}' already holds the maximum of {} rewind records",
                DisplayName(m_header), KEEL_ARENA_MAX_REWIND_DEPTH);
            return MemoryStatus::InvalidOperation;
        }

        m_header->rewindStack[m_header->rewindDepth++] = static_cast<usize>(m_header->current - m_header->start);
        return MemoryStatus::Ok;
    }

    MemoryStatus ArenaHandle::Pop() noexcept
    {
        if (!m_header)
            return MemoryStatus::InvalidHandle;
        if (!ValidateForMutation(m_header, "Arena::Pop"))
            return MemoryStatus::Corruption;

        if (m_header->rewindDepth == 0)
        {
            ReportHardFailure(KEEL_ARENA_LOG_CATEGORY, HardFailureKind::InvalidOperation,
                "Arena '{}' has no rewind records to pop", DisplayName(m_header));
            return MemoryStatus::InvalidOperation;
        }

        const usize offset = m_header->rewindStack[--m_header->rewindDepth];
        m_header->current = m_header->start + offset;
        m_header->sizeRemaining = m_header->size - offset;
        WriteBoundary(m_header);
        return MemoryStatus::Ok;
    }

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    bool ArenaHandle::Owns(const void* ptr) const noexcept
    {
        if (!IsLive(m_header) || !ptr)
            return false;
        const auto* p = static_cast<const u8*>(ptr);
        return p >= m_header->start && p < m_header->start + m_header->size;
    }

    bool ArenaHandle::IsValid(const void* ptr) const noexcept
    {
        if (!IsLive(m_header) || !ptr)
            return false;
        const auto* p = static_cast<const u8*>(ptr);
        return p >= m_header->start && p < m_header->current;
    }

    usize ArenaHandle::Size() const noexcept
    {
        return IsLive(m_header) ? m_header->size : 0;
    }

    usize ArenaHandle::FreeBytes() const noexcept
    {
        return IsLive(m_header) ? m_header->sizeRemaining : 0;
    }

    usize ArenaHandle::UsedBytes() const noexcept
    {
        return IsLive(m_header) ? m_header->size - m_header->sizeRemaining : 0;
    }

    const char* ArenaHandle::Name() const noexcept
    {
        return IsLive(m_header) ? DisplayName(m_header) : "<invalid>";
    }

    u32 ArenaHandle::NameHash() const noexcept
    {
        return IsLive(m_header) ? m_header->nameHash : 0u;
    }

    ArenaFlags ArenaHandle::Flags() const noexcept
    {
        return IsLive(m_header) ? m_header->flags : ArenaFlags::None;
    }

    u32 ArenaHandle::RewindDepth() const noexcept
    {
        return IsLive(m_header) ? static_cast<u32>(m_header->rewindDepth) : 0u;
    }

    bool ArenaHandle::IsAlive() const noexcept
    {
        return IsLive(m_header);
    }

} // namespace keel::core
