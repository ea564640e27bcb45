// ============================================================================
// Keel - tests/Smoke/Memory/arena_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Exercise the arena bump allocator: exact-fit accounting, reset,
//           rewind records, buffer/sub-arena placement and guard detection.
// Contract: No exceptions/RTTI. Returns 0 on pass, a distinct code per failed
//           expectation. Hard failures run under the non-fatal policy.
// Notes   : Guard checks only run when the build compiles guards in.
// ============================================================================

#include "Core/Diagnostics/HardFailure.hpp"
#include "Core/Logger.hpp"
#include "Core/Memory/Arena.hpp"
#include "Core/Memory/DefaultAllocator.hpp"
#include "Core/Memory/OOM.hpp"

#include <cstring>

namespace
{
    using namespace keel;
    using namespace keel::core;

    bool RangesOverlap(const void* a, usize aLen, const void* b, usize bLen) noexcept
    {
        const auto pa = reinterpret_cast<uptr>(a);
        const auto pb = reinterpret_cast<uptr>(b);
        return pa < pb + bLen && pb < pa + aLen;
    }

    // A 64-byte arena serves 40 then 24 bytes exactly and refuses anything in between.
    int RunExactFitScenario()
    {
        ArenaHandle arena = CreateArena(64, "ExactFit");
        if (!arena.IsInitialized()) return 1;
        if (arena.Size() != 64 || arena.FreeBytes() != 64) return 2;

        void* a = arena.Alloc(40);
        if (!a || arena.FreeBytes() != 24) return 3;

        {
            // Expected refusal; keep it out of the test output.
            ScopedLogLevel quiet(LogLevel::Fatal);
            if (arena.Alloc(30) != nullptr) return 4;
            if (Logger::GetMinLevel() != LogLevel::Fatal) return 15;
        }
        if (arena.FreeBytes() != 24) return 5;

        void* b = arena.Alloc(24);
        if (!b || arena.FreeBytes() != 0) return 6;
        if (RangesOverlap(a, 40, b, 24)) return 7;
        if (!arena.IsValid(a) || !arena.IsValid(b)) return 8;

        arena.Reset();
        if (arena.UsedBytes() != 0) return 9;
        if (arena.IsValid(a)) return 10;
        if (!arena.Owns(a)) return 11;

        void* c = arena.Alloc(64);
        if (c != a) return 12;

        if (DestroyArena(arena) != MemoryStatus::Ok) return 13;
        if (arena.IsInitialized()) return 14;
        return 0;
    }

    int RunAccountingScenario()
    {
        ArenaHandle arena = CreateArena(100, "Accounting");
        if (!arena.IsInitialized()) return 20;
        if (arena.Size() != 128) return 21; // rounded to the block granule

        usize expectedUsed = 0;
        const usize sizes[] = {1, 7, 16, 3, 33};
        void* blocks[5] = {};
        for (usize i = 0; i < 5; ++i)
        {
            blocks[i] = arena.Alloc(sizes[i]);
            if (!blocks[i]) return 22;
            expectedUsed += sizes[i];
            if (arena.UsedBytes() != expectedUsed) return 23;
            if (arena.UsedBytes() + arena.FreeBytes() != arena.Size()) return 24;
        }

        for (usize i = 0; i < 5; ++i)
            for (usize j = i + 1; j < 5; ++j)
                if (RangesOverlap(blocks[i], sizes[i], blocks[j], sizes[j])) return 25;

        if (arena.Alloc(0) != nullptr) return 26;

        double* d = arena.Alloc<double>();
        if (!d || !IsAligned(d, alignof(double))) return 27;

        u32* words = arena.AllocArray<u32>(4);
        if (!words || reinterpret_cast<uptr>(words) % alignof(u32) != 0) return 28;

        if (std::strcmp(arena.Name(), "Accounting") != 0) return 30;
        if (DestroyArena(arena) != MemoryStatus::Ok) return 31;
        return 0;
    }

    int RunRewindScenario()
    {
        ArenaHandle arena = CreateArena(256, "Rewind");
        if (!arena.IsInitialized()) return 40;

        if (!arena.Alloc(10)) return 41;
        if (arena.Push() != MemoryStatus::Ok) return 42;
        if (!arena.Alloc(50)) return 43;
        if (arena.Push() != MemoryStatus::Ok) return 44;
        if (!arena.Alloc(20)) return 45;
        if (arena.RewindDepth() != 2) return 46;

        if (arena.Pop() != MemoryStatus::Ok || arena.UsedBytes() != 60) return 47;
        if (arena.Pop() != MemoryStatus::Ok || arena.UsedBytes() != 10) return 48;

        const unsigned failuresBefore = GetHardFailureCount();
        if (arena.Pop() != MemoryStatus::InvalidOperation) return 49;
        if (GetHardFailureCount() != failuresBefore + 1) return 50;

        for (u32 i = 0; i < KEEL_ARENA_MAX_REWIND_DEPTH; ++i)
            if (arena.Push() != MemoryStatus::Ok) return 51;
        if (arena.Push() != MemoryStatus::InvalidOperation) return 52;
        if (arena.RewindDepth() != KEEL_ARENA_MAX_REWIND_DEPTH) return 53;

        arena.Reset();
        if (arena.RewindDepth() != 0 || arena.UsedBytes() != 0) return 54;

        {
            ScopedArenaRewind scope(arena);
            if (!scope.IsActive()) return 55;
            if (!arena.Alloc(100)) return 56;
            ScopedArenaRewind moved(static_cast<ScopedArenaRewind&&>(scope));
            if (scope.IsActive() || !moved.IsActive()) return 57;
        }
        if (arena.UsedBytes() != 0 || arena.RewindDepth() != 0) return 58;

        if (DestroyArena(arena) != MemoryStatus::Ok) return 59;
        return 0;
    }

    int RunPlacementScenario()
    {
        alignas(64) u8 storage[512];
        ArenaHandle tooSmall = CreateArenaInBuffer(storage, ArenaHeaderSize() + 16, "Tiny");
        if (tooSmall.IsInitialized()) return 60;

        ArenaHandle inBuffer = CreateArenaInBuffer(storage, sizeof(storage), "InBuffer");
        if (!inBuffer.IsInitialized()) return 61;
        if (!HasFlag(inBuffer.Flags(), ArenaFlags::DoesNotOwnMemory)) return 62;
        void* p = inBuffer.Alloc(32);
        if (!p || !RangesOverlap(p, 32, storage, sizeof(storage))) return 63;

        ArenaHandle child = CreateSubArena(inBuffer, 64, "Child");
        if (!child.IsInitialized()) return 64;
        if (!inBuffer.Owns(child.GetHeader())) return 65;
        void* q = child.Alloc(64);
        if (!q || !inBuffer.Owns(q)) return 66;
        if (child.Alloc(1) != nullptr) return 67;

        if (DestroyArena(child) != MemoryStatus::Ok) return 68;
        if (DestroyArena(inBuffer) != MemoryStatus::Ok) return 69;

        ArenaHandle zeroed = CreateArena(64, "Zeroed", ArenaFlags::ZeroOnAllocate);
        if (!zeroed.IsInitialized()) return 70;
        auto* bytes = static_cast<u8*>(zeroed.Alloc(32));
        if (!bytes) return 71;
        std::memset(bytes, 0xAB, 32);
        zeroed.Reset();
        bytes = static_cast<u8*>(zeroed.Alloc(32));
        for (usize i = 0; i < 32; ++i)
            if (bytes[i] != 0) return 72;
        if (DestroyArena(zeroed) != MemoryStatus::Ok) return 73;

        // Payloads start on the block granule even when the placement does not.
        constexpr uptr kGranuleMask = KEEL_ARENA_BLOCK_GRANULE - 1;
        ArenaHandle offset = CreateArenaInBuffer(storage + 1, sizeof(storage) - 1, "Offset");
        if (!offset.IsInitialized()) return 74;
        void* first = offset.Alloc(1);
        if (!first || (reinterpret_cast<uptr>(first) & kGranuleMask) != 0) return 75;

        // Parent cursor left on an odd address by an unpadded allocation.
        if (!offset.Alloc(3)) return 76;
        ArenaHandle nested = CreateSubArena(offset, 32, "Nested");
        if (!nested.IsInitialized()) return 77;
        void* inner = nested.Alloc(1);
        if (!inner || (reinterpret_cast<uptr>(inner) & kGranuleMask) != 0) return 78;
        if (DestroyArena(nested) != MemoryStatus::Ok || DestroyArena(offset) != MemoryStatus::Ok) return 79;

        return 0;
    }

    int RunDestroyScenario()
    {
        ArenaHandle none{};
        if (TryDestroyArena(none)) return 80;
        if (DestroyArena(none) != MemoryStatus::InvalidHandle) return 81;

        ArenaHandle arena = CreateArena(32, "Destroy");
        if (!TryDestroyArena(arena)) return 82;
        if (arena.IsInitialized()) return 83;
        if (TryDestroyArena(arena)) return 84;

        // A size that cannot be backed goes through the OOM policy.
        const unsigned oomBefore = GetOOMCount();
        ArenaHandle huge = CreateArena(static_cast<usize>(-1) - 8, "Huge");
        if (huge.IsInitialized()) return 85;
        if (GetOOMCount() != oomBefore + 1) return 86;
        return 0;
    }

    int RunGuardScenario()
    {
        ArenaHandle arena = CreateArena(64, "Guarded");
        if (!arena.IsInitialized()) return 90;
        if (!HasFlag(arena.Flags(), ArenaFlags::Guarded))
        {
            return DestroyArena(arena) == MemoryStatus::Ok ? 0 : 91;
        }

        auto* bytes = static_cast<u8*>(arena.Alloc(8));
        if (!bytes) return 92;

        // Write one word past the allocation: the boundary word lives there.
        const u32 garbage = 0x12345678u;
        std::memcpy(bytes + 8, &garbage, sizeof(garbage));

        const unsigned failuresBefore = GetHardFailureCount();
        if (arena.Alloc(8) != nullptr) return 93;
        if (GetHardFailureCount() <= failuresBefore) return 94;

        if (DestroyArena(arena) != MemoryStatus::Corruption) return 95;
        if (!arena.IsInitialized()) return 96;

        // Repair the word so the block can be released.
        const u32 boundary = kArenaBoundaryValue;
        std::memcpy(bytes + 8, &boundary, sizeof(boundary));
        if (DestroyArena(arena) != MemoryStatus::Ok) return 97;
        return 0;
    }
} // namespace

int RunArenaSmoke()
{
    SetFatalOnHardFailurePolicy(false);
    SetFatalOnOOMPolicy(false);

    if (const int code = RunExactFitScenario(); code != 0) return code;
    if (const int code = RunAccountingScenario(); code != 0) return code;
    if (const int code = RunRewindScenario(); code != 0) return code;
    if (const int code = RunPlacementScenario(); code != 0) return code;
    if (const int code = RunDestroyScenario(); code != 0) return code;
    if (const int code = RunGuardScenario(); code != 0) return code;
    return 0;
}
