// ============================================================================
// Keel - Core/Memory/MemoryConfig.hpp
// ----------------------------------------------------------------------------
// Purpose : Centralize compile-time memory feature gates and the small set of
//           runtime knobs used by the arena, the default allocator and the
//           failure policies. Uses the Keel logging front-end; no local fallbacks.
// Contract: Header-only, self-contained, and safe to include from any TU.
//           Compile-time macros define the compiled feature set; runtime
//           toggles only take effect when their feature is compiled in. When a
//           feature is compiled out, setters are explicit no-ops that log a
//           warning. Invariants validated via #error / static_assert.
// Notes   : Arena guard mode is sampled from the runtime toggle when an arena
//           is created and recorded in its header, so flipping the toggle never
//           affects an arena that is already live.
// ============================================================================

#pragma once

#include "Core/Logger.hpp"
#include "Core/Diagnostics/HardFailure.hpp"

#include <cstddef>
#include <cstdint>

#ifndef KEEL_MEM_LOG_CATEGORY
#define KEEL_MEM_LOG_CATEGORY "Memory"
#endif

#ifndef KEEL_ARENA_LOG_CATEGORY
#define KEEL_ARENA_LOG_CATEGORY "Memory.Arena"
#endif

// Optional: memory log verbosity (0=silent, 1=info, 2=debug)
#ifndef KEEL_MEM_LOG_VERBOSITY
#if defined(NDEBUG)
#define KEEL_MEM_LOG_VERBOSITY 0
#else
#define KEEL_MEM_LOG_VERBOSITY 1
#endif
#endif

// -----------------------------------------------------------------------------
// Defaults for compile-time gates (Dev-defaults vs Release-defaults)
// Override these in the build system or before including this header.
// -----------------------------------------------------------------------------

// Out-of-memory strategy: fatal (log + abort) vs returning nullptr
#ifndef KEEL_MEM_FATAL_ON_OOM
#   define KEEL_MEM_FATAL_ON_OOM 0
#endif

// Arena boundary guard word written after the bump cursor. Release builds
// compile it out; the header magic check is never compiled out.
#ifndef KEEL_MEM_GUARDS
#   if !defined(NDEBUG)
#       define KEEL_MEM_GUARDS 1
#   else
#       define KEEL_MEM_GUARDS 0
#   endif
#endif

// 0 = DefaultAllocator header stores rawPtr+magic only
// 1 = also store size+align (checked on Deallocate)
#ifndef KEEL_MEM_PARANOID_META
#   define KEEL_MEM_PARANOID_META 0
#endif

// Global cap for "reasonable" alignments. Power-of-two. Default: 1 MiB.
#ifndef KEEL_MAX_REASONABLE_ALIGNMENT
#   define KEEL_MAX_REASONABLE_ALIGNMENT (1u << 20)
#endif

// Arena capacity granule: requested sizes are rounded up to this many bytes.
#ifndef KEEL_ARENA_BLOCK_GRANULE
#   define KEEL_ARENA_BLOCK_GRANULE 32u
#endif

// Maximum number of outstanding Arena Push() records.
#ifndef KEEL_ARENA_MAX_REWIND_DEPTH
#   define KEEL_ARENA_MAX_REWIND_DEPTH 6
#endif

// --- Sanity checks for core switches ---
#if (KEEL_MEM_LOG_VERBOSITY < 0) || (KEEL_MEM_LOG_VERBOSITY > 2)
#   error "KEEL_MEM_LOG_VERBOSITY must be 0 (silent), 1 (info), or 2 (debug)"
#endif

#if (KEEL_MEM_FATAL_ON_OOM != 0) && (KEEL_MEM_FATAL_ON_OOM != 1)
#   error "KEEL_MEM_FATAL_ON_OOM must be 0 (non-fatal) or 1 (fatal)"
#endif

#if (KEEL_MEM_GUARDS != 0) && (KEEL_MEM_GUARDS != 1)
#   error "KEEL_MEM_GUARDS must be 0 or 1"
#endif

#if (KEEL_MEM_PARANOID_META != 0) && (KEEL_MEM_PARANOID_META != 1)
#   error "KEEL_MEM_PARANOID_META must be 0 or 1"
#endif

static_assert(((KEEL_MAX_REASONABLE_ALIGNMENT) & ((KEEL_MAX_REASONABLE_ALIGNMENT) - 1)) == 0,
    "KEEL_MAX_REASONABLE_ALIGNMENT must be a power of two");
static_assert(((KEEL_ARENA_BLOCK_GRANULE) & ((KEEL_ARENA_BLOCK_GRANULE) - 1)) == 0,
    "KEEL_ARENA_BLOCK_GRANULE must be a power of two");
static_assert((KEEL_ARENA_MAX_REWIND_DEPTH) >= 1 && (KEEL_ARENA_MAX_REWIND_DEPTH) <= 64,
    "KEEL_ARENA_MAX_REWIND_DEPTH must be in [1, 64]");

#include "Core/Memory/OOM.hpp"

// ============================================================================
// Compile-time "capabilities" view (constexpr booleans)
// ============================================================================
namespace keel::core
{
    // clang-format off
    constexpr bool CompiledFatalOnOOM() noexcept { return KEEL_MEM_FATAL_ON_OOM != 0; }
    constexpr bool CompiledFatalOnHardFailure() noexcept { return KEEL_FATAL_ON_HARD_FAILURE != 0; }
    constexpr bool CompiledGuards() noexcept { return KEEL_MEM_GUARDS != 0; }
    constexpr bool CompiledParanoidMeta() noexcept { return KEEL_MEM_PARANOID_META != 0; }
    // clang-format on

    // =========================================================================
    // Runtime toggles container
    //   Toggles only take effect if the corresponding *compiled* flag is true.
    //   Otherwise, setters are no-ops and log a warning. The two fatal policies
    //   are runtime-switchable regardless of their compile-time default.
    // =========================================================================
    struct MemoryConfig
    {
        bool enable_guards = CompiledGuards();                      // sampled by CreateArena*
        bool fatal_on_oom = CompiledFatalOnOOM();
        bool fatal_on_hard_failure = CompiledFatalOnHardFailure();

        static MemoryConfig& GetGlobal() noexcept
        {
            static MemoryConfig s_cfg{};
            return s_cfg;
        }

        void SetEnableGuards(bool v) noexcept
        {
            if constexpr (CompiledGuards())
            {
                enable_guards = v;
            }
            else
            {
                (void)v;
                KEEL_LOG_WARNING(KEEL_MEM_LOG_CATEGORY, "[no-op] Arena guard words compiled out (KEEL_MEM_GUARDS=0).");
            }
        }

        void SetFatalOnOOM(bool v) noexcept
        {
            fatal_on_oom = v;
            SetFatalOnOOMPolicy(v);
        }

        void SetFatalOnHardFailure(bool v) noexcept
        {
            fatal_on_hard_failure = v;
            SetFatalOnHardFailurePolicy(v);
        }

        // ---
        // Purpose : Effective guard mode for a newly created arena.
        // Contract: False whenever guards are compiled out.
        // ---
        [[nodiscard]] bool GuardsActive() const noexcept
        {
            return CompiledGuards() && enable_guards;
        }
    };

} // namespace keel::core

// ============================================================================
//                       TRUTH TABLE
// ============================================================================
// Feature                 | CT Macro                    | RT Toggle              | Eff
// ------------------------|-----------------------------|------------------------|---------------------------
// Arena guard word        | KEEL_MEM_GUARDS             | enable_guards          | ON iff CT=1 AND RT=true (at create)
// Fatal on OOM            | KEEL_MEM_FATAL_ON_OOM       | fatal_on_oom           | RT value (CT is the default)
// Fatal on hard failure   | KEEL_FATAL_ON_HARD_FAILURE  | fatal_on_hard_failure  | RT value (CT is the default)
// Header magic check      | (always)                    | (none)                 | always ON
// ============================================================================
