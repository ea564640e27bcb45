#pragma once
// ============================================================================
// Keel - Core/Diagnostics/HardFailure.hpp
// ----------------------------------------------------------------------------
// Purpose : Declare the library-wide policy for hard failures: memory
//           corruption, ring capacity overflow, rewind-stack misuse and use of
//           an uninitialized stream. Detecting sites report through here and
//           hand a status back to their caller.
// Contract: Header-only and noexcept. `ReportHardFailure` always logs at Error
//           severity; when the runtime policy is fatal it logs at Fatal and
//           aborts instead of returning. The policy never affects soft
//           conditions (arena exhaustion, empty ring), which only log.
// Notes   : Mirrors the OOM policy in Core/Memory/OOM.hpp. The compile-time
//           default (KEEL_FATAL_ON_HARD_FAILURE) is non-fatal so smokes can
//           observe the returned statuses; production hosts typically flip it
//           at start-up through MemoryConfig::SetFatalOnHardFailure.
// ============================================================================

#include "Core/Logger.hpp"
#include "Core/Types.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <format>
#include <string>

#ifndef KEEL_FATAL_ON_HARD_FAILURE
#define KEEL_FATAL_ON_HARD_FAILURE 0
#endif

#if (KEEL_FATAL_ON_HARD_FAILURE != 0) && (KEEL_FATAL_ON_HARD_FAILURE != 1)
#   error "KEEL_FATAL_ON_HARD_FAILURE must be 0 (report) or 1 (abort)"
#endif

namespace keel::core {

    // ---
    // Purpose : Classify hard failures for logging and for the status a caller receives.
    // Contract: Values are stable; used as log tags only.
    // ---
    enum class HardFailureKind : u8
    {
        MemoryCorruption = 0,
        CapacityOverflow,
        InvalidOperation,
        NotInitialized
    };

    [[nodiscard]] constexpr const char* ToString(HardFailureKind kind) noexcept
    {
        switch (kind)
        {
        case HardFailureKind::MemoryCorruption: return "MemoryCorruption";
        case HardFailureKind::CapacityOverflow: return "CapacityOverflow";
        case HardFailureKind::InvalidOperation: return "InvalidOperation";
        case HardFailureKind::NotInitialized:   return "NotInitialized";
        default:                                return "Unknown";
        }
    }

    namespace detail
    {
        [[nodiscard]] inline std::atomic<bool>& HardFailurePolicyFlag() noexcept
        {
            static std::atomic<bool> policy{ KEEL_FATAL_ON_HARD_FAILURE != 0 };
            return policy;
        }

        [[nodiscard]] inline std::atomic<unsigned>& HardFailureCounter() noexcept
        {
            static std::atomic<unsigned> count{ 0 };
            return count;
        }
    }

    // ---
    // Purpose : Determine whether hard failures terminate the process.
    // Contract: Lock-free read of the runtime flag (seeded from KEEL_FATAL_ON_HARD_FAILURE).
    // ---
    [[nodiscard]] inline bool ShouldFatalOnHardFailure() noexcept
    {
        return detail::HardFailurePolicyFlag().load(std::memory_order_relaxed);
    }

    // ---
    // Purpose : Update the runtime hard-failure disposition.
    // Contract: Callable from any thread; applies to subsequent reports.
    // Notes   : Tests may toggle this directly; hosts should go through MemoryConfig.
    // ---
    inline void SetFatalOnHardFailurePolicy(bool fatal) noexcept
    {
        detail::HardFailurePolicyFlag().store(fatal, std::memory_order_relaxed);
    }

    // ---
    // Purpose : Total hard failures reported (non-fatal mode) since start-up.
    // Contract: Monotonic; diagnostics only.
    // ---
    [[nodiscard]] inline unsigned GetHardFailureCount() noexcept
    {
        return detail::HardFailureCounter().load(std::memory_order_relaxed);
    }

    // ---
    // Purpose : Report a hard failure detected at the calling site.
    // Contract: Formats `fmt` with `args` once. Fatal policy => logs at Fatal and
    //           never returns. Otherwise logs at Error under `category`, bumps the
    //           failure counter and returns so the caller can hand back its status.
    // Notes   : Formatting failures degrade to the bare kind tag.
    // ---
    template <class... Args>
    inline void ReportHardFailure(const char* category, HardFailureKind kind,
        std::format_string<Args...> fmt, Args&&... args) noexcept
    {
        std::string message;
        try {
            message = std::format(fmt, static_cast<Args&&>(args)...);
        }
        catch (const std::exception&) {
            message.clear();
        }

        if (ShouldFatalOnHardFailure())
        {
            KEEL_LOG_FATAL(category, "{}: {}", ToString(kind), message);
        }

        detail::HardFailureCounter().fetch_add(1, std::memory_order_relaxed);
        KEEL_LOG_ERROR(category, "{}: {}", ToString(kind), message);
    }

} // namespace keel::core
