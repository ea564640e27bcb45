#pragma once
// ============================================================================
// Keel - Core/Memory/OOM.hpp
// ----------------------------------------------------------------------------
// Purpose : Out-of-memory policy for backing allocations (arena blocks, owned
//           stream scratch buffers, copied byte spans).
// Contract: Under the fatal policy a failure logs at Fatal and aborts.
//           Otherwise it logs at Error (when KEEL_MEM_LOG_VERBOSITY >= 1),
//           bumps the OOM counter and the caller returns nullptr.
// Notes   : Running out of room inside an existing arena block is not an OOM.
//           The arena reports that itself as a soft failure.
// ============================================================================
#include "Core/Logger.hpp"

#include <atomic>
#include <cstddef>

#ifndef KEEL_MEM_LOG_CATEGORY
#define KEEL_MEM_LOG_CATEGORY "Memory"
#endif

#ifndef KEEL_MEM_FATAL_ON_OOM
#define KEEL_MEM_FATAL_ON_OOM 0
#endif

#ifndef KEEL_MEM_LOG_VERBOSITY
#define KEEL_MEM_LOG_VERBOSITY 1
#endif

namespace keel::core
{
    namespace detail
    {
        struct OOMState
        {
            std::atomic<bool>     fatal{ KEEL_MEM_FATAL_ON_OOM != 0 };
            std::atomic<unsigned> failures{ 0 };
        };

        [[nodiscard]] inline OOMState& GetOOMState() noexcept
        {
            static OOMState state;
            return state;
        }
    } // namespace detail

    [[nodiscard]] inline bool ShouldFatalOnOOM() noexcept
    {
        return detail::GetOOMState().fatal.load(std::memory_order_relaxed);
    }

    inline void SetFatalOnOOMPolicy(bool fatal) noexcept
    {
        detail::GetOOMState().fatal.store(fatal, std::memory_order_relaxed);
    }

    // Non-fatal OOM reports since start-up.
    [[nodiscard]] inline unsigned GetOOMCount() noexcept
    {
        return detail::GetOOMState().failures.load(std::memory_order_relaxed);
    }

    // ---
    // Purpose : Apply the OOM policy to a failed request of `size` bytes.
    // Contract: `where` names the requesting function and may be null.
    //           Returns only under the non-fatal policy.
    // ---
    inline void OnAllocFailure(std::size_t size, std::size_t align,
        const char* where, const char* file, int line) noexcept
    {
        const char* site = where ? where : "<unknown>";
        if (ShouldFatalOnOOM())
        {
            KEEL_LOG_FATAL(KEEL_MEM_LOG_CATEGORY, "out of memory in {} ({} bytes, align {}) at {}:{}",
                site, size, align, file, line);
        }

        detail::GetOOMState().failures.fetch_add(1, std::memory_order_relaxed);
#if KEEL_MEM_LOG_VERBOSITY >= 1
        KEEL_LOG_ERROR(KEEL_MEM_LOG_CATEGORY, "allocation of {} bytes (align {}) failed in {} at {}:{}",
            size, align, site, file, line);
#else
        (void)align; (void)file; (void)line;
#endif
    }

} // namespace keel::core

#define KEEL_MEM_CHECK_OOM(size, align, where) \
    ::keel::core::OnAllocFailure((size), (align), (where), __FILE__, __LINE__)
