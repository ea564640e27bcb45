#pragma once

// ============================================================================
// Keel - Core/Diagnostics/Check.hpp
// ----------------------------------------------------------------------------
// Purpose : Debug-only sanity checks for hot paths that must stay unchecked in
//           Release (raw copies, ring index math).
// Contract: KEEL_CHECK and KEEL_CHECK_SPAN compile to nothing when KEEL_DEBUG
//           is 0. KEEL_VERIFY always evaluates its argument.
//           None of them log; KEEL_ASSERT in Logger.hpp is the logging form.
// Notes   : Define KEEL_CHECK_BREAK or KEEL_VERIFY_BREAK to trap in a debugger
//           on failure.
// ============================================================================

#ifndef KEEL_DEBUG
#  ifdef NDEBUG
#    define KEEL_DEBUG 0
#  else
#    define KEEL_DEBUG 1
#  endif
#endif

#if !KEEL_DEBUG
#  define KEEL_INTERNAL_DEBUG_BREAK() ((void)0)
#elif defined(_MSC_VER)
#  define KEEL_INTERNAL_DEBUG_BREAK() __debugbreak()
#else
#  define KEEL_INTERNAL_DEBUG_BREAK() __builtin_trap()
#endif

#if KEEL_DEBUG && defined(KEEL_CHECK_BREAK)
#  define KEEL_INTERNAL_ON_CHECK_FAIL() KEEL_INTERNAL_DEBUG_BREAK()
#else
#  define KEEL_INTERNAL_ON_CHECK_FAIL() ((void)0)
#endif

#ifndef KEEL_CHECK
#  if KEEL_DEBUG
#    define KEEL_CHECK(cond) do { if (!(cond)) { KEEL_INTERNAL_ON_CHECK_FAIL(); } } while (0)
#  else
#    define KEEL_CHECK(cond) ((void)0)
#  endif
#endif

#ifndef KEEL_VERIFY
#  if KEEL_DEBUG && defined(KEEL_VERIFY_BREAK)
#    define KEEL_VERIFY(cond) do { if (!(cond)) { KEEL_INTERNAL_DEBUG_BREAK(); } } while (0)
#  else
#    define KEEL_VERIFY(cond) ((void)(cond))
#  endif
#endif

// A copy of `count` elements fits `capacity`. Non-positive counts always pass.
// Arguments may be evaluated twice.
#ifndef KEEL_CHECK_SPAN
#  define KEEL_CHECK_SPAN(count, capacity) KEEL_CHECK(((count) <= 0) || ((count) <= (capacity)))
#endif
