// ============================================================================
// Keel - Source/Core/Streaming/StreamConfig.hpp
// ----------------------------------------------------------------------------
// Purpose : Compile-time knobs for the streaming layer.
// Contract: Header-only; override any value before including this header or
//           from the build system. Invariants validated via static_assert.
// ============================================================================

#pragma once

#ifndef KEEL_STREAM_LOG_CATEGORY
#define KEEL_STREAM_LOG_CATEGORY "Stream"
#endif

#ifndef KEEL_TEXT_LOG_CATEGORY
#define KEEL_TEXT_LOG_CATEGORY "Text"
#endif

// Scratch size used by LoadParams when the caller supplies no unpack buffer
// for a Stream source; the buffer is then owned by the CharStream.
#ifndef KEEL_STREAM_DEFAULT_BLOCK_SIZE
#define KEEL_STREAM_DEFAULT_BLOCK_SIZE 4096
#endif

static_assert((KEEL_STREAM_DEFAULT_BLOCK_SIZE) >= 16 && (KEEL_STREAM_DEFAULT_BLOCK_SIZE) <= (1 << 24),
    "KEEL_STREAM_DEFAULT_BLOCK_SIZE must be in [16, 16 MiB]");
