// Compile-only self containment check for Utf8.hpp
#include "Core/Text/Utf8.hpp"

#include <type_traits>

static_assert(std::is_trivially_copyable_v<::keel::text::Utf8Decoder>, "Decoder state stays flat");
static_assert(std::is_trivially_copyable_v<::keel::text::Utf8Encoder>, "Encoder state stays flat");
static_assert(::keel::text::EncodedLength(0x20ACu) == 3, "Euro sign encodes in three bytes");
