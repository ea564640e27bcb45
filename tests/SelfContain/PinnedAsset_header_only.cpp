// Compile-only self containment check for Contracts/PinnedAsset.hpp
#include "Core/Contracts/PinnedAsset.hpp"

namespace {
    struct EmptyAsset
    {
        ::keel::stream::IoStatus Pin(const ::keel::u8*& outData, ::keel::i32& outSize) noexcept
        {
            outData = nullptr;
            outSize = 0;
            return ::keel::stream::IoStatus::Ok;
        }

        void Release(const ::keel::u8*) noexcept {}
    };

    static_assert(::keel::stream::PinnedAssetBackend<EmptyAsset>, "Minimal asset satisfies the concept");
}

static_assert(true, "PinnedAsset contract header-only TU compiles");
