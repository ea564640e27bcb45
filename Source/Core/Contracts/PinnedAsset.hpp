// ============================================================================
// Keel - Source/Core/Contracts/PinnedAsset.hpp
// ----------------------------------------------------------------------------
// Purpose : Contract for assets (text files, embedded resources) whose UTF-8
//           bytes a host keeps resident for as long as a reader holds a pin.
// Contract: Header-only, no exceptions/RTTI. Every successful Pin() must be
//           matched by exactly one Release() with the pointer it returned.
//           The bytes stay immutable and valid between the two calls.
// Notes   : CharStream records the interface and releases the pin on dispose
//           (Ownership::ReleasePinnedAsset).
// ============================================================================

#pragma once

#include "Core/Contracts/ByteStream.hpp" // IoStatus
#include "Core/Types.hpp"

#include <concepts>
#include <type_traits>

namespace keel::stream
{
    struct PinnedAssetVTable
    {
        using PinFunc     = IoStatus(*)(void* userData, const keel::u8*& outData, keel::i32& outSize) noexcept;
        using ReleaseFunc = void(*)(void* userData, const keel::u8* data) noexcept;

        PinFunc     pin     = nullptr;
        ReleaseFunc release = nullptr;
    };

    struct PinnedAssetInterface
    {
        PinnedAssetVTable vtable{};
        void*             userData = nullptr; // Non-owning asset instance pointer.
    };

    static_assert(std::is_trivially_copyable_v<PinnedAssetInterface>);

    [[nodiscard]] inline bool IsBound(const PinnedAssetInterface& asset) noexcept
    {
        return asset.vtable.pin != nullptr && asset.vtable.release != nullptr && asset.userData != nullptr;
    }

    [[nodiscard]] inline IoStatus Pin(PinnedAssetInterface& asset, const keel::u8*& outData, keel::i32& outSize) noexcept
    {
        outData = nullptr;
        outSize = 0;
        return IsBound(asset)
            ? asset.vtable.pin(asset.userData, outData, outSize)
            : IoStatus::InvalidArg;
    }

    inline void Release(PinnedAssetInterface& asset, const keel::u8* data) noexcept
    {
        if (asset.vtable.release && asset.userData)
        {
            asset.vtable.release(asset.userData, data);
        }
    }

    template <typename Backend>
    concept PinnedAssetBackend = requires(Backend& backend,
                                          const keel::u8*& outData,
                                          keel::i32& outSize,
                                          const keel::u8* data)
    {
        { backend.Pin(outData, outSize) } noexcept -> std::same_as<IoStatus>;
        { backend.Release(data) } noexcept;
    };

    namespace detail
    {
        template <typename Backend>
        struct PinnedAssetInterfaceAdapter
        {
            static IoStatus Pin(void* userData, const keel::u8*& outData, keel::i32& outSize) noexcept
            {
                return static_cast<Backend*>(userData)->Pin(outData, outSize);
            }

            static void Release(void* userData, const keel::u8* data) noexcept
            {
                static_cast<Backend*>(userData)->Release(data);
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline PinnedAssetInterface MakePinnedAssetInterface(Backend& backend) noexcept
    {
        static_assert(PinnedAssetBackend<Backend>, "Backend must satisfy PinnedAssetBackend concept.");

        PinnedAssetInterface iface{};
        iface.userData       = &backend;
        iface.vtable.pin     = &detail::PinnedAssetInterfaceAdapter<Backend>::Pin;
        iface.vtable.release = &detail::PinnedAssetInterfaceAdapter<Backend>::Release;
        return iface;
    }

} // namespace keel::stream
