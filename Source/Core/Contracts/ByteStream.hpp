// ============================================================================
// Keel - Source/Core/Contracts/ByteStream.hpp
// ----------------------------------------------------------------------------
// Purpose : Blocking byte-stream contract consumed by CharStream's Stream
//           source kind: read a bounded block, close once.
// Contract: Header-only, no exceptions/RTTI. Types are trivially copyable so a
//           stream handle can live inside a flat CharStream value. A read that
//           returns Ok with outRead == 0, or EndOfStream, means no more data.
//           Thread-safety is delegated to the backend owner.
// Notes   : Static face (concept + adapter) mirrors the dynamic face so
//           backends can be plain structs with member functions.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <concepts>
#include <type_traits>

namespace keel::stream
{
    enum class IoStatus : keel::u8
    {
        Ok = 0,
        EndOfStream,
        InvalidArg,
        Closed,
        IoError
    };

    [[nodiscard]] constexpr const char* ToString(IoStatus status) noexcept
    {
        switch (status)
        {
        case IoStatus::Ok:          return "Ok";
        case IoStatus::EndOfStream: return "EndOfStream";
        case IoStatus::InvalidArg:  return "InvalidArg";
        case IoStatus::Closed:      return "Closed";
        case IoStatus::IoError:     return "IoError";
        default:                    return "Unknown";
        }
    }

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    struct ByteStreamVTable
    {
        using ReadFunc  = IoStatus(*)(void* userData, void* dst, keel::u64 dstSize, keel::u64& outRead) noexcept;
        using CloseFunc = void(*)(void* userData) noexcept;

        ReadFunc  read  = nullptr;
        CloseFunc close = nullptr;
    };

    struct ByteStreamInterface
    {
        ByteStreamVTable vtable{};
        void*            userData = nullptr; // Non-owning backend instance pointer.
    };

    static_assert(std::is_trivially_copyable_v<ByteStreamInterface>);

    [[nodiscard]] inline bool IsBound(const ByteStreamInterface& stream) noexcept
    {
        return stream.vtable.read != nullptr && stream.userData != nullptr;
    }

    [[nodiscard]] inline IoStatus Read(ByteStreamInterface& stream, void* dst, keel::u64 dstSize, keel::u64& outRead) noexcept
    {
        outRead = 0;
        return IsBound(stream)
            ? stream.vtable.read(stream.userData, dst, dstSize, outRead)
            : IoStatus::InvalidArg;
    }

    inline void Close(ByteStreamInterface& stream) noexcept
    {
        if (stream.vtable.close && stream.userData)
        {
            stream.vtable.close(stream.userData);
        }
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept ByteStreamBackend = requires(Backend& backend,
                                         void* dst,
                                         keel::u64 dstSize,
                                         keel::u64& outRead)
    {
        { backend.Read(dst, dstSize, outRead) } noexcept -> std::same_as<IoStatus>;
        { backend.Close() } noexcept;
    };

    namespace detail
    {
        template <typename Backend>
        struct ByteStreamInterfaceAdapter
        {
            static IoStatus Read(void* userData, void* dst, keel::u64 dstSize, keel::u64& outRead) noexcept
            {
                return static_cast<Backend*>(userData)->Read(dst, dstSize, outRead);
            }

            static void Close(void* userData) noexcept
            {
                static_cast<Backend*>(userData)->Close();
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline ByteStreamInterface MakeByteStreamInterface(Backend& backend) noexcept
    {
        static_assert(ByteStreamBackend<Backend>, "Backend must satisfy ByteStreamBackend concept.");

        ByteStreamInterface iface{};
        iface.userData     = &backend;
        iface.vtable.read  = &detail::ByteStreamInterfaceAdapter<Backend>::Read;
        iface.vtable.close = &detail::ByteStreamInterfaceAdapter<Backend>::Close;
        return iface;
    }

} // namespace keel::stream
