// ============================================================================
// Keel - Source/Core/Streaming/FileByteStream.hpp
// ----------------------------------------------------------------------------
// Purpose : Byte-stream backend reading a file through the C stdio layer.
// Contract: Header-only, no exceptions/RTTI. Open() acquires the handle,
//           Close() releases it (idempotent), the destructor closes a handle
//           that is still open. Not copyable; the interface stores a pointer
//           to the backend, so the backend must outlive any CharStream that
//           reads from it.
// Notes   : Binary mode; no newline translation.
// ============================================================================

#pragma once

#include "Core/Contracts/ByteStream.hpp"
#include "Core/Logger.hpp"
#include "Core/Streaming/StreamConfig.hpp"

#include <cstdio>

namespace keel::stream
{
    class FileByteStream
    {
    public:
        FileByteStream() noexcept = default;
        FileByteStream(const FileByteStream&) = delete;
        FileByteStream& operator=(const FileByteStream&) = delete;

        ~FileByteStream() noexcept
        {
            Close();
        }

        [[nodiscard]] IoStatus Open(const char* path) noexcept
        {
            Close();
            if (!path || !*path)
                return IoStatus::InvalidArg;

            m_file = std::fopen(path, "rb");
            if (!m_file)
            {
                KEEL_LOG_WARNING(KEEL_STREAM_LOG_CATEGORY, "FileByteStream: unable to open '{}'", path);
                return IoStatus::IoError;
            }
            return IoStatus::Ok;
        }

        [[nodiscard]] bool IsOpen() const noexcept { return m_file != nullptr; }

        [[nodiscard]] IoStatus Read(void* dst, keel::u64 dstSize, keel::u64& outRead) noexcept
        {
            outRead = 0;
            if (!m_file)
                return IoStatus::Closed;
            if (!dst && dstSize != 0)
                return IoStatus::InvalidArg;

            const std::size_t n = std::fread(dst, 1, static_cast<std::size_t>(dstSize), m_file);
            outRead = static_cast<keel::u64>(n);
            if (n == 0)
            {
                return std::ferror(m_file) ? IoStatus::IoError : IoStatus::EndOfStream;
            }
            return IoStatus::Ok;
        }

        void Close() noexcept
        {
            if (m_file)
            {
                if (std::fclose(m_file) != 0)
                {
                    KEEL_LOG_WARNING(KEEL_STREAM_LOG_CATEGORY, "FileByteStream: fclose reported an error");
                }
                m_file = nullptr;
            }
        }

    private:
        std::FILE* m_file = nullptr;
    };

    static_assert(ByteStreamBackend<FileByteStream>, "FileByteStream must satisfy byte stream backend concept.");

    [[nodiscard]] inline ByteStreamInterface MakeFileByteStreamInterface(FileByteStream& backend) noexcept
    {
        return MakeByteStreamInterface(backend);
    }

} // namespace keel::stream
