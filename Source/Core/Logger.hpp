#pragma once

// ============================================================================
// Keel - Logger.hpp
// ----------------------------------------------------------------------------
// Purpose : Header-only line logger shared by the memory, text and stream
//           layers. Each line is "[LEVEL][Category] message" written with
//           std::print to stdout (Info/Verbose) or stderr (Warn/Error/Fatal).
// Contract: Every entry point is noexcept. A line is emitted when its level is
//           at or below the runtime minimum and its category passes the
//           optional equals-filter. Lines are serialized by one mutex.
//           Emission counters advance only for lines that pass the filters.
// Notes   : Categories are string literals with static storage ("Memory",
//           "Memory.Arena", "Memory.Alignment", "Stream", "Text").
//           KEEL_ENABLE_LOGGING=0 compiles every KEEL_LOG_* macro out.
// ============================================================================

#include <array>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <format>
#include <mutex>
#include <print>
#include <string_view>

#ifndef KEEL_ENABLE_LOGGING
#  define KEEL_ENABLE_LOGGING 1
#endif
#ifndef KEEL_ENABLE_LOG_ASSERT
#  define KEEL_ENABLE_LOG_ASSERT 1
#endif

namespace keel::core {

    // Lower value == more severe. Disabled is never emitted.
    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal,
        Error,
        Warn,
        Info,
        Verbose,
        Count
    };

    [[nodiscard]] constexpr std::string_view ToString(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Fatal:   return "FATAL";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warn:    return "WARN";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Verbose: return "VERBOSE";
        default:                return "OFF";
        }
    }

    class Logger final {
    public:
        static void SetMinLevel(LogLevel level) noexcept { Instance().mMinLevel.store(level, std::memory_order_relaxed); }
        [[nodiscard]] static LogLevel GetMinLevel() noexcept { return Instance().mMinLevel.load(std::memory_order_relaxed); }

        // nullptr accepts every category; otherwise only exact matches pass.
        static void SetCategoryEqualsFilter(const char* category) noexcept {
            Instance().mCategoryFilter.store(category, std::memory_order_relaxed);
        }

        [[nodiscard]] static bool IsEnabled(LogLevel level, const char* category) noexcept {
            const Logger& self = Instance();
            if (level == LogLevel::Disabled || level >= LogLevel::Count)
                return false;
            if (level > self.mMinLevel.load(std::memory_order_relaxed))
                return false;
            const char* filter = self.mCategoryFilter.load(std::memory_order_relaxed);
            if (filter == nullptr)
                return true;
            return category != nullptr && std::string_view(filter) == category;
        }

        // ---
        // Purpose : Lines emitted at `level` since start-up or the last ResetCounters().
        // ---
        [[nodiscard]] static std::uint64_t GetEmittedCount(LogLevel level) noexcept {
            const auto index = static_cast<std::size_t>(level);
            if (index >= kLevelCount)
                return 0;
            return Instance().mEmitted[index].load(std::memory_order_relaxed);
        }

        static void ResetCounters() noexcept {
            for (auto& counter : Instance().mEmitted)
                counter.store(0, std::memory_order_relaxed);
        }

        template <class... Args>
        static void Log(LogLevel level, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!IsEnabled(level, category))
                return;
            Logger& self = Instance();
            self.mEmitted[static_cast<std::size_t>(level)].fetch_add(1, std::memory_order_relaxed);

            std::FILE* sink = SinkFor(level);
            std::scoped_lock lock(self.mMutex);
            try {
                WritePrefix(sink, level, category);
                std::println(sink, fmt, static_cast<Args&&>(args)...);
            }
            catch (const std::exception&) {
                // Formatting or I/O failed; the line is lost.
            }
        }

        // Fatal lines bypass the filters.
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Logger& self = Instance();
            self.mEmitted[static_cast<std::size_t>(LogLevel::Fatal)].fetch_add(1, std::memory_order_relaxed);
            {
                std::scoped_lock lock(self.mMutex);
                try {
                    WritePrefix(stderr, LogLevel::Fatal, category);
                    std::println(stderr, fmt, static_cast<Args&&>(args)...);
                }
                catch (const std::exception&) {
                }
                std::fflush(stderr);
            }
            std::abort();
        }

    private:
        static constexpr std::size_t kLevelCount = static_cast<std::size_t>(LogLevel::Count);

        Logger() = default;

        static Logger& Instance() noexcept {
            static Logger instance;
            return instance;
        }

        static std::FILE* SinkFor(LogLevel level) noexcept {
            return level <= LogLevel::Warn ? stderr : stdout;
        }

        static void WritePrefix(std::FILE* sink, LogLevel level, const char* category) {
            if (category != nullptr)
                std::print(sink, "[{}][{}] ", ToString(level), category);
            else
                std::print(sink, "[{}] ", ToString(level));
        }

        std::mutex mMutex{};
        std::atomic<LogLevel> mMinLevel{ LogLevel::Info };
        std::atomic<const char*> mCategoryFilter{ nullptr };
        std::array<std::atomic<std::uint64_t>, kLevelCount> mEmitted{};
    };

    // Lowers or raises the minimum level for a scope and restores it on exit.
    class ScopedLogLevel final {
    public:
        explicit ScopedLogLevel(LogLevel level) noexcept
            : mPrevious(Logger::GetMinLevel()) {
            Logger::SetMinLevel(level);
        }
        ~ScopedLogLevel() { Logger::SetMinLevel(mPrevious); }

        ScopedLogLevel(const ScopedLogLevel&) = delete;
        ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

    private:
        LogLevel mPrevious;
    };

} // namespace keel::core

#if KEEL_ENABLE_LOGGING
#  define KEEL_INTERNAL_LOG(Level, Category, Fmt, ...) do { \
        const char* keelLogCat_ = (Category); \
        if (::keel::core::Logger::IsEnabled((Level), keelLogCat_)) \
            ::keel::core::Logger::Log((Level), keelLogCat_, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)

#  define KEEL_LOG_VERBOSE(Category, Fmt, ...) KEEL_INTERNAL_LOG(::keel::core::LogLevel::Verbose, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#  define KEEL_LOG_INFO(Category, Fmt, ...)    KEEL_INTERNAL_LOG(::keel::core::LogLevel::Info, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#  define KEEL_LOG_WARNING(Category, Fmt, ...) KEEL_INTERNAL_LOG(::keel::core::LogLevel::Warn, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#  define KEEL_LOG_ERROR(Category, Fmt, ...)   KEEL_INTERNAL_LOG(::keel::core::LogLevel::Error, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#  define KEEL_LOG_FATAL(Category, Fmt, ...) \
        ::keel::core::Logger::Fatal((Category), (Fmt) __VA_OPT__(,) __VA_ARGS__)
#else
#  define KEEL_LOG_VERBOSE(Category, Fmt, ...) ((void)0)
#  define KEEL_LOG_INFO(Category, Fmt, ...)    ((void)0)
#  define KEEL_LOG_WARNING(Category, Fmt, ...) ((void)0)
#  define KEEL_LOG_ERROR(Category, Fmt, ...)   ((void)0)
#  define KEEL_LOG_FATAL(Category, Fmt, ...)   ::std::abort()
#endif

// KEEL_ASSERT(Expr) or KEEL_ASSERT(Expr, Msg): logs the failing site, never aborts.
#ifndef KEEL_ASSERT
#  if KEEL_ENABLE_LOG_ASSERT
#    include <source_location>

#    define KEEL_INTERNAL_ASSERT_PICK(_1, _2, Name, ...) Name
#    define KEEL_INTERNAL_ASSERT_1(Expr) KEEL_INTERNAL_ASSERT_2(Expr, #Expr)
#    define KEEL_INTERNAL_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto keelSite_ = std::source_location::current(); \
                KEEL_LOG_ERROR("Assert", "{}:{} in {}: {}", \
                    keelSite_.file_name(), keelSite_.line(), keelSite_.function_name(), (Msg)); \
            } \
        } while (0)
#    define KEEL_ASSERT(...) \
        KEEL_INTERNAL_ASSERT_PICK(__VA_ARGS__, KEEL_INTERNAL_ASSERT_2, KEEL_INTERNAL_ASSERT_1, unused)(__VA_ARGS__)
#  else
#    define KEEL_ASSERT(...) ((void)0)
#  endif
#endif
