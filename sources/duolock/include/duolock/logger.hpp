#pragma once

#include "duolock/format.hpp"
#include "duolock/spin_mutex.hpp"
#include "duolock/status.hpp"

#include <array>
#include <atomic>
#include <optional>
#include <source_location>
#include <string_view>

#include <stdint.h>
#include <stdio.h>

namespace duo {
    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        ePrint = 0,
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

    template<>
    struct Format<LogLevel> {
        static constexpr size_t kStringSize = 8;
        static std::string_view toString(char *buffer, LogLevel level) noexcept;
    };

    struct LogMessageView {
        std::source_location location;
        std::string_view message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };

    /// @brief Writes one line per message to a stdio stream.
    class StreamAppender final : public ILogAppender {
        FILE *mStream = nullptr;

    public:
        constexpr StreamAppender() noexcept = default;

        constexpr StreamAppender(FILE *stream) noexcept
            : mStream(stream)
        { }

        /// @note A null stream writes to stderr.
        void write(const LogMessageView& message) override;
    };

    struct LogQueueOptions {
        /// @brief Messages below this level are discarded, print messages are always written.
        LogLevel minLevel = LogLevel::eInfo;
    };

    class LogQueue {
        static constexpr size_t kMaxAppenders = 4;

        struct AppenderList {
            std::array<ILogAppender*, kMaxAppenders> items{};
            size_t count = 0;
        };

        static LogQueue sLogQueue;

        /// @brief Bound to the same gate as the rest of the system, so logging
        ///        during bring-up does not issue atomic instructions.
        SpinMutex<AppenderList> mAppenders;

        std::atomic<LogLevel> mMinLevel;

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mCommittedCount{0};

        /// @brief Number of messages dropped because the queue was busy.
        std::atomic<uint32_t> mDroppedCount{0};

        void write(const AppenderList& appenders, const LogMessageView& message) noexcept;

    public:
        constexpr LogQueue(const AtomicGate& gate, LogQueueOptions options = {}) noexcept
            : mAppenders(gate)
            , mMinLevel(options.minLevel)
        { }

        constexpr LogQueue(const AtomicGate& gate, ILogAppender *appender, LogQueueOptions options = {}) noexcept
            : mAppenders(gate, AppenderList { .items = { appender }, .count = 1 })
            , mMinLevel(options.minLevel)
        { }

        [[nodiscard]]
        Status addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        void configure(LogQueueOptions options) noexcept;

        LogLevel getMinLevel() const noexcept;
        bool isEnabled(LogLevel level) const noexcept;

        /// @brief Write a message to all appenders, spinning if another writer is active.
        void submit(const LogMessageView& message) noexcept;

        /// @brief Write a message only if no other writer is active.
        ///
        /// @return True if the message was written, false if it was dropped.
        bool trySubmit(const LogMessageView& message) noexcept;

        /// @brief The gate that decides whether the appender list is locked.
        const AtomicGate& gate() const noexcept {
            return mAppenders.gate();
        }

        uint32_t getCommittedCount() const noexcept;
        uint32_t getDroppedCount() const noexcept;

        static constexpr LogQueue& getGlobalQueue() noexcept {
            return sLogQueue;
        }
    };

    /// @brief Apply a log level from the environment to a queue.
    ///
    /// @return StatusNotFound if the variable is unset, StatusInvalidInput if it does not
    ///         name a level.
    [[nodiscard]]
    Status ConfigureLogFromEnvironment(LogQueue& queue, const char *variable = "DUOLOCK_LOG_LEVEL") noexcept;

    class Logger {
        LogQueue *mQueue;
        std::string_view mName;

    public:
        constexpr Logger() noexcept
            : Logger("DEFAULT")
        { }

        constexpr Logger(std::string_view name, LogQueue *queue) noexcept
            : mQueue(queue)
            , mName(name)
        { }

        constexpr Logger(std::string_view name) noexcept
            : Logger(name, &LogQueue::getGlobalQueue())
        { }

        std::string_view getName() const noexcept;

        void submit(LogLevel level, std::string_view message, std::source_location location) noexcept;

        template<typename... Args>
        void print(Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            submit(LogLevel::ePrint, message, std::source_location::current());
        }

        template<typename... Args>
        void println(Args&&... args) noexcept {
            print(std::forward<Args>(args)..., "\n");
        }

        void dbg(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void info(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void warn(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void error(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void fatal(std::string_view message, std::source_location location = std::source_location::current()) noexcept;

        template<typename... Args>
        void dbgfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            dbg(message, location);
        }

        template<typename... Args>
        void infofImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            info(message, location);
        }

        template<typename... Args>
        void warnfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            warn(message, location);
        }

        template<typename... Args>
        void errorfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            error(message, location);
        }

        template<typename... Args>
        void fatalfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = concat<kLogMessageSize>(std::forward<Args>(args)...);
            fatal(message, location);
        }
    };
}

#define dbgf(...) dbgfImpl(std::source_location::current(), __VA_ARGS__)
#define infof(...) infofImpl(std::source_location::current(), __VA_ARGS__)
#define warnf(...) warnfImpl(std::source_location::current(), __VA_ARGS__)
#define errorf(...) errorfImpl(std::source_location::current(), __VA_ARGS__)
#define fatalf(...) fatalfImpl(std::source_location::current(), __VA_ARGS__)
