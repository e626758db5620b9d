#include "duolock/logger.hpp"

#include <algorithm>

#include <stdlib.h>
#include <strings.h>

struct LogLevelName {
    duo::LogLevel level;
    std::string_view name;
};

static constexpr LogLevelName kLogLevelNames[] = {
    { duo::LogLevel::ePrint, "print" },
    { duo::LogLevel::eDebug, "debug" },
    { duo::LogLevel::eInfo, "info" },
    { duo::LogLevel::eWarning, "warn" },
    { duo::LogLevel::eWarning, "warning" },
    { duo::LogLevel::eError, "error" },
    { duo::LogLevel::eFatal, "fatal" },
};

std::optional<duo::LogLevel> duo::ParseLogLevel(std::string_view name) noexcept {
    for (const LogLevelName& entry : kLogLevelNames) {
        if (entry.name.size() != name.size()) continue;

        if (strncasecmp(entry.name.data(), name.data(), name.size()) == 0) {
            return entry.level;
        }
    }

    return std::nullopt;
}

std::string_view duo::Format<duo::LogLevel>::toString(char *, LogLevel level) noexcept {
    switch (level) {
    case LogLevel::ePrint: return "PRINT";
    case LogLevel::eDebug: return "DEBUG";
    case LogLevel::eInfo: return "INFO";
    case LogLevel::eWarning: return "WARN";
    case LogLevel::eError: return "ERROR";
    case LogLevel::eFatal: return "FATAL";
    default: return "UNKNOWN";
    }
}

// log queue

constinit static duo::StreamAppender gStderrAppender;

constinit duo::LogQueue duo::LogQueue::sLogQueue { duo::GlobalGate(), &gStderrAppender };

void duo::LogQueue::write(const AppenderList& appenders, const LogMessageView& message) noexcept {
    for (size_t i = 0; i < appenders.count; i++) {
        appenders.items[i]->write(message);
    }

    mCommittedCount.fetch_add(1, std::memory_order_relaxed);
}

duo::Status duo::LogQueue::addAppender(ILogAppender *appender) noexcept {
    auto appenders = mAppenders.lock();
    auto begin = appenders->items.begin();
    auto end = begin + appenders->count;

    if (std::find(begin, end, appender) != end) {
        return StatusAlreadyExists;
    }

    if (appenders->count >= kMaxAppenders) {
        return StatusOutOfMemory;
    }

    appenders->items[appenders->count++] = appender;
    return StatusSuccess;
}

void duo::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    auto appenders = mAppenders.lock();
    auto begin = appenders->items.begin();
    auto end = begin + appenders->count;

    auto it = std::remove(begin, end, appender);
    std::fill(it, end, nullptr);
    appenders->count = it - begin;
}

void duo::LogQueue::configure(LogQueueOptions options) noexcept {
    mMinLevel.store(options.minLevel, std::memory_order_relaxed);
}

duo::LogLevel duo::LogQueue::getMinLevel() const noexcept {
    return mMinLevel.load(std::memory_order_relaxed);
}

bool duo::LogQueue::isEnabled(LogLevel level) const noexcept {
    return level == LogLevel::ePrint || level >= getMinLevel();
}

void duo::LogQueue::submit(const LogMessageView& message) noexcept {
    if (!isEnabled(message.level)) return;

    auto appenders = mAppenders.lock();
    write(*appenders, message);
}

bool duo::LogQueue::trySubmit(const LogMessageView& message) noexcept {
    if (!isEnabled(message.level)) return true;

    if (auto appenders = mAppenders.tryLock()) {
        write(**appenders, message);
        return true;
    }

    mDroppedCount.fetch_add(1, std::memory_order_relaxed);
    return false;
}

uint32_t duo::LogQueue::getCommittedCount() const noexcept {
    return mCommittedCount.load(std::memory_order_relaxed);
}

uint32_t duo::LogQueue::getDroppedCount() const noexcept {
    return mDroppedCount.load(std::memory_order_relaxed);
}

duo::Status duo::ConfigureLogFromEnvironment(LogQueue& queue, const char *variable) noexcept {
    const char *value = getenv(variable);
    if (value == nullptr) {
        return StatusNotFound;
    }

    std::optional<LogLevel> level = ParseLogLevel(value);
    if (!level.has_value()) {
        return StatusInvalidInput;
    }

    queue.configure(LogQueueOptions { .minLevel = *level });
    return StatusSuccess;
}

// logger

std::string_view duo::Logger::getName() const noexcept {
    return mName;
}

void duo::Logger::submit(LogLevel level, std::string_view message, std::source_location location) noexcept {
    LogMessageView view {
        .location = location,
        .message = message,
        .logger = this,
        .level = level,
    };

    mQueue->submit(view);
}

void duo::Logger::dbg(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void duo::Logger::info(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void duo::Logger::warn(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void duo::Logger::error(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void duo::Logger::fatal(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
