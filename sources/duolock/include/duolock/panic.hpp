#pragma once

#include <source_location>
#include <string_view>

namespace duo {
    /// @brief Report an unrecoverable contract violation and terminate the process.
    ///
    /// The message is submitted to the global log queue at fatal level if the queue is
    /// not currently held, otherwise it is written straight to stderr.
    [[noreturn]]
    void BugCheck(std::string_view message, std::source_location where = std::source_location::current()) noexcept;
}

#define DUO_PANIC(msg) duo::BugCheck(msg)
#define DUO_CHECK(expr, msg) do { if (!(expr)) { duo::BugCheck(msg); } } while (0)
#define DUO_ASSERT(expr) do { if (!(expr)) { duo::BugCheck(#expr); } } while (0)
