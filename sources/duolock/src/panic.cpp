#include "duolock/panic.hpp"

#include "duolock/categories.hpp"

#include <stdio.h>
#include <stdlib.h>

void duo::BugCheck(std::string_view message, std::source_location where) noexcept {
    StaticString text = concat<kLogMessageSize>("Bugcheck: ", message, " at ", where.file_name(), ":", where.line());

    LogMessageView view {
        .location = where,
        .message = text,
        .logger = &BugLog,
        .level = LogLevel::eFatal,
    };

    //
    // The log queue may be held by the caller, never spin on it here.
    //
    if (!LogQueue::getGlobalQueue().trySubmit(view)) {
        fwrite(text.data(), 1, text.size(), stderr);
        fputc('\n', stderr);
    }

    abort();
}
