#include "duolock/logger.hpp"

void duo::StreamAppender::write(const LogMessageView& message) {
    auto& [_, msg, logger, level] = message;
    FILE *stream = mStream ? mStream : stderr;

    if (level == LogLevel::ePrint) {
        fwrite(msg.data(), 1, msg.size(), stream);
        return;
    }

    StaticString line = concat<kLogMessageSize + 32>("[", level, "] ", logger->getName(), ": ", msg, '\n');
    fwrite(line.data(), 1, line.size(), stream);
    fflush(stream);
}
