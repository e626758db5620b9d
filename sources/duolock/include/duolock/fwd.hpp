#pragma once

#include <concepts>

namespace duo {
    class AtomicGate;
    class BringupPhase;
    class SmpPhase;
    class SpinLock;

    template<typename T>
    class SpinMutex;

    template<typename T>
    class MutexGuard;

    template<std::unsigned_integral T>
    class BasicSpinRwLock;

    class Logger;
    class LogQueue;
    class ILogAppender;
}

namespace duo::testing {
    struct LockInspector;
}
