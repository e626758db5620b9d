#pragma once

#include "duolock/gate.hpp"
#include "duolock/shared_spinlock.hpp"
#include "duolock/spin_mutex.hpp"

namespace duo::testing {
    /// @brief Access to internal lock state for tests.
    ///
    /// @warning Production code must never depend on anything here.
    struct LockInspector {
        template<typename T>
        static bool isLocked(const SpinMutex<T>& mutex) noexcept {
            return mutex.mLock.isLocked();
        }

        static bool isLocked(const SpinLock& lock) noexcept {
            return lock.isLocked();
        }

        /// @brief Switch a gate into raw-atomic mode without a bring-up phase.
        static void enableGate(AtomicGate& gate) noexcept {
            gate.enable();
        }

        /// @brief Return a gate to bring-up mode between independent tests.
        static void resetGate(AtomicGate& gate) noexcept {
            gate.disable();
        }

        template<typename T>
        static T rawState(const BasicSpinRwLock<T>& lock) noexcept {
            return lock.mState.load(std::memory_order_acquire);
        }

        template<typename T>
        static void setRawState(BasicSpinRwLock<T>& lock, T state) noexcept {
            lock.mState.store(state, std::memory_order_release);
        }
    };
}
