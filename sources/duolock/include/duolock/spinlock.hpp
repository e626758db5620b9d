#pragma once

#include <atomic>

#include "duolock/annotations.hpp"
#include "duolock/compiler.hpp"
#include "duolock/fwd.hpp"
#include "duolock/panic.hpp"

namespace duo {
    /// @brief Binary spin lock, always uses atomic instructions.
    class DUO_CAPABILITY("mutex") SpinLock {
        std::atomic<bool> mLocked = false;

        template<typename T>
        friend class SpinMutex;
        friend struct testing::LockInspector;

        bool isLocked() const noexcept {
            return mLocked.load(std::memory_order_acquire);
        }

    public:
        constexpr SpinLock() noexcept = default;

        void lock() noexcept DUO_ACQUIRE() {
            bool expected = false;
            while (!mLocked.compare_exchange_weak(expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
                expected = false;
                arch::pause();
            }
        }

        [[nodiscard]]
        bool try_lock() noexcept DUO_TRY_ACQUIRE(true) {
            bool expected = false;
            return mLocked.compare_exchange_strong(expected, true, std::memory_order_acquire, std::memory_order_relaxed);
        }

        void unlock() noexcept DUO_RELEASE() {
#if DUO_LOCK_CHECKS
            bool held = mLocked.exchange(false, std::memory_order_release);
            DUO_CHECK(held, "SpinLock released while not held");
#else
            mLocked.store(false, std::memory_order_release);
#endif
        }
    };

    template<typename T>
    class DUO_SCOPED_CAPABILITY [[nodiscard]] LockGuard {
        T& mLock;

    public:
        LockGuard(T& lock) noexcept DUO_ACQUIRE(lock)
            : mLock(lock)
        {
            mLock.lock();
        }

        ~LockGuard() noexcept DUO_RELEASE() {
            mLock.unlock();
        }

        LockGuard(const LockGuard&) = delete;
        LockGuard& operator=(const LockGuard&) = delete;
    };
}
