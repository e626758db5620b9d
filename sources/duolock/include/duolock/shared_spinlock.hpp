#pragma once

#include <atomic>
#include <concepts>
#include <limits>

#include <stdint.h>

#include "duolock/annotations.hpp"
#include "duolock/compiler.hpp"
#include "duolock/fwd.hpp"
#include "duolock/panic.hpp"

namespace duo {
    /// @brief Reader/writer spin lock packed into a single counter.
    ///
    /// The most significant bit of the counter marks a writer, the remaining bits count
    /// the readers currently holding the lock. Not bound to any gate, every operation
    /// issues atomic instructions.
    ///
    /// No fairness is provided, a steady stream of readers can starve a writer.
    template<std::unsigned_integral T>
    class DUO_CAPABILITY("mutex") BasicSpinRwLock {
    public:
        static constexpr T kWriteFlag = T(1) << (std::numeric_limits<T>::digits - 1);
        static constexpr T kReaderMask = T(~kWriteFlag);

    private:
        std::atomic<T> mState = 0;

        friend struct testing::LockInspector;

    public:
        constexpr BasicSpinRwLock() noexcept = default;

        BasicSpinRwLock(const BasicSpinRwLock&) = delete;
        BasicSpinRwLock& operator=(const BasicSpinRwLock&) = delete;

        void lock() noexcept DUO_ACQUIRE() {
            while (true) {
                T current = mState.load(std::memory_order_relaxed);
                if (current & kWriteFlag) {
                    arch::pause();
                    continue;
                }

                if (mState.compare_exchange_weak(current, T(current | kWriteFlag), std::memory_order_acquire, std::memory_order_relaxed)) {
                    //
                    // We own the write flag, no new readers can enter. Wait for
                    // the readers that were already admitted to leave.
                    //
                    while (mState.load(std::memory_order_acquire) & kReaderMask) {
                        arch::pause();
                    }

                    return;
                }

                arch::pause();
            }
        }

        [[nodiscard]]
        bool try_lock() noexcept DUO_TRY_ACQUIRE(true) {
            T expected = 0;
            return mState.compare_exchange_strong(expected, kWriteFlag, std::memory_order_acquire, std::memory_order_relaxed);
        }

        void unlock() noexcept DUO_RELEASE() {
            [[maybe_unused]] T previous = mState.fetch_and(T(~kWriteFlag), std::memory_order_release);
#if DUO_LOCK_CHECKS
            DUO_CHECK(previous & kWriteFlag, "SpinRwLock write released while not held");
#endif
        }

        void lock_shared() noexcept DUO_ACQUIRE_SHARED() {
            while (true) {
                T current = mState.load(std::memory_order_relaxed);
                if (current & kWriteFlag) {
                    arch::pause();
                    continue;
                }

                //
                // A full reader count would carry into the write flag, treat
                // it the same as contention.
                //
                T next = T(current + 1);
                if (next & kWriteFlag) {
                    arch::pause();
                    continue;
                }

                if (mState.compare_exchange_weak(current, next, std::memory_order_acquire, std::memory_order_relaxed)) {
                    return;
                }

                arch::pause();
            }
        }

        [[nodiscard]]
        bool try_lock_shared() noexcept DUO_TRY_ACQUIRE_SHARED(true) {
            T current = mState.load(std::memory_order_relaxed);
            T next = T(current + 1);
            if ((current & kWriteFlag) || (next & kWriteFlag)) {
                return false;
            }

            return mState.compare_exchange_strong(current, next, std::memory_order_acquire, std::memory_order_relaxed);
        }

        void unlock_shared() noexcept DUO_RELEASE_SHARED() {
            [[maybe_unused]] T previous = mState.fetch_sub(1, std::memory_order_release);
#if DUO_LOCK_CHECKS
            DUO_CHECK(previous & kReaderMask, "SpinRwLock read released while not held");
#endif
        }
    };

    using SpinRwLock = BasicSpinRwLock<uint32_t>;

    template<typename T>
    class DUO_SCOPED_CAPABILITY [[nodiscard]] UniqueLock {
        T& mLock;

    public:
        UniqueLock(T& lock) noexcept DUO_ACQUIRE(lock)
            : mLock(lock)
        {
            mLock.lock();
        }

        ~UniqueLock() noexcept DUO_RELEASE() {
            mLock.unlock();
        }

        UniqueLock(const UniqueLock&) = delete;
        UniqueLock& operator=(const UniqueLock&) = delete;
    };

    template<typename T>
    class DUO_SCOPED_CAPABILITY [[nodiscard]] SharedLock {
        T& mLock;

    public:
        SharedLock(T& lock) noexcept DUO_ACQUIRE_SHARED(lock)
            : mLock(lock)
        {
            mLock.lock_shared();
        }

        ~SharedLock() noexcept DUO_RELEASE() {
            mLock.unlock_shared();
        }

        SharedLock(const SharedLock&) = delete;
        SharedLock& operator=(const SharedLock&) = delete;
    };
}
